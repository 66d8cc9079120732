// File: include/sim/instance/speech_output_instance.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sim/instance/corpus.hpp"
#include "sim/instance/instance.hpp"

namespace sim {

// Speech target over a speech source. Delays and durations are in milliseconds.
//
// Each segment starts at max(source revealed so far, end of the previous segment): the
// system cannot play two segments at once.
class SpeechOutputInstance : public Instance {
 public:
  SpeechOutputInstance(InstanceIndex index, SourceItem source, std::string reference,
                       InstanceOptions options);

  explicit SpeechOutputInstance(InstanceSummary restored);

  static Result<std::unique_ptr<Instance>> create(InstanceIndex index, const Corpus& corpus,
                                                  const InstanceOptions& options);

  Status receive_prediction(const PredictionSegment& segment) override;

  // Also writes wavs/<index>_pred.wav under the output dir (when configured).
  Status sentence_level_eval() override;

  // Relative path of the prediction wav inside a log directory.
  static std::string wav_relpath(InstanceIndex index);

 private:
  Status write_wav_();

  std::vector<float> audio_;
  int sample_rate_{0};
  bool wav_written_{false};
};

}  // namespace sim
