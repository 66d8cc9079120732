// File: include/sim/speech/asr_transcriber.hpp
#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "sim/core/config.hpp"
#include "sim/core/events/event_sink.hpp"
#include "sim/core/status.hpp"
#include "sim/core/types.hpp"

namespace sim {

// Transcribes the speech predictions of a log directory with an external ASR tool.
//
// Layout under the log dir:
//   wavs/<i>_pred.wav                  input
//   asr_prep_data/eval.tsv             manifest: wav root, then "<name>\t<frames>" per file
//   asr_out/eval_asr_predictions.tsv   tool output: header, then "<id>\t<transcription>"
//   wavs/<i>_pred.txt                  lowercased transcription, one per instance
//
// An unavailable or failing tool is not an error: every hypothesis comes back empty and an
// `asr_unavailable` warning is emitted.
class AsrTranscriber {
 public:
  AsrTranscriber(AsrConfig cfg, EventSink& events) : cfg_(std::move(cfg)), events_(events) {}

  // Hypotheses in the order of `indices`.
  Result<std::vector<std::string>> transcribe(const std::filesystem::path& logdir,
                                              const std::vector<InstanceIndex>& indices);

 private:
  Status write_manifest_(const std::filesystem::path& logdir,
                         const std::vector<InstanceIndex>& indices) const;
  Result<std::vector<std::string>> read_predictions_(const std::filesystem::path& tsv,
                                                     const std::vector<InstanceIndex>& indices);

  AsrConfig cfg_;
  EventSink& events_;
};

}  // namespace sim
