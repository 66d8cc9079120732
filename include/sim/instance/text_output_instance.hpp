// File: include/sim/instance/text_output_instance.hpp
#pragma once

#include <memory>
#include <string>

#include "sim/instance/corpus.hpp"
#include "sim/instance/instance.hpp"

namespace sim {

// Text target over a text or speech source.
// Delays are in source words (text source) or source milliseconds (speech source).
class TextOutputInstance : public Instance {
 public:
  TextOutputInstance(InstanceIndex index, SourceItem source, MediaType source_type,
                     std::string reference, InstanceOptions options);

  // Replay: a record read back from instances.log.
  explicit TextOutputInstance(InstanceSummary restored);

  static Result<std::unique_ptr<Instance>> create(InstanceIndex index, const Corpus& corpus,
                                                  const InstanceOptions& options);

  Status receive_prediction(const PredictionSegment& segment) override;
  Status sentence_level_eval() override;

 private:
  void append_unit_(const std::string& unit);
};

// Latency units of a text increment: whitespace words, or one UTF-8 code point per
// non-space character.
std::vector<std::string> split_latency_units(const std::string& text, LatencyUnit unit);

}  // namespace sim
