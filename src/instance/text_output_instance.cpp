// File: src/instance/text_output_instance.cpp
#include "sim/instance/text_output_instance.hpp"

#include <cctype>
#include <utility>

#include "sim/latency/latency_metrics.hpp"

namespace sim {

std::vector<std::string> split_latency_units(const std::string& text, LatencyUnit unit) {
  if (unit == LatencyUnit::kWord) return split_words(text);

  std::vector<std::string> out;
  for (std::size_t i = 0; i < text.size();) {
    const auto c = static_cast<unsigned char>(text[i]);
    std::size_t len = 1;
    if (c >= 0xF0) {
      len = 4;
    } else if (c >= 0xE0) {
      len = 3;
    } else if (c >= 0xC0) {
      len = 2;
    }
    if (i + len > text.size()) len = text.size() - i;

    if (!(len == 1 && std::isspace(c))) out.push_back(text.substr(i, len));
    i += len;
  }
  return out;
}

TextOutputInstance::TextOutputInstance(InstanceIndex index, SourceItem source, MediaType source_type,
                                       std::string reference, InstanceOptions options)
    : Instance(index, std::move(source), source_type, MediaType::kText, std::move(reference),
               std::move(options)) {}

TextOutputInstance::TextOutputInstance(InstanceSummary restored) : Instance(std::move(restored)) {}

Result<std::unique_ptr<Instance>> TextOutputInstance::create(InstanceIndex index,
                                                             const Corpus& corpus,
                                                             const InstanceOptions& options) {
  auto src = corpus.source(index);
  if (!src.ok()) return Result<std::unique_ptr<Instance>>::err(src.status());
  auto ref = corpus.reference(index);
  if (!ref.ok()) return Result<std::unique_ptr<Instance>>::err(ref.status());

  std::unique_ptr<Instance> inst = std::make_unique<TextOutputInstance>(
      index, src.take_value(), corpus.source_type(), ref.take_value(), options);
  return Result<std::unique_ptr<Instance>>::ok(std::move(inst));
}

void TextOutputInstance::append_unit_(const std::string& unit) {
  if (options_.latency_unit == LatencyUnit::kWord && !s_.prediction.empty()) s_.prediction += ' ';
  s_.prediction += unit;
}

Status TextOutputInstance::receive_prediction(const PredictionSegment& segment) {
  SIM_RETURN_IF_ERROR(check_mutable());

  const bool timed = measures_elapsed();
  if (timed) account_compute_time();

  const double delay = revealed();
  for (const auto& unit : split_latency_units(segment.content, options_.latency_unit)) {
    append_unit_(unit);
    s_.delays.push_back(delay);
    if (timed) s_.elapsed.push_back(delay + compute_ms());
  }
  s_.prediction_length = s_.delays.size();

  if (segment.finished) return sentence_level_eval();
  return Status::ok_status();
}

Status TextOutputInstance::sentence_level_eval() {
  SIM_RETURN_IF_ERROR(check_mutable());

  // Nothing emitted: one unit at the very end of the source.
  std::vector<double> delays = s_.delays;
  if (delays.empty()) delays.push_back(s_.source_length);

  // Metrics first; the instance only counts as finished once they exist.
  MetricsMap metrics = s_.metrics;
  auto lat = eval_all_latency(delays, s_.source_length);
  if (!lat.ok()) {
    return lat.status().annotated("instance " + std::to_string(s_.index));
  }
  metrics["latency"] = lat.take_value();

  if (!s_.elapsed.empty()) {
    auto ca = eval_all_latency(s_.elapsed, s_.source_length);
    if (!ca.ok()) {
      return ca.status().annotated("instance " + std::to_string(s_.index));
    }
    metrics["latency_ca"] = ca.take_value();
  }

  s_.metrics = std::move(metrics);
  s_.prediction_length = s_.delays.size();
  s_.finish_prediction = true;
  return Status::ok_status();
}

}  // namespace sim
