// File: src/instance/speech_output_instance.cpp
#include "sim/instance/speech_output_instance.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include "sim/latency/latency_metrics.hpp"
#include "sim/speech/wav_io.hpp"

namespace sim {

SpeechOutputInstance::SpeechOutputInstance(InstanceIndex index, SourceItem source,
                                           std::string reference, InstanceOptions options)
    : Instance(index, std::move(source), MediaType::kSpeech, MediaType::kSpeech,
               std::move(reference), std::move(options)) {}

SpeechOutputInstance::SpeechOutputInstance(InstanceSummary restored)
    : Instance(std::move(restored)) {
  wav_written_ = true;  // whatever exists on disk is what was produced
}

Result<std::unique_ptr<Instance>> SpeechOutputInstance::create(InstanceIndex index,
                                                               const Corpus& corpus,
                                                               const InstanceOptions& options) {
  if (corpus.source_type() != MediaType::kSpeech) {
    return Result<std::unique_ptr<Instance>>::err(
        Status::invalid_argument("speech output requires a speech source"));
  }
  auto src = corpus.source(index);
  if (!src.ok()) return Result<std::unique_ptr<Instance>>::err(src.status());
  auto ref = corpus.reference(index);
  if (!ref.ok()) return Result<std::unique_ptr<Instance>>::err(ref.status());

  std::unique_ptr<Instance> inst =
      std::make_unique<SpeechOutputInstance>(index, src.take_value(), ref.take_value(), options);
  return Result<std::unique_ptr<Instance>>::ok(std::move(inst));
}

std::string SpeechOutputInstance::wav_relpath(InstanceIndex index) {
  return "wavs/" + std::to_string(index) + "_pred.wav";
}

Status SpeechOutputInstance::receive_prediction(const PredictionSegment& segment) {
  SIM_RETURN_IF_ERROR(check_mutable());

  if (!segment.samples.empty()) {
    if (segment.sample_rate <= 0) {
      return Status::invalid_argument("speech segment sample_rate must be > 0");
    }
    if (sample_rate_ != 0 && segment.sample_rate != sample_rate_) {
      return Status::invalid_argument("speech segments of instance " + std::to_string(s_.index) +
                                      " change sample rate");
    }
    sample_rate_ = segment.sample_rate;

    const bool timed = measures_elapsed();
    if (timed) account_compute_time();

    const double duration =
        1000.0 * static_cast<double>(segment.samples.size()) / static_cast<double>(sample_rate_);
    double offset = revealed();
    if (!s_.delays.empty()) offset = std::max(offset, s_.delays.back() + s_.durations.back());

    s_.delays.push_back(offset);
    s_.durations.push_back(duration);
    if (timed) s_.elapsed.push_back(offset + compute_ms());

    audio_.insert(audio_.end(), segment.samples.begin(), segment.samples.end());
    s_.prediction_length = s_.delays.size();
  }

  if (segment.finished) return sentence_level_eval();
  return Status::ok_status();
}

Status SpeechOutputInstance::write_wav_() {
  if (wav_written_ || options_.output_dir.empty()) return Status::ok_status();

  namespace fs = std::filesystem;
  std::error_code ec;
  fs::create_directories(options_.output_dir / "wavs", ec);
  if (ec) {
    return Status::io_error("failed to create " + (options_.output_dir / "wavs").string() + ": " +
                            ec.message());
  }

  const int rate = sample_rate_ > 0 ? sample_rate_ : options_.sample_rate;
  SIM_RETURN_IF_ERROR(
      write_wav_pcm16((options_.output_dir / wav_relpath(s_.index)).string(), audio_, rate));
  wav_written_ = true;
  return Status::ok_status();
}

Status SpeechOutputInstance::sentence_level_eval() {
  SIM_RETURN_IF_ERROR(check_mutable());
  SIM_RETURN_IF_ERROR(write_wav_());

  std::vector<double> delays = s_.delays;
  MetricFamily latency;
  if (delays.empty()) {
    delays.push_back(s_.source_length);
    latency["StartOffset"] = s_.source_length;
    latency["EndOffset"] = 0.0;
  } else {
    latency["StartOffset"] = s_.delays.front();
    latency["EndOffset"] = s_.delays.back() + s_.durations.back() - s_.source_length;
  }

  MetricsMap metrics = s_.metrics;
  auto lat = eval_all_latency(delays, s_.source_length);
  if (!lat.ok()) {
    return lat.status().annotated("instance " + std::to_string(s_.index));
  }
  for (const auto& kv : *lat) latency[kv.first] = kv.second;
  metrics["latency"] = std::move(latency);

  if (!s_.elapsed.empty()) {
    auto ca = eval_all_latency(s_.elapsed, s_.source_length);
    if (!ca.ok()) {
      return ca.status().annotated("instance " + std::to_string(s_.index));
    }
    metrics["latency_ca"] = ca.take_value();
  }

  s_.metrics = std::move(metrics);
  s_.prediction = wav_relpath(s_.index);
  s_.prediction_length = s_.delays.size();
  s_.finish_prediction = true;
  return Status::ok_status();
}

}  // namespace sim
