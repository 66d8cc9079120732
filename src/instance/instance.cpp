// File: src/instance/instance.cpp
#include "sim/instance/instance.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

namespace sim {

std::vector<std::string> split_words(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string w;
  while (in >> w) out.push_back(w);
  return out;
}

InstanceOptions instance_options_from_config(const Config& cfg) {
  InstanceOptions o;
  o.latency_unit = cfg.latency.unit;
  o.computation_aware = cfg.latency.computation_aware;
  o.output_dir = cfg.logdir;
  o.sample_rate = cfg.speech.sample_rate;
  return o;
}

Instance::Instance(InstanceIndex index, SourceItem source, MediaType source_type,
                   MediaType target_type, std::string reference, InstanceOptions options)
    : options_(std::move(options)), source_item_(std::move(source)) {
  s_.index = index;
  s_.source_type = source_type;
  s_.target_type = target_type;
  s_.reference = std::move(reference);
  s_.reference_length = split_words(s_.reference).size();

  if (source_type == MediaType::kText) {
    source_words_ = split_words(source_item_.text);
    s_.source = source_item_.text;
    s_.source_length = static_cast<double>(source_words_.size());
  } else {
    s_.source_length = 1000.0 * static_cast<double>(source_item_.samples.size()) / source_rate();
  }
}

Instance::Instance(InstanceSummary restored) : s_(std::move(restored)) {
  // Replayed instances have no source to reveal; everything already happened.
  cursor_ = 0;
}

double Instance::now_ms() const {
  if (options_.clock) return options_.clock();
  const auto t = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration<double, std::milli>(t).count();
}

int Instance::source_rate() const {
  if (source_item_.sample_rate > 0) return source_item_.sample_rate;
  return options_.sample_rate > 0 ? options_.sample_rate : 16000;
}

double Instance::revealed() const {
  if (s_.source_type == MediaType::kText) return static_cast<double>(cursor_);
  return 1000.0 * static_cast<double>(cursor_) / source_rate();
}

bool Instance::measures_elapsed() const {
  return options_.computation_aware && s_.source_type == MediaType::kSpeech;
}

void Instance::account_compute_time() {
  const double now = now_ms();
  if (last_mark_ms_ >= 0.0) compute_ms_ += std::max(0.0, now - last_mark_ms_);
  last_mark_ms_ = now;
}

Status Instance::check_mutable() const {
  if (s_.finish_prediction) {
    return Status::invalid_argument("instance " + std::to_string(s_.index) + " is already finished");
  }
  return Status::ok_status();
}

Result<SourceSegment> Instance::send_source(int segment_size) {
  if (segment_size <= 0) {
    return Result<SourceSegment>::err(Status::invalid_argument("segment_size must be > 0"));
  }

  SourceSegment seg;
  seg.instance_id = s_.index;

  if (s_.source_type == MediaType::kText) {
    const std::size_t end = std::min(source_words_.size(), cursor_ + static_cast<std::size_t>(segment_size));
    for (std::size_t i = cursor_; i < end; ++i) {
      if (!seg.content.empty()) seg.content += ' ';
      seg.content += source_words_[i];
    }
    cursor_ = end;
    seg.finished = cursor_ >= source_words_.size();
  } else {
    const int rate = source_rate();
    const auto n = static_cast<std::size_t>(static_cast<double>(segment_size) * rate / 1000.0);
    const std::size_t end = std::min(source_item_.samples.size(), cursor_ + std::max<std::size_t>(n, 1));
    seg.samples.assign(source_item_.samples.begin() + static_cast<std::ptrdiff_t>(cursor_),
                       source_item_.samples.begin() + static_cast<std::ptrdiff_t>(end));
    seg.sample_rate = rate;
    cursor_ = end;
    seg.finished = cursor_ >= source_item_.samples.size();
  }

  // Compute time is measured from the moment the system has the new input.
  last_mark_ms_ = now_ms();
  return Result<SourceSegment>::ok(std::move(seg));
}

}  // namespace sim
