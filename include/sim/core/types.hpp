// include/sim/core/types.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sim {

// -----------------------------
// Basic identifiers
// -----------------------------

using InstanceIndex = std::int64_t;

enum class MediaType {
  kText,
  kSpeech,
};

inline const char* media_type_name(MediaType t) {
  return t == MediaType::kSpeech ? "speech" : "text";
}

// -----------------------------
// Time
// -----------------------------
// Wall timestamps are integer nanoseconds since epoch (events only).
// Delays live in the instance's own unit (source words or milliseconds) as doubles.

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
};

// -----------------------------
// Metrics
// -----------------------------
// family ("latency", "latency_ca", ...) -> metric name ("AL", "AP", "DAL", ...) -> value.
// Families are sparse: which ones exist depends on what the instance could measure.

using MetricFamily = std::map<std::string, double>;
using MetricsMap = std::map<std::string, MetricFamily>;

// Flat name -> value table used in score reports.
using ScoreTable = std::map<std::string, double>;

// -----------------------------
// Shards
// -----------------------------

// Half-open [start_index, end_index). end_index < 0 means "through the end of the corpus"
// until resolved against a corpus size.
struct ShardRange {
  InstanceIndex start_index = 0;
  InstanceIndex end_index = -1;

  [[nodiscard]] bool is_resolved() const noexcept { return end_index >= 0; }

  [[nodiscard]] std::int64_t size() const noexcept {
    return is_resolved() ? end_index - start_index : 0;
  }

  [[nodiscard]] bool contains(InstanceIndex i) const noexcept {
    return i >= start_index && (!is_resolved() || i < end_index);
  }
};

}  // namespace sim
