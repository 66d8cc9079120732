// File: include/sim/scorer/score_report.hpp
#pragma once

#include <map>
#include <string>

#include "sim/core/status.hpp"
#include "sim/core/types.hpp"

namespace sim {

// {"Quality": {...}, "Latency": {...}}.
// Text scoring fills `latency`; speech scoring fills `latency_by_boundary` (BOW / EOW / COW).
struct ScoreReport {
  ScoreTable quality;
  ScoreTable latency;
  std::map<std::string, ScoreTable> latency_by_boundary;
};

// Four-space indented JSON, keys sorted.
std::string to_pretty_json(const ScoreReport& report);

// Writes through <path>.tmp and rename so readers never see a partial file.
Status write_score_file(const std::string& path, const ScoreReport& report);

}  // namespace sim
