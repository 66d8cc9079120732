// File: include/sim/latency/latency_metrics.hpp
#pragma once

#include <vector>

#include "sim/core/status.hpp"
#include "sim/core/types.hpp"

namespace sim {

// Sentence-level streaming latency metrics.
//
// Inputs, for one sentence:
//   d_i  delays, one per emitted target unit, in source units (words or ms)
//   |x|  source length in the same unit
//   |y|  target length; callers pass the reference length or the number of emitted units
//
// AP  = 1 / (|x| * n) * sum_i d_i                                  (n = number of delays)
// AL  = 1 / tau * sum_{i < tau} d_i - i * |x| / |y|
//       tau = 1 + first i with d_i >= |x| (or n when the source is never fully read)
// DAL = 1 / |y| * sum_i d'_i - i * |x| / |y|
//       d'_0 = d_0, d'_i = max(d_i, d'_{i-1} + |x| / |y|)
//
// All three reject empty delays and non-positive lengths with kInvalidArgument.

Result<double> average_proportion(const std::vector<double>& delays, double source_length);

Result<double> average_lagging(const std::vector<double>& delays, double source_length,
                               double target_length);

Result<double> differentiable_average_lagging(const std::vector<double>& delays,
                                              double source_length, double target_length);

// {"AL": .., "AP": .., "DAL": ..}. target_length <= 0 uses delays.size().
Result<MetricFamily> eval_all_latency(const std::vector<double>& delays, double source_length,
                                      double target_length = 0.0);

inline constexpr const char* kLatencyMetricNames[] = {"AL", "AP", "DAL"};

}  // namespace sim
