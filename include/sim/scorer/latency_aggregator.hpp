// File: include/sim/scorer/latency_aggregator.hpp
#pragma once

#include <set>
#include <string>
#include <vector>

#include "sim/core/status.hpp"
#include "sim/core/types.hpp"

namespace sim {

// Family keys present in every given metrics map. Empty input gives an empty set.
std::set<std::string> common_metric_families(const std::vector<const MetricsMap*>& per_instance);

// Report-key suffix of a latency family; false for non-latency families:
//   latency -> "", latency_ca -> "_CA", latency_text_w_time -> " (Time in ms)",
//   latency_<x> -> "_<X>".
bool latency_family_suffix(const std::string& family, std::string* suffix);

// Unweighted per-instance mean of AL, AP and DAL for every latency family present in all
// instances. Optional families missing from any instance are left out; an instance without the
// base "latency" family is kCorruptData. No instances is kInvalidArgument.
Result<ScoreTable> aggregate_latency(const std::vector<const MetricsMap*>& per_instance);

// Mean of every metric of one family across instances, keyed by metric name. Used by the
// boundary-convention reports, where each instance contributes one family.
Result<ScoreTable> mean_metric_family(const std::vector<MetricFamily>& per_instance);

}  // namespace sim
