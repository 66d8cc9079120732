// File: src/scorer/latency_aggregator.cpp
#include "sim/scorer/latency_aggregator.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>

#include "sim/latency/latency_metrics.hpp"

namespace sim {

std::set<std::string> common_metric_families(const std::vector<const MetricsMap*>& per_instance) {
  std::set<std::string> common;
  bool first = true;
  for (const MetricsMap* m : per_instance) {
    std::set<std::string> keys;
    if (m != nullptr) {
      for (const auto& kv : *m) keys.insert(kv.first);
    }
    if (first) {
      common = std::move(keys);
      first = false;
      continue;
    }
    std::set<std::string> both;
    std::set_intersection(common.begin(), common.end(), keys.begin(), keys.end(),
                          std::inserter(both, both.begin()));
    common = std::move(both);
  }
  return common;
}

bool latency_family_suffix(const std::string& family, std::string* suffix) {
  static const std::string kPrefix = "latency_";
  if (family == "latency") {
    *suffix = "";
    return true;
  }
  if (family == "latency_ca") {
    *suffix = "_CA";
    return true;
  }
  if (family == "latency_text_w_time") {
    *suffix = " (Time in ms)";
    return true;
  }
  if (family.size() > kPrefix.size() && family.compare(0, kPrefix.size(), kPrefix) == 0) {
    std::string tail = family.substr(kPrefix.size());
    std::transform(tail.begin(), tail.end(), tail.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    *suffix = "_" + tail;
    return true;
  }
  return false;
}

Result<ScoreTable> aggregate_latency(const std::vector<const MetricsMap*>& per_instance) {
  if (per_instance.empty()) {
    return Result<ScoreTable>::err(Status::invalid_argument("latency: no instances to aggregate"));
  }

  // AL/AP/DAL are always reported; only the optional families may drop out.
  for (std::size_t k = 0; k < per_instance.size(); ++k) {
    const MetricsMap* m = per_instance[k];
    if (m == nullptr || m->count("latency") == 0) {
      return Result<ScoreTable>::err(Status::corrupt_data(
          "latency: entry " + std::to_string(k) + " of " + std::to_string(per_instance.size()) +
          " has no 'latency' metrics"));
    }
  }

  const double n = static_cast<double>(per_instance.size());
  ScoreTable out;
  for (const auto& family : common_metric_families(per_instance)) {
    std::string suffix;
    if (!latency_family_suffix(family, &suffix)) continue;

    for (const char* metric : kLatencyMetricNames) {
      double sum = 0.0;
      bool complete = true;
      for (const MetricsMap* m : per_instance) {
        const MetricFamily& values = m->at(family);
        auto it = values.find(metric);
        if (it == values.end()) {
          complete = false;
          break;
        }
        sum += it->second;
      }
      if (complete) out[std::string(metric) + suffix] = sum / n;
    }
  }
  return Result<ScoreTable>::ok(std::move(out));
}

Result<ScoreTable> mean_metric_family(const std::vector<MetricFamily>& per_instance) {
  if (per_instance.empty()) {
    return Result<ScoreTable>::err(Status::invalid_argument("latency: no instances to aggregate"));
  }

  ScoreTable out;
  for (const auto& kv : per_instance.front()) {
    double sum = 0.0;
    bool complete = true;
    for (const auto& fam : per_instance) {
      auto it = fam.find(kv.first);
      if (it == fam.end()) {
        complete = false;
        break;
      }
      sum += it->second;
    }
    if (complete) out[kv.first] = sum / static_cast<double>(per_instance.size());
  }
  return Result<ScoreTable>::ok(std::move(out));
}

}  // namespace sim
