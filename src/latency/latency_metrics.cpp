// File: src/latency/latency_metrics.cpp
#include "sim/latency/latency_metrics.hpp"

#include <algorithm>
#include <numeric>

namespace sim {
namespace {

Status check_inputs(const std::vector<double>& delays, double source_length) {
  if (delays.empty()) return Status::invalid_argument("latency: no delays");
  if (!(source_length > 0.0)) return Status::invalid_argument("latency: source_length must be > 0");
  return Status::ok_status();
}

}  // namespace

Result<double> average_proportion(const std::vector<double>& delays, double source_length) {
  const Status st = check_inputs(delays, source_length);
  if (!st.ok()) return Result<double>::err(st);

  const double sum = std::accumulate(delays.begin(), delays.end(), 0.0);
  return Result<double>::ok(sum / (source_length * static_cast<double>(delays.size())));
}

Result<double> average_lagging(const std::vector<double>& delays, double source_length,
                               double target_length) {
  const Status st = check_inputs(delays, source_length);
  if (!st.ok()) return Result<double>::err(st);
  if (!(target_length > 0.0)) {
    return Result<double>::err(Status::invalid_argument("latency: target_length must be > 0"));
  }

  // Oracle system goes diagonally: i * |x| / |y|.
  const double step = source_length / target_length;

  double lagging = 0.0;
  std::size_t tau = 0;
  for (std::size_t i = 0; i < delays.size(); ++i) {
    // Count up to and including the first unit emitted with the full source read.
    if (i > 0 && delays[i - 1] >= source_length) break;
    lagging += delays[i] - static_cast<double>(i) * step;
    ++tau;
  }
  return Result<double>::ok(lagging / static_cast<double>(tau));
}

Result<double> differentiable_average_lagging(const std::vector<double>& delays,
                                              double source_length, double target_length) {
  const Status st = check_inputs(delays, source_length);
  if (!st.ok()) return Result<double>::err(st);
  if (!(target_length > 0.0)) {
    return Result<double>::err(Status::invalid_argument("latency: target_length must be > 0"));
  }

  const double step = source_length / target_length;  // 1 / gamma

  double sum = 0.0;
  double prev = 0.0;
  for (std::size_t i = 0; i < delays.size(); ++i) {
    const double d = (i == 0) ? delays[0] : std::max(delays[i], prev + step);
    sum += d - static_cast<double>(i) * step;
    prev = d;
  }
  return Result<double>::ok(sum / target_length);
}

Result<MetricFamily> eval_all_latency(const std::vector<double>& delays, double source_length,
                                      double target_length) {
  if (!(target_length > 0.0)) target_length = static_cast<double>(delays.size());

  auto al = average_lagging(delays, source_length, target_length);
  if (!al.ok()) return Result<MetricFamily>::err(al.status());
  auto ap = average_proportion(delays, source_length);
  if (!ap.ok()) return Result<MetricFamily>::err(ap.status());
  auto dal = differentiable_average_lagging(delays, source_length, target_length);
  if (!dal.ok()) return Result<MetricFamily>::err(dal.status());

  MetricFamily out;
  out["AL"] = *al;
  out["AP"] = *ap;
  out["DAL"] = *dal;
  return Result<MetricFamily>::ok(std::move(out));
}

}  // namespace sim
