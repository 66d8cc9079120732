// File: src/core/model/score_run.cpp
#include "sim/core/model/score_run.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "sim/core/util/repro_hash.hpp"

namespace sim {
namespace {

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::int64_t parse_events_epoch_ns_from_name(const std::string& name) {
  const std::string prefix = "events_";
  const std::string suffix = ".jsonl";

  if (name == "events_latest.jsonl") return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string mid = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (!is_digits(mid) || mid.size() > 18) return -1;  // fits in int64
  return std::stoll(mid);
}

}  // namespace

ScoreRun::ScoreRun(Config cfg, std::string config_path)
    : cfg_(std::move(cfg)), config_path_(std::move(config_path)) {}

void ScoreRun::prune_events(const std::string& logdir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(logdir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(logdir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::int64_t k = parse_events_epoch_ns_from_name(it.path().filename().string());
    if (k < 0) continue;
    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status ScoreRun::start(EventSink& sink, const std::string& mode, const std::string& log_fingerprint) {
  prune_events(cfg_.logdir, /*keep_last=*/50);

  t0_wall_ns_ = wall_now_epoch_ns();

  RunInfo run;
  run.logdir = cfg_.logdir;
  run.config_path = config_path_;
  run.mode = mode;
  run.config_hash = compute_config_hash(cfg_);
  run.log_fingerprint = log_fingerprint;
  run.wall_start_time_ns = t0_wall_ns_;

  SIM_RETURN_IF_ERROR(sink.open(run));
  started_ = true;
  return Status::ok_status();
}

void ScoreRun::stop(EventSink& sink) {
  if (!started_) return;
  (void)sink.flush();
  sink.close();
  started_ = false;
}

}  // namespace sim
