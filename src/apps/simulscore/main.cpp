// File: src/apps/simulscore/main.cpp
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "sim/core/events/jsonl_event_sink.hpp"
#include "sim/core/model/score_run.hpp"
#include "sim/core/util/config_loader.hpp"
#include "sim/core/util/repro_hash.hpp"
#include "sim/scorer/instance_log.hpp"
#include "sim/scorer/scorer.hpp"
#include "sim/scorer/shard_merge.hpp"

namespace {

struct Args {
  std::string config_path;
  std::string logdir;
  std::string merge_out;
  std::vector<std::string> merge_shards;
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--logdir" && i + 1 < argc) {
      a.logdir = argv[++i];
      continue;
    }
    if (s == "--merge" && i + 1 < argc) {
      a.merge_out = argv[++i];
      while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
        a.merge_shards.push_back(argv[++i]);
      }
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "simulscore\n"
            << "  --logdir <dir> [--config <path>]\n"
            << "  --merge <out_dir> <shard_dir>... [--config <path>]\n";
}

bool usage_ok(const Args& a) {
  const bool score = !a.logdir.empty();
  const bool merge = !a.merge_out.empty();
  if (score == merge) return false;
  return !merge || !a.merge_shards.empty();
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || !usage_ok(args)) {
    print_usage();
    return args.help ? 0 : 2;
  }

  sim::Config cfg;
  if (!args.config_path.empty()) {
    auto cfg_r = sim::load_config(args.config_path);
    if (!cfg_r.ok()) {
      std::cerr << cfg_r.status().message() << "\n";
      return 1;
    }
    cfg = cfg_r.take_value();
  }

  const bool merging = !args.merge_out.empty();
  cfg.logdir = merging ? args.merge_out : args.logdir;

  const sim::Status st_cfg = sim::validate_config(cfg);
  if (!st_cfg.ok()) {
    std::cerr << st_cfg.message() << "\n";
    return 1;
  }

  std::string fingerprint;
  std::string mode = "merge";
  if (!merging) {
    std::error_code ec;
    mode = std::filesystem::is_directory(std::filesystem::path(cfg.logdir) / "wavs", ec) ? "speech" : "text";
    // An unreadable log is reported by compute_score below.
    auto recs = sim::read_instance_log(
        (std::filesystem::path(cfg.logdir) / sim::kInstanceLogName).string());
    if (recs.ok()) fingerprint = sim::compute_log_fingerprint(*recs);
  }

  sim::ScoreRun run(cfg, args.config_path);
  sim::JsonlEventSink sink(cfg.events.mirror_to_stderr);

  const sim::Status st_start = run.start(sink, mode, fingerprint);
  if (!st_start.ok()) {
    std::cerr << st_start.message() << "\n";
    return 2;
  }

  // Always close/flush the events file.
  struct Guard {
    sim::ScoreRun& r;
    sim::JsonlEventSink& s;
    ~Guard() { r.stop(s); }
  } guard{run, sink};

  if (merging) {
    std::vector<std::filesystem::path> shards(args.merge_shards.begin(), args.merge_shards.end());
    auto merged = sim::merge_shard_dirs(cfg.logdir, shards, sink);
    if (!merged.ok()) {
      std::cerr << merged.status().message() << "\n";
      return 1;
    }
    std::cout << "Merged " << merged->size() << " instances into " << cfg.logdir << "\n";
  }

  auto report = sim::compute_score(cfg.logdir, cfg, sink);
  if (!report.ok()) {
    std::cerr << report.status().message() << "\n";
    return 1;
  }

  std::cout << sim::to_pretty_json(*report) << "\n";
  return 0;
}
