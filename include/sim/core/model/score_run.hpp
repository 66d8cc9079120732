// File: include/sim/core/model/score_run.hpp
#pragma once

#include <cstddef>
#include <string>

#include "sim/core/config.hpp"
#include "sim/core/events/event_sink.hpp"
#include "sim/core/status.hpp"
#include "sim/core/types.hpp"

namespace sim {

// ScoreRun owns the lifecycle of one scoring invocation's diagnostics: it prunes stale
// events files, opens the sink with the run header and closes it at the end.
class ScoreRun {
 public:
  ScoreRun(Config cfg, std::string config_path);

  // mode: "text" | "speech" | "merge". log_fingerprint may be empty when no log was read yet.
  Status start(EventSink& sink, const std::string& mode, const std::string& log_fingerprint);

  void stop(EventSink& sink);

  bool started() const { return started_; }
  TimestampNs wall_start() const { return t0_wall_ns_; }

  // Keeps the newest `keep_last` events_<ns>.jsonl files in `logdir`; events_latest.jsonl is
  // never touched.
  static void prune_events(const std::string& logdir, std::size_t keep_last);

 private:
  Config cfg_;
  std::string config_path_;

  TimestampNs t0_wall_ns_{0};
  bool started_{false};
};

}  // namespace sim
