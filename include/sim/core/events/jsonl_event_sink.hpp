// File: include/sim/core/events/jsonl_event_sink.hpp
#pragma once

#include <fstream>
#include <string>

#include "sim/core/events/event_sink.hpp"
#include "sim/core/status.hpp"

namespace sim {

// JSONL sink for scoring diagnostics.
// Writes every event line to:
//   1) a unique per-run file: <logdir>/events_<wall_start_time_ns>.jsonl
//   2) a stable "latest" file: <logdir>/events_latest.jsonl (truncated each run)
// Warnings are optionally mirrored to stderr as "[warn] <type>: <message>".
class JsonlEventSink final : public EventSink {
 public:
  explicit JsonlEventSink(bool mirror_to_stderr = false) : mirror_to_stderr_(mirror_to_stderr) {}
  ~JsonlEventSink() override;

  const std::string& path() const { return path_; }
  const std::string& latest_path() const { return latest_path_; }

  Status open(const RunInfo& run) override;
  Status emit(const Event& e) override;
  Status flush() override;
  void close() override;

 private:
  Status write_line_(const std::string& line);

  bool mirror_to_stderr_{false};
  bool open_{false};

  std::string path_;
  std::string latest_path_;

  std::ofstream f_;
  std::ofstream latest_;
};

}  // namespace sim
