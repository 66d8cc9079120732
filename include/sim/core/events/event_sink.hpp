// File: include/sim/core/events/event_sink.hpp
#pragma once

#include <string>
#include <vector>

#include "sim/core/status.hpp"
#include "sim/core/types.hpp"

namespace sim {

// Diagnostics leave the library as events, never as prints.
// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  std::string logdir;
  std::string config_path;
  std::string mode;  // "text" | "speech"

  std::string config_hash;
  std::string log_fingerprint;

  TimestampNs wall_start_time_ns;
};

enum class Severity {
  kInfo,
  kWarning,
};

struct Event {
  std::string type;  // e.g. "incomplete_instance", "empty_hypothesis", "asr_unavailable"
  Severity severity = Severity::kInfo;
  TimestampNs t_wall_ns;

  // Instances the event is about (may be empty).
  std::vector<InstanceIndex> indices;

  std::string message;  // optional human-readable hint
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

// Drops everything. Used when the caller does not care about diagnostics.
class NullEventSink final : public EventSink {
 public:
  Status open(const RunInfo&) override { return Status::ok_status(); }
  Status emit(const Event&) override { return Status::ok_status(); }
  Status flush() override { return Status::ok_status(); }
  void close() override {}
};

// Fills in the wall timestamp and emits. Diagnostics are best-effort: a sink failure never
// changes a scoring result, so the status is returned for callers that want it.
Status emit_event(EventSink& sink, Severity severity, std::string type, std::string message,
                  std::vector<InstanceIndex> indices = {});

TimestampNs wall_now_epoch_ns();

}  // namespace sim
