// File: src/core/events/jsonl_event_sink.cpp
#include "sim/core/events/jsonl_event_sink.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

#include "sim/core/util/json_text.hpp"

namespace sim {
namespace {

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

const char* severity_name(Severity s) { return s == Severity::kWarning ? "warning" : "info"; }

}  // namespace

TimestampNs wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

Status emit_event(EventSink& sink, Severity severity, std::string type, std::string message,
                  std::vector<InstanceIndex> indices) {
  Event e;
  e.type = std::move(type);
  e.severity = severity;
  e.t_wall_ns = wall_now_epoch_ns();
  e.indices = std::move(indices);
  e.message = std::move(message);
  return sink.emit(e);
}

JsonlEventSink::~JsonlEventSink() { close(); }

Status JsonlEventSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.logdir, ec);
  if (ec) {
    return Status::io_error("failed creating logdir '" + run.logdir + "': " + ec.message());
  }

  const std::int64_t wall0 = run.wall_start_time_ns.ns;

  path_ = join_path(run.logdir, "events_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.logdir, "events_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  // Run header line (written to BOTH files).
  std::ostringstream ss;
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"t_wall_ns\":" << wall0 << ","
     << "\"logdir\":" << json_quote(run.logdir) << ","
     << "\"config_path\":" << json_quote(run.config_path) << ","
     << "\"mode\":" << json_quote(run.mode) << ","
     << "\"config_hash\":\"" << run.config_hash << "\","
     << "\"log_fingerprint\":\"" << run.log_fingerprint << "\""
     << "}";

  const Status w = write_line_(ss.str());
  if (!w.ok()) return w;
  return flush();
}

Status JsonlEventSink::emit(const Event& e) {
  if (!open_) return Status::invalid_argument("JsonlEventSink::emit called while not open");

  std::ostringstream ss;
  ss << "{"
     << "\"type\":" << json_quote(e.type) << ","
     << "\"severity\":\"" << severity_name(e.severity) << "\","
     << "\"t_wall_ns\":" << e.t_wall_ns.ns;

  if (!e.indices.empty()) {
    ss << ",\"indices\":[";
    for (std::size_t i = 0; i < e.indices.size(); ++i) {
      if (i) ss << ",";
      ss << e.indices[i];
    }
    ss << "]";
  }
  if (!e.message.empty()) {
    ss << ",\"message\":" << json_quote(e.message);
  }
  ss << "}";

  if (mirror_to_stderr_ && e.severity == Severity::kWarning) {
    std::cerr << "[warn] " << e.type << ": " << e.message << "\n";
  }

  return write_line_(ss.str());
}

Status JsonlEventSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlEventSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlEventSink::close() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace sim
