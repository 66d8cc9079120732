// File: include/sim/scorer/instance_log.hpp
#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "sim/core/status.hpp"
#include "sim/instance/instance.hpp"

namespace sim {

// instances.log: one JSON object per line, self-describing through its "index" field.
//
// Doubles are written with the shortest representation that reads back to the same bits, so
// replaying a log reproduces live scores exactly.

inline constexpr const char* kInstanceLogName = "instances.log";

std::string to_log_line(const InstanceSummary& s);
Result<InstanceSummary> parse_log_line(const std::string& line);

// Blank lines are skipped. Parse errors name the line number.
Result<std::vector<InstanceSummary>> read_instance_log(const std::string& path);

// Writes all records to `path` through a temporary file and rename.
Status write_instance_log(const std::string& path, const std::vector<InstanceSummary>& records);

// Union of shard logs keyed by index, in index order. A repeated index is kAlreadyExists.
Result<std::vector<InstanceSummary>> merge_instance_logs(const std::vector<std::string>& paths);

// Appends completed instances during a live run.
class InstanceLogWriter {
 public:
  InstanceLogWriter() = default;
  ~InstanceLogWriter();

  InstanceLogWriter(const InstanceLogWriter&) = delete;
  InstanceLogWriter& operator=(const InstanceLogWriter&) = delete;

  // truncate=false keeps existing lines (resuming a shard).
  Status open(const std::string& path, bool truncate);
  Status append(const InstanceSummary& s);
  void close();

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::ofstream f_;
};

}  // namespace sim
