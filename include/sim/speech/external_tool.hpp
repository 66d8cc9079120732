// File: include/sim/speech/external_tool.hpp
#pragma once

#include <filesystem>
#include <utility>
#include <string>
#include <vector>

#include "sim/core/status.hpp"

namespace sim {

// Absolute path of `name` on PATH (or `name` itself when it contains a '/' and is executable).
// kUnavailable when nothing executable is found.
Result<std::string> find_executable(const std::string& name);

// Runs argv[0] (resolved through PATH) with the given arguments and waits for it.
// Returns the exit code; a failed fork, exec or abnormal termination is kUnavailable.
Result<int> run_process(const std::vector<std::string>& argv);

// Directory that exists for the lifetime of the object: cleared on creation, removed on
// destruction unless released.
class ScopedWorkDir {
 public:
  explicit ScopedWorkDir(std::filesystem::path path) : path_(std::move(path)) {}
  ~ScopedWorkDir();

  ScopedWorkDir(const ScopedWorkDir&) = delete;
  ScopedWorkDir& operator=(const ScopedWorkDir&) = delete;

  // Removes anything left from a previous run and creates the directory.
  Status create();

  // Keep the directory on destruction.
  void release() { released_ = true; }

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
  bool released_{false};
};

}  // namespace sim
