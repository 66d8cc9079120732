// File: src/speech/external_tool.cpp
#include "sim/speech/external_tool.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <system_error>

namespace sim {
namespace fs = std::filesystem;

namespace {

bool is_executable_file(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

}  // namespace

Result<std::string> find_executable(const std::string& name) {
  if (name.empty()) return Result<std::string>::err(Status::invalid_argument("empty executable name"));

  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name)) return Result<std::string>::ok(name);
    return Result<std::string>::err(Status::unavailable(name + " is not an executable file"));
  }

  const char* env = std::getenv("PATH");
  std::istringstream dirs(env != nullptr ? env : "");
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) dir = ".";
    const fs::path candidate = fs::path(dir) / name;
    if (is_executable_file(candidate)) return Result<std::string>::ok(candidate.string());
  }
  return Result<std::string>::err(Status::unavailable(name + " not found on PATH"));
}

Result<int> run_process(const std::vector<std::string>& argv_in) {
  if (argv_in.empty()) return Result<int>::err(Status::invalid_argument("run_process: empty argv"));

  auto exe = find_executable(argv_in[0]);
  if (!exe.ok()) return Result<int>::err(exe.status());

  std::vector<std::string> argv_str = argv_in;
  std::vector<char*> argv;
  argv.reserve(argv_str.size() + 1);
  for (auto& s : argv_str) argv.push_back(s.data());
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    return Result<int>::err(Status::unavailable(std::string("fork failed: ") + std::strerror(errno)));
  }
  if (pid == 0) {
    ::execv(exe->c_str(), argv.data());
    std::cerr << "execv " << *exe << " failed: " << std::strerror(errno) << "\n";
    std::_Exit(127);
  }

  int st = 0;
  while (::waitpid(pid, &st, 0) < 0) {
    if (errno != EINTR) {
      return Result<int>::err(Status::unavailable(std::string("waitpid failed: ") + std::strerror(errno)));
    }
  }

  if (WIFEXITED(st)) {
    const int code = WEXITSTATUS(st);
    if (code == 127) return Result<int>::err(Status::unavailable("failed to exec " + *exe));
    return Result<int>::ok(code);
  }
  if (WIFSIGNALED(st)) {
    return Result<int>::err(
        Status::unavailable(*exe + " terminated by signal " + std::to_string(WTERMSIG(st))));
  }
  return Result<int>::err(Status::unavailable(*exe + " ended abnormally"));
}

ScopedWorkDir::~ScopedWorkDir() {
  if (released_) return;
  std::error_code ec;
  fs::remove_all(path_, ec);  // nothing useful to do with a failure here
}

Status ScopedWorkDir::create() {
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) return Status::io_error("failed to clear " + path_.string() + ": " + ec.message());
  fs::create_directories(path_, ec);
  if (ec) return Status::io_error("failed to create " + path_.string() + ": " + ec.message());
  return Status::ok_status();
}

}  // namespace sim
