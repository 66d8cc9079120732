// File: src/scorer/score_report.cpp
#include "sim/scorer/score_report.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "sim/core/util/json_text.hpp"

namespace sim {
namespace {

void append_table(std::string& out, const ScoreTable& t, int indent) {
  if (t.empty()) {
    out += "{}";
    return;
  }
  const std::string pad(static_cast<std::size_t>(indent + 4), ' ');
  out += "{\n";
  bool first = true;
  for (const auto& kv : t) {
    if (!first) out += ",\n";
    first = false;
    out += pad + json_quote(kv.first) + ": " + json_number(kv.second);
  }
  out += "\n" + std::string(static_cast<std::size_t>(indent), ' ') + "}";
}

}  // namespace

std::string to_pretty_json(const ScoreReport& report) {
  std::string out = "{\n    \"Quality\": ";
  append_table(out, report.quality, 4);
  out += ",\n    \"Latency\": ";

  if (report.latency_by_boundary.empty()) {
    append_table(out, report.latency, 4);
  } else {
    out += "{\n";
    bool first = true;
    for (const auto& kv : report.latency_by_boundary) {
      if (!first) out += ",\n";
      first = false;
      out += "        " + json_quote(kv.first) + ": ";
      append_table(out, kv.second, 8);
    }
    out += "\n    }";
  }
  out += "\n}";
  return out;
}

Status write_score_file(const std::string& path, const ScoreReport& report) {
  const std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::out | std::ios::trunc);
    if (!f.is_open()) return Status::io_error("failed to open " + tmp);
    f << to_pretty_json(report) << "\n";
    f.flush();
    if (!f) return Status::io_error("short write to " + tmp);
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return Status::io_error("failed to move " + tmp + " to " + path);
  }
  return Status::ok_status();
}

}  // namespace sim
