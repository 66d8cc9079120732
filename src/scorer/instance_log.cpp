// File: src/scorer/instance_log.cpp
#include "sim/scorer/instance_log.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <map>
#include <sstream>
#include <system_error>

#include "sim/core/util/config_loader.hpp"
#include "sim/core/util/json_text.hpp"

namespace sim {
namespace {

std::string json_array(const std::vector<double>& v) {
  std::string out = "[";
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) out += ", ";
    out += json_number(v[i]);
  }
  out += "]";
  return out;
}

std::string json_metrics(const MetricsMap& m) {
  std::string out = "{";
  bool first_family = true;
  for (const auto& fam : m) {
    if (!first_family) out += ", ";
    first_family = false;
    out += json_quote(fam.first) + ": {";
    bool first = true;
    for (const auto& kv : fam.second) {
      if (!first) out += ", ";
      first = false;
      out += json_quote(kv.first) + ": " + json_number(kv.second);
    }
    out += "}";
  }
  out += "}";
  return out;
}

// Flat list of numbers. Absent or non-list fields read as empty.
Status read_doubles(const YAML::Node& root, const char* key, std::vector<double>* out) {
  out->clear();
  const YAML::Node n = root[key];
  if (!n || !n.IsSequence()) return Status::ok_status();
  out->reserve(n.size());
  for (const auto& x : n) {
    if (!x.IsScalar()) {
      return Status::corrupt_data(std::string("log record: \"") + key +
                                  "\" entries must be numbers, not pairs or objects");
    }
    out->push_back(x.as<double>());
  }
  return Status::ok_status();
}

bool ends_with(const std::string& s, const std::string& tail) {
  return s.size() >= tail.size() && s.compare(s.size() - tail.size(), tail.size(), tail) == 0;
}

// Required scalar field; a missing key is corrupt data rather than a default.
template <typename T>
Status read_required(const YAML::Node& root, const char* key, T* out) {
  const YAML::Node n = root[key];
  if (!n) return Status::corrupt_data(std::string("log record is missing \"") + key + "\"");
  *out = n.as<T>();
  return Status::ok_status();
}

}  // namespace

std::string to_log_line(const InstanceSummary& s) {
  std::ostringstream o;
  o << "{\"index\": " << s.index
    << ", \"source_type\": " << json_quote(media_type_name(s.source_type))
    << ", \"target_type\": " << json_quote(media_type_name(s.target_type))
    << ", \"source\": " << json_quote(s.source)
    << ", \"source_length\": " << json_number(s.source_length)
    << ", \"reference\": " << json_quote(s.reference)
    << ", \"reference_length\": " << s.reference_length
    << ", \"prediction\": " << json_quote(s.prediction)
    << ", \"prediction_length\": " << s.prediction_length
    << ", \"finish_prediction\": " << (s.finish_prediction ? "true" : "false")
    << ", \"delays\": " << json_array(s.delays);
  if (!s.elapsed.empty()) o << ", \"elapsed\": " << json_array(s.elapsed);
  if (!s.durations.empty()) o << ", \"durations\": " << json_array(s.durations);
  o << ", \"metric\": " << json_metrics(s.metrics) << "}";
  return o.str();
}

Result<InstanceSummary> parse_log_line(const std::string& line) {
  try {
    const YAML::Node root = YAML::Load(line);
    if (!root.IsMap()) {
      return Result<InstanceSummary>::err(Status::parse_error("log record is not an object"));
    }

    InstanceSummary s;
    Status st = read_required(root, "index", &s.index);
    if (!st.ok()) return Result<InstanceSummary>::err(st);
    st = read_required(root, "source_length", &s.source_length);
    if (!st.ok()) return Result<InstanceSummary>::err(st);
    st = read_required(root, "reference", &s.reference);
    if (!st.ok()) return Result<InstanceSummary>::err(st);
    st = read_required(root, "prediction", &s.prediction);
    if (!st.ok()) return Result<InstanceSummary>::err(st);

    if (root["source_type"]) {
      auto t = parse_media_type(root["source_type"].as<std::string>());
      if (!t.ok()) return Result<InstanceSummary>::err(t.status());
      s.source_type = *t;
    }
    if (root["target_type"]) {
      auto t = parse_media_type(root["target_type"].as<std::string>());
      if (!t.ok()) return Result<InstanceSummary>::err(t.status());
      s.target_type = *t;
    } else if (ends_with(s.prediction, ".wav")) {
      // Records without a target type: speech predictions are wav paths.
      s.target_type = MediaType::kSpeech;
    }

    if (root["source"]) s.source = root["source"].as<std::string>();
    s.reference_length = root["reference_length"] ? root["reference_length"].as<std::size_t>()
                                                  : split_words(s.reference).size();
    st = read_doubles(root, "delays", &s.delays);
    if (st.ok()) st = read_doubles(root, "elapsed", &s.elapsed);
    if (st.ok()) st = read_doubles(root, "durations", &s.durations);
    if (!st.ok()) return Result<InstanceSummary>::err(st.annotated("index " + std::to_string(s.index)));
    s.prediction_length = root["prediction_length"] ? root["prediction_length"].as<std::size_t>()
                                                    : s.delays.size();
    s.finish_prediction = root["finish_prediction"] ? root["finish_prediction"].as<bool>() : true;

    const YAML::Node metric = root["metric"];
    if (metric && metric.IsMap()) {
      for (const auto& fam : metric) {
        MetricFamily values;
        if (!fam.second.IsMap()) continue;  // scalar extras are not latency families
        for (const auto& kv : fam.second) values[kv.first.as<std::string>()] = kv.second.as<double>();
        s.metrics[fam.first.as<std::string>()] = std::move(values);
      }
    }

    if (s.durations.size() > s.delays.size()) {
      return Result<InstanceSummary>::err(Status::corrupt_data(
          "log record " + std::to_string(s.index) + ": more durations than delays"));
    }
    return Result<InstanceSummary>::ok(std::move(s));
  } catch (const YAML::Exception& e) {
    return Result<InstanceSummary>::err(Status::parse_error(std::string("log record: ") + e.what()));
  }
}

Result<std::vector<InstanceSummary>> read_instance_log(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      return Result<std::vector<InstanceSummary>>::err(Status::not_found("no instance log at " + path));
    }
    return Result<std::vector<InstanceSummary>>::err(Status::io_error("failed to open " + path));
  }

  std::vector<InstanceSummary> out;
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(f, line)) {
    ++lineno;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    auto rec = parse_log_line(line);
    if (!rec.ok()) {
      return Result<std::vector<InstanceSummary>>::err(
          rec.status().annotated(path + ":" + std::to_string(lineno)));
    }
    out.push_back(rec.take_value());
  }
  if (f.bad()) return Result<std::vector<InstanceSummary>>::err(Status::io_error("read error on " + path));
  return Result<std::vector<InstanceSummary>>::ok(std::move(out));
}

Status write_instance_log(const std::string& path, const std::vector<InstanceSummary>& records) {
  const std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::out | std::ios::trunc);
    if (!f.is_open()) return Status::io_error("failed to open " + tmp);
    for (const auto& r : records) f << to_log_line(r) << "\n";
    f.flush();
    if (!f) return Status::io_error("short write to " + tmp);
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return Status::io_error("failed to move " + tmp + " into place");
  }
  return Status::ok_status();
}

Result<std::vector<InstanceSummary>> merge_instance_logs(const std::vector<std::string>& paths) {
  std::map<InstanceIndex, std::pair<InstanceSummary, std::string>> merged;

  for (const auto& p : paths) {
    auto recs = read_instance_log(p);
    if (!recs.ok()) return Result<std::vector<InstanceSummary>>::err(recs.status());

    for (auto& r : recs.take_value()) {
      const InstanceIndex idx = r.index;
      auto it = merged.find(idx);
      if (it != merged.end()) {
        return Result<std::vector<InstanceSummary>>::err(Status::already_exists(
            "instance " + std::to_string(idx) + " appears in both " + it->second.second + " and " +
            p + " (overlapping shards)"));
      }
      merged.emplace(idx, std::make_pair(std::move(r), p));
    }
  }

  std::vector<InstanceSummary> out;
  out.reserve(merged.size());
  for (auto& kv : merged) out.push_back(std::move(kv.second.first));
  return Result<std::vector<InstanceSummary>>::ok(std::move(out));
}

InstanceLogWriter::~InstanceLogWriter() { close(); }

Status InstanceLogWriter::open(const std::string& path, bool truncate) {
  close();
  path_ = path;

  std::error_code ec;
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  if (ec) return Status::io_error("failed to create " + parent.string() + ": " + ec.message());

  f_.open(path, std::ios::out | (truncate ? std::ios::trunc : std::ios::app));
  if (!f_.is_open()) return Status::io_error("failed to open " + path);
  return Status::ok_status();
}

Status InstanceLogWriter::append(const InstanceSummary& s) {
  if (!f_.is_open()) return Status::invalid_argument("InstanceLogWriter: not open");
  f_ << to_log_line(s) << "\n";
  f_.flush();
  if (!f_) return Status::io_error("short write to " + path_);
  return Status::ok_status();
}

void InstanceLogWriter::close() {
  if (f_.is_open()) {
    f_.flush();
    f_.close();
  }
}

}  // namespace sim
