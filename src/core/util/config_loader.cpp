// src/core/util/config_loader.cpp
#include "sim/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <yaml-cpp/yaml.h>

namespace sim {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }
static bool is_scalar(const YAML::Node& n) { return n && n.IsScalar(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path) {
  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["base.yaml", "speech.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child);
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

Result<MediaType> parse_media_type(const std::string& name) {
  const auto s = to_lower(name);
  if (s == "text") return Result<MediaType>::ok(MediaType::kText);
  if (s == "speech") return Result<MediaType>::ok(MediaType::kSpeech);
  return Result<MediaType>::err(Status::invalid_argument("unknown media type: " + name));
}

static Result<MediaType> parse_media_node(const YAML::Node& n, const char* what) {
  if (!is_scalar(n)) {
    return Result<MediaType>::err(Status::invalid_argument(std::string(what) + " must be a string"));
  }
  return parse_media_type(n.as<std::string>());
}

static Result<LatencyUnit> parse_latency_unit(const YAML::Node& n) {
  if (!is_scalar(n)) return Result<LatencyUnit>::err(Status::invalid_argument("latency.unit must be a string"));
  const auto s = to_lower(n.as<std::string>());
  if (s == "word") return Result<LatencyUnit>::ok(LatencyUnit::kWord);
  if (s == "char") return Result<LatencyUnit>::ok(LatencyUnit::kChar);
  return Result<LatencyUnit>::err(Status::invalid_argument("unknown latency.unit: " + s));
}

static Status apply_yaml(const YAML::Node& y, Config& cfg) {
  maybe_set(y, "logdir", cfg.logdir);

  if (y["source_type"]) {
    auto t = parse_media_node(y["source_type"], "source_type");
    if (!t.ok()) return t.status();
    cfg.source_type = t.take_value();
  }
  if (y["target_type"]) {
    auto t = parse_media_node(y["target_type"], "target_type");
    if (!t.ok()) return t.status();
    cfg.target_type = t.take_value();
  }

  // --- shard
  if (is_map(y["shard"])) {
    const auto s = y["shard"];
    maybe_set(s, "start_index", cfg.shard.start_index);
    maybe_set(s, "end_index", cfg.shard.end_index);
  }

  // --- quality
  if (is_map(y["quality"])) {
    const auto q = y["quality"];
    maybe_set(q, "metric", cfg.quality.metric);
    maybe_set(q, "tokenizer", cfg.quality.tokenizer);
  }

  // --- latency
  if (is_map(y["latency"])) {
    const auto l = y["latency"];
    if (l["unit"]) {
      auto u = parse_latency_unit(l["unit"]);
      if (!u.ok()) return u.status();
      cfg.latency.unit = u.take_value();
    }
    maybe_set(l, "computation_aware", cfg.latency.computation_aware);
  }

  // --- speech
  if (is_map(y["speech"])) {
    const auto s = y["speech"];
    maybe_set(s, "align", cfg.speech.align);
    maybe_set(s, "sample_rate", cfg.speech.sample_rate);

    if (is_map(s["aligner"])) {
      const auto a = s["aligner"];
      maybe_set(a, "executable", cfg.speech.aligner.executable);
      maybe_set(a, "dictionary_path", cfg.speech.aligner.dictionary_path);
      maybe_set(a, "acoustic_model_path", cfg.speech.aligner.acoustic_model_path);
    }
    if (is_map(s["asr"])) {
      const auto a = s["asr"];
      maybe_set(a, "executable", cfg.speech.asr.executable);
      if (a["args"]) {
        if (!a["args"].IsSequence()) return Status::invalid_argument("speech.asr.args must be a YAML sequence");
        cfg.speech.asr.args = a["args"].as<std::vector<std::string>>();
      }
    }
  }

  // --- events
  if (is_map(y["events"])) {
    maybe_set(y["events"], "mirror_to_stderr", cfg.events.mirror_to_stderr);
  }

  return Status::ok_status();
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes(path);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  const YAML::Node y = yaml_r.take_value();

  Config cfg;  // defaults

  try {
    const Status st = apply_yaml(y, cfg);
    if (!st.ok()) return Result<Config>::err(st);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error("bad value in " + path.string() + ": " + e.what()));
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

}  // namespace sim
