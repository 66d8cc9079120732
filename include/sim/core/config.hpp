// include/sim/core/config.hpp
#pragma once

#include <string>
#include <vector>

#include "sim/core/status.hpp"
#include "sim/core/types.hpp"

namespace sim {

// Units policy:
// - Text source delays in source words
// - Speech source / speech target delays in milliseconds
// - Alignment times in seconds (TextGrid convention), converted to ms on use

// -----------------------------
// Latency
// -----------------------------
enum class LatencyUnit {
  kWord,
  kChar,  // non-space characters, for unsegmented target languages
};

struct LatencyConfig {
  LatencyUnit unit = LatencyUnit::kWord;

  // Record per-unit elapsed time (delay + compute time) for speech sources.
  bool computation_aware = true;
};

// -----------------------------
// Quality
// -----------------------------
struct QualityConfig {
  std::string metric = "BLEU";
  std::string tokenizer = "13a";  // 13a | none
};

// -----------------------------
// Speech target tooling
// -----------------------------
struct AlignerConfig {
  std::string executable = "mfa";

  // Empty means ~/Documents/MFA/pretrained_models/{dictionary,acoustic}/english_mfa.*
  std::string dictionary_path;
  std::string acoustic_model_path;
};

struct AsrConfig {
  // Invoked as: <executable> <asr_prep_data> <asr_out> [args...]
  // Empty disables ASR (quality degrades to empty hypotheses).
  std::string executable;
  std::vector<std::string> args;
};

struct SpeechConfig {
  // false: reuse alignment artifacts already present under <logdir>/align.
  bool align = true;
  AlignerConfig aligner;
  AsrConfig asr;
  int sample_rate = 16000;
};

// -----------------------------
// Events
// -----------------------------
struct EventsConfig {
  bool mirror_to_stderr = true;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  std::string logdir = "out";

  MediaType source_type = MediaType::kText;
  MediaType target_type = MediaType::kText;
  ShardRange shard;

  QualityConfig quality;
  LatencyConfig latency;
  SpeechConfig speech;
  EventsConfig events;
};

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.logdir.empty()) {
    return Status::invalid_argument("logdir must not be empty");
  }
  if (cfg.shard.start_index < 0) {
    return Status::invalid_argument("shard.start_index must be >= 0");
  }
  if (cfg.shard.is_resolved() && cfg.shard.end_index < cfg.shard.start_index) {
    return Status::invalid_argument("shard.end_index must be >= shard.start_index (or < 0 for corpus end)");
  }
  if (cfg.source_type == MediaType::kText && cfg.target_type == MediaType::kSpeech) {
    return Status::invalid_argument("text source with speech target is not supported");
  }
  if (cfg.quality.metric != "BLEU") {
    return Status::invalid_argument("quality.metric must be 'BLEU'");
  }
  if (cfg.quality.tokenizer != "13a" && cfg.quality.tokenizer != "none") {
    return Status::invalid_argument("quality.tokenizer must be '13a' or 'none'");
  }
  if (cfg.speech.sample_rate <= 0) {
    return Status::invalid_argument("speech.sample_rate must be > 0");
  }
  if (cfg.speech.align && cfg.speech.aligner.executable.empty()) {
    return Status::invalid_argument("speech.aligner.executable must not be empty when speech.align is set");
  }
  return Status::ok_status();
}

}  // namespace sim
