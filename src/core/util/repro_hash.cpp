// File: src/core/util/repro_hash.cpp
#include "sim/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

namespace sim {
namespace {

// FNV-1a 64-bit. Not cryptographic; stable across runs and hosts of the same endianness.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Length first so ("ab","c") != ("a","bc").
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) { add_u64(std::bit_cast<std::uint64_t>(v)); }

  void add_doubles(const std::vector<double>& v) {
    add_u64(static_cast<std::uint64_t>(v.size()));
    for (const double x : v) add_double(x);
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_media(Fnv1a64& h, MediaType t) { h.add_i32(t == MediaType::kSpeech ? 2 : 1); }

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  h.add_string(cfg.logdir);
  add_media(h, cfg.source_type);
  add_media(h, cfg.target_type);
  h.add_i64(cfg.shard.start_index);
  h.add_i64(cfg.shard.end_index);

  // Quality.
  h.add_string(cfg.quality.metric);
  h.add_string(cfg.quality.tokenizer);

  // Latency.
  h.add_i32(cfg.latency.unit == LatencyUnit::kChar ? 2 : 1);
  h.add_bool(cfg.latency.computation_aware);

  // Speech tooling. Paths change what the aligner and ASR produce.
  h.add_bool(cfg.speech.align);
  h.add_string(cfg.speech.aligner.executable);
  h.add_string(cfg.speech.aligner.dictionary_path);
  h.add_string(cfg.speech.aligner.acoustic_model_path);
  h.add_string(cfg.speech.asr.executable);
  h.add_u64(static_cast<std::uint64_t>(cfg.speech.asr.args.size()));
  for (const auto& a : cfg.speech.asr.args) h.add_string(a);
  h.add_i32(cfg.speech.sample_rate);

  return to_hex(h.h);
}

std::string compute_log_fingerprint(const std::vector<InstanceSummary>& records) {
  Fnv1a64 h;
  h.add_u64(static_cast<std::uint64_t>(records.size()));

  for (const auto& r : records) {
    h.add_i64(r.index);
    add_media(h, r.source_type);
    add_media(h, r.target_type);
    h.add_double(r.source_length);
    h.add_string(r.reference);
    h.add_string(r.prediction);
    h.add_bool(r.finish_prediction);
    h.add_doubles(r.delays);
    h.add_doubles(r.elapsed);
    h.add_doubles(r.durations);

    // std::map iteration order is sorted, so this is stable.
    for (const auto& fam : r.metrics) {
      h.add_string(fam.first);
      for (const auto& kv : fam.second) {
        h.add_string(kv.first);
        h.add_double(kv.second);
      }
    }
  }
  return to_hex(h.h);
}

}  // namespace sim
