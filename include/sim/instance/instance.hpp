// File: include/sim/instance/instance.hpp
#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "sim/core/config.hpp"
#include "sim/core/status.hpp"
#include "sim/core/types.hpp"
#include "sim/instance/corpus.hpp"

namespace sim {

// Reply to a reveal request. Tagged with the instance index so that callers serving several
// instances (or several clients) can correlate responses.
struct SourceSegment {
  InstanceIndex instance_id{0};
  std::string content;         // text sources: revealed words joined by spaces
  std::vector<float> samples;  // speech sources: revealed samples
  int sample_rate{16000};
  bool finished{false};        // whole source revealed
};

// One increment of system output.
struct PredictionSegment {
  std::string content;         // text targets
  std::vector<float> samples;  // speech targets
  int sample_rate{16000};
  bool finished{false};        // system declared the prediction complete
};

// Everything the log persists about an instance. This is also what `summarize()` exposes.
struct InstanceSummary {
  InstanceIndex index{0};
  MediaType source_type{MediaType::kText};
  MediaType target_type{MediaType::kText};

  std::string source;  // text sources only
  double source_length{0.0};

  std::string reference;
  std::size_t reference_length{0};

  std::string prediction;  // text, or the wav path relative to the log dir for speech targets
  std::size_t prediction_length{0};
  bool finish_prediction{false};

  // One entry per emitted unit (text) or segment (speech), non-decreasing.
  std::vector<double> delays;
  // Computation-aware variant of `delays`; empty when not measured.
  std::vector<double> elapsed;
  // Speech targets: duration in ms of each emitted segment.
  std::vector<double> durations;

  MetricsMap metrics;
};

// Milliseconds from an arbitrary fixed origin.
using MillisecondClock = std::function<double()>;

struct InstanceOptions {
  LatencyUnit latency_unit{LatencyUnit::kWord};
  bool computation_aware{true};

  // Speech targets write <output_dir>/wavs/<index>_pred.wav on completion. Empty disables.
  std::filesystem::path output_dir;

  // Rate assumed for speech sources that carry none, and for prediction wavs without audio.
  int sample_rate{16000};

  // Defaults to std::chrono::steady_clock when empty.
  MillisecondClock clock;
};

// Latency unit, compute timing, sample rate and output dir (the logdir) from a run config.
InstanceOptions instance_options_from_config(const Config& cfg);

// Per-example streaming state.
//
// Lifecycle: created from a corpus entry (live) or from a log record (replay); receives reveal
// requests and prediction segments until a segment marks it finished or a scorer forces
// `sentence_level_eval()`; frozen afterwards.
class Instance {
 public:
  virtual ~Instance() = default;

  Instance(const Instance&) = delete;
  Instance& operator=(const Instance&) = delete;

  InstanceIndex index() const { return s_.index; }
  MediaType source_type() const { return s_.source_type; }
  MediaType target_type() const { return s_.target_type; }

  const std::string& reference() const { return s_.reference; }
  std::size_t reference_length() const { return s_.reference_length; }
  const std::string& prediction() const { return s_.prediction; }
  bool finish_prediction() const { return s_.finish_prediction; }
  double source_length() const { return s_.source_length; }
  const MetricsMap& metrics() const { return s_.metrics; }

  const InstanceSummary& summarize() const { return s_; }

  // Reveals the next `segment_size` source words (text) or milliseconds (speech).
  Result<SourceSegment> send_source(int segment_size);

  // Records one output increment. Rejected once the instance is finished.
  virtual Status receive_prediction(const PredictionSegment& segment) = 0;

  // Marks the instance complete and computes its metrics from what was emitted so far.
  // Already-emitted output is left untouched.
  virtual Status sentence_level_eval() = 0;

 protected:
  Instance(InstanceIndex index, SourceItem source, MediaType source_type, MediaType target_type,
           std::string reference, InstanceOptions options);
  explicit Instance(InstanceSummary restored);

  // Source amount revealed so far, in the delay unit.
  double revealed() const;

  // Adds the time since the last reveal (or prediction) to the compute budget.
  void account_compute_time();
  double compute_ms() const { return compute_ms_; }
  bool measures_elapsed() const;

  Status check_mutable() const;

  InstanceSummary s_;
  InstanceOptions options_;

 private:
  double now_ms() const;
  int source_rate() const;

  SourceItem source_item_;
  std::vector<std::string> source_words_;
  std::size_t cursor_{0};  // words or samples revealed

  double compute_ms_{0.0};
  double last_mark_ms_{-1.0};
};

// Whitespace tokenization shared by instances and scorers.
std::vector<std::string> split_words(const std::string& text);

}  // namespace sim
