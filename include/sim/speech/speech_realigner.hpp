// File: include/sim/speech/speech_realigner.hpp
#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "sim/core/config.hpp"
#include "sim/core/events/event_sink.hpp"
#include "sim/core/status.hpp"
#include "sim/core/types.hpp"
#include "sim/instance/instance.hpp"
#include "sim/speech/textgrid.hpp"

namespace sim {

// Word timing of one speech prediction, in absolute milliseconds of the instance timeline.
struct BoundaryDelays {
  std::vector<double> bow;  // begin of word
  std::vector<double> eow;  // end of word
  std::vector<double> cow;  // center of word
};

// Intervals of the first tier with a non-empty label, shifted by `offset_ms`.
BoundaryDelays word_boundary_delays(const TextGrid& tg, double offset_ms);

// Recovers word-level latency of speech output from forced alignment.
//
//   <logdir>/wavs/<i>_pred.wav  ->  aligner  ->  <logdir>/align/<i>_pred.TextGrid
//
// The aligner writes into align.partial (scratch in mfa/); align/ is replaced only when it
// succeeds.
class SpeechRealigner {
 public:
  SpeechRealigner(SpeechConfig cfg, EventSink& events) : cfg_(std::move(cfg)), events_(events) {}

  // kUnavailable when the aligner is not on PATH or fails.
  Status prepare_alignment(const std::filesystem::path& logdir);

  // {"BOW": {...}, "EOW": {...}, "COW": {...}} over all given instances. Every instance needs an
  // artifact in `align_dir`; a missing one is kNotFound naming the index.
  Result<std::map<std::string, ScoreTable>> score_alignments(
      const std::vector<const Instance*>& instances, const std::filesystem::path& align_dir);

  // prepare_alignment() (unless alignment reuse is configured), then score_alignments().
  Result<std::map<std::string, ScoreTable>> latency_by_boundary(
      const std::vector<const Instance*>& instances, const std::filesystem::path& logdir);

  static std::string artifact_name(InstanceIndex index);

 private:
  SpeechConfig cfg_;
  EventSink& events_;
};

}  // namespace sim
