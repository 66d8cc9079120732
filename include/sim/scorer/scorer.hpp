// File: include/sim/scorer/scorer.hpp
#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "sim/core/config.hpp"
#include "sim/core/events/event_sink.hpp"
#include "sim/core/status.hpp"
#include "sim/core/types.hpp"
#include "sim/scorer/instance_store.hpp"
#include "sim/scorer/quality_scorer.hpp"
#include "sim/scorer/score_report.hpp"

namespace sim {

// Combines quality and latency aggregation over one instance store.
//
// Works the same over a live store and over one rebuilt from instances.log.
class Scorer {
 public:
  virtual ~Scorer() = default;

  Scorer(const Scorer&) = delete;
  Scorer& operator=(const Scorer&) = delete;

  // Picks TextScorer or SpeechScorer by the store's target type.
  static Result<std::unique_ptr<Scorer>> create(InstanceStore store, const Config& cfg,
                                                EventSink& events);

  // Rebuilds the store from <logdir>/instances.log.
  static Result<std::unique_ptr<Scorer>> from_logdir(const std::filesystem::path& logdir,
                                                     MediaType target_type, const Config& cfg,
                                                     EventSink& events);

  // Hypotheses in index order. Unfinished instances are forced to completion first (once) and
  // reported in a single `incomplete_instance` warning.
  virtual Result<std::vector<std::string>> get_translation_list() = 0;

  std::vector<std::string> get_reference_list() const;

  // {"BLEU": x}: one call of the quality scorer over the whole shard.
  Result<ScoreTable> get_quality_score();

  virtual Result<ScoreReport> score() = 0;

  InstanceStore& store() { return store_; }
  const InstanceStore& store() const { return store_; }

 protected:
  Scorer(InstanceStore store, std::unique_ptr<QualityScorer> quality, EventSink& events,
         std::filesystem::path logdir);

  // Forces completion of every unfinished instance. No-op once everything is complete.
  Status finalize_instances_();
  void report_empty_(const std::vector<std::string>& hypotheses) const;

  InstanceStore store_;
  std::unique_ptr<QualityScorer> quality_;
  EventSink& events_;
  std::filesystem::path logdir_;
};

class TextScorer final : public Scorer {
 public:
  TextScorer(InstanceStore store, std::unique_ptr<QualityScorer> quality, EventSink& events,
             std::filesystem::path logdir = {});

  Result<std::vector<std::string>> get_translation_list() override;

  // AL / AP / DAL (+ suffixed variants) averaged over the shard.
  Result<ScoreTable> get_latency_score();

  Result<ScoreReport> score() override;
};

class SpeechScorer final : public Scorer {
 public:
  SpeechScorer(InstanceStore store, std::unique_ptr<QualityScorer> quality, EventSink& events,
               std::filesystem::path logdir, SpeechConfig speech);

  // ASR transcriptions of wavs/<i>_pred.wav.
  Result<std::vector<std::string>> get_translation_list() override;

  // {"BOW": {...}, "EOW": {...}, "COW": {...}} from forced alignment.
  Result<std::map<std::string, ScoreTable>> get_latency_score();

  // Quality first; a latency failure (no aligner, missing alignment) fails the whole report.
  Result<ScoreReport> score() override;

 private:
  SpeechConfig speech_;
};

// Scores a log directory: speech pathway when <logdir>/wavs exists, text otherwise.
// The report is written to <logdir>/scores atomically and returned.
Result<ScoreReport> compute_score(const std::filesystem::path& logdir, const Config& cfg,
                                  EventSink& events);

}  // namespace sim
