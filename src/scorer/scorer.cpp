// File: src/scorer/scorer.cpp
#include "sim/scorer/scorer.hpp"

#include <system_error>
#include <utility>

#include "sim/instance/instance_factory.hpp"
#include "sim/scorer/instance_log.hpp"
#include "sim/scorer/latency_aggregator.hpp"
#include "sim/speech/asr_transcriber.hpp"
#include "sim/speech/speech_realigner.hpp"

namespace sim {
namespace fs = std::filesystem;

Scorer::Scorer(InstanceStore store, std::unique_ptr<QualityScorer> quality, EventSink& events,
               fs::path logdir)
    : store_(std::move(store)), quality_(std::move(quality)), events_(events), logdir_(std::move(logdir)) {}

Result<std::unique_ptr<Scorer>> Scorer::create(InstanceStore store, const Config& cfg,
                                               EventSink& events) {
  auto quality = make_quality_scorer(cfg.quality);
  if (!quality.ok()) return Result<std::unique_ptr<Scorer>>::err(quality.status());

  std::unique_ptr<Scorer> out;
  if (store.target_type() == MediaType::kSpeech) {
    out = std::make_unique<SpeechScorer>(std::move(store), quality.take_value(), events,
                                         fs::path(cfg.logdir), cfg.speech);
  } else {
    out = std::make_unique<TextScorer>(std::move(store), quality.take_value(), events,
                                       fs::path(cfg.logdir));
  }
  return Result<std::unique_ptr<Scorer>>::ok(std::move(out));
}

Result<std::unique_ptr<Scorer>> Scorer::from_logdir(const fs::path& logdir, MediaType target_type,
                                                    const Config& cfg, EventSink& events) {
  using R = Result<std::unique_ptr<Scorer>>;

  auto records = read_instance_log((logdir / kInstanceLogName).string());
  if (!records.ok()) return R::err(records.status());

  std::vector<std::unique_ptr<Instance>> instances;
  instances.reserve(records->size());
  for (auto& rec : records.take_value()) {
    if (rec.target_type != target_type) {
      return R::err(Status::invalid_argument(
          "instance " + std::to_string(rec.index) + " has a " + media_type_name(rec.target_type) +
          " target but the log is scored as " + media_type_name(target_type)));
    }
    auto inst = restore_instance(std::move(rec));
    if (!inst.ok()) return R::err(inst.status());
    instances.push_back(inst.take_value());
  }

  auto store = InstanceStore::from_instances(std::move(instances), events);
  if (!store.ok()) return R::err(store.status());

  Config scoped = cfg;
  scoped.logdir = logdir.string();
  return create(store.take_value(), scoped, events);
}

std::vector<std::string> Scorer::get_reference_list() const {
  std::vector<std::string> out;
  out.reserve(store_.size());
  for (const Instance* inst : store_.ordered()) out.push_back(inst->reference());
  return out;
}

Status Scorer::finalize_instances_() {
  std::vector<Instance*> unfinished;
  for (Instance* inst : store_.ordered()) {
    if (!inst->finish_prediction()) unfinished.push_back(inst);
  }
  if (unfinished.empty()) return Status::ok_status();

  std::vector<InstanceIndex> ids;
  ids.reserve(unfinished.size());
  for (const Instance* inst : unfinished) ids.push_back(inst->index());
  (void)emit_event(events_, Severity::kWarning, "incomplete_instance",
                   std::to_string(ids.size()) + " predictions never finished; scoring what was emitted",
                   std::move(ids));

  for (Instance* inst : unfinished) SIM_RETURN_IF_ERROR(inst->sentence_level_eval());
  return Status::ok_status();
}

void Scorer::report_empty_(const std::vector<std::string>& hypotheses) const {
  std::vector<InstanceIndex> empty;
  const auto indices = store_.indices();
  for (std::size_t k = 0; k < hypotheses.size() && k < indices.size(); ++k) {
    if (hypotheses[k].empty()) empty.push_back(indices[k]);
  }
  if (empty.empty()) return;
  (void)emit_event(events_, Severity::kWarning, "empty_hypothesis",
                   std::to_string(empty.size()) + " hypotheses are empty", std::move(empty));
}

Result<ScoreTable> Scorer::get_quality_score() {
  auto hyps = get_translation_list();
  if (!hyps.ok()) return Result<ScoreTable>::err(hyps.status());

  auto value = quality_->corpus_score(*hyps, get_reference_list());
  if (!value.ok()) return Result<ScoreTable>::err(value.status());

  ScoreTable out;
  out[quality_->name()] = *value;
  return Result<ScoreTable>::ok(std::move(out));
}

// -----------------------------
// Text
// -----------------------------

TextScorer::TextScorer(InstanceStore store, std::unique_ptr<QualityScorer> quality,
                       EventSink& events, fs::path logdir)
    : Scorer(std::move(store), std::move(quality), events, std::move(logdir)) {}

Result<std::vector<std::string>> TextScorer::get_translation_list() {
  using R = Result<std::vector<std::string>>;
  SIM_RETURN_IF_ERROR_R(finalize_instances_(), R);

  std::vector<std::string> out;
  out.reserve(store_.size());
  for (const Instance* inst : store_.ordered()) out.push_back(inst->prediction());
  report_empty_(out);
  return R::ok(std::move(out));
}

Result<ScoreTable> TextScorer::get_latency_score() {
  SIM_RETURN_IF_ERROR_R(finalize_instances_(), Result<ScoreTable>);

  std::vector<const MetricsMap*> metrics;
  metrics.reserve(store_.size());
  for (const Instance* inst : store_.ordered()) {
    if (inst->metrics().count("latency") == 0) {
      return Result<ScoreTable>::err(Status::corrupt_data(
          "instance " + std::to_string(inst->index()) + " is finished but has no latency metrics"));
    }
    metrics.push_back(&inst->metrics());
  }
  return aggregate_latency(metrics);
}

Result<ScoreReport> TextScorer::score() {
  auto quality = get_quality_score();
  if (!quality.ok()) return Result<ScoreReport>::err(quality.status());
  auto latency = get_latency_score();
  if (!latency.ok()) return Result<ScoreReport>::err(latency.status());

  ScoreReport report;
  report.quality = quality.take_value();
  report.latency = latency.take_value();
  return Result<ScoreReport>::ok(std::move(report));
}

// -----------------------------
// Speech
// -----------------------------

SpeechScorer::SpeechScorer(InstanceStore store, std::unique_ptr<QualityScorer> quality,
                           EventSink& events, fs::path logdir, SpeechConfig speech)
    : Scorer(std::move(store), std::move(quality), events, std::move(logdir)),
      speech_(std::move(speech)) {}

Result<std::vector<std::string>> SpeechScorer::get_translation_list() {
  using R = Result<std::vector<std::string>>;
  SIM_RETURN_IF_ERROR_R(finalize_instances_(), R);

  AsrTranscriber asr(speech_.asr, events_);
  auto hyps = asr.transcribe(logdir_, store_.indices());
  if (!hyps.ok()) return hyps;
  report_empty_(*hyps);
  return hyps;
}

Result<std::map<std::string, ScoreTable>> SpeechScorer::get_latency_score() {
  using R = Result<std::map<std::string, ScoreTable>>;
  SIM_RETURN_IF_ERROR_R(finalize_instances_(), R);

  const std::vector<const Instance*> instances = std::as_const(store_).ordered();
  SpeechRealigner realigner(speech_, events_);
  return realigner.latency_by_boundary(instances, logdir_);
}

Result<ScoreReport> SpeechScorer::score() {
  auto quality = get_quality_score();
  if (!quality.ok()) return Result<ScoreReport>::err(quality.status());
  auto latency = get_latency_score();
  if (!latency.ok()) return Result<ScoreReport>::err(latency.status());

  ScoreReport report;
  report.quality = quality.take_value();
  report.latency_by_boundary = latency.take_value();
  return Result<ScoreReport>::ok(std::move(report));
}

// -----------------------------
// Log directory entry point
// -----------------------------

Result<ScoreReport> compute_score(const fs::path& logdir, const Config& cfg, EventSink& events) {
  std::error_code ec;
  const MediaType mode = fs::is_directory(logdir / "wavs", ec) ? MediaType::kSpeech : MediaType::kText;

  auto scorer = Scorer::from_logdir(logdir, mode, cfg, events);
  if (!scorer.ok()) return Result<ScoreReport>::err(scorer.status());

  auto report = (*scorer)->score();
  if (!report.ok()) return report;

  const fs::path out = logdir / "scores";
  SIM_RETURN_IF_ERROR_R(write_score_file(out.string(), *report), Result<ScoreReport>);
  (void)emit_event(events, Severity::kInfo, "score_written", out.string());
  return report;
}

}  // namespace sim
