// File: src/speech/speech_realigner.cpp
#include "sim/speech/speech_realigner.hpp"

#include <charconv>
#include <cstdlib>
#include <set>
#include <system_error>

#include "sim/latency/latency_metrics.hpp"
#include "sim/scorer/latency_aggregator.hpp"
#include "sim/speech/external_tool.hpp"

namespace sim {
namespace fs = std::filesystem;

namespace {

std::string expand_home(const std::string& p) {
  if (p.rfind("~/", 0) != 0) return p;
  const char* home = std::getenv("HOME");
  return (home != nullptr ? std::string(home) : std::string()) + p.substr(1);
}

std::string default_model_path(const char* kind, const char* file) {
  return expand_home(std::string("~/Documents/MFA/pretrained_models/") + kind + "/" + file);
}

// Leading integer of "<index>_pred.TextGrid"; -1 when there is none or it overflows.
InstanceIndex index_from_artifact(const std::string& name) {
  const std::size_t us = name.find('_');
  const std::string head = name.substr(0, us);
  if (head.empty()) return -1;
  for (const char c : head) {
    if (c < '0' || c > '9') return -1;
  }
  InstanceIndex v = -1;
  const auto [ptr, ec] = std::from_chars(head.data(), head.data() + head.size(), v);
  if (ec != std::errc() || ptr != head.data() + head.size()) return -1;
  return v;
}

}  // namespace

BoundaryDelays word_boundary_delays(const TextGrid& tg, double offset_ms) {
  BoundaryDelays out;
  if (tg.tiers.empty()) return out;
  for (const auto& iv : tg.tiers.front().intervals) {
    if (iv.label.empty()) continue;  // silence
    out.bow.push_back(offset_ms + 1000.0 * iv.min_time);
    out.eow.push_back(offset_ms + 1000.0 * iv.max_time);
    out.cow.push_back(offset_ms + 500.0 * (iv.min_time + iv.max_time));
  }
  return out;
}

std::string SpeechRealigner::artifact_name(InstanceIndex index) {
  return std::to_string(index) + "_pred.TextGrid";
}

Status SpeechRealigner::prepare_alignment(const fs::path& logdir) {
  auto exe = find_executable(cfg_.aligner.executable);
  if (!exe.ok()) {
    return Status::unavailable("forced aligner unavailable (" + exe.status().message() +
                               "); speech latency cannot be computed");
  }

  const std::string dict = cfg_.aligner.dictionary_path.empty()
                               ? default_model_path("dictionary", "english_mfa.dict")
                               : expand_home(cfg_.aligner.dictionary_path);
  const std::string acoustic = cfg_.aligner.acoustic_model_path.empty()
                                   ? default_model_path("acoustic", "english_mfa.zip")
                                   : expand_home(cfg_.aligner.acoustic_model_path);

  ScopedWorkDir scratch(logdir / "mfa");
  ScopedWorkDir staging(logdir / "align.partial");
  SIM_RETURN_IF_ERROR(scratch.create());
  SIM_RETURN_IF_ERROR(staging.create());

  const std::vector<std::string> argv{*exe,
                                      "align",
                                      (logdir / "wavs").string(),
                                      dict,
                                      acoustic,
                                      staging.path().string(),
                                      "--clean",
                                      "--overwrite",
                                      "--temporary_directory",
                                      scratch.path().string()};

  std::string cmd;
  for (const auto& a : argv) cmd += (cmd.empty() ? "" : " ") + a;
  (void)emit_event(events_, Severity::kInfo, "alignment_started", cmd);

  auto rc = run_process(argv);
  if (!rc.ok()) return rc.status();
  if (*rc != 0) {
    return Status::unavailable("forced aligner exited with " + std::to_string(*rc));
  }

  const fs::path align = logdir / "align";
  std::error_code ec;
  fs::remove_all(align, ec);
  if (ec) return Status::io_error("failed to clear " + align.string() + ": " + ec.message());
  fs::rename(staging.path(), align, ec);
  if (ec) return Status::io_error("failed to move alignment into " + align.string() + ": " + ec.message());
  staging.release();
  return Status::ok_status();
}

Result<std::map<std::string, ScoreTable>> SpeechRealigner::score_alignments(
    const std::vector<const Instance*>& instances, const fs::path& align_dir) {
  using R = Result<std::map<std::string, ScoreTable>>;
  if (instances.empty()) return R::err(Status::invalid_argument("speech latency: no instances"));

  std::set<InstanceIndex> wanted;
  for (const Instance* inst : instances) wanted.insert(inst->index());

  std::error_code ec;
  if (fs::is_directory(align_dir, ec)) {
    std::vector<InstanceIndex> unexpected;
    for (const auto& it : fs::directory_iterator(align_dir, ec)) {
      if (it.path().extension() != ".TextGrid") continue;
      const InstanceIndex idx = index_from_artifact(it.path().filename().string());
      if (idx >= 0 && wanted.count(idx) == 0) unexpected.push_back(idx);
    }
    if (!unexpected.empty()) {
      (void)emit_event(events_, Severity::kWarning, "alignment_unexpected_artifact",
                       std::to_string(unexpected.size()) + " alignment files match no instance; ignored",
                       std::move(unexpected));
    }
  }

  std::vector<MetricFamily> bow;
  std::vector<MetricFamily> eow;
  std::vector<MetricFamily> cow;
  std::vector<InstanceIndex> no_words;

  for (const Instance* inst : instances) {
    const fs::path path = align_dir / artifact_name(inst->index());
    if (!fs::exists(path, ec)) {
      return R::err(Status::not_found("no alignment for instance " + std::to_string(inst->index()) +
                                      " (" + path.string() + ")"));
    }
    auto tg = read_textgrid(path.string());
    if (!tg.ok()) return R::err(tg.status());

    const InstanceSummary& s = inst->summarize();
    const double offset = s.delays.empty() ? s.source_length : s.delays.front();

    BoundaryDelays d = word_boundary_delays(*tg, offset);
    if (d.bow.empty()) {
      // Nothing intelligible: the whole prediction counts as one word ending with the audio.
      no_words.push_back(inst->index());
      const double end = offset + 1000.0 * tg->xmax;
      d.bow = d.eow = d.cow = {end};
    }

    const double ref_len = static_cast<double>(inst->reference_length());
    auto b = eval_all_latency(d.bow, s.source_length, ref_len);
    if (!b.ok()) return R::err(b.status());
    auto e = eval_all_latency(d.eow, s.source_length, ref_len);
    if (!e.ok()) return R::err(e.status());
    auto c = eval_all_latency(d.cow, s.source_length, ref_len);
    if (!c.ok()) return R::err(c.status());

    bow.push_back(b.take_value());
    eow.push_back(e.take_value());
    cow.push_back(c.take_value());
  }

  if (!no_words.empty()) {
    (void)emit_event(events_, Severity::kWarning, "alignment_no_words",
                     std::to_string(no_words.size()) + " predictions have no aligned words",
                     std::move(no_words));
  }

  std::map<std::string, ScoreTable> out;
  auto mb = mean_metric_family(bow);
  if (!mb.ok()) return R::err(mb.status());
  auto me = mean_metric_family(eow);
  if (!me.ok()) return R::err(me.status());
  auto mc = mean_metric_family(cow);
  if (!mc.ok()) return R::err(mc.status());
  out["BOW"] = mb.take_value();
  out["EOW"] = me.take_value();
  out["COW"] = mc.take_value();
  return R::ok(std::move(out));
}

Result<std::map<std::string, ScoreTable>> SpeechRealigner::latency_by_boundary(
    const std::vector<const Instance*>& instances, const fs::path& logdir) {
  if (cfg_.align) {
    const Status st = prepare_alignment(logdir);
    if (!st.ok()) return Result<std::map<std::string, ScoreTable>>::err(st);
  }
  return score_alignments(instances, logdir / "align");
}

}  // namespace sim
