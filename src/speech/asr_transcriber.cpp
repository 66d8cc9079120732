// File: src/speech/asr_transcriber.cpp
#include "sim/speech/asr_transcriber.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

#include "sim/instance/speech_output_instance.hpp"
#include "sim/speech/external_tool.hpp"
#include "sim/speech/wav_io.hpp"

namespace sim {
namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_tabs(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  std::istringstream in(line);
  while (std::getline(in, field, '\t')) out.push_back(field);
  return out;
}

std::string to_lower_ascii(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// "..._<index>" -> index. False when there is no numeric tail or it overflows.
bool index_from_id(const std::string& id, InstanceIndex* out) {
  const std::size_t us = id.find_last_of('_');
  const std::string tail = us == std::string::npos ? id : id.substr(us + 1);
  if (tail.empty() || !std::all_of(tail.begin(), tail.end(),
                                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(tail.data(), tail.data() + tail.size(), *out);
  return ec == std::errc() && ptr == tail.data() + tail.size();
}

}  // namespace

Status AsrTranscriber::write_manifest_(const fs::path& logdir,
                                       const std::vector<InstanceIndex>& indices) const {
  const fs::path wavs = fs::absolute(logdir / "wavs");
  const fs::path manifest = logdir / "asr_prep_data" / "eval.tsv";

  std::ofstream f(manifest, std::ios::out | std::ios::trunc);
  if (!f.is_open()) return Status::io_error("failed to open " + manifest.string());

  f << wavs.string() << "\n";
  for (const InstanceIndex i : indices) {
    const fs::path wav = logdir / SpeechOutputInstance::wav_relpath(i);
    auto info = read_wav_info(wav.string());
    if (!info.ok()) return info.status();
    f << wav.filename().string() << "\t" << info->num_frames << "\n";
  }
  f.flush();
  if (!f) return Status::io_error("short write to " + manifest.string());
  return Status::ok_status();
}

Result<std::vector<std::string>> AsrTranscriber::read_predictions_(
    const fs::path& tsv, const std::vector<InstanceIndex>& indices) {
  std::ifstream f(tsv);
  if (!f.is_open()) {
    return Result<std::vector<std::string>>::err(Status::not_found("ASR output missing: " + tsv.string()));
  }

  std::string line;
  if (!std::getline(f, line)) {
    return Result<std::vector<std::string>>::err(Status::corrupt_data("empty ASR output " + tsv.string()));
  }

  std::size_t id_col = 0;
  std::size_t text_col = 1;
  const auto header = split_tabs(line);
  for (std::size_t c = 0; c < header.size(); ++c) {
    if (header[c] == "id") id_col = c;
    if (header[c] == "transcription") text_col = c;
  }

  std::map<InstanceIndex, std::string> by_index;
  while (std::getline(f, line)) {
    if (line.empty()) continue;
    const auto cols = split_tabs(line);
    if (cols.size() <= id_col) continue;

    InstanceIndex idx = 0;
    if (!index_from_id(cols[id_col], &idx)) {
      return Result<std::vector<std::string>>::err(
          Status::corrupt_data("ASR output id without instance index: '" + cols[id_col] + "'"));
    }
    by_index[idx] = text_col < cols.size() ? to_lower_ascii(cols[text_col]) : std::string();
  }

  std::vector<std::string> out;
  std::vector<InstanceIndex> missing;
  out.reserve(indices.size());
  for (const InstanceIndex i : indices) {
    auto it = by_index.find(i);
    if (it == by_index.end()) {
      missing.push_back(i);
      out.emplace_back();
    } else {
      out.push_back(it->second);
    }
  }
  if (!missing.empty()) {
    (void)emit_event(events_, Severity::kWarning, "asr_missing_transcript",
                     std::to_string(missing.size()) + " predictions have no transcription",
                     std::move(missing));
  }
  return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<std::vector<std::string>> AsrTranscriber::transcribe(const fs::path& logdir,
                                                            const std::vector<InstanceIndex>& indices) {
  using R = Result<std::vector<std::string>>;
  const std::vector<std::string> empty(indices.size());

  (void)emit_event(events_, Severity::kWarning, "speech_beta", "evaluating speech output");

  if (cfg_.executable.empty()) {
    (void)emit_event(events_, Severity::kWarning, "asr_unavailable",
                     "no ASR executable configured; all hypotheses are empty");
    return R::ok(empty);
  }
  auto exe = find_executable(cfg_.executable);
  if (!exe.ok()) {
    (void)emit_event(events_, Severity::kWarning, "asr_unavailable",
                     exe.status().message() + "; all hypotheses are empty");
    return R::ok(empty);
  }

  ScopedWorkDir prep(logdir / "asr_prep_data");
  SIM_RETURN_IF_ERROR_R(prep.create(), R);
  SIM_RETURN_IF_ERROR_R(write_manifest_(logdir, indices), R);
  prep.release();

  const fs::path out_dir = logdir / "asr_out";
  ScopedWorkDir staging(logdir / "asr_out.partial");
  SIM_RETURN_IF_ERROR_R(staging.create(), R);

  std::vector<std::string> argv{*exe, prep.path().string(), staging.path().string()};
  argv.insert(argv.end(), cfg_.args.begin(), cfg_.args.end());

  auto rc = run_process(argv);
  if (!rc.ok() || *rc != 0) {
    const std::string why = rc.ok() ? cfg_.executable + " exited with " + std::to_string(*rc)
                                    : rc.status().message();
    (void)emit_event(events_, Severity::kWarning, "asr_unavailable", why + "; all hypotheses are empty");
    return R::ok(empty);
  }

  std::error_code ec;
  fs::remove_all(out_dir, ec);
  fs::rename(staging.path(), out_dir, ec);
  if (ec) return R::err(Status::io_error("failed to move ASR output into " + out_dir.string()));
  staging.release();

  auto hyps = read_predictions_(out_dir / "eval_asr_predictions.tsv", indices);
  if (!hyps.ok()) return hyps;

  for (std::size_t k = 0; k < indices.size(); ++k) {
    const fs::path txt = logdir / "wavs" / (std::to_string(indices[k]) + "_pred.txt");
    std::ofstream f(txt, std::ios::out | std::ios::trunc);
    if (!f.is_open()) return R::err(Status::io_error("failed to open " + txt.string()));
    f << (*hyps)[k] << "\n";
    if (!f) return R::err(Status::io_error("short write to " + txt.string()));
  }
  return hyps;
}

}  // namespace sim
