// File: tests/unit/speech_test.cpp
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "sim/instance/speech_output_instance.hpp"
#include "sim/latency/latency_metrics.hpp"
#include "sim/speech/asr_transcriber.hpp"
#include "sim/speech/external_tool.hpp"
#include "sim/speech/speech_realigner.hpp"
#include "sim/speech/wav_io.hpp"
#include "test_util.hpp"

namespace sim {
namespace {
namespace fs = std::filesystem;

std::string words_textgrid(double xmax, const std::vector<TextGridInterval>& ivs) {
  std::string out = "File type = \"ooTextFile\"\nObject class = \"TextGrid\"\n0\n" +
                    std::to_string(xmax) + "\n<exists>\n1\n\"IntervalTier\"\n\"words\"\n0\n" +
                    std::to_string(xmax) + "\n" + std::to_string(ivs.size()) + "\n";
  for (const auto& iv : ivs) {
    out += std::to_string(iv.min_time) + "\n" + std::to_string(iv.max_time) + "\n\"" + iv.label + "\"\n";
  }
  return out;
}

// Executable shell script at `path`.
void write_script(const fs::path& path, const std::string& body) {
  sim::testing::write_file(path, "#!/bin/sh\n" + body);
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
}

std::unique_ptr<Instance> restored_speech(InstanceIndex index, double source_length,
                                          const std::string& reference, std::vector<double> delays) {
  InstanceSummary s;
  s.index = index;
  s.source_type = MediaType::kSpeech;
  s.target_type = MediaType::kSpeech;
  s.source_length = source_length;
  s.reference = reference;
  s.reference_length = split_words(reference).size();
  s.prediction = SpeechOutputInstance::wav_relpath(index);
  s.durations.assign(delays.size(), 100.0);
  s.prediction_length = delays.size();
  s.delays = std::move(delays);
  s.finish_prediction = true;
  return std::make_unique<SpeechOutputInstance>(std::move(s));
}

TEST(ExternalToolTest, FindsShellAndReportsExitCodes) {
  auto sh = find_executable("sh");
  ASSERT_TRUE(sh.ok()) << sh.status().message();
  EXPECT_TRUE(fs::path(*sh).is_absolute());

  auto rc = run_process({"sh", "-c", "exit 3"});
  ASSERT_TRUE(rc.ok());
  EXPECT_EQ(*rc, 3);

  EXPECT_EQ(find_executable("simulscore-no-such-tool").status().code(), Status::Code::kUnavailable);
  EXPECT_EQ(run_process({"simulscore-no-such-tool"}).status().code(), Status::Code::kUnavailable);
  EXPECT_EQ(run_process({}).status().code(), Status::Code::kInvalidArgument);
}

TEST(ExternalToolTest, ScopedWorkDirRemovesUnlessReleased) {
  sim::testing::TempDir dir;
  {
    ScopedWorkDir w(dir / "scratch");
    ASSERT_TRUE(w.create().ok());
    sim::testing::write_file(w.path() / "x", "1");
  }
  EXPECT_FALSE(fs::exists(dir / "scratch"));
  {
    ScopedWorkDir w(dir / "kept");
    ASSERT_TRUE(w.create().ok());
    w.release();
  }
  EXPECT_TRUE(fs::is_directory(dir / "kept"));
}

TEST(WavIoTest, HeaderDescribesWrittenAudio) {
  sim::testing::TempDir dir;
  const auto path = (dir / "a.wav").string();
  ASSERT_TRUE(write_wav_pcm16(path, std::vector<float>(8000, 0.25f), 16000).ok());

  auto info = read_wav_info(path);
  ASSERT_TRUE(info.ok()) << info.status().message();
  EXPECT_EQ(info->sample_rate, 16000);
  EXPECT_EQ(info->channels, 1);
  EXPECT_EQ(info->bits_per_sample, 16);
  EXPECT_EQ(info->num_frames, 8000);
  EXPECT_EQ(fs::file_size(path), 44u + 16000u);

  sim::testing::write_file(dir / "bad.wav", "not a wav file at all, really");
  EXPECT_FALSE(read_wav_info((dir / "bad.wav").string()).ok());
  EXPECT_EQ(write_wav_pcm16(path, {}, 0).code(), Status::Code::kInvalidArgument);
}

TEST(SpeechRealignerTest, WordBoundariesSkipSilence) {
  TextGrid tg;
  tg.xmax = 1.0;
  tg.tiers.push_back(TextGridTier{"words", {{0.0, 0.2, ""}, {0.2, 0.5, "hello"}, {0.5, 1.0, "world"}}});

  const BoundaryDelays d = word_boundary_delays(tg, 1000.0);
  EXPECT_EQ(d.bow, (std::vector<double>{1200.0, 1500.0}));
  EXPECT_EQ(d.eow, (std::vector<double>{1500.0, 2000.0}));
  EXPECT_EQ(d.cow, (std::vector<double>{1350.0, 1750.0}));

  EXPECT_TRUE(word_boundary_delays(TextGrid{}, 0.0).bow.empty());
}

TEST(SpeechRealignerTest, ScoresPreparedAlignments) {
  sim::testing::TempDir dir;
  const fs::path align = dir / "align";
  sim::testing::write_file(align / "0_pred.TextGrid",
                           words_textgrid(1.0, {{0.0, 0.2, ""}, {0.2, 0.5, "hello"}, {0.5, 1.0, "world"}}));
  sim::testing::write_file(align / "1_pred.TextGrid", words_textgrid(0.5, {{0.0, 0.5, ""}}));
  sim::testing::write_file(align / "7_pred.TextGrid", words_textgrid(0.5, {{0.0, 0.5, "x"}}));

  auto i0 = restored_speech(0, 3000.0, "a b", {1000.0});
  auto i1 = restored_speech(1, 2000.0, "c", {});

  sim::testing::RecordingEventSink events;
  SpeechConfig cfg;
  cfg.align = false;
  SpeechRealigner realigner(cfg, events);
  auto r = realigner.score_alignments({i0.get(), i1.get()}, align);
  ASSERT_TRUE(r.ok()) << r.status().message();

  // Instance 1 has no words: one delay at its start (the source end) plus the audio length.
  auto b0 = eval_all_latency({1200.0, 1500.0}, 3000.0, 2.0);
  auto b1 = eval_all_latency({2500.0}, 2000.0, 1.0);
  ASSERT_TRUE(b0.ok());
  ASSERT_TRUE(b1.ok());
  for (const char* m : {"AL", "AP", "DAL"}) {
    EXPECT_NEAR(r->at("BOW").at(m), (b0->at(m) + b1->at(m)) / 2.0, 1e-9) << m;
  }
  EXPECT_NEAR(r->at("BOW").at("AP"), (2700.0 / 6000.0 + 2500.0 / 2000.0) / 2.0, 1e-9);
  EXPECT_EQ(r->size(), 3u);

  const auto no_words = events.of_type("alignment_no_words");
  ASSERT_EQ(no_words.size(), 1u);
  EXPECT_EQ(no_words[0].indices, (std::vector<InstanceIndex>{1}));

  const auto extra = events.of_type("alignment_unexpected_artifact");
  ASSERT_EQ(extra.size(), 1u);
  EXPECT_EQ(extra[0].indices, (std::vector<InstanceIndex>{7}));
}

TEST(SpeechRealignerTest, OverflowingArtifactNameIsIgnored) {
  sim::testing::TempDir dir;
  const fs::path align = dir / "align";
  sim::testing::write_file(align / "0_pred.TextGrid", words_textgrid(1.0, {{0.0, 1.0, "a"}}));
  sim::testing::write_file(align / "99999999999999999999_pred.TextGrid",
                           words_textgrid(1.0, {{0.0, 1.0, "a"}}));

  auto i0 = restored_speech(0, 1000.0, "a", {0.0});

  sim::testing::RecordingEventSink events;
  SpeechConfig cfg;
  cfg.align = false;
  SpeechRealigner realigner(cfg, events);
  auto r = realigner.score_alignments({i0.get()}, align);
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r->size(), 3u);
  EXPECT_TRUE(events.of_type("alignment_unexpected_artifact").empty());
}

TEST(SpeechRealignerTest, MissingArtifactNamesTheInstance) {
  sim::testing::TempDir dir;
  sim::testing::write_file(dir / "align/0_pred.TextGrid", words_textgrid(1.0, {{0.0, 1.0, "a"}}));

  auto i0 = restored_speech(0, 1000.0, "a", {0.0});
  auto i1 = restored_speech(1, 1000.0, "b", {0.0});

  NullEventSink events;
  SpeechConfig cfg;
  cfg.align = false;
  SpeechRealigner realigner(cfg, events);
  auto r = realigner.latency_by_boundary({i0.get(), i1.get()}, dir.path());
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kNotFound);
  EXPECT_NE(r.status().message().find("instance 1"), std::string::npos);
}

TEST(SpeechRealignerTest, MissingAlignerIsUnavailable) {
  sim::testing::TempDir dir;
  NullEventSink events;
  SpeechConfig cfg;
  cfg.aligner.executable = "simulscore-no-such-aligner";
  SpeechRealigner realigner(cfg, events);
  EXPECT_EQ(realigner.prepare_alignment(dir.path()).code(), Status::Code::kUnavailable);
  EXPECT_FALSE(fs::exists(dir / "align"));
}

TEST(SpeechRealignerTest, RunsAlignerIntoStagingThenPublishes) {
  sim::testing::TempDir dir;
  const fs::path canned = dir / "canned";
  sim::testing::write_file(canned / "0_pred.TextGrid", words_textgrid(1.0, {{0.0, 1.0, "a"}}));
  sim::testing::write_file(dir / "log/align/stale.TextGrid", "old");

  // Arguments: align <wavs> <dict> <acoustic> <out> --clean ...
  const fs::path tool = dir / "fake_mfa";
  write_script(tool, "cp \"" + canned.string() + "\"/*.TextGrid \"$5\"/\n");

  sim::testing::RecordingEventSink events;
  SpeechConfig cfg;
  cfg.aligner.executable = tool.string();
  cfg.aligner.dictionary_path = "dict";
  cfg.aligner.acoustic_model_path = "model";
  SpeechRealigner realigner(cfg, events);

  ASSERT_TRUE(realigner.prepare_alignment(dir / "log").ok());
  EXPECT_TRUE(fs::exists(dir / "log/align/0_pred.TextGrid"));
  EXPECT_FALSE(fs::exists(dir / "log/align/stale.TextGrid"));
  EXPECT_FALSE(fs::exists(dir / "log/align.partial"));
  EXPECT_FALSE(fs::exists(dir / "log/mfa"));
  EXPECT_EQ(events.of_type("alignment_started").size(), 1u);
}

TEST(SpeechRealignerTest, FailingAlignerLeavesPreviousAlignment) {
  sim::testing::TempDir dir;
  sim::testing::write_file(dir / "log/align/0_pred.TextGrid", "kept");
  const fs::path tool = dir / "fake_mfa";
  write_script(tool, "exit 2\n");

  NullEventSink events;
  SpeechConfig cfg;
  cfg.aligner.executable = tool.string();
  SpeechRealigner realigner(cfg, events);
  EXPECT_EQ(realigner.prepare_alignment(dir / "log").code(), Status::Code::kUnavailable);
  EXPECT_EQ(sim::testing::read_file(dir / "log/align/0_pred.TextGrid"), "kept");
}

class AsrTranscriberTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fs::create_directories(dir_ / "wavs");
    ASSERT_TRUE(write_wav_pcm16((dir_ / "wavs/0_pred.wav").string(), std::vector<float>(1600), 16000).ok());
    ASSERT_TRUE(write_wav_pcm16((dir_ / "wavs/1_pred.wav").string(), std::vector<float>(3200), 16000).ok());
  }

  sim::testing::TempDir dir_;
  sim::testing::RecordingEventSink events_;
};

TEST_F(AsrTranscriberTest, UnconfiguredAsrGivesEmptyHypotheses) {
  AsrTranscriber asr(AsrConfig{}, events_);
  auto hyps = asr.transcribe(dir_.path(), {0, 1});
  ASSERT_TRUE(hyps.ok());
  EXPECT_EQ(*hyps, (std::vector<std::string>{"", ""}));
  EXPECT_EQ(events_.of_type("asr_unavailable").size(), 1u);
  EXPECT_EQ(events_.of_type("speech_beta").size(), 1u);
}

TEST_F(AsrTranscriberTest, FailingAsrGivesEmptyHypotheses) {
  const fs::path tool = dir_ / "fake_asr";
  write_script(tool, "exit 1\n");

  AsrConfig cfg;
  cfg.executable = tool.string();
  AsrTranscriber asr(cfg, events_);
  auto hyps = asr.transcribe(dir_.path(), {0, 1});
  ASSERT_TRUE(hyps.ok());
  EXPECT_EQ(*hyps, (std::vector<std::string>{"", ""}));
  EXPECT_EQ(events_.of_type("asr_unavailable").size(), 1u);
}

TEST_F(AsrTranscriberTest, ReadsTranscriptionsByIndex) {
  // Arguments: <prep dir> <out dir>
  const fs::path tool = dir_ / "fake_asr";
  write_script(tool,
               "test -f \"$1/eval.tsv\" || exit 4\n"
               "printf 'id\\ttranscription\\n' > \"$2/eval_asr_predictions.tsv\"\n"
               "printf 'utt_0\\tHello World\\n' >> \"$2/eval_asr_predictions.tsv\"\n");

  AsrConfig cfg;
  cfg.executable = tool.string();
  AsrTranscriber asr(cfg, events_);
  auto hyps = asr.transcribe(dir_.path(), {0, 1});
  ASSERT_TRUE(hyps.ok()) << hyps.status().message();
  EXPECT_EQ(*hyps, (std::vector<std::string>{"hello world", ""}));

  const auto missing = events_.of_type("asr_missing_transcript");
  ASSERT_EQ(missing.size(), 1u);
  EXPECT_EQ(missing[0].indices, (std::vector<InstanceIndex>{1}));

  EXPECT_EQ(sim::testing::read_file(dir_ / "wavs/0_pred.txt"), "hello world\n");
  const std::string manifest = sim::testing::read_file(dir_ / "asr_prep_data/eval.tsv");
  EXPECT_NE(manifest.find("0_pred.wav\t1600\n"), std::string::npos);
  EXPECT_NE(manifest.find("1_pred.wav\t3200\n"), std::string::npos);
  EXPECT_TRUE(fs::exists(dir_ / "asr_out/eval_asr_predictions.tsv"));
  EXPECT_FALSE(fs::exists(dir_ / "asr_out.partial"));
}

TEST_F(AsrTranscriberTest, OverflowingIdIsCorruptData) {
  const fs::path tool = dir_ / "fake_asr";
  write_script(tool,
               "printf 'id\\ttranscription\\n' > \"$2/eval_asr_predictions.tsv\"\n"
               "printf 'utt_99999999999999999999\\thi\\n' >> \"$2/eval_asr_predictions.tsv\"\n");

  AsrConfig cfg;
  cfg.executable = tool.string();
  AsrTranscriber asr(cfg, events_);
  auto hyps = asr.transcribe(dir_.path(), {0, 1});
  ASSERT_FALSE(hyps.ok());
  EXPECT_EQ(hyps.status().code(), Status::Code::kCorruptData);
  EXPECT_NE(hyps.status().message().find("utt_99999999999999999999"), std::string::npos);
}

}  // namespace
}  // namespace sim
