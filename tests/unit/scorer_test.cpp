// File: tests/unit/scorer_test.cpp
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "sim/instance/speech_output_instance.hpp"
#include "sim/instance/text_output_instance.hpp"
#include "sim/latency/latency_metrics.hpp"
#include "sim/scorer/instance_log.hpp"
#include "sim/scorer/instance_store.hpp"
#include "sim/scorer/scorer.hpp"
#include "sim/speech/wav_io.hpp"
#include "test_util.hpp"

namespace sim {
namespace {
namespace fs = std::filesystem;

const std::vector<std::string> kSources = {"a b c d", "e f g", "h i j k l"};
const std::vector<std::string> kReferences = {"the cat sat on the mat", "hello there world",
                                              "one two three four five"};
const std::vector<std::string> kOutputs = {"the cat sat on a mat", "hello world", "one two three four five"};

// Wait-k: read k words, then alternate one output word and one more source word.
void run_wait_k(InstanceStore& store, InstanceIndex index, const std::string& output, int k,
                bool finish = true) {
  ASSERT_TRUE(store.send_source(index, k).ok());
  const auto words = split_words(output);
  for (std::size_t j = 0; j < words.size(); ++j) {
    PredictionSegment p;
    p.content = words[j];
    p.finished = finish && j + 1 == words.size();
    ASSERT_TRUE(store.receive_prediction(index, p).ok());
    if (!p.finished) ASSERT_TRUE(store.send_source(index, 1).ok());
  }
}

std::vector<double> wait_k_delays(std::size_t n_out, double src_len, int k) {
  std::vector<double> d;
  for (std::size_t j = 0; j < n_out; ++j) d.push_back(std::min(src_len, static_cast<double>(k) + j));
  return d;
}

InstanceStore live_store(const Corpus& corpus, EventSink& events,
                         InstanceConstructorTable table = default_instance_constructors()) {
  auto store = InstanceStore::create(corpus, ShardRange{}, MediaType::kText, std::move(table),
                                     InstanceOptions{}, events);
  EXPECT_TRUE(store.ok()) << store.status().message();
  return store.take_value();
}

TEST(TextScorerTest, QualityAndMeanLatencyOverShard) {
  const auto corpus = InMemoryCorpus::from_text(kSources, kReferences);
  sim::testing::RecordingEventSink events;
  InstanceStore store = live_store(corpus, events);
  for (InstanceIndex i = 0; i < 3; ++i) run_wait_k(store, i, kOutputs[static_cast<std::size_t>(i)], 1);

  TextScorer scorer(std::move(store), std::make_unique<CorpusBleu>(), events);
  auto report = scorer.score();
  ASSERT_TRUE(report.ok()) << report.status().message();

  auto bleu = CorpusBleu().corpus_score(kOutputs, kReferences);
  ASSERT_TRUE(bleu.ok());
  EXPECT_DOUBLE_EQ(report->quality.at("BLEU"), *bleu);

  std::map<std::string, double> expected;
  for (std::size_t i = 0; i < 3; ++i) {
    const double src_len = static_cast<double>(split_words(kSources[i]).size());
    const std::size_t n_out = split_words(kOutputs[i]).size();
    auto m = eval_all_latency(wait_k_delays(n_out, src_len, 1), src_len);
    ASSERT_TRUE(m.ok());
    for (const auto& kv : *m) expected[kv.first] += kv.second / 3.0;
  }
  ASSERT_EQ(report->latency.size(), 3u);
  for (const auto& kv : expected) EXPECT_NEAR(report->latency.at(kv.first), kv.second, 1e-12) << kv.first;

  EXPECT_TRUE(events.of_type("incomplete_instance").empty());
  EXPECT_EQ(scorer.get_reference_list(), kReferences);
}

std::map<InstanceIndex, int>& eval_calls() {
  static std::map<InstanceIndex, int> calls;
  return calls;
}

class CountingInstance final : public TextOutputInstance {
 public:
  using TextOutputInstance::TextOutputInstance;

  Status sentence_level_eval() override {
    ++eval_calls()[index()];
    return TextOutputInstance::sentence_level_eval();
  }
};

TEST(TextScorerTest, UnfinishedInstanceIsForcedOnceAndReported) {
  eval_calls().clear();
  InstanceConstructorTable table;
  table["text-text"] = [](InstanceIndex index, const Corpus& corpus,
                          const InstanceOptions& options) -> Result<std::unique_ptr<Instance>> {
    auto src = corpus.source(index);
    if (!src.ok()) return Result<std::unique_ptr<Instance>>::err(src.status());
    auto ref = corpus.reference(index);
    if (!ref.ok()) return Result<std::unique_ptr<Instance>>::err(ref.status());
    std::unique_ptr<Instance> inst = std::make_unique<CountingInstance>(
        index, src.take_value(), MediaType::kText, ref.take_value(), options);
    return Result<std::unique_ptr<Instance>>::ok(std::move(inst));
  };

  const auto corpus = InMemoryCorpus::from_text(kSources, kReferences);
  sim::testing::RecordingEventSink events;
  InstanceStore store = live_store(corpus, events, table);
  run_wait_k(store, 0, kOutputs[0], 2);
  run_wait_k(store, 1, kOutputs[1], 2);
  run_wait_k(store, 2, "one two", 2, /*finish=*/false);

  TextScorer scorer(std::move(store), std::make_unique<CorpusBleu>(), events);
  auto hyps = scorer.get_translation_list();
  ASSERT_TRUE(hyps.ok());
  EXPECT_EQ((*hyps)[2], "one two");

  auto report = scorer.score();
  ASSERT_TRUE(report.ok()) << report.status().message();

  const auto incomplete = events.of_type("incomplete_instance");
  ASSERT_EQ(incomplete.size(), 1u);
  EXPECT_EQ(incomplete[0].indices, (std::vector<InstanceIndex>{2}));
  EXPECT_EQ(incomplete[0].severity, Severity::kWarning);
  EXPECT_EQ(eval_calls()[0], 1);
  EXPECT_EQ(eval_calls()[2], 1);

  auto forced = scorer.store().at(2);
  ASSERT_TRUE(forced.ok());
  EXPECT_TRUE((*forced)->finish_prediction());
  EXPECT_EQ((*forced)->metrics().count("latency"), 1u);
}

TEST(TextScorerTest, EmptyHypothesisIsReportedAndScoredWorstCase) {
  const auto corpus = InMemoryCorpus::from_text({"a b"}, {"x y"});
  sim::testing::RecordingEventSink events;
  InstanceStore store = live_store(corpus, events);
  PredictionSegment done;
  done.finished = true;
  ASSERT_TRUE(store.receive_prediction(0, done).ok());

  TextScorer scorer(std::move(store), std::make_unique<CorpusBleu>(), events);
  auto report = scorer.score();
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(report->quality.at("BLEU"), 0.0);
  EXPECT_DOUBLE_EQ(report->latency.at("AP"), 1.0);
  EXPECT_EQ(events.of_type("empty_hypothesis").size(), 1u);
}

TEST(TextScorerTest, UnscorableInstanceFailsInsteadOfDroppingLatency) {
  const auto corpus = InMemoryCorpus::from_text({"a b", ""}, {"x y", "z"});
  sim::testing::RecordingEventSink events;
  InstanceStore store = live_store(corpus, events);
  run_wait_k(store, 0, "x y", 1);

  PredictionSegment p;
  p.content = "x y";
  p.finished = true;
  EXPECT_FALSE(store.receive_prediction(1, p).ok());

  Config cfg;
  auto scorer = Scorer::create(std::move(store), cfg, events);
  ASSERT_TRUE(scorer.ok());
  auto report = (*scorer)->score();
  ASSERT_FALSE(report.ok());
  EXPECT_NE(report.status().message().find("instance 1"), std::string::npos);
}

TEST(ScorerTest, ReplayedRecordWithoutLatencyIsCorrupt) {
  sim::testing::TempDir dir;
  InstanceSummary good;
  good.index = 0;
  good.source = "a b";
  good.source_length = 2.0;
  good.reference = "x y";
  good.reference_length = 2;
  good.prediction = "x y";
  good.prediction_length = 2;
  good.finish_prediction = true;
  good.delays = {1.0, 2.0};
  good.metrics["latency"] = {{"AL", 1.0}, {"AP", 0.75}, {"DAL", 1.0}};

  InstanceSummary bare = good;
  bare.index = 1;
  bare.metrics.clear();

  ASSERT_TRUE(write_instance_log((dir / kInstanceLogName).string(), {good, bare}).ok());
  NullEventSink events;
  auto report = compute_score(dir.path(), Config{}, events);
  ASSERT_FALSE(report.ok());
  EXPECT_EQ(report.status().code(), Status::Code::kCorruptData);
  EXPECT_NE(report.status().message().find("instance 1"), std::string::npos);
  EXPECT_FALSE(fs::exists(dir / "scores"));
}

TEST(ScorerTest, ReplayMatchesLiveScoringExactly) {
  sim::testing::TempDir dir;
  const auto corpus = InMemoryCorpus::from_text(kSources, kReferences);
  NullEventSink events;
  InstanceStore store = live_store(corpus, events);

  InstanceLogWriter writer;
  ASSERT_TRUE(writer.open((dir / kInstanceLogName).string(), /*truncate=*/true).ok());
  store.set_log_writer(&writer);
  run_wait_k(store, 2, kOutputs[2], 3);
  run_wait_k(store, 0, kOutputs[0], 1);
  run_wait_k(store, 1, kOutputs[1], 2);
  writer.close();
  store.set_log_writer(nullptr);

  Config cfg;
  auto live = Scorer::create(std::move(store), cfg, events);
  ASSERT_TRUE(live.ok());
  auto live_report = (*live)->score();
  ASSERT_TRUE(live_report.ok());

  auto replay = compute_score(dir.path(), cfg, events);
  ASSERT_TRUE(replay.ok()) << replay.status().message();
  EXPECT_EQ(replay->quality, live_report->quality);
  EXPECT_EQ(replay->latency, live_report->latency);

  const std::string written = sim::testing::read_file(dir / "scores");
  EXPECT_EQ(written, to_pretty_json(*replay) + "\n");
  EXPECT_NE(written.find("\"Quality\": {\n        \"BLEU\": "), std::string::npos);
}

TEST(ScorerTest, MissingLogIsNotFound) {
  sim::testing::TempDir dir;
  NullEventSink events;
  EXPECT_EQ(compute_score(dir.path(), Config{}, events).status().code(), Status::Code::kNotFound);
}

InstanceSummary speech_record(InstanceIndex index) {
  InstanceSummary s;
  s.index = index;
  s.source_type = MediaType::kSpeech;
  s.target_type = MediaType::kSpeech;
  s.source_length = 2000.0;
  s.reference = "hello world";
  s.reference_length = 2;
  s.prediction = SpeechOutputInstance::wav_relpath(index);
  s.prediction_length = 1;
  s.finish_prediction = true;
  s.delays = {500.0};
  s.durations = {1000.0};
  return s;
}

TEST(ScorerTest, SpeechTargetScoredAsTextIsRejected) {
  sim::testing::TempDir dir;
  ASSERT_TRUE(write_instance_log((dir / kInstanceLogName).string(), {speech_record(0)}).ok());
  NullEventSink events;
  EXPECT_EQ(compute_score(dir.path(), Config{}, events).status().code(),
            Status::Code::kInvalidArgument);
}

TEST(SpeechScorerTest, MissingAlignmentFailsLatencyButNotQuality) {
  sim::testing::TempDir dir;
  ASSERT_TRUE(write_instance_log((dir / kInstanceLogName).string(), {speech_record(0), speech_record(1)}).ok());
  fs::create_directories(dir / "wavs");
  for (InstanceIndex i : {0, 1}) {
    ASSERT_TRUE(write_wav_pcm16((dir / SpeechOutputInstance::wav_relpath(i)).string(),
                                std::vector<float>(16000), 16000).ok());
  }
  sim::testing::write_file(dir / "align/0_pred.TextGrid",
                           "File type = \"ooTextFile\"\nObject class = \"TextGrid\"\n0\n1\n<exists>\n1\n"
                           "\"IntervalTier\"\n\"words\"\n0\n1\n1\n0\n1\n\"hello\"\n");

  Config cfg;
  cfg.speech.align = false;
  sim::testing::RecordingEventSink events;

  auto scorer = Scorer::from_logdir(dir.path(), MediaType::kSpeech, cfg, events);
  ASSERT_TRUE(scorer.ok()) << scorer.status().message();
  auto* speech = dynamic_cast<SpeechScorer*>(scorer->get());
  ASSERT_NE(speech, nullptr);

  auto quality = speech->get_quality_score();
  ASSERT_TRUE(quality.ok()) << quality.status().message();
  EXPECT_EQ(quality->at("BLEU"), 0.0);
  EXPECT_EQ(events.of_type("asr_unavailable").size(), 1u);

  auto latency = speech->get_latency_score();
  ASSERT_FALSE(latency.ok());
  EXPECT_EQ(latency.status().code(), Status::Code::kNotFound);
  EXPECT_NE(latency.status().message().find("instance 1"), std::string::npos);

  auto report = compute_score(dir.path(), cfg, events);
  EXPECT_EQ(report.status().code(), Status::Code::kNotFound);
  EXPECT_FALSE(fs::exists(dir / "scores"));
}

TEST(SpeechScorerTest, AlignedLogScoresByBoundary) {
  sim::testing::TempDir dir;
  ASSERT_TRUE(write_instance_log((dir / kInstanceLogName).string(), {speech_record(0)}).ok());
  fs::create_directories(dir / "wavs");
  ASSERT_TRUE(write_wav_pcm16((dir / "wavs/0_pred.wav").string(), std::vector<float>(16000), 16000).ok());
  sim::testing::write_file(dir / "align/0_pred.TextGrid",
                           "File type = \"ooTextFile\"\nObject class = \"TextGrid\"\n0\n1\n<exists>\n1\n"
                           "\"IntervalTier\"\n\"words\"\n0\n1\n2\n0\n0.5\n\"hello\"\n0.5\n1\n\"world\"\n");

  Config cfg;
  cfg.speech.align = false;
  NullEventSink events;
  auto report = compute_score(dir.path(), cfg, events);
  ASSERT_TRUE(report.ok()) << report.status().message();
  ASSERT_EQ(report->latency_by_boundary.size(), 3u);

  // Offset 500 ms: words start at 500 and 1000, end at 1000 and 1500.
  auto bow = eval_all_latency({500.0, 1000.0}, 2000.0, 2.0);
  auto eow = eval_all_latency({1000.0, 1500.0}, 2000.0, 2.0);
  ASSERT_TRUE(bow.ok());
  ASSERT_TRUE(eow.ok());
  EXPECT_DOUBLE_EQ(report->latency_by_boundary.at("BOW").at("AL"), bow->at("AL"));
  EXPECT_DOUBLE_EQ(report->latency_by_boundary.at("EOW").at("DAL"), eow->at("DAL"));
  EXPECT_TRUE(report->latency.empty());
  EXPECT_TRUE(fs::exists(dir / "scores"));
}

}  // namespace
}  // namespace sim
