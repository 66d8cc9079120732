// File: tests/unit/config_loader_test.cpp
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sim/core/util/config_loader.hpp"
#include "test_util.hpp"

namespace sim {
namespace {

TEST(ConfigLoaderTest, DefaultsFromEmptyFile) {
  sim::testing::TempDir dir;
  sim::testing::write_file(dir / "empty.yaml", "{}\n");
  auto cfg = load_config((dir / "empty.yaml").string());
  ASSERT_TRUE(cfg.ok()) << cfg.status().message();
  EXPECT_EQ(cfg->quality.metric, "BLEU");
  EXPECT_EQ(cfg->quality.tokenizer, "13a");
  EXPECT_EQ(cfg->latency.unit, LatencyUnit::kWord);
  EXPECT_TRUE(cfg->speech.align);
  EXPECT_EQ(cfg->shard.end_index, -1);
}

TEST(ConfigLoaderTest, IncludesAreMergedThenOverridden) {
  sim::testing::TempDir dir;
  sim::testing::write_file(dir / "conf/base.yaml",
                           "logdir: base_out\n"
                           "quality:\n  tokenizer: none\n"
                           "latency:\n  unit: char\n  computation_aware: false\n"
                           "speech:\n  asr:\n    executable: asr-tool\n    args: [\"--beam\", \"5\"]\n");
  sim::testing::write_file(dir / "conf/run.yaml",
                           "includes: [\"base.yaml\"]\n"
                           "logdir: run_out\n"
                           "source_type: speech\n"
                           "target_type: speech\n"
                           "shard:\n  start_index: 10\n  end_index: 20\n"
                           "speech:\n  align: false\n  aligner:\n    executable: /opt/mfa/bin/mfa\n");

  auto cfg = load_config((dir / "conf/run.yaml").string());
  ASSERT_TRUE(cfg.ok()) << cfg.status().message();
  EXPECT_EQ(cfg->logdir, "run_out");
  EXPECT_EQ(cfg->source_type, MediaType::kSpeech);
  EXPECT_EQ(cfg->target_type, MediaType::kSpeech);
  EXPECT_EQ(cfg->shard.start_index, 10);
  EXPECT_EQ(cfg->shard.end_index, 20);
  EXPECT_EQ(cfg->quality.tokenizer, "none");
  EXPECT_EQ(cfg->latency.unit, LatencyUnit::kChar);
  EXPECT_FALSE(cfg->latency.computation_aware);
  EXPECT_FALSE(cfg->speech.align);
  EXPECT_EQ(cfg->speech.aligner.executable, "/opt/mfa/bin/mfa");
  EXPECT_EQ(cfg->speech.asr.executable, "asr-tool");
  EXPECT_EQ(cfg->speech.asr.args, (std::vector<std::string>{"--beam", "5"}));
}

TEST(ConfigLoaderTest, InvalidValuesAreRejected) {
  sim::testing::TempDir dir;
  const auto path = dir / "c.yaml";

  sim::testing::write_file(path, "quality:\n  tokenizer: intl\n");
  EXPECT_EQ(load_config(path.string()).status().code(), Status::Code::kInvalidArgument);

  sim::testing::write_file(path, "target_type: video\n");
  EXPECT_EQ(load_config(path.string()).status().code(), Status::Code::kInvalidArgument);

  sim::testing::write_file(path, "source_type: text\ntarget_type: speech\n");
  EXPECT_EQ(load_config(path.string()).status().code(), Status::Code::kInvalidArgument);

  sim::testing::write_file(path, "shard:\n  start_index: 5\n  end_index: 2\n");
  EXPECT_EQ(load_config(path.string()).status().code(), Status::Code::kInvalidArgument);

  sim::testing::write_file(path, "includes: base.yaml\n");
  EXPECT_EQ(load_config(path.string()).status().code(), Status::Code::kInvalidArgument);

  sim::testing::write_file(path, "shard:\n  start_index: first\n");
  EXPECT_EQ(load_config(path.string()).status().code(), Status::Code::kParseError);
}

TEST(ConfigLoaderTest, MissingAndMalformedFiles) {
  sim::testing::TempDir dir;
  EXPECT_EQ(load_config((dir / "nope.yaml").string()).status().code(), Status::Code::kNotFound);

  sim::testing::write_file(dir / "bad.yaml", "quality: [1, 2\n");
  EXPECT_EQ(load_config((dir / "bad.yaml").string()).status().code(), Status::Code::kParseError);

  sim::testing::write_file(dir / "inc.yaml", "includes: [\"missing.yaml\"]\n");
  EXPECT_EQ(load_config((dir / "inc.yaml").string()).status().code(), Status::Code::kNotFound);
}

TEST(ConfigLoaderTest, MediaTypeNames) {
  EXPECT_EQ(*parse_media_type("Speech"), MediaType::kSpeech);
  EXPECT_EQ(*parse_media_type("text"), MediaType::kText);
  EXPECT_FALSE(parse_media_type("image").ok());
}

}  // namespace
}  // namespace sim
