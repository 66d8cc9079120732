// File: include/sim/scorer/quality_scorer.hpp
#pragma once

#include <memory>
#include <utility>
#include <string>
#include <vector>

#include "sim/core/config.hpp"
#include "sim/core/status.hpp"

namespace sim {

// Corpus-level quality metric over index-ordered hypotheses and references.
class QualityScorer {
 public:
  virtual ~QualityScorer() = default;

  // Reporting key, e.g. "BLEU".
  virtual std::string name() const = 0;

  // hypotheses.size() must equal references.size(). Empty hypotheses are valid input.
  virtual Result<double> corpus_score(const std::vector<std::string>& hypotheses,
                                      const std::vector<std::string>& references) const = 0;
};

// Corpus BLEU on a 0-100 scale, compatible with sacreBLEU defaults:
// 4-gram, "exp" smoothing, brevity penalty, 13a tokenization (or plain whitespace with "none").
class CorpusBleu final : public QualityScorer {
 public:
  explicit CorpusBleu(std::string tokenizer = "13a") : tokenizer_(std::move(tokenizer)) {}

  std::string name() const override { return "BLEU"; }

  Result<double> corpus_score(const std::vector<std::string>& hypotheses,
                              const std::vector<std::string>& references) const override;

  struct Stats {
    std::size_t sys_len{0};
    std::size_t ref_len{0};
    std::size_t correct[4]{0, 0, 0, 0};
    std::size_t total[4]{0, 0, 0, 0};
  };

  // Sufficient statistics, exposed for tests.
  Stats corpus_stats(const std::vector<std::string>& hypotheses,
                     const std::vector<std::string>& references) const;

  static double score_from_stats(const Stats& stats);

 private:
  std::vector<std::string> tokenize_(const std::string& line) const;

  std::string tokenizer_;
};

// mteval-v13a tokenization as done by sacreBLEU.
std::string tokenize_13a(const std::string& line);

// Quality scorer named by the config (only BLEU today).
Result<std::unique_ptr<QualityScorer>> make_quality_scorer(const QualityConfig& cfg);

}  // namespace sim
