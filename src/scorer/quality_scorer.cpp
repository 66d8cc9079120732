// File: src/scorer/quality_scorer.cpp
#include "sim/scorer/quality_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <regex>
#include <sstream>

namespace sim {
namespace {

constexpr int kMaxOrder = 4;

// Stand-in for log(0) so a zero precision drives the geometric mean to zero.
constexpr double kLogZero = -9999999999.0;

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
  return s;
}

using NgramCounts = std::map<std::vector<std::string>, std::size_t>;

NgramCounts count_ngrams(const std::vector<std::string>& toks, int n) {
  NgramCounts out;
  if (toks.size() < static_cast<std::size_t>(n)) return out;
  for (std::size_t i = 0; i + static_cast<std::size_t>(n) <= toks.size(); ++i) {
    ++out[std::vector<std::string>(toks.begin() + static_cast<std::ptrdiff_t>(i),
                                   toks.begin() + static_cast<std::ptrdiff_t>(i) + n)];
  }
  return out;
}

std::vector<std::string> split_ws(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream in(s);
  std::string w;
  while (in >> w) out.push_back(w);
  return out;
}

}  // namespace

std::string tokenize_13a(const std::string& input) {
  std::string line = replace_all(input, "<skipped>", "");
  line = replace_all(line, "-\n", "");
  line = replace_all(line, "\n", " ");
  if (line.find('&') != std::string::npos) {
    line = replace_all(line, "&quot;", "\"");
    line = replace_all(line, "&amp;", "&");
    line = replace_all(line, "&lt;", "<");
    line = replace_all(line, "&gt;", ">");
  }
  line = " " + line + " ";

  // Punctuation and symbols become separate tokens; periods and commas stay inside numbers.
  static const std::regex kSymbols(R"(([\x7b-\x7e\x5b-\x60\x20-\x26\x28-\x2b\x3a-\x40\x2f]))");
  static const std::regex kPeriodCommaAfter(R"(([^0-9])([\.,]))");
  static const std::regex kPeriodCommaBefore(R"(([\.,])([^0-9]))");
  static const std::regex kDashAfterDigit(R"(([0-9])(-))");

  line = std::regex_replace(line, kSymbols, " $1 ");
  line = std::regex_replace(line, kPeriodCommaAfter, "$1 $2 ");
  line = std::regex_replace(line, kPeriodCommaBefore, " $1 $2");
  line = std::regex_replace(line, kDashAfterDigit, "$1 $2 ");

  std::string out;
  for (const auto& t : split_ws(line)) {
    if (!out.empty()) out += ' ';
    out += t;
  }
  return out;
}

std::vector<std::string> CorpusBleu::tokenize_(const std::string& line) const {
  if (tokenizer_ == "13a") return split_ws(tokenize_13a(line));
  return split_ws(line);
}

CorpusBleu::Stats CorpusBleu::corpus_stats(const std::vector<std::string>& hypotheses,
                                           const std::vector<std::string>& references) const {
  Stats st;
  const std::size_t n = std::min(hypotheses.size(), references.size());
  for (std::size_t i = 0; i < n; ++i) {
    const auto hyp = tokenize_(hypotheses[i]);
    const auto ref = tokenize_(references[i]);
    st.sys_len += hyp.size();
    st.ref_len += ref.size();

    for (int order = 1; order <= kMaxOrder; ++order) {
      const NgramCounts h = count_ngrams(hyp, order);
      const NgramCounts r = count_ngrams(ref, order);
      for (const auto& kv : h) {
        st.total[order - 1] += kv.second;
        auto it = r.find(kv.first);
        if (it != r.end()) st.correct[order - 1] += std::min(kv.second, it->second);
      }
    }
  }
  return st;
}

double CorpusBleu::score_from_stats(const Stats& stats) {
  if (stats.sys_len == 0) return 0.0;

  double log_sum = 0.0;
  double smooth = 1.0;
  for (int i = 0; i < kMaxOrder; ++i) {
    double precision = 0.0;
    if (stats.total[i] > 0) {
      if (stats.correct[i] == 0) {
        smooth *= 2.0;
        precision = 100.0 / (smooth * static_cast<double>(stats.total[i]));
      } else {
        precision = 100.0 * static_cast<double>(stats.correct[i]) / static_cast<double>(stats.total[i]);
      }
    }
    log_sum += precision > 0.0 ? std::log(precision) : kLogZero;
  }

  double bp = 1.0;
  if (stats.sys_len < stats.ref_len) {
    bp = std::exp(1.0 - static_cast<double>(stats.ref_len) / static_cast<double>(stats.sys_len));
  }
  return bp * std::exp(log_sum / kMaxOrder);
}

Result<double> CorpusBleu::corpus_score(const std::vector<std::string>& hypotheses,
                                        const std::vector<std::string>& references) const {
  if (hypotheses.size() != references.size()) {
    return Result<double>::err(Status::invalid_argument(
        "BLEU: " + std::to_string(hypotheses.size()) + " hypotheses vs " +
        std::to_string(references.size()) + " references"));
  }
  return Result<double>::ok(score_from_stats(corpus_stats(hypotheses, references)));
}

Result<std::unique_ptr<QualityScorer>> make_quality_scorer(const QualityConfig& cfg) {
  if (cfg.metric != "BLEU") {
    return Result<std::unique_ptr<QualityScorer>>::err(
        Status::unsupported("quality metric '" + cfg.metric + "'"));
  }
  if (cfg.tokenizer != "13a" && cfg.tokenizer != "none") {
    return Result<std::unique_ptr<QualityScorer>>::err(
        Status::unsupported("BLEU tokenizer '" + cfg.tokenizer + "'"));
  }
  std::unique_ptr<QualityScorer> s = std::make_unique<CorpusBleu>(cfg.tokenizer);
  return Result<std::unique_ptr<QualityScorer>>::ok(std::move(s));
}

}  // namespace sim
