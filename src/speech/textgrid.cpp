// File: src/speech/textgrid.cpp
#include "sim/speech/textgrid.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sim {
namespace {

struct Token {
  enum class Kind { kString, kNumber, kFlag } kind;
  std::string text;
};

// Both text formats carry the same value sequence; the long format only adds labels
// ("xmin =", "item [1]:") around it. Keep the values, drop the labels.
Result<std::vector<Token>> tokenize(const std::string& s) {
  std::vector<Token> out;
  std::size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
    } else if (c == '!') {
      while (i < s.size() && s[i] != '\n') ++i;  // comment
    } else if (c == '[') {
      while (i < s.size() && s[i] != ']') ++i;
      ++i;
    } else if (c == '"') {
      std::string v;
      ++i;
      while (true) {
        if (i >= s.size()) return Result<std::vector<Token>>::err(Status::parse_error("TextGrid: unterminated string"));
        if (s[i] == '"') {
          if (i + 1 < s.size() && s[i + 1] == '"') {  // "" is an escaped quote
            v.push_back('"');
            i += 2;
            continue;
          }
          ++i;
          break;
        }
        v.push_back(s[i++]);
      }
      out.push_back(Token{Token::Kind::kString, std::move(v)});
    } else if (c == '<') {
      const std::size_t end = s.find('>', i);
      if (end == std::string::npos) return Result<std::vector<Token>>::err(Status::parse_error("TextGrid: unterminated flag"));
      out.push_back(Token{Token::Kind::kFlag, s.substr(i, end - i + 1)});
      i = end + 1;
    } else if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.') {
      std::size_t j = i + 1;
      while (j < s.size() && (std::isdigit(static_cast<unsigned char>(s[j])) || s[j] == '.' ||
                              s[j] == 'e' || s[j] == 'E' || s[j] == '-' || s[j] == '+')) {
        ++j;
      }
      out.push_back(Token{Token::Kind::kNumber, s.substr(i, j - i)});
      i = j;
    } else {
      ++i;  // label characters, '=' and ':'
    }
  }
  return Result<std::vector<Token>>::ok(std::move(out));
}

class Cursor {
 public:
  explicit Cursor(std::vector<Token> toks) : toks_(std::move(toks)) {}

  Result<std::string> string() {
    if (pos_ >= toks_.size() || toks_[pos_].kind != Token::Kind::kString) {
      return Result<std::string>::err(error_("string"));
    }
    return Result<std::string>::ok(toks_[pos_++].text);
  }

  Result<double> number() {
    if (pos_ >= toks_.size() || toks_[pos_].kind != Token::Kind::kNumber) {
      return Result<double>::err(error_("number"));
    }
    const std::string& t = toks_[pos_++].text;
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end == t.c_str() || *end != '\0') {
      return Result<double>::err(Status::parse_error("TextGrid: bad number '" + t + "'"));
    }
    return Result<double>::ok(v);
  }

  // Element count: a non-negative integer. Every element takes at least `per_item` values, so a
  // count larger than what is left cannot be honest.
  Result<std::size_t> count(const char* what, std::size_t per_item) {
    auto v = number();
    if (!v.ok()) return Result<std::size_t>::err(v.status());
    const double n = *v;
    const std::size_t left = toks_.size() - pos_;
    if (!std::isfinite(n) || n < 0.0 || n != std::floor(n) ||
        n > static_cast<double>(left / per_item)) {
      return Result<std::size_t>::err(Status::corrupt_data(
          "TextGrid: bad " + std::string(what) + " count " + toks_[pos_ - 1].text));
    }
    return Result<std::size_t>::ok(static_cast<std::size_t>(n));
  }

  Result<std::string> flag() {
    if (pos_ >= toks_.size() || toks_[pos_].kind != Token::Kind::kFlag) {
      return Result<std::string>::err(error_("<exists> or <absent>"));
    }
    return Result<std::string>::ok(toks_[pos_++].text);
  }

 private:
  Status error_(const char* expected) const {
    return Status::parse_error("TextGrid: expected " + std::string(expected) + " at value " +
                               std::to_string(pos_));
  }

  std::vector<Token> toks_;
  std::size_t pos_{0};
};

#define TG_ASSIGN(lhs, expr)                                   \
  do {                                                         \
    auto _r = (expr);                                          \
    if (!_r.ok()) return Result<TextGrid>::err(_r.status());   \
    lhs = _r.take_value();                                     \
  } while (0)

}  // namespace

Result<TextGrid> parse_textgrid(const std::string& text) {
  auto toks = tokenize(text);
  if (!toks.ok()) return Result<TextGrid>::err(toks.status());
  Cursor cur(toks.take_value());

  std::string file_type;
  std::string object_class;
  TG_ASSIGN(file_type, cur.string());
  TG_ASSIGN(object_class, cur.string());
  if (file_type != "ooTextFile" || object_class != "TextGrid") {
    return Result<TextGrid>::err(Status::parse_error("TextGrid: not an ooTextFile TextGrid"));
  }

  TextGrid tg;
  TG_ASSIGN(tg.xmin, cur.number());
  TG_ASSIGN(tg.xmax, cur.number());

  std::string tiers_flag;
  TG_ASSIGN(tiers_flag, cur.flag());
  if (tiers_flag != "<exists>") return Result<TextGrid>::ok(std::move(tg));

  // A tier header is class, name, xmin, xmax, size.
  std::size_t n_tiers = 0;
  TG_ASSIGN(n_tiers, cur.count("tier", 5));

  for (std::size_t t = 0; t < n_tiers; ++t) {
    std::string cls;
    TextGridTier tier;
    std::size_t n_items = 0;
    double unused = 0.0;
    TG_ASSIGN(cls, cur.string());
    TG_ASSIGN(tier.name, cur.string());
    TG_ASSIGN(unused, cur.number());
    TG_ASSIGN(unused, cur.number());
    TG_ASSIGN(n_items, cur.count("item", cls == "IntervalTier" ? 3 : 2));

    if (cls == "IntervalTier") {
      for (std::size_t k = 0; k < n_items; ++k) {
        TextGridInterval iv;
        TG_ASSIGN(iv.min_time, cur.number());
        TG_ASSIGN(iv.max_time, cur.number());
        TG_ASSIGN(iv.label, cur.string());
        if (iv.max_time < iv.min_time) {
          return Result<TextGrid>::err(Status::corrupt_data("TextGrid: interval ends before it starts"));
        }
        tier.intervals.push_back(std::move(iv));
      }
      tg.tiers.push_back(std::move(tier));
    } else if (cls == "TextTier") {
      // Point tiers carry no word spans; read past them.
      for (std::size_t k = 0; k < n_items; ++k) {
        std::string mark;
        TG_ASSIGN(unused, cur.number());
        TG_ASSIGN(mark, cur.string());
      }
    } else {
      return Result<TextGrid>::err(Status::unsupported("TextGrid: tier class '" + cls + "'"));
    }
  }
  return Result<TextGrid>::ok(std::move(tg));
}

#undef TG_ASSIGN

Result<TextGrid> read_textgrid(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) return Result<TextGrid>::err(Status::io_error("failed to open " + path));

  std::ostringstream ss;
  ss << f.rdbuf();
  std::string text = ss.str();

  // MFA writes UTF-8, Praat sometimes UTF-16; only the former is supported.
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
    text.erase(0, 3);
  }

  auto tg = parse_textgrid(text);
  if (!tg.ok()) {
    return Result<TextGrid>::err(tg.status().annotated(path));
  }
  return tg;
}

}  // namespace sim
