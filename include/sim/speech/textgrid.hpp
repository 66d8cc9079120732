// File: include/sim/speech/textgrid.hpp
#pragma once

#include <string>
#include <vector>

#include "sim/core/status.hpp"

namespace sim {

// Praat TextGrid, interval tiers only. Times are in seconds.
struct TextGridInterval {
  double min_time{0.0};
  double max_time{0.0};
  std::string label;
};

struct TextGridTier {
  std::string name;
  std::vector<TextGridInterval> intervals;
};

struct TextGrid {
  double xmin{0.0};
  double xmax{0.0};
  std::vector<TextGridTier> tiers;
};

// Long ("xmin = 0") and short (values only) text formats. Point tiers are skipped.
Result<TextGrid> parse_textgrid(const std::string& text);
Result<TextGrid> read_textgrid(const std::string& path);

}  // namespace sim
