// File: include/sim/core/util/json_text.hpp
#pragma once

#include <string>

namespace sim {

// JSON string literal with escaping, including the surrounding quotes.
std::string json_quote(const std::string& s);

// Shortest decimal text that reads back to the same double. NaN/inf become null.
std::string json_number(double v);

}  // namespace sim
