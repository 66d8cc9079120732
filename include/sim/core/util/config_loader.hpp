// include/sim/core/util/config_loader.hpp
#pragma once

#include <string>

#include "sim/core/config.hpp"
#include "sim/core/status.hpp"

namespace sim {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// Parses media type names ("text" | "speech").
Result<MediaType> parse_media_type(const std::string& name);

}  // namespace sim
