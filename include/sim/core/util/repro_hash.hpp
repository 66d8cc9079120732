// File: include/sim/core/util/repro_hash.hpp
#pragma once

#include <string>
#include <vector>

#include "sim/core/config.hpp"
#include "sim/instance/instance.hpp"

namespace sim {

// Hash of every config field that can change a score.
// Goal: two runs with the same hash scored the same way.
std::string compute_config_hash(const Config& cfg);

// Hash of the ordered instance records a score is computed from (index, texts, delays,
// metrics). Goal: re-scoring the same log is recognizable in the events file.
std::string compute_log_fingerprint(const std::vector<InstanceSummary>& records);

}  // namespace sim
