// File: include/sim/scorer/shard_merge.hpp
#pragma once

#include <filesystem>
#include <vector>

#include "sim/core/events/event_sink.hpp"
#include "sim/core/status.hpp"
#include "sim/instance/instance.hpp"

namespace sim {

// Combines disjoint shard log directories into `out_dir`:
//   out_dir/instances.log  union of the shard logs, index order
//   out_dir/wavs/          union of the shard wavs/ (speech runs)
// Overlapping indices or clashing wav names are kAlreadyExists and nothing is written.
// Returns the merged records.
Result<std::vector<InstanceSummary>> merge_shard_dirs(
    const std::filesystem::path& out_dir, const std::vector<std::filesystem::path>& shard_dirs,
    EventSink& events);

}  // namespace sim
