// File: src/scorer/shard_merge.cpp
#include "sim/scorer/shard_merge.hpp"

#include <map>
#include <string>
#include <system_error>

#include "sim/scorer/instance_log.hpp"

namespace sim {
namespace fs = std::filesystem;

Result<std::vector<InstanceSummary>> merge_shard_dirs(const fs::path& out_dir,
                                                      const std::vector<fs::path>& shard_dirs,
                                                      EventSink& events) {
  using R = Result<std::vector<InstanceSummary>>;
  if (shard_dirs.empty()) return R::err(Status::invalid_argument("merge: no shard directories"));

  std::vector<std::string> logs;
  logs.reserve(shard_dirs.size());
  for (const auto& d : shard_dirs) logs.push_back((d / kInstanceLogName).string());

  auto merged = merge_instance_logs(logs);
  if (!merged.ok()) return merged;

  // Plan the wav copies before touching out_dir so a clash leaves nothing behind.
  std::error_code ec;
  std::map<std::string, fs::path> wavs;
  for (const auto& d : shard_dirs) {
    const fs::path src = d / "wavs";
    if (!fs::is_directory(src, ec)) continue;
    for (const auto& it : fs::directory_iterator(src, ec)) {
      if (!it.is_regular_file(ec)) continue;
      const std::string name = it.path().filename().string();
      auto [pos, inserted] = wavs.emplace(name, it.path());
      if (!inserted) {
        return R::err(Status::already_exists("merge: " + name + " exists in " +
                                             pos->second.parent_path().string() + " and " +
                                             src.string()));
      }
    }
    if (ec) return R::err(Status::io_error("merge: failed listing " + src.string()));
  }

  fs::create_directories(out_dir, ec);
  if (ec) return R::err(Status::io_error("merge: failed to create " + out_dir.string()));

  if (!wavs.empty()) {
    const fs::path dst = out_dir / "wavs";
    fs::create_directories(dst, ec);
    if (ec) return R::err(Status::io_error("merge: failed to create " + dst.string()));
    for (const auto& kv : wavs) {
      fs::copy_file(kv.second, dst / kv.first, fs::copy_options::overwrite_existing, ec);
      if (ec) {
        return R::err(Status::io_error("merge: failed to copy " + kv.second.string() + ": " + ec.message()));
      }
    }
  }

  SIM_RETURN_IF_ERROR_R(write_instance_log((out_dir / kInstanceLogName).string(), *merged), R);

  (void)emit_event(events, Severity::kInfo, "shards_merged",
                   std::to_string(merged->size()) + " instances from " +
                       std::to_string(shard_dirs.size()) + " shards into " + out_dir.string());
  return merged;
}

}  // namespace sim
