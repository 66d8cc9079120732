// File: include/sim/scorer/instance_store.hpp
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

#include "sim/core/config.hpp"
#include "sim/core/events/event_sink.hpp"
#include "sim/core/status.hpp"
#include "sim/core/types.hpp"
#include "sim/instance/corpus.hpp"
#include "sim/instance/instance.hpp"
#include "sim/instance/instance_factory.hpp"

namespace sim {

class InstanceLogWriter;

// Owns exactly one Instance per index of a shard.
//
// Live stores are built from a corpus and a shard range; replay stores from log records.
// Any index outside the shard is a contract violation reported as kOutOfRange.
class InstanceStore {
 public:
  // Resolves end_index < 0 to the corpus size, checks 0 <= start <= end <= size and builds
  // every instance through `constructors[instance_variant_key(source, target)]`.
  static Result<InstanceStore> create(const Corpus& corpus, ShardRange shard, MediaType target_type,
                                      InstanceConstructorTable constructors,
                                      InstanceOptions options, EventSink& events);

  // Live store for a run config: cfg.shard, cfg.target_type and the instance options derived
  // from it. A corpus whose media type differs from cfg.source_type is kInvalidArgument.
  static Result<InstanceStore> create(const Corpus& corpus, const Config& cfg, EventSink& events,
                                      InstanceConstructorTable constructors =
                                          default_instance_constructors());

  // Frozen store over replayed instances. Range is [min, max + 1); gaps are reported as an
  // `index_gap` warning. A repeated index is kAlreadyExists.
  static Result<InstanceStore> from_instances(std::vector<std::unique_ptr<Instance>> instances,
                                              EventSink& events);

  InstanceStore(InstanceStore&&) = default;
  InstanceStore& operator=(InstanceStore&&) = default;

  // Recreates every instance. Destructive; warns when the store was already populated.
  Status reset();

  Result<SourceSegment> send_source(InstanceIndex instance_id, int segment_size);

  // Forwards a prediction; when it completes the instance, the record is appended to the log
  // writer (if attached).
  Status receive_prediction(InstanceIndex instance_id, const PredictionSegment& segment);

  Result<Instance*> at(InstanceIndex instance_id);
  Result<const Instance*> at(InstanceIndex instance_id) const;

  // Index order.
  std::vector<Instance*> ordered();
  std::vector<const Instance*> ordered() const;
  std::vector<InstanceIndex> indices() const;

  std::size_t size() const { return instances_.size(); }
  bool empty() const { return instances_.empty(); }
  const ShardRange& range() const { return range_; }
  MediaType source_type() const { return source_type_; }
  MediaType target_type() const { return target_type_; }

  // Not owned; must outlive the store's use of it. nullptr detaches.
  void set_log_writer(InstanceLogWriter* writer) { log_writer_ = writer; }

 private:
  InstanceStore() = default;

  Status check_index_(InstanceIndex instance_id) const;
  Status populate_();

  const Corpus* corpus_{nullptr};  // null for replay stores
  EventSink* events_{nullptr};
  InstanceLogWriter* log_writer_{nullptr};

  ShardRange range_;
  MediaType source_type_{MediaType::kText};
  MediaType target_type_{MediaType::kText};
  InstanceFactory factory_;
  InstanceOptions options_;

  std::map<InstanceIndex, std::unique_ptr<Instance>> instances_;
};

}  // namespace sim
