// File: src/scorer/instance_store.cpp
#include "sim/scorer/instance_store.hpp"

#include <utility>

#include "sim/scorer/instance_log.hpp"

namespace sim {

Result<InstanceStore> InstanceStore::create(const Corpus& corpus, ShardRange shard,
                                            MediaType target_type,
                                            InstanceConstructorTable constructors,
                                            InstanceOptions options, EventSink& events) {
  const auto corpus_size = static_cast<InstanceIndex>(corpus.size());
  if (!shard.is_resolved()) shard.end_index = corpus_size;

  if (shard.start_index < 0 || shard.start_index > shard.end_index || shard.end_index > corpus_size) {
    return Result<InstanceStore>::err(Status::out_of_range(
        "shard [" + std::to_string(shard.start_index) + ", " + std::to_string(shard.end_index) +
        ") is not within corpus of size " + std::to_string(corpus_size)));
  }

  const std::string key = instance_variant_key(corpus.source_type(), target_type);
  auto it = constructors.find(key);
  if (it == constructors.end() || !it->second) {
    return Result<InstanceStore>::err(
        Status::invalid_argument("no instance constructor for variant '" + key + "'"));
  }

  InstanceStore store;
  store.corpus_ = &corpus;
  store.events_ = &events;
  store.range_ = shard;
  store.source_type_ = corpus.source_type();
  store.target_type_ = target_type;
  store.factory_ = it->second;
  store.options_ = std::move(options);

  const Status st = store.populate_();
  if (!st.ok()) return Result<InstanceStore>::err(st);
  return Result<InstanceStore>::ok(std::move(store));
}

Result<InstanceStore> InstanceStore::create(const Corpus& corpus, const Config& cfg,
                                            EventSink& events,
                                            InstanceConstructorTable constructors) {
  if (corpus.source_type() != cfg.source_type) {
    return Result<InstanceStore>::err(Status::invalid_argument(
        std::string("config source_type is ") + media_type_name(cfg.source_type) +
        " but the corpus is " + media_type_name(corpus.source_type())));
  }
  return create(corpus, cfg.shard, cfg.target_type, std::move(constructors),
                instance_options_from_config(cfg), events);
}

Result<InstanceStore> InstanceStore::from_instances(std::vector<std::unique_ptr<Instance>> instances,
                                                    EventSink& events) {
  InstanceStore store;
  store.events_ = &events;

  for (auto& inst : instances) {
    if (!inst) return Result<InstanceStore>::err(Status::invalid_argument("null instance"));
    const InstanceIndex idx = inst->index();
    if (idx < 0) {
      return Result<InstanceStore>::err(
          Status::corrupt_data("negative instance index " + std::to_string(idx)));
    }
    if (store.instances_.count(idx) != 0) {
      return Result<InstanceStore>::err(
          Status::already_exists("instance " + std::to_string(idx) + " appears more than once"));
    }
    store.source_type_ = inst->source_type();
    store.target_type_ = inst->target_type();
    store.instances_.emplace(idx, std::move(inst));
  }

  if (store.instances_.empty()) {
    store.range_ = ShardRange{0, 0};
    return Result<InstanceStore>::ok(std::move(store));
  }

  store.range_.start_index = store.instances_.begin()->first;
  store.range_.end_index = store.instances_.rbegin()->first + 1;

  if (static_cast<std::int64_t>(store.instances_.size()) != store.range_.size()) {
    std::vector<InstanceIndex> missing;
    for (InstanceIndex i = store.range_.start_index; i < store.range_.end_index; ++i) {
      if (store.instances_.count(i) == 0) missing.push_back(i);
    }
    (void)emit_event(events, Severity::kWarning, "index_gap",
                     std::to_string(missing.size()) + " indices missing from replayed range [" +
                         std::to_string(store.range_.start_index) + ", " +
                         std::to_string(store.range_.end_index) + ")",
                     std::move(missing));
  }
  return Result<InstanceStore>::ok(std::move(store));
}

Status InstanceStore::populate_() {
  instances_.clear();
  for (InstanceIndex i = range_.start_index; i < range_.end_index; ++i) {
    auto inst = factory_(i, *corpus_, options_);
    if (!inst.ok()) return inst.status();
    if (!inst.value()) return Status::internal("instance constructor returned null");
    instances_.emplace(i, inst.take_value());
  }
  return Status::ok_status();
}

Status InstanceStore::reset() {
  if (corpus_ == nullptr) {
    return Status::unsupported("reset() on a replayed store: there is no corpus to rebuild from");
  }
  if (!instances_.empty() && events_ != nullptr) {
    (void)emit_event(*events_, Severity::kWarning, "reset_populated_store",
                     "discarding state of " + std::to_string(instances_.size()) + " instances");
  }
  return populate_();
}

Status InstanceStore::check_index_(InstanceIndex instance_id) const {
  if (!range_.contains(instance_id) || instances_.count(instance_id) == 0) {
    return Status::out_of_range("instance " + std::to_string(instance_id) + " is outside shard [" +
                                std::to_string(range_.start_index) + ", " +
                                std::to_string(range_.end_index) + ")");
  }
  return Status::ok_status();
}

Result<SourceSegment> InstanceStore::send_source(InstanceIndex instance_id, int segment_size) {
  const Status st = check_index_(instance_id);
  if (!st.ok()) return Result<SourceSegment>::err(st);

  auto seg = instances_.at(instance_id)->send_source(segment_size);
  if (seg.ok()) seg->instance_id = instance_id;
  return seg;
}

Status InstanceStore::receive_prediction(InstanceIndex instance_id, const PredictionSegment& segment) {
  SIM_RETURN_IF_ERROR(check_index_(instance_id));

  Instance& inst = *instances_.at(instance_id);
  const bool was_finished = inst.finish_prediction();
  SIM_RETURN_IF_ERROR(inst.receive_prediction(segment));

  if (!was_finished && inst.finish_prediction() && log_writer_ != nullptr) {
    return log_writer_->append(inst.summarize());
  }
  return Status::ok_status();
}

Result<Instance*> InstanceStore::at(InstanceIndex instance_id) {
  const Status st = check_index_(instance_id);
  if (!st.ok()) return Result<Instance*>::err(st);
  return Result<Instance*>::ok(instances_.at(instance_id).get());
}

Result<const Instance*> InstanceStore::at(InstanceIndex instance_id) const {
  const Status st = check_index_(instance_id);
  if (!st.ok()) return Result<const Instance*>::err(st);
  return Result<const Instance*>::ok(instances_.at(instance_id).get());
}

std::vector<Instance*> InstanceStore::ordered() {
  std::vector<Instance*> out;
  out.reserve(instances_.size());
  for (auto& kv : instances_) out.push_back(kv.second.get());
  return out;
}

std::vector<const Instance*> InstanceStore::ordered() const {
  std::vector<const Instance*> out;
  out.reserve(instances_.size());
  for (const auto& kv : instances_) out.push_back(kv.second.get());
  return out;
}

std::vector<InstanceIndex> InstanceStore::indices() const {
  std::vector<InstanceIndex> out;
  out.reserve(instances_.size());
  for (const auto& kv : instances_) out.push_back(kv.first);
  return out;
}

}  // namespace sim
