// File: src/instance/corpus.cpp
#include "sim/instance/corpus.hpp"

#include <algorithm>
#include <utility>

namespace sim {

InMemoryCorpus::InMemoryCorpus(MediaType source_type, std::vector<SourceItem> sources,
                               std::vector<std::string> references)
    : source_type_(source_type), sources_(std::move(sources)), references_(std::move(references)) {
  // A reference-less tail would be unscorable; keep the two lists the same length.
  const std::size_t n = std::min(sources_.size(), references_.size());
  sources_.resize(n);
  references_.resize(n);
}

InMemoryCorpus InMemoryCorpus::from_text(std::vector<std::string> sources,
                                         std::vector<std::string> references) {
  std::vector<SourceItem> items;
  items.reserve(sources.size());
  for (auto& s : sources) {
    SourceItem item;
    item.text = std::move(s);
    items.push_back(std::move(item));
  }
  return InMemoryCorpus(MediaType::kText, std::move(items), std::move(references));
}

Status InMemoryCorpus::check_index_(InstanceIndex index) const {
  if (index < 0 || static_cast<std::size_t>(index) >= sources_.size()) {
    return Status::out_of_range("corpus index " + std::to_string(index) + " outside [0, " +
                                std::to_string(sources_.size()) + ")");
  }
  return Status::ok_status();
}

Result<SourceItem> InMemoryCorpus::source(InstanceIndex index) const {
  const Status st = check_index_(index);
  if (!st.ok()) return Result<SourceItem>::err(st);
  return Result<SourceItem>::ok(sources_[static_cast<std::size_t>(index)]);
}

Result<std::string> InMemoryCorpus::reference(InstanceIndex index) const {
  const Status st = check_index_(index);
  if (!st.ok()) return Result<std::string>::err(st);
  return Result<std::string>::ok(references_[static_cast<std::size_t>(index)]);
}

}  // namespace sim
