// File: include/sim/instance/corpus.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sim/core/status.hpp"
#include "sim/core/types.hpp"

namespace sim {

// One source example. Text sources use `text`; speech sources use `samples` + `sample_rate`.
struct SourceItem {
  std::string text;
  std::vector<float> samples;
  int sample_rate{16000};
};

// Read-only corpus accessor. Loading from disk is the caller's business.
class Corpus {
 public:
  virtual ~Corpus() = default;

  virtual std::size_t size() const = 0;
  virtual MediaType source_type() const = 0;

  // Returns out_of_range for indices >= size().
  virtual Result<SourceItem> source(InstanceIndex index) const = 0;
  virtual Result<std::string> reference(InstanceIndex index) const = 0;
};

class InMemoryCorpus final : public Corpus {
 public:
  InMemoryCorpus(MediaType source_type, std::vector<SourceItem> sources,
                 std::vector<std::string> references);

  // Convenience for text-to-text corpora.
  static InMemoryCorpus from_text(std::vector<std::string> sources,
                                  std::vector<std::string> references);

  std::size_t size() const override { return sources_.size(); }
  MediaType source_type() const override { return source_type_; }

  Result<SourceItem> source(InstanceIndex index) const override;
  Result<std::string> reference(InstanceIndex index) const override;

 private:
  Status check_index_(InstanceIndex index) const;

  MediaType source_type_;
  std::vector<SourceItem> sources_;
  std::vector<std::string> references_;
};

}  // namespace sim
