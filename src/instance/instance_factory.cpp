// File: src/instance/instance_factory.cpp
#include "sim/instance/instance_factory.hpp"

#include <utility>

#include "sim/instance/speech_output_instance.hpp"
#include "sim/instance/text_output_instance.hpp"

namespace sim {

std::string instance_variant_key(MediaType source, MediaType target) {
  return std::string(media_type_name(source)) + "-" + media_type_name(target);
}

InstanceConstructorTable default_instance_constructors() {
  InstanceConstructorTable table;
  table[instance_variant_key(MediaType::kText, MediaType::kText)] = &TextOutputInstance::create;
  table[instance_variant_key(MediaType::kSpeech, MediaType::kText)] = &TextOutputInstance::create;
  table[instance_variant_key(MediaType::kSpeech, MediaType::kSpeech)] = &SpeechOutputInstance::create;
  return table;
}

Result<std::unique_ptr<Instance>> restore_instance(InstanceSummary summary) {
  std::unique_ptr<Instance> inst;
  if (summary.target_type == MediaType::kSpeech) {
    if (summary.source_type != MediaType::kSpeech) {
      return Result<std::unique_ptr<Instance>>::err(Status::invalid_argument(
          "instance " + std::to_string(summary.index) + ": text source with speech target"));
    }
    inst = std::make_unique<SpeechOutputInstance>(std::move(summary));
  } else {
    inst = std::make_unique<TextOutputInstance>(std::move(summary));
  }
  return Result<std::unique_ptr<Instance>>::ok(std::move(inst));
}

}  // namespace sim
