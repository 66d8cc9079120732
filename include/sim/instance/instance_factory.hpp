// File: include/sim/instance/instance_factory.hpp
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "sim/core/status.hpp"
#include "sim/instance/corpus.hpp"
#include "sim/instance/instance.hpp"

namespace sim {

using InstanceFactory = std::function<Result<std::unique_ptr<Instance>>(
    InstanceIndex index, const Corpus& corpus, const InstanceOptions& options)>;

// "<source>-<target>" -> factory. Handed to the store explicitly; there is no global registry.
using InstanceConstructorTable = std::map<std::string, InstanceFactory>;

// "text-text", "speech-text", "speech-speech", ...
std::string instance_variant_key(MediaType source, MediaType target);

// text-text, speech-text and speech-speech.
InstanceConstructorTable default_instance_constructors();

// Rebuilds a frozen instance from a log record, dispatching on its target type.
Result<std::unique_ptr<Instance>> restore_instance(InstanceSummary summary);

}  // namespace sim
