// File: include/sim/speech/wav_io.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sim/core/status.hpp"

namespace sim {

struct WavInfo {
  int sample_rate{0};
  int channels{0};
  int bits_per_sample{0};
  std::int64_t num_frames{0};
};

// Mono 16-bit PCM. Samples are clamped to [-1, 1].
Status write_wav_pcm16(const std::string& path, const std::vector<float>& samples, int sample_rate);

// RIFF/WAVE header only; enough to count frames for manifests.
Result<WavInfo> read_wav_info(const std::string& path);

}  // namespace sim
