// File: src/speech/wav_io.cpp
#include "sim/speech/wav_io.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <fstream>

namespace sim {
namespace {

// RIFF is little-endian regardless of host.
void put_u32(std::ofstream& f, std::uint32_t v) {
  const std::array<char, 4> b{static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                              static_cast<char>((v >> 16) & 0xFF),
                              static_cast<char>((v >> 24) & 0xFF)};
  f.write(b.data(), 4);
}

void put_u16(std::ofstream& f, std::uint16_t v) {
  const std::array<char, 2> b{static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF)};
  f.write(b.data(), 2);
}

std::uint32_t get_u32(const unsigned char* p) {
  return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::uint16_t get_u16(const unsigned char* p) {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

}  // namespace

Status write_wav_pcm16(const std::string& path, const std::vector<float>& samples, int sample_rate) {
  if (sample_rate <= 0) return Status::invalid_argument("write_wav_pcm16: sample_rate must be > 0");

  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.is_open()) return Status::io_error("write_wav_pcm16: failed to open " + path);

  const std::uint32_t data_bytes = static_cast<std::uint32_t>(samples.size() * 2);
  const std::uint32_t rate = static_cast<std::uint32_t>(sample_rate);

  f.write("RIFF", 4);
  put_u32(f, 36 + data_bytes);
  f.write("WAVE", 4);

  f.write("fmt ", 4);
  put_u32(f, 16);
  put_u16(f, 1);  // PCM
  put_u16(f, 1);  // mono
  put_u32(f, rate);
  put_u32(f, rate * 2);
  put_u16(f, 2);
  put_u16(f, 16);

  f.write("data", 4);
  put_u32(f, data_bytes);

  std::vector<char> buf(samples.size() * 2);
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const float x = std::clamp(samples[i], -1.0f, 1.0f);
    const auto v = static_cast<std::int16_t>(std::lround(x * 32767.0f));
    const auto u = static_cast<std::uint16_t>(v);
    buf[2 * i] = static_cast<char>(u & 0xFF);
    buf[2 * i + 1] = static_cast<char>((u >> 8) & 0xFF);
  }
  f.write(buf.data(), static_cast<std::streamsize>(buf.size()));

  if (!f) return Status::io_error("write_wav_pcm16: short write to " + path);
  return Status::ok_status();
}

Result<WavInfo> read_wav_info(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) return Result<WavInfo>::err(Status::io_error("read_wav_info: failed to open " + path));

  unsigned char riff[12];
  f.read(reinterpret_cast<char*>(riff), sizeof(riff));
  if (!f || std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
    return Result<WavInfo>::err(Status::corrupt_data("read_wav_info: not a RIFF/WAVE file: " + path));
  }

  WavInfo info;
  bool have_fmt = false;
  while (true) {
    unsigned char hdr[8];
    f.read(reinterpret_cast<char*>(hdr), sizeof(hdr));
    if (!f) break;

    const std::uint32_t size = get_u32(hdr + 4);
    if (std::memcmp(hdr, "fmt ", 4) == 0) {
      if (size < 16) {
        return Result<WavInfo>::err(Status::corrupt_data("read_wav_info: short fmt chunk in " + path));
      }
      unsigned char fmt[16];
      f.read(reinterpret_cast<char*>(fmt), sizeof(fmt));
      if (!f) return Result<WavInfo>::err(Status::io_error("read_wav_info: short read"));
      info.channels = get_u16(fmt + 2);
      info.sample_rate = static_cast<int>(get_u32(fmt + 4));
      info.bits_per_sample = get_u16(fmt + 14);
      have_fmt = true;
      f.seekg(static_cast<std::streamoff>(size - 16 + (size & 1)), std::ios::cur);
      continue;
    }

    if (std::memcmp(hdr, "data", 4) == 0) {
      if (!have_fmt || info.channels <= 0 || info.bits_per_sample <= 0) {
        return Result<WavInfo>::err(Status::corrupt_data("read_wav_info: data before fmt in " + path));
      }
      const std::int64_t frame_bytes =
          static_cast<std::int64_t>(info.channels) * (info.bits_per_sample / 8);
      info.num_frames = frame_bytes > 0 ? static_cast<std::int64_t>(size) / frame_bytes : 0;
      return Result<WavInfo>::ok(info);
    }

    // Chunks are word-aligned.
    f.seekg(static_cast<std::streamoff>(size + (size & 1)), std::ios::cur);
  }

  return Result<WavInfo>::err(Status::corrupt_data("read_wav_info: no data chunk in " + path));
}

}  // namespace sim
