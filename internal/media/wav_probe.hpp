#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace lipsync::media {

struct WavInfo {
  std::uint16_t audio_format    = 0;
  std::uint16_t channels        = 0;
  std::uint32_t sample_rate     = 0;
  std::uint32_t byte_rate       = 0;
  std::uint16_t block_align     = 0;
  std::uint16_t bits_per_sample = 0;
  std::uint64_t data_bytes      = 0;

  double DurationSeconds() const {
    return byte_rate == 0 ? 0.0 : static_cast<double>(data_bytes) / static_cast<double>(byte_rate);
  }
};

/*
  Reads the RIFF/WAVE header of `path` and walks its chunks up to "data".

  Returns std::nullopt for anything that is not a readable WAVE file with a
  "fmt " chunk preceding a "data" chunk, or whose format fields disagree
  (zero channels, sample width or block size, or a byte rate other than
  sample_rate * block_align). Only the header is inspected; samples are
  never decoded.
*/
std::optional<WavInfo> ProbeWav(const std::filesystem::path& path);

// Convenience wrapper: duration in seconds, or std::nullopt.
std::optional<double> ProbeDurationSeconds(const std::filesystem::path& path);

} // namespace lipsync::media
