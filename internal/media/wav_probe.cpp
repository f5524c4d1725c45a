#include "internal/media/wav_probe.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <system_error>

namespace lipsync::media {
namespace {

constexpr std::uint32_t kUnknownSize = 0xFFFFFFFFu;

std::uint16_t ReadLe16(const unsigned char* p) {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t ReadLe32(const unsigned char* p) {
  return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) | (static_cast<std::uint32_t>(p[2]) << 16) |
         (static_cast<std::uint32_t>(p[3]) << 24);
}

bool ReadExact(std::ifstream& in, unsigned char* dst, std::size_t n) {
  in.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
  return static_cast<std::size_t>(in.gcount()) == n;
}

// The rate fields must agree with each other before the byte rate is trusted.
bool IsConsistent(const WavInfo& info) {
  if (info.channels == 0 || info.sample_rate == 0 || info.block_align == 0 || info.bits_per_sample == 0) {
    return false;
  }
  return static_cast<std::uint64_t>(info.byte_rate) == static_cast<std::uint64_t>(info.sample_rate) * info.block_align;
}

} // namespace

std::optional<WavInfo> ProbeWav(const std::filesystem::path& path) {
  std::error_code ec;
  const auto      file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    return std::nullopt;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }

  std::array<unsigned char, 12> riff{};
  if (!ReadExact(in, riff.data(), riff.size())) {
    return std::nullopt;
  }
  if (std::memcmp(riff.data(), "RIFF", 4) != 0 || std::memcmp(riff.data() + 8, "WAVE", 4) != 0) {
    return std::nullopt;
  }

  WavInfo info;
  bool    have_fmt = false;

  std::array<unsigned char, 8> header{};
  while (ReadExact(in, header.data(), header.size())) {
    const std::uint32_t chunk_size = ReadLe32(header.data() + 4);

    if (std::memcmp(header.data(), "fmt ", 4) == 0) {
      if (chunk_size < 16) {
        return std::nullopt;
      }
      std::array<unsigned char, 16> fmt{};
      if (!ReadExact(in, fmt.data(), fmt.size())) {
        return std::nullopt;
      }
      info.audio_format    = ReadLe16(fmt.data());
      info.channels        = ReadLe16(fmt.data() + 2);
      info.sample_rate     = ReadLe32(fmt.data() + 4);
      info.byte_rate       = ReadLe32(fmt.data() + 8);
      info.block_align     = ReadLe16(fmt.data() + 12);
      info.bits_per_sample = ReadLe16(fmt.data() + 14);
      have_fmt             = true;

      // chunks are word aligned
      const std::uint64_t rest = static_cast<std::uint64_t>(chunk_size) - 16 + (chunk_size & 1u);
      in.seekg(static_cast<std::streamoff>(rest), std::ios::cur);
      continue;
    }

    if (std::memcmp(header.data(), "data", 4) == 0) {
      if (!have_fmt || !IsConsistent(info)) {
        return std::nullopt;
      }
      const auto          position  = static_cast<std::uint64_t>(in.tellg());
      const std::uint64_t available = file_size > position ? file_size - position : 0;
      // streamed writers leave the size unset; trust the file instead
      info.data_bytes = chunk_size == kUnknownSize ? available : std::min<std::uint64_t>(chunk_size, available);
      return info;
    }

    in.seekg(static_cast<std::streamoff>(static_cast<std::uint64_t>(chunk_size) + (chunk_size & 1u)), std::ios::cur);
    if (!in) {
      return std::nullopt;
    }
  }

  return std::nullopt;
}

std::optional<double> ProbeDurationSeconds(const std::filesystem::path& path) {
  auto info = ProbeWav(path);
  if (!info) {
    return std::nullopt;
  }
  return info->DurationSeconds();
}

} // namespace lipsync::media
