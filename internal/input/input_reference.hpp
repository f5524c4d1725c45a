#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace lipsync::input {

enum class InputSource : std::uint8_t {
  kPath   = 0,
  kUrl    = 1,
  kBase64 = 2,
};

enum class MediaKind : std::uint8_t {
  kImage = 0,
  kVideo = 1,
  kAudio = 2,
};

struct InputReference {
  InputSource source = InputSource::kPath;
  std::string value;
};

std::string_view ToString(InputSource source);
std::string_view ToString(MediaKind kind);

// File name a materialized input of this kind is written under.
std::string_view FileNameFor(MediaKind kind);

} // namespace lipsync::input
