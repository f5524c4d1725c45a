#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace lipsync::util {

/*
  Random RFC 4122 version 4 identifiers, used for realtime client ids and
  job workspace names. Bytes come from OpenSSL's CSPRNG.
*/

using UUID = std::array<std::uint8_t, 16>;

// Throws std::runtime_error when the random source fails.
UUID GenerateUUID();

// Lowercase 8-4-4-4-12 form.
std::string ToString(const UUID& id);

std::string NewUuidString();

} // namespace lipsync::util
