#include "internal/util/base64.hpp"

#include <openssl/evp.h>

#include <cctype>

#include "internal/util/errors.hpp"

namespace lipsync::util {

std::string Base64Encode(std::string_view bytes) {
  if (bytes.empty()) {
    return {};
  }

  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  const int   written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::string Base64Decode(std::string_view text) {
  std::string compact;
  compact.reserve(text.size());
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      continue;
    }
    compact.push_back(c);
  }

  if (compact.empty()) {
    return {};
  }
  if (compact.size() % 4 != 0) {
    throw DecodeError("base64 decode failed: length " + std::to_string(compact.size()) + " is not a multiple of 4");
  }

  std::size_t padding = 0;
  if (compact[compact.size() - 1] == '=') ++padding;
  if (compact[compact.size() - 2] == '=') ++padding;
  for (std::size_t i = 0; i + padding < compact.size(); ++i) {
    if (compact[i] == '=') {
      throw DecodeError("base64 decode failed: padding inside payload");
    }
  }

  std::string out(3 * (compact.size() / 4), '\0');
  const int   decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(compact.data()), static_cast<int>(compact.size()));
  if (decoded < 0) {
    throw DecodeError("base64 decode failed: invalid character in payload");
  }

  // EVP_DecodeBlock counts padding as zero bytes.
  out.resize(static_cast<std::size_t>(decoded) - padding);
  return out;
}

std::string TruncateForLog(std::string_view value, std::size_t max_length) {
  if (value.empty()) {
    return "None";
  }
  if (value.size() <= max_length) {
    return std::string(value);
  }
  return std::string(value.substr(0, max_length)) + "... (total " + std::to_string(value.size()) + " chars)";
}

} // namespace lipsync::util
