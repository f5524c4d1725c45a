#pragma once

#include <string>
#include <string_view>

namespace lipsync::util {

/*
  Standard (RFC 4648) base64 with padding, backed by OpenSSL's EVP block
  coder. Decoding skips ASCII whitespace and throws DecodeError on anything
  else that is not part of the alphabet.
*/

std::string Base64Encode(std::string_view bytes);
std::string Base64Decode(std::string_view text);

// Log-safe rendering of a base64 value: first max_length chars plus total size.
std::string TruncateForLog(std::string_view value, std::size_t max_length = 50);

} // namespace lipsync::util
