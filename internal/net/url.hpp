#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace lipsync::net {

struct Url {
  std::string   scheme;  // http, https, ws
  std::string   host;
  std::uint16_t port = 0;
  std::string   target;  // path + query, always starts with '/'

  bool IsTls() const {
    return scheme == "https" || scheme == "wss";
  }
};

// Throws std::invalid_argument on anything that is not scheme://host[:port][/target].
Url ParseUrl(std::string_view text);

bool LooksLikeHttpUrl(std::string_view text);

std::string PercentEncode(std::string_view text);

/*
  Absolute form of `reference` (a Location header value) relative to `base`:
  absolute URLs are kept, "//host/x" takes the base scheme, "/x" the base
  authority, "?q" the base path and "x" the base directory. Dot segments are
  not collapsed. Throws std::invalid_argument when either URL is unusable.
*/
std::string ResolveReference(std::string_view base, std::string_view reference);

// Replaces every occurrence of `placeholder` in `pattern`.
std::string ExpandTemplate(std::string pattern, std::string_view placeholder, std::string_view value);

} // namespace lipsync::net
