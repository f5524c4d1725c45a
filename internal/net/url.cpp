#include "internal/net/url.hpp"

#include <cctype>
#include <stdexcept>

namespace lipsync::net {
namespace {

std::uint16_t DefaultPort(const std::string& scheme) {
  if (scheme == "http" || scheme == "ws") return 80;
  if (scheme == "https" || scheme == "wss") return 443;
  throw std::invalid_argument("unsupported url scheme: " + scheme);
}

// "scheme://..." with a scheme made of the characters RFC 3986 allows.
bool HasScheme(std::string_view text) {
  const auto end = text.find("://");
  if (end == std::string_view::npos || end == 0 || !std::isalpha(static_cast<unsigned char>(text.front()))) {
    return false;
  }
  for (char c : text.substr(0, end)) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

std::string HostPart(const Url& url) {
  const bool default_port = url.port == DefaultPort(url.scheme);
  return default_port ? url.host : url.host + ":" + std::to_string(url.port);
}

} // namespace

Url ParseUrl(std::string_view text) {
  const auto scheme_end = text.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    throw std::invalid_argument("url is missing a scheme: " + std::string(text));
  }

  Url url;
  for (char c : text.substr(0, scheme_end)) {
    url.scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  auto rest       = text.substr(scheme_end + 3);
  auto target_pos = rest.find_first_of("/?");
  auto authority  = rest.substr(0, target_pos);
  if (target_pos == std::string_view::npos) {
    url.target = "/";
  } else {
    url.target = std::string(rest.substr(target_pos));
    if (url.target.front() == '?') {
      url.target.insert(url.target.begin(), '/');
    }
  }

  if (authority.empty()) {
    throw std::invalid_argument("url is missing a host: " + std::string(text));
  }

  const auto colon = authority.rfind(':');
  if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
    url.host = std::string(authority.substr(0, colon));
    const auto port_text = authority.substr(colon + 1);
    if (port_text.empty()) {
      throw std::invalid_argument("url has an empty port: " + std::string(text));
    }
    unsigned long port = 0;
    for (char c : port_text) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        throw std::invalid_argument("url has a non-numeric port: " + std::string(text));
      }
      port = port * 10 + static_cast<unsigned long>(c - '0');
      if (port > 65535) {
        throw std::invalid_argument("url port out of range: " + std::string(text));
      }
    }
    url.port = static_cast<std::uint16_t>(port);
  } else {
    url.host = std::string(authority);
    url.port = DefaultPort(url.scheme);
  }

  if (url.host.empty()) {
    throw std::invalid_argument("url is missing a host: " + std::string(text));
  }

  DefaultPort(url.scheme);
  return url;
}

bool LooksLikeHttpUrl(std::string_view text) {
  return text.rfind("http://", 0) == 0 || text.rfind("https://", 0) == 0;
}

std::string PercentEncode(std::string_view text) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string           out;
  out.reserve(text.size());
  for (char c : text) {
    const auto b = static_cast<unsigned char>(c);
    if (std::isalnum(b) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(c);
    } else {
      out.push_back('%');
      out.push_back(kHex[b >> 4]);
      out.push_back(kHex[b & 0x0F]);
    }
  }
  return out;
}

std::string ResolveReference(std::string_view base, std::string_view reference) {
  if (HasScheme(reference)) {
    (void)ParseUrl(reference);
    return std::string(reference);
  }

  const auto parsed    = ParseUrl(base);
  const auto authority = parsed.scheme + "://" + HostPart(parsed);

  if (reference.rfind("//", 0) == 0) {
    return ResolveReference(base, parsed.scheme + ":" + std::string(reference));
  }
  if (reference.empty()) {
    return authority + parsed.target;
  }
  if (reference.front() == '/') {
    return authority + std::string(reference);
  }

  const auto path = parsed.target.substr(0, parsed.target.find('?'));
  if (reference.front() == '?') {
    return authority + path + std::string(reference);
  }
  return authority + path.substr(0, path.rfind('/') + 1) + std::string(reference);
}

std::string ExpandTemplate(std::string pattern, std::string_view placeholder, std::string_view value) {
  if (placeholder.empty()) {
    return pattern;
  }
  std::size_t pos = 0;
  while ((pos = pattern.find(placeholder, pos)) != std::string::npos) {
    pattern.replace(pos, placeholder.size(), value);
    pos += value.size();
  }
  return pattern;
}

} // namespace lipsync::net
