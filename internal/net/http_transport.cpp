#include "internal/net/http_transport.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/net/url.hpp"
#include "internal/util/errors.hpp"

namespace lipsync::net {

namespace {

bool SameOrigin(const Url& a, const Url& b) {
  return a.scheme == b.scheme && a.host == b.host && a.port == b.port;
}

bool HeaderIs(const std::string& name, std::string_view wanted) {
  return std::equal(name.begin(), name.end(), wanted.begin(), wanted.end(), [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
  });
}

void DropHeader(HttpRequest& request, std::string_view name) {
  auto& headers = request.headers;
  headers.erase(std::remove_if(headers.begin(), headers.end(), [&](const auto& header) { return HeaderIs(header.first, name); }),
                headers.end());
}

} // namespace

HttpResponse HttpTransport::Send(const HttpRequest& request) {
  return FollowRedirects(request, [this](const HttpRequest& hop) { return SendOnce(hop); });
}

HttpResponse HttpTransport::Stream(const HttpRequest& request, std::size_t chunk_bytes, const ChunkSink& sink) {
  return FollowRedirects(request, [&](const HttpRequest& hop) { return StreamOnce(hop, chunk_bytes, sink); });
}

HttpResponse HttpTransport::FollowRedirects(const HttpRequest& request, const Exchange& exchange) {
  const auto deadline = std::chrono::steady_clock::now() + request.timeout;

  HttpRequest current = request;
  for (int hop = 0;; ++hop) {
    auto response = exchange(current);
    if (!response.IsRedirect() || response.location.empty()) {
      return response;
    }
    if (hop == kMaxRedirects) {
      throw util::TransportError("Too many redirects from " + request.url + " (last " + current.url + ")");
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining <= std::chrono::milliseconds::zero()) {
      throw util::TransportError("Timed out following redirects from " + request.url);
    }

    HttpRequest next = current;
    try {
      next.url = ResolveReference(current.url, response.location);
      if (!SameOrigin(ParseUrl(current.url), ParseUrl(next.url))) {
        DropHeader(next, "Authorization");
      }
    } catch (const std::invalid_argument& e) {
      throw util::TransportError("Unusable redirect from " + current.url + " to " + response.location + ": " + e.what());
    }
    next.timeout = remaining;

    const bool post_to_get = (response.status == 301 || response.status == 302) && current.method == "POST";
    if (response.status == 303 || post_to_get) {
      next.method = "GET";
      next.body.clear();
      DropHeader(next, "Content-Type");
    }
    current = std::move(next);
  }
}

} // namespace lipsync::net
