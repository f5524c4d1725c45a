#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lipsync::net {

struct HttpRequest {
  std::string                                      method = "GET";
  std::string                                      url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      body;
  std::chrono::milliseconds                        timeout{std::chrono::seconds(30)};
};

struct HttpResponse {
  int         status = 0;
  std::string body;
  std::string location;  // Location header, kept for 3xx answers

  bool ok() const {
    return status >= 200 && status < 300;
  }

  bool IsRedirect() const {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
  }
};

// Receives one chunk of a streamed response body.
using ChunkSink = std::function<void(std::string_view chunk)>;

/*
  HTTP transport abstraction.

  Implementations:
    BeastHttpTransport → Boost.Beast over TCP / TLS
    tests              → scripted fakes

  Implementations provide a single exchange; Send and Stream follow
  redirects (301, 302, 303, 307, 308) on top of it, at most kMaxRedirects
  hops, all within the caller's request.timeout. 303, and 301/302 after a
  POST, continue as a body-less GET. Authorization is dropped when a redirect
  changes scheme, host or port.

  Network-level failures (resolve, connect, TLS, timeout, truncated
  response, redirect loops) throw util::TransportError. HTTP error statuses
  are returned, not thrown; callers decide what a non-2xx means for their
  step.
*/
class HttpTransport {
 public:
  static constexpr int kMaxRedirects = 5;

  virtual ~HttpTransport() = default;

  // Buffered request; the full body lands in HttpResponse::body.
  HttpResponse Send(const HttpRequest& request);

  /*
    Streamed request.

    For a 2xx response the body is handed to `sink` in chunks of at most
    `chunk_bytes` and HttpResponse::body stays empty. For any other status
    the body is buffered into HttpResponse::body and `sink` is never called.
  */
  HttpResponse Stream(const HttpRequest& request, std::size_t chunk_bytes, const ChunkSink& sink);

 protected:
  // One request/response exchange; 3xx answers are returned as they are.
  virtual HttpResponse SendOnce(const HttpRequest& request) = 0;
  virtual HttpResponse StreamOnce(const HttpRequest& request, std::size_t chunk_bytes, const ChunkSink& sink) = 0;

 private:
  using Exchange = std::function<HttpResponse(const HttpRequest&)>;

  static HttpResponse FollowRedirects(const HttpRequest& request, const Exchange& exchange);
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

} // namespace lipsync::net
