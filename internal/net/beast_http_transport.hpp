#pragma once

#include <boost/asio/ssl/context.hpp>

#include "internal/net/http_transport.hpp"

namespace lipsync::net {

/*
  HttpTransport over Boost.Beast.

  Every request runs on its own io_context, so one transport instance can
  serve several jobs from different threads. https uses OpenSSL with the
  system trust store; connections are not reused.
*/
class BeastHttpTransport final : public HttpTransport {
 public:
  explicit BeastHttpTransport(bool verify_peer = true);

 protected:
  HttpResponse SendOnce(const HttpRequest& request) override;
  HttpResponse StreamOnce(const HttpRequest& request, std::size_t chunk_bytes, const ChunkSink& sink) override;

 private:
  HttpResponse Perform(const HttpRequest& request, std::size_t chunk_bytes, const ChunkSink* sink);

  boost::asio::ssl::context ssl_ctx_;
};

} // namespace lipsync::net
