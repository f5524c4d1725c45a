#include "internal/net/beast_http_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

#include "internal/net/beast_support.hpp"
#include "internal/net/url.hpp"
#include "internal/util/errors.hpp"

namespace lipsync::net {

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

using detail::Await;
using detail::Deadline;
using detail::ThrowIfFailed;

namespace {

constexpr const char* kUserAgent = "lipsync-orchestrator";

std::string HostHeader(const Url& url) {
  const bool default_port = (url.port == 80 && !url.IsTls()) || (url.port == 443 && url.IsTls());
  return default_port ? url.host : url.host + ":" + std::to_string(url.port);
}

http::request<http::string_body> BuildRequest(const Url& url, const HttpRequest& request) {
  const auto verb = http::string_to_verb(request.method);
  if (verb == http::verb::unknown) {
    throw std::invalid_argument("unsupported http method: " + request.method);
  }

  http::request<http::string_body> req{verb, url.target, 11};
  req.set(http::field::host, HostHeader(url));
  req.set(http::field::user_agent, kUserAgent);
  for (const auto& [name, value] : request.headers) {
    req.set(name, value);
  }
  if (!request.body.empty() || verb == http::verb::post || verb == http::verb::put) {
    req.body() = request.body;
    req.prepare_payload();
  }
  return req;
}

tcp::resolver::results_type Resolve(asio::io_context& ioc, const Url& url, Deadline deadline) {
  tcp::resolver               resolver(ioc);
  tcp::resolver::results_type results;

  auto ec = Await(
      ioc, deadline,
      [&](auto handler) {
        resolver.async_resolve(url.host, std::to_string(url.port),
                               [&results, handler](beast::error_code e, tcp::resolver::results_type r) mutable {
                                 results = std::move(r);
                                 handler(e);
                               });
      },
      [&] { resolver.cancel(); });
  ThrowIfFailed(ec, "resolve " + url.host);
  return results;
}

template <typename Stream>
HttpResponse Exchange(asio::io_context& ioc, Stream& stream, const Url& url, const HttpRequest& request, Deadline deadline,
                      std::size_t chunk_bytes, const ChunkSink* sink) {
  auto cancel = [&] { beast::get_lowest_layer(stream).cancel(); };

  auto req = BuildRequest(url, request);
  auto ec  = Await(
      ioc, deadline, [&](auto handler) { http::async_write(stream, req, handler); }, cancel);
  ThrowIfFailed(ec, request.method + " " + request.url + ": write");

  beast::flat_buffer                   buffer;
  http::response_parser<http::buffer_body> parser;
  parser.body_limit(std::numeric_limits<std::uint64_t>::max());

  ec = Await(
      ioc, deadline, [&](auto handler) { http::async_read_header(stream, buffer, parser, handler); }, cancel);
  ThrowIfFailed(ec, request.method + " " + request.url + ": read header");

  HttpResponse response;
  response.status = static_cast<int>(parser.get().result_int());
  if (response.IsRedirect()) {
    const auto location = parser.get()[http::field::location];
    response.location.assign(location.data(), location.size());
  }

  const bool        streaming = sink != nullptr && response.ok();
  std::vector<char> chunk(chunk_bytes == 0 ? 8192 : chunk_bytes);

  while (!parser.is_done()) {
    parser.get().body().data = chunk.data();
    parser.get().body().size = chunk.size();

    ec = Await(
        ioc, deadline, [&](auto handler) { http::async_read(stream, buffer, parser, handler); }, cancel);
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    ThrowIfFailed(ec, request.method + " " + request.url + ": read body");

    const auto filled = chunk.size() - parser.get().body().size;
    if (filled == 0) {
      continue;
    }
    if (streaming) {
      (*sink)(std::string_view(chunk.data(), filled));
    } else {
      response.body.append(chunk.data(), filled);
    }
  }

  return response;
}

} // namespace

BeastHttpTransport::BeastHttpTransport(bool verify_peer) : ssl_ctx_(asio::ssl::context::tls_client) {
  ssl_ctx_.set_default_verify_paths();
  ssl_ctx_.set_verify_mode(verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none);
}

HttpResponse BeastHttpTransport::SendOnce(const HttpRequest& request) {
  return Perform(request, 0, nullptr);
}

HttpResponse BeastHttpTransport::StreamOnce(const HttpRequest& request, std::size_t chunk_bytes, const ChunkSink& sink) {
  return Perform(request, chunk_bytes, &sink);
}

HttpResponse BeastHttpTransport::Perform(const HttpRequest& request, std::size_t chunk_bytes, const ChunkSink* sink) {
  const auto url = ParseUrl(request.url);
  if (url.scheme != "http" && url.scheme != "https") {
    throw std::invalid_argument("http transport cannot handle scheme " + url.scheme);
  }

  const Deadline   deadline = std::chrono::steady_clock::now() + request.timeout;
  asio::io_context ioc;
  const auto       endpoints = Resolve(ioc, url, deadline);

  if (!url.IsTls()) {
    beast::tcp_stream stream(ioc);
    auto              ec = Await(
        ioc, deadline, [&](auto handler) { stream.async_connect(endpoints, handler); }, [&] { stream.cancel(); });
    ThrowIfFailed(ec, "connect " + HostHeader(url));

    auto response = net::Exchange(ioc, stream, url, request, deadline, chunk_bytes, sink);

    // not_connected is common here and carries no information
    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    return response;
  }

  beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
    throw util::TransportError("TLS: cannot set SNI host name " + url.host);
  }
  stream.set_verify_callback(asio::ssl::host_name_verification(url.host));

  auto cancel = [&] { beast::get_lowest_layer(stream).cancel(); };
  auto ec     = Await(
      ioc, deadline, [&](auto handler) { beast::get_lowest_layer(stream).async_connect(endpoints, handler); }, cancel);
  ThrowIfFailed(ec, "connect " + HostHeader(url));

  ec = Await(
      ioc, deadline, [&](auto handler) { stream.async_handshake(asio::ssl::stream_base::client, handler); }, cancel);
  ThrowIfFailed(ec, "TLS handshake with " + url.host);

  auto response = net::Exchange(ioc, stream, url, request, deadline, chunk_bytes, sink);

  // many servers drop TLS without close_notify; closing the socket is enough
  beast::error_code ignored;
  beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ignored);
  return response;
}

} // namespace lipsync::net
