#include "internal/net/beast_event_channel.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

#include <stdexcept>

#include "internal/net/beast_support.hpp"
#include "internal/net/url.hpp"
#include "internal/util/errors.hpp"

namespace lipsync::net {

namespace asio      = boost::asio;
namespace beast     = boost::beast;
namespace websocket = beast::websocket;
using tcp           = asio::ip::tcp;

using detail::Await;
using detail::ThrowIfFailed;

BeastEventChannel::BeastEventChannel() = default;

BeastEventChannel::~BeastEventChannel() {
  Close();
}

void BeastEventChannel::Connect(const std::string& url_text, std::chrono::milliseconds timeout) {
  const auto url = ParseUrl(url_text);
  if (url.scheme != "ws") {
    throw std::invalid_argument("event channel supports ws:// only, got " + url.scheme);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  tcp::resolver               resolver(ioc_);
  tcp::resolver::results_type endpoints;
  auto                        ec = Await(
      ioc_, deadline,
      [&](auto handler) {
        resolver.async_resolve(url.host, std::to_string(url.port),
                               [&endpoints, handler](beast::error_code e, tcp::resolver::results_type r) mutable {
                                 endpoints = std::move(r);
                                 handler(e);
                               });
      },
      [&] { resolver.cancel(); });
  ThrowIfFailed(ec, "resolve " + url.host);

  auto ws     = std::make_unique<Socket>(ioc_);
  auto cancel = [&] { beast::get_lowest_layer(*ws).cancel(); };

  ec = Await(
      ioc_, deadline, [&](auto handler) { beast::get_lowest_layer(*ws).async_connect(endpoints, handler); }, cancel);
  ThrowIfFailed(ec, "connect " + url.host + ":" + std::to_string(url.port));

  ec = Await(
      ioc_, deadline,
      [&](auto handler) { ws->async_handshake(url.host + ":" + std::to_string(url.port), url.target, handler); }, cancel);
  ThrowIfFailed(ec, "websocket handshake " + url_text);

  // the websocket layer takes over timeouts once the session is up
  beast::get_lowest_layer(*ws).expires_never();
  ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

  ws_           = std::move(ws);
  read_pending_ = false;
  read_done_    = false;
  buffer_.consume(buffer_.size());
}

std::optional<ChannelMessage> BeastEventChannel::Read(std::chrono::milliseconds timeout) {
  if (!ws_) {
    throw util::TransportError("event channel is not connected");
  }

  if (!read_pending_) {
    read_done_    = false;
    read_pending_ = true;
    ws_->async_read(buffer_, [this](beast::error_code ec, std::size_t) {
      read_ec_   = ec;
      read_done_ = true;
    });
  }

  ioc_.restart();
  ioc_.run_for(timeout);

  if (!read_done_) {
    return std::nullopt;
  }
  read_pending_ = false;

  if (read_ec_) {
    const auto reason = read_ec_ == websocket::error::closed ? std::string("closed by server") : read_ec_.message();
    throw util::TransportError("event channel read failed: " + reason);
  }

  ChannelMessage message;
  message.binary  = ws_->got_binary();
  message.payload = beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  return message;
}

void BeastEventChannel::Close() {
  if (!ws_) {
    return;
  }

  if (ws_->is_open()) {
    // closing handshake is best effort; a dead peer must not block teardown
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    (void)Await(
        ioc_, deadline, [&](auto handler) { ws_->async_close(websocket::close_code::normal, handler); },
        [&] { beast::get_lowest_layer(*ws_).cancel(); });
  }

  beast::error_code ignored;
  beast::get_lowest_layer(*ws_).socket().close(ignored);
  ioc_.restart();
  ioc_.poll();
  ws_.reset();
  read_pending_ = false;
}

} // namespace lipsync::net
