#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <memory>

#include "internal/net/event_channel.hpp"

namespace lipsync::net {

/*
  EventChannel over a Boost.Beast WebSocket (plain ws:// only; the inference
  server listens on the worker's loopback interface).

  Reads are sliced: a read that does not finish within the slice stays
  pending and is resumed by the next Read() call, so no message is lost
  between slices.
*/
class BeastEventChannel final : public EventChannel {
 public:
  BeastEventChannel();
  ~BeastEventChannel() override;

  void                          Connect(const std::string& url, std::chrono::milliseconds timeout) override;
  std::optional<ChannelMessage> Read(std::chrono::milliseconds timeout) override;
  void                          Close() override;

 private:
  using Socket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  boost::asio::io_context     ioc_;
  std::unique_ptr<Socket>     ws_;
  boost::beast::flat_buffer   buffer_;
  bool                        read_pending_ = false;
  bool                        read_done_    = false;
  boost::beast::error_code    read_ec_;
};

} // namespace lipsync::net
