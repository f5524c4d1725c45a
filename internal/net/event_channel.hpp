#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace lipsync::net {

struct ChannelMessage {
  std::string payload;
  bool        binary = false;
};

/*
  Realtime event channel (the inference server's WebSocket).

  One channel serves one job; it is opened with the job's correlation id
  before the job is submitted.
*/
class EventChannel {
 public:
  virtual ~EventChannel() = default;

  // Throws util::TransportError when the endpoint refuses or times out.
  virtual void Connect(const std::string& url, std::chrono::milliseconds timeout) = 0;

  /*
    Waits up to `timeout` for the next message.

    Returns std::nullopt when nothing arrived in time. Throws
    util::TransportError when the channel was closed or failed.
  */
  virtual std::optional<ChannelMessage> Read(std::chrono::milliseconds timeout) = 0;

  virtual void Close() = 0;
};

using EventChannelPtr = std::unique_ptr<EventChannel>;

} // namespace lipsync::net
