#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/execution/execution_monitor.hpp"
#include "internal/net/event_channel.hpp"
#include "internal/util/errors.hpp"

namespace lipsync::testing {

struct ScriptedRead {
  std::optional<net::ChannelMessage> message;
  bool                               drop = false;
};

/*
  Script shared by every channel a factory hands out. The first `refusals`
  Connect calls fail as a refused connection would, and so does every call
  once `connections_allowed` connections (when non-negative) were made.

  Reads pop `messages` in order; an entry without a message is an empty read
  slice, a drop entry closes the connection. Once the script is exhausted the
  channel reports closure, or keeps timing out when `close_when_drained` is
  false.
*/
struct ChannelScript {
  int                      refusals            = 0;
  int                      connections_allowed = -1;
  std::deque<ScriptedRead> messages;
  bool                     close_when_drained = true;

  int                                       connect_attempts = 0;
  int                                       closes           = 0;
  std::vector<std::string>                  connected_urls;
  std::shared_ptr<std::vector<std::string>> journal;

  void Push(std::string payload) {
    messages.push_back(ScriptedRead{net::ChannelMessage{std::move(payload), false}});
  }

  void PushBinary(std::string payload) {
    messages.push_back(ScriptedRead{net::ChannelMessage{std::move(payload), true}});
  }

  void PushSilence() {
    messages.push_back(ScriptedRead{});
  }

  void PushDrop() {
    messages.push_back(ScriptedRead{std::nullopt, true});
  }
};

class FakeEventChannel final : public net::EventChannel {
 public:
  explicit FakeEventChannel(std::shared_ptr<ChannelScript> script) : script_(std::move(script)) {
  }

  void Connect(const std::string& url, std::chrono::milliseconds) override {
    ++script_->connect_attempts;
    const bool exhausted = script_->connections_allowed >= 0 &&
                           static_cast<int>(script_->connected_urls.size()) >= script_->connections_allowed;
    if (script_->connect_attempts <= script_->refusals || exhausted) {
      throw util::TransportError("connection refused");
    }
    script_->connected_urls.push_back(url);
    if (script_->journal) {
      script_->journal->push_back("CONNECT " + url);
    }
  }

  std::optional<net::ChannelMessage> Read(std::chrono::milliseconds) override {
    if (script_->messages.empty()) {
      if (script_->close_when_drained) {
        throw util::TransportError("websocket closed");
      }
      return std::nullopt;
    }
    auto next = std::move(script_->messages.front());
    script_->messages.pop_front();
    if (next.drop) {
      throw util::TransportError("websocket closed by peer");
    }
    return std::move(next.message);
  }

  void Close() override {
    ++script_->closes;
  }

 private:
  std::shared_ptr<ChannelScript> script_;
};

inline execution::EventChannelFactory MakeChannelFactory(std::shared_ptr<ChannelScript> script) {
  return [script] { return std::make_unique<FakeEventChannel>(script); };
}

inline std::string ExecutingEvent(const std::string& prompt_id, const std::string& node) {
  return R"({"type": "executing", "data": {"node": ")" + node + R"(", "prompt_id": ")" + prompt_id + R"("}})";
}

inline std::string CompletionEvent(const std::string& prompt_id) {
  return R"({"type": "executing", "data": {"node": null, "prompt_id": ")" + prompt_id + R"("}})";
}

} // namespace lipsync::testing
