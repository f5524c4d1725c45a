#pragma once

#include <algorithm>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/net/http_transport.hpp"
#include "internal/util/errors.hpp"

namespace lipsync::testing {

/*
  Scripted HttpTransport.

  Responses are keyed by "METHOD url". Queued responses are consumed in
  order; once a key's queue has a single entry left it is repeated. Unknown
  keys take the method's fallback when one is set, else answer 404. Every
  exchange is recorded, each redirect hop separately, and when a journal is
  attached each one appends "METHOD url" to it.
*/
class FakeHttpTransport final : public net::HttpTransport {
 public:
  struct Scripted {
    net::HttpResponse response;
    // Non-empty: throw util::TransportError with this message.
    std::string error;
    // Streamed responses: deliver this many bytes, then fail.
    std::optional<std::size_t> fail_after_bytes;
  };

  void Enqueue(const std::string& method, const std::string& url, int status, std::string body) {
    Scripted scripted;
    scripted.response.status = status;
    scripted.response.body   = std::move(body);
    routes_[Key(method, url)].push_back(std::move(scripted));
  }

  void EnqueueError(const std::string& method, const std::string& url, std::string error) {
    Scripted scripted;
    scripted.error = std::move(error);
    routes_[Key(method, url)].push_back(std::move(scripted));
  }

  void EnqueueTruncated(const std::string& method, const std::string& url, std::string body, std::size_t fail_after) {
    Scripted scripted;
    scripted.response.status = 200;
    scripted.response.body   = std::move(body);
    scripted.fail_after_bytes = fail_after;
    routes_[Key(method, url)].push_back(std::move(scripted));
  }

  void EnqueueRedirect(const std::string& method, const std::string& url, int status, std::string location) {
    Scripted scripted;
    scripted.response.status   = status;
    scripted.response.location = std::move(location);
    routes_[Key(method, url)].push_back(std::move(scripted));
  }

  // Answers any URL for `method` that has no route of its own.
  void SetFallback(const std::string& method, int status, std::string body) {
    Scripted scripted;
    scripted.response.status = status;
    scripted.response.body   = std::move(body);
    fallbacks_[method]       = std::move(scripted);
  }

  void AttachJournal(std::shared_ptr<std::vector<std::string>> journal) {
    journal_ = std::move(journal);
  }

  std::size_t Count(const std::string& method, const std::string& url) const {
    return static_cast<std::size_t>(std::count_if(requests.begin(), requests.end(), [&](const net::HttpRequest& r) {
      return r.method == method && r.url == url;
    }));
  }

  const net::HttpRequest* Last(const std::string& method, const std::string& url) const {
    for (auto it = requests.rbegin(); it != requests.rend(); ++it) {
      if (it->method == method && it->url == url) {
        return &*it;
      }
    }
    return nullptr;
  }

  std::vector<net::HttpRequest> requests;
  std::size_t                   streamed_requests = 0;
  std::size_t                   largest_chunk     = 0;

 protected:
  net::HttpResponse SendOnce(const net::HttpRequest& request) override {
    auto scripted = Next(request);
    if (!scripted.error.empty()) {
      throw util::TransportError(scripted.error);
    }
    return scripted.response;
  }

  net::HttpResponse StreamOnce(const net::HttpRequest& request, std::size_t chunk_bytes, const net::ChunkSink& sink) override {
    auto scripted = Next(request);
    if (!scripted.error.empty()) {
      throw util::TransportError(scripted.error);
    }
    if (!scripted.response.ok()) {
      return scripted.response;
    }

    ++streamed_requests;
    const auto& body  = scripted.response.body;
    const auto  limit = scripted.fail_after_bytes.value_or(body.size());
    for (std::size_t offset = 0; offset < std::min(limit, body.size()); offset += chunk_bytes) {
      const auto size = std::min({chunk_bytes, body.size() - offset, limit - offset});
      largest_chunk   = std::max(largest_chunk, size);
      sink(std::string_view(body).substr(offset, size));
    }
    if (scripted.fail_after_bytes) {
      throw util::TransportError("connection reset by peer");
    }

    net::HttpResponse response;
    response.status = scripted.response.status;
    return response;
  }

 private:
  static std::string Key(const std::string& method, const std::string& url) {
    return method + " " + url;
  }

  Scripted Next(const net::HttpRequest& request) {
    requests.push_back(request);
    if (journal_) {
      journal_->push_back(Key(request.method, request.url));
    }

    auto it = routes_.find(Key(request.method, request.url));
    if (it == routes_.end() || it->second.empty()) {
      if (auto fallback = fallbacks_.find(request.method); fallback != fallbacks_.end()) {
        return fallback->second;
      }
      Scripted missing;
      missing.response.status = 404;
      missing.response.body   = "no route for " + Key(request.method, request.url);
      return missing;
    }
    if (it->second.size() == 1) {
      return it->second.front();
    }
    auto next = std::move(it->second.front());
    it->second.pop_front();
    return next;
  }

  std::map<std::string, std::deque<Scripted>> routes_;
  std::map<std::string, Scripted>             fallbacks_;
  std::shared_ptr<std::vector<std::string>>    journal_;
};

} // namespace lipsync::testing
