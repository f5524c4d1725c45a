#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/error.hpp>

#include <chrono>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace lipsync::net::detail {

using Deadline = std::chrono::steady_clock::time_point;

/*
  Drives one asynchronous Beast/Asio operation to completion on a private
  io_context, bounded by `deadline`.

  `initiate` receives the completion handler; `cancel` aborts the pending
  operation when the deadline passes. Returns the operation's error code, or
  beast::error::timeout.
*/
template <typename Initiate, typename Cancel>
boost::beast::error_code Await(boost::asio::io_context& ioc, Deadline deadline, Initiate&& initiate, Cancel&& cancel) {
  boost::beast::error_code ec;
  bool                     done = false;

  std::forward<Initiate>(initiate)([&](boost::beast::error_code e, auto&&...) {
    ec   = e;
    done = true;
  });

  ioc.restart();
  const auto now = std::chrono::steady_clock::now();
  if (deadline > now) {
    ioc.run_for(deadline - now);
  }

  if (!done) {
    std::forward<Cancel>(cancel)();
    ioc.restart();
    ioc.run();
    return boost::beast::error::timeout;
  }
  return ec;
}

inline void ThrowIfFailed(const boost::beast::error_code& ec, const std::string& what) {
  if (ec) {
    throw lipsync::util::TransportError(what + ": " + ec.message());
  }
}

} // namespace lipsync::net::detail
