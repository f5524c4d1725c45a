#pragma once

#include <chrono>
#include <filesystem>

#include "internal/input/input_reference.hpp"
#include "internal/input/workspace.hpp"
#include "internal/net/http_transport.hpp"
#include "internal/observability/logging.hpp"

namespace lipsync::input {

/*
  InputMaterializer

  Turns an input reference into a local file:

      path   → returned unchanged (no copy, caller vouches for it)
      url    → streamed into the workspace        (DownloadError on failure)
      base64 → decoded into the workspace         (DecodeError on bad input)
*/
class InputMaterializer {
 public:
  InputMaterializer(net::HttpTransportPtr transport, std::chrono::milliseconds download_timeout, observability::Logger logger);

  std::filesystem::path Materialize(const InputReference& reference, MediaKind kind, const JobWorkspace& workspace) const;

 private:
  std::filesystem::path Download(const std::string& url, const std::filesystem::path& destination) const;
  std::filesystem::path Decode(const std::string& payload, const std::filesystem::path& destination) const;

  net::HttpTransportPtr     transport_;
  std::chrono::milliseconds download_timeout_;
  observability::Logger     logger_;
};

} // namespace lipsync::input
