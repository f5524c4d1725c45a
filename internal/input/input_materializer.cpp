#include "internal/input/input_materializer.hpp"

#include <fstream>
#include <stdexcept>

#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace lipsync::input {

using lipsync::observability::IntField;
using lipsync::observability::StringField;

namespace {

constexpr std::size_t kDownloadChunkBytes = 64 * 1024;

} // namespace

InputMaterializer::InputMaterializer(net::HttpTransportPtr transport, std::chrono::milliseconds download_timeout,
                                     observability::Logger logger)
    : transport_(std::move(transport)), download_timeout_(download_timeout), logger_(std::move(logger)) {
}

std::filesystem::path InputMaterializer::Materialize(const InputReference& reference, MediaKind kind,
                                                     const JobWorkspace& workspace) const {
  switch (reference.source) {
    case InputSource::kPath:
      LIPSYNC_LOG_INFO(logger_, "Path input", {StringField("medium", ToString(kind)), StringField("path", reference.value)});
      return reference.value;

    case InputSource::kUrl:
      LIPSYNC_LOG_INFO(logger_, "URL input", {StringField("medium", ToString(kind)), StringField("url", reference.value)});
      return Download(reference.value, workspace.File(std::string(FileNameFor(kind))));

    case InputSource::kBase64:
      LIPSYNC_LOG_INFO(logger_, "Base64 input", {StringField("medium", ToString(kind)), IntField("chars", static_cast<int64_t>(reference.value.size()))});
      return Decode(reference.value, workspace.File(std::string(FileNameFor(kind))));
  }
  throw std::logic_error("unhandled input source");
}

/*
  Streams the body to `<destination>.tmp` and renames on success, so a
  half-written input never carries the final name.
*/
std::filesystem::path InputMaterializer::Download(const std::string& url, const std::filesystem::path& destination) const {
  const auto tmp_path = destination.string() + ".tmp";

  net::HttpRequest request;
  request.method  = "GET";
  request.url     = url;
  request.timeout = download_timeout_;

  net::HttpResponse response;
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::DownloadError("URL download failed: cannot open " + tmp_path);
    }

    try {
      response = transport_->Stream(request, kDownloadChunkBytes, [&](std::string_view chunk) {
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!out) {
          throw util::DownloadError("URL download failed: write to " + tmp_path + " failed");
        }
      });
    } catch (const util::TransportError& e) {
      LIPSYNC_LOG_ERROR(logger_, "Download error", {StringField("url", url), StringField("error", e.what())});
      throw util::DownloadError(std::string("Download error: ") + e.what());
    } catch (const std::invalid_argument& e) {
      throw util::DownloadError(std::string("Download error: ") + e.what());
    }
  }

  if (!response.ok()) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    LIPSYNC_LOG_ERROR(logger_, "Download failed", {StringField("url", url), IntField("status", response.status)});
    throw util::DownloadError("URL download failed: HTTP " + std::to_string(response.status) + " for " + url);
  }

  std::filesystem::rename(tmp_path, destination);
  LIPSYNC_LOG_INFO(logger_, "Downloaded file from URL", {StringField("url", url), StringField("path", destination.string())});
  return destination;
}

std::filesystem::path InputMaterializer::Decode(const std::string& payload, const std::filesystem::path& destination) const {
  std::string bytes;
  try {
    bytes = util::Base64Decode(payload);
  } catch (const util::DecodeError& e) {
    LIPSYNC_LOG_ERROR(logger_, "Base64 decode failed", {StringField("error", e.what())});
    throw;
  }

  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out) {
    throw util::DecodeError("Base64 input could not be written to " + destination.string());
  }

  LIPSYNC_LOG_INFO(logger_, "Saved base64 input", {StringField("path", destination.string()), IntField("bytes", static_cast<int64_t>(bytes.size()))});
  return destination;
}

} // namespace lipsync::input
