#include "internal/input/job_request.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace lipsync::input {

using lipsync::observability::IntField;
using lipsync::observability::StringField;

std::string_view ToString(InputSource source) {
  switch (source) {
    case InputSource::kPath:
      return "path";
    case InputSource::kUrl:
      return "url";
    case InputSource::kBase64:
      return "base64";
  }
  return "unknown";
}

std::string_view ToString(MediaKind kind) {
  switch (kind) {
    case MediaKind::kImage:
      return "image";
    case MediaKind::kVideo:
      return "video";
    case MediaKind::kAudio:
      return "audio";
  }
  return "unknown";
}

std::string_view FileNameFor(MediaKind kind) {
  switch (kind) {
    case MediaKind::kImage:
      return "input_image.jpg";
    case MediaKind::kVideo:
      return "input_video.mp4";
    case MediaKind::kAudio:
      return "input_audio.wav";
  }
  return "input.bin";
}

namespace {

int CountPresent(const std::string& path, const std::string& url, const std::string& base64) {
  return static_cast<int>(!path.empty()) + static_cast<int>(!url.empty()) + static_cast<int>(!base64.empty());
}

InputReference RequireSource(MediaKind kind, const std::string& prefix, const std::string& path, const std::string& url,
                             const std::string& base64, const observability::Logger& logger) {
  auto selected = SelectSource(path, url, base64);
  if (!selected) {
    const std::string label = kind == MediaKind::kAudio ? "Audio" : (kind == MediaKind::kVideo ? "Video" : "Image");
    throw util::ValidationError(label + " input required (" + prefix + "_path, " + prefix + "_url, or " + prefix + "_base64)");
  }

  const int present = CountPresent(path, url, base64);
  if (present > 1) {
    LIPSYNC_LOG_WARN(logger, "Several input forms supplied; using the highest precedence one",
                     {StringField("medium", ToString(kind)), IntField("forms", present), StringField("selected", ToString(selected->source))});
  }
  return *selected;
}

} // namespace

std::optional<InputReference> SelectSource(const std::string& path, const std::string& url, const std::string& base64) {
  if (!path.empty()) {
    return InputReference{InputSource::kPath, path};
  }
  if (!url.empty()) {
    return InputReference{InputSource::kUrl, url};
  }
  if (!base64.empty()) {
    return InputReference{InputSource::kBase64, base64};
  }
  return std::nullopt;
}

lipsync::v1::JobRequest ParseJobRequest(const std::string& json) {
  lipsync::v1::JobRequest request;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &request, options);
  if (!status.ok()) {
    throw util::ValidationError("Invalid job request: " + std::string(status.message()));
  }
  return request;
}

ValidatedRequest ValidateJobRequest(const lipsync::v1::JobRequest& request, const observability::Logger& logger) {
  ValidatedRequest out;

  const std::string input_type = request.input_type().empty() ? "image" : request.input_type();
  if (input_type == "image") {
    out.primary_kind = MediaKind::kImage;
    out.primary = RequireSource(MediaKind::kImage, "image", request.image_path(), request.image_url(), request.image_base64(), logger);
  } else if (input_type == "video") {
    out.primary_kind = MediaKind::kVideo;
    out.primary = RequireSource(MediaKind::kVideo, "video", request.video_path(), request.video_url(), request.video_base64(), logger);
  } else {
    throw util::ValidationError("Unsupported input_type '" + input_type + "' (expected 'image' or 'video')");
  }

  out.audio  = RequireSource(MediaKind::kAudio, "wav", request.wav_path(), request.wav_url(), request.wav_base64(), logger);
  out.prompt = request.prompt();

  if (request.has_width()) {
    if (request.width() <= 0) throw util::ValidationError("width must be positive");
    out.width = request.width();
  }
  if (request.has_height()) {
    if (request.height() <= 0) throw util::ValidationError("height must be positive");
    out.height = request.height();
  }
  if (request.has_max_frame()) {
    if (request.max_frame() <= 0) throw util::ValidationError("max_frame must be positive");
    out.max_frame = request.max_frame();
  }
  if (request.has_force_offload()) {
    out.force_offload = request.force_offload();
  }

  return out;
}

std::string DescribeForLog(const lipsync::v1::JobRequest& request) {
  auto copy = request;
  for (auto* field : {copy.mutable_image_base64(), copy.mutable_video_base64(), copy.mutable_wav_base64()}) {
    if (!field->empty()) {
      *field = util::TruncateForLog(*field);
    }
  }

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(copy, &json, options).ok()) {
    return "<unprintable request>";
  }
  return json;
}

} // namespace lipsync::input
