#include "internal/input/job_request.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using lipsync::input::InputSource;
using lipsync::input::MediaKind;
using lipsync::input::ParseJobRequest;
using lipsync::input::ValidateJobRequest;

const lipsync::observability::Logger kLogger;

bool ThrowsValidation(const std::string& json, const std::string& expected_message = {}) {
  try {
    (void)ValidateJobRequest(ParseJobRequest(json), kLogger);
  } catch (const lipsync::util::ValidationError& e) {
    return expected_message.empty() || std::string(e.what()) == expected_message;
  }
  return false;
}

void TestMissingImageIsRejected() {
  assert(ThrowsValidation(R"({"wav_path": "/data/a.wav"})", "Image input required (image_path, image_url, or image_base64)"));
}

void TestMissingAudioIsRejected() {
  assert(ThrowsValidation(R"({"image_url": "https://x/a.jpg"})", "Audio input required (wav_path, wav_url, or wav_base64)"));
}

void TestVideoModeNeedsVideo() {
  assert(ThrowsValidation(R"({"input_type": "video", "image_path": "/a.jpg", "wav_path": "/a.wav"})",
                          "Video input required (video_path, video_url, or video_base64)"));
}

void TestUnknownInputTypeIsRejected() {
  assert(ThrowsValidation(R"({"input_type": "gif", "image_path": "/a.jpg", "wav_path": "/a.wav"})"));
}

void TestNonPositiveNumbersAreRejected() {
  assert(ThrowsValidation(R"({"image_path": "/a.jpg", "wav_path": "/a.wav", "width": 0})"));
  assert(ThrowsValidation(R"({"image_path": "/a.jpg", "wav_path": "/a.wav", "max_frame": -3})"));
}

void TestMalformedJsonIsRejected() {
  bool threw = false;
  try {
    (void)ParseJobRequest("{not json");
  } catch (const lipsync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestPrecedenceIndependentOfKeyOrder() {
  const auto forward = ValidateJobRequest(
      ParseJobRequest(R"({"image_path": "/in/a.jpg", "image_url": "https://x/a.jpg", "image_base64": "Zm9v",
                          "wav_base64": "Zm9v", "wav_url": "https://x/a.wav"})"),
      kLogger);
  const auto reverse = ValidateJobRequest(
      ParseJobRequest(R"({"wav_url": "https://x/a.wav", "wav_base64": "Zm9v",
                          "image_base64": "Zm9v", "image_url": "https://x/a.jpg", "image_path": "/in/a.jpg"})"),
      kLogger);

  for (const auto* request : {&forward, &reverse}) {
    assert(request->primary_kind == MediaKind::kImage);
    assert(request->primary.source == InputSource::kPath);
    assert(request->primary.value == "/in/a.jpg");
    assert(request->audio.source == InputSource::kUrl);
    assert(request->audio.value == "https://x/a.wav");
  }
}

void TestOptionalParametersAndUnknownKeys() {
  const auto request = ValidateJobRequest(
      ParseJobRequest(R"({"input_type": "video", "video_url": "https://x/v.mp4", "wav_path": "/a.wav",
                          "prompt": "hello", "width": 640, "force_offload": false, "extra_key": {"nested": 1}})"),
      kLogger);

  assert(request.primary_kind == MediaKind::kVideo);
  assert(request.primary.source == InputSource::kUrl);
  assert(request.prompt == "hello");
  assert(request.width && *request.width == 640);
  assert(!request.height);
  assert(!request.max_frame);
  assert(request.force_offload && !*request.force_offload);
}

void TestDescribeForLogTruncatesPayloads() {
  lipsync::v1::JobRequest request;
  request.set_image_base64(std::string(4000, 'A'));
  request.set_wav_path("/a.wav");

  const auto described = lipsync::input::DescribeForLog(request);
  assert(described.find("total 4000 chars") != std::string::npos);
  assert(described.find(std::string(51, 'A')) == std::string::npos);
  assert(described.find("/a.wav") != std::string::npos);
}

} // namespace

int main() {
  TestMissingImageIsRejected();
  TestMissingAudioIsRejected();
  TestVideoModeNeedsVideo();
  TestUnknownInputTypeIsRejected();
  TestNonPositiveNumbersAreRejected();
  TestMalformedJsonIsRejected();
  TestPrecedenceIndependentOfKeyOrder();
  TestOptionalParametersAndUnknownKeys();
  TestDescribeForLogTruncatesPayloads();

  std::cout << "lipsync_unit_job_request: pass\n";
  return 0;
}
