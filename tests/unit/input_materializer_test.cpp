#include "internal/input/input_materializer.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/fakes/fake_http_transport.hpp"

namespace {

using lipsync::input::InputMaterializer;
using lipsync::input::InputReference;
using lipsync::input::InputSource;
using lipsync::input::JobWorkspace;
using lipsync::input::MediaKind;
using lipsync::testing::FakeHttpTransport;

std::filesystem::path Root() {
  const auto root = std::filesystem::temp_directory_path() / "lipsync_input_materializer_tests";
  std::filesystem::create_directories(root);
  return root;
}

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream bytes;
  bytes << in.rdbuf();
  return bytes.str();
}

std::string Bytes(std::size_t size) {
  std::string out;
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(static_cast<char>((i * 31) & 0xFF));
  }
  return out;
}

void TestPathIsReturnedUnchanged() {
  auto              transport = std::make_shared<FakeHttpTransport>();
  InputMaterializer materializer(transport, std::chrono::seconds(60), {});
  JobWorkspace      workspace(Root(), false, {});

  const auto path = materializer.Materialize({InputSource::kPath, "/data/portrait.jpg"}, MediaKind::kImage, workspace);
  assert(path == "/data/portrait.jpg");
  assert(transport->requests.empty());
  assert(std::filesystem::is_empty(workspace.path()));
}

void TestUrlIsStreamedIntoWorkspace() {
  auto transport = std::make_shared<FakeHttpTransport>();
  const auto body = Bytes(200000);
  transport->Enqueue("GET", "https://cdn.example/voice.wav", 200, body);

  InputMaterializer materializer(transport, std::chrono::seconds(7), {});
  JobWorkspace      workspace(Root(), false, {});

  const auto path = materializer.Materialize({InputSource::kUrl, "https://cdn.example/voice.wav"}, MediaKind::kAudio, workspace);
  assert(path == workspace.File("input_audio.wav"));
  assert(ReadAll(path) == body);
  assert(!std::filesystem::exists(path.string() + ".tmp"));
  assert(transport->requests.front().timeout == std::chrono::seconds(7));
}

void TestHttpErrorIsDownloadError() {
  auto transport = std::make_shared<FakeHttpTransport>();
  transport->Enqueue("GET", "https://cdn.example/missing.jpg", 404, "not found");

  InputMaterializer materializer(transport, std::chrono::seconds(60), {});
  JobWorkspace      workspace(Root(), false, {});

  bool threw = false;
  try {
    (void)materializer.Materialize({InputSource::kUrl, "https://cdn.example/missing.jpg"}, MediaKind::kImage, workspace);
  } catch (const lipsync::util::DownloadError& e) {
    threw = std::string(e.what()).find("404") != std::string::npos;
  }
  assert(threw);
  assert(!std::filesystem::exists(workspace.File("input_image.jpg")));
  assert(!std::filesystem::exists(workspace.File("input_image.jpg").string() + ".tmp"));
}

void TestUrlFollowsRedirect() {
  auto       transport = std::make_shared<FakeHttpTransport>();
  const auto body      = Bytes(5000);
  transport->EnqueueRedirect("GET", "http://cdn.example/share/portrait", 301, "/media/portrait.jpg");
  transport->Enqueue("GET", "http://cdn.example/media/portrait.jpg", 200, body);

  InputMaterializer materializer(transport, std::chrono::seconds(7), {});
  JobWorkspace      workspace(Root(), false, {});

  const auto path = materializer.Materialize({InputSource::kUrl, "http://cdn.example/share/portrait"}, MediaKind::kImage, workspace);
  assert(path == workspace.File("input_image.jpg"));
  assert(ReadAll(path) == body);
  assert(transport->requests.size() == 2);
  assert(transport->requests[1].url == "http://cdn.example/media/portrait.jpg");
  assert(transport->requests[1].timeout <= std::chrono::seconds(7));
}

void TestTransportFailureIsDownloadError() {
  auto transport = std::make_shared<FakeHttpTransport>();
  transport->EnqueueError("GET", "https://cdn.example/slow.jpg", "operation timed out");

  InputMaterializer materializer(transport, std::chrono::seconds(60), {});
  JobWorkspace      workspace(Root(), false, {});

  bool threw = false;
  try {
    (void)materializer.Materialize({InputSource::kUrl, "https://cdn.example/slow.jpg"}, MediaKind::kImage, workspace);
  } catch (const lipsync::util::DownloadError&) {
    threw = true;
  }
  assert(threw);
}

void TestBase64IsDecodedIntoWorkspace() {
  auto              transport = std::make_shared<FakeHttpTransport>();
  InputMaterializer materializer(transport, std::chrono::seconds(60), {});
  JobWorkspace      workspace(Root(), false, {});

  const auto bytes = Bytes(4099);
  const auto path  = materializer.Materialize({InputSource::kBase64, lipsync::util::Base64Encode(bytes)}, MediaKind::kVideo, workspace);
  assert(path == workspace.File("input_video.mp4"));
  assert(ReadAll(path) == bytes);
  assert(transport->requests.empty());
}

void TestMalformedBase64IsDecodeError() {
  auto              transport = std::make_shared<FakeHttpTransport>();
  InputMaterializer materializer(transport, std::chrono::seconds(60), {});
  JobWorkspace      workspace(Root(), false, {});

  bool threw = false;
  try {
    (void)materializer.Materialize({InputSource::kBase64, "not*base64"}, MediaKind::kImage, workspace);
  } catch (const lipsync::util::DecodeError&) {
    threw = true;
  }
  assert(threw);
}

void TestWorkspaceLifetime() {
  std::filesystem::path removed;
  {
    JobWorkspace workspace(Root(), false, {});
    removed = workspace.path();
    assert(workspace.id().rfind("task_", 0) == 0);
    assert(std::filesystem::is_directory(removed));
    std::ofstream(workspace.File("scratch.bin")) << "x";
  }
  assert(!std::filesystem::exists(removed));

  std::filesystem::path kept;
  {
    JobWorkspace workspace(Root(), true, {});
    kept = workspace.path();
  }
  assert(std::filesystem::is_directory(kept));
  std::filesystem::remove_all(kept);

  JobWorkspace a(Root(), false, {});
  JobWorkspace b(Root(), false, {});
  assert(a.path() != b.path());
}

} // namespace

int main() {
  TestPathIsReturnedUnchanged();
  TestUrlIsStreamedIntoWorkspace();
  TestHttpErrorIsDownloadError();
  TestUrlFollowsRedirect();
  TestTransportFailureIsDownloadError();
  TestBase64IsDecodedIntoWorkspace();
  TestMalformedBase64IsDecodeError();
  TestWorkspaceLifetime();

  std::cout << "lipsync_unit_input_materializer: pass\n";
  return 0;
}
