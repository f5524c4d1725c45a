#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/base64.hpp"
#include "internal/util/error_result.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using lipsync::util::Base64Decode;
using lipsync::util::Base64Encode;

void TestBase64KnownVectors() {
  assert(Base64Encode("") == "");
  assert(Base64Encode("f") == "Zg==");
  assert(Base64Encode("fo") == "Zm8=");
  assert(Base64Encode("foo") == "Zm9v");
  assert(Base64Encode("foobar") == "Zm9vYmFy");

  assert(Base64Decode("Zg==") == "f");
  assert(Base64Decode("Zm8=") == "fo");
  assert(Base64Decode("Zm9vYmFy") == "foobar");
}

void TestBase64BinaryAndWhitespace() {
  std::string bytes;
  for (int i = 0; i < 256; ++i) {
    bytes.push_back(static_cast<char>(i));
  }
  const auto encoded = Base64Encode(bytes);

  std::string wrapped;
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    wrapped.push_back(encoded[i]);
    if (i % 76 == 75) {
      wrapped.push_back('\n');
    }
  }
  assert(Base64Decode(wrapped) == bytes);
}

void TestBase64RejectsMalformedInput() {
  for (const char* bad : {"Zm9", "Zm9v!A==", "Zg==Zg==", "@@@@"}) {
    bool threw = false;
    try {
      (void)Base64Decode(bad);
    } catch (const lipsync::util::DecodeError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestTruncateForLog() {
  assert(lipsync::util::TruncateForLog("") == "None");
  assert(lipsync::util::TruncateForLog("short") == "short");

  const std::string long_value(120, 'A');
  assert(lipsync::util::TruncateForLog(long_value) == std::string(50, 'A') + "... (total 120 chars)");
}

void TestUuidFormatAndUniqueness() {
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i) {
    const auto id = lipsync::util::NewUuidString();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(std::string("89ab").find(id[19]) != std::string::npos);
    for (std::size_t pos = 0; pos < id.size(); ++pos) {
      if (pos == 8 || pos == 13 || pos == 18 || pos == 23) {
        continue;
      }
      assert(std::string("0123456789abcdef").find(id[pos]) != std::string::npos);
    }
    seen.insert(id);
  }
  assert(seen.size() == 64);

  lipsync::util::UUID fixed{};
  fixed[0]  = 0xAB;
  fixed[15] = 0x01;
  assert(lipsync::util::ToString(fixed) == "ab000000-0000-0000-0000-000000000001");
}

void TestExitCodes() {
  assert(lipsync::util::ToExitCode(lipsync::util::ValidationError("x")) == lipsync::util::kExitUsage);
  assert(lipsync::util::ToExitCode(lipsync::util::PollError("x")) == lipsync::util::kExitFailure);
  assert(lipsync::util::ToExitCode(lipsync::util::NoOutputError("x")) == lipsync::util::kExitFailure);
  assert(lipsync::util::ToExitCode(std::runtime_error("x")) == lipsync::util::kExitFailure);

  const auto result = lipsync::util::ToJobResult(lipsync::util::DownloadError("Download error: timeout"));
  assert(result.error() == "Download error: timeout");
  assert(result.video().empty());
}

} // namespace

int main() {
  TestBase64KnownVectors();
  TestBase64BinaryAndWhitespace();
  TestBase64RejectsMalformedInput();
  TestTruncateForLog();
  TestUuidFormatAndUniqueness();
  TestExitCodes();

  std::cout << "lipsync_unit_util: pass\n";
  return 0;
}
