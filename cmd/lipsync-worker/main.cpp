#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/input/job_request.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/error_result.hpp"
#include "internal/worker/server_readiness.hpp"

static void Usage() {
  std::cerr << "Usage: lipsync-worker [--config <config.yaml>] [--request <file|->] [--async]\n"
            << "\n"
            << "Waits for the inference server, runs one job request (JSON, stdin by\n"
            << "default) and prints the JSON result on stdout.\n";
}

static std::string ReadRequest(const std::string& source) {
  if (source == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    throw std::invalid_argument("cannot read request file " + source);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static std::string ToJson(const lipsync::v1::JobResult& result) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(result, &json, options);
  if (!status.ok()) {
    return "{\"error\": \"failed to encode result\"}";
  }
  return json;
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string request_source = "-";
  bool        async          = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--request" && i + 1 < argc) {
      request_source = argv[++i];
    } else if (arg == "--async") {
      async = true;
    } else {
      Usage();
      return lipsync::util::kExitUsage;
    }
  }

  lipsync::runtime::config::RuntimeConfig config;
  try {
    if (!config_path.empty()) {
      config = lipsync::config::ConfigLoader::LoadFromYaml(config_path);
    }
  } catch (const std::exception& e) {
    std::cerr << "lipsync-worker: " << e.what() << "\n";
    return lipsync::util::kExitUsage;
  }

  auto logger = lipsync::observability::InitializeLogging(config.logging(), "lipsync-worker");

  lipsync::v1::JobResult result;
  int                    code = lipsync::util::kExitSuccess;
  try {
    // ------------------------------------------------------------
    // Read and parse the request before touching the server
    // ------------------------------------------------------------
    const auto request = lipsync::input::ParseJobRequest(ReadRequest(request_source));

    // ------------------------------------------------------------
    // Build dependency graph, wait for the inference server
    // ------------------------------------------------------------
    auto runtime = lipsync::factory::BuildWorker(config, logger);
    lipsync::worker::WaitForServerReady(*runtime.inference, runtime.readiness, logger.WithName("readiness"));

    result = async ? runtime.processor->ProcessAsync(request) : runtime.processor->ProcessSync(request);
    if (!result.error().empty()) {
      code = lipsync::util::kExitFailure;
    }
  } catch (const std::exception& e) {
    LIPSYNC_LOG_ERROR(logger, "Fatal error", {lipsync::observability::StringField("error", e.what())});
    result = lipsync::util::ToJobResult(e);
    code   = lipsync::util::kExitFailure;
  }

  std::cout << ToJson(result) << std::endl;
  lipsync::observability::ShutdownLogging();
  return code;
}
