#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "client/cpp/client_cli.h"
#include "client/cpp/task_queue_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/net/beast_http_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/error_result.hpp"

using lipsync::client::ClientOptions;

static constexpr const char* kDefaultTokenEnv = "LIPSYNC_API_TOKEN";

int main(int argc, char** argv) {
  ClientOptions options;
  try {
    options = lipsync::client::ParseClientArgs(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const std::invalid_argument& e) {
    std::cerr << "lipsyncctl: " << e.what() << "\n\n";
    lipsync::client::PrintUsage(std::cerr);
    return lipsync::util::kExitUsage;
  }
  if (options.help) {
    lipsync::client::PrintUsage(std::cout);
    return lipsync::util::kExitSuccess;
  }

  lipsync::runtime::config::RuntimeConfig config;
  try {
    if (!options.config_path.empty()) {
      config = lipsync::config::ConfigLoader::LoadFromYaml(options.config_path);
    }
  } catch (const std::exception& e) {
    std::cerr << "lipsyncctl: " << e.what() << "\n";
    return lipsync::util::kExitUsage;
  }

  auto logger = lipsync::observability::InitializeLogging(config.logging(), "lipsyncctl");

  const std::string token_env = config.queue().token_env().empty() ? kDefaultTokenEnv : config.queue().token_env();
  const char*       token     = std::getenv(token_env.c_str());
  if (token == nullptr || *token == '\0') {
    std::cerr << "Error: " << token_env << " environment variable not set\n";
    lipsync::observability::ShutdownLogging();
    return lipsync::util::kExitUsage;
  }

  int code = lipsync::util::kExitSuccess;
  try {
    auto settings = lipsync::client::ResolveSettings(options, config.queue(), token);
    lipsync::client::TaskQueueClient client(std::move(settings), std::make_shared<lipsync::net::BeastHttpTransport>(), logger);
    code = lipsync::client::RunClient(options, client, std::cout, std::cerr);
  } catch (const std::invalid_argument& e) {
    std::cerr << "lipsyncctl: " << e.what() << "\n\n";
    lipsync::client::PrintUsage(std::cerr);
    code = lipsync::util::kExitUsage;
  } catch (const std::exception& e) {
    LIPSYNC_LOG_ERROR(logger, "Fatal error", {lipsync::observability::StringField("error", e.what())});
    code = lipsync::util::ToExitCode(e);
  }

  lipsync::observability::ShutdownLogging();
  return code;
}
