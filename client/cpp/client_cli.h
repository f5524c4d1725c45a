#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "client/cpp/task_queue_client.h"
#include "config/config.pb.h"
#include "lipsync/v1.hpp"

namespace lipsync::client {

struct ClientOptions {
  std::string url;
  std::string mode = "i2v";
  std::string image;
  std::string video;
  std::string audio;
  std::string prompt = "A person talking naturally";

  std::optional<int>  width;
  std::optional<int>  height;
  std::optional<bool> force_offload;

  std::string output = "output.mp4";
  std::string config_path;
  std::string task_id;
  bool        sync = false;
  bool        help = false;
};

// Arguments without the program name. Throws std::invalid_argument on
// unknown flags, missing values and malformed numbers.
ClientOptions ParseClientArgs(const std::vector<std::string>& args);

void PrintUsage(std::ostream& out);

/*
  Builds the submission payload.

  Inputs given as http(s) URLs are passed by reference; anything else is
  read from disk and inlined as base64. Width and height default to 384 for
  i2v and 640 for v2v. Throws util::ValidationError when the medium the mode
  needs, or the audio, is missing or unreadable.
*/
lipsync::v1::JobRequest BuildPayload(const ClientOptions& options);

// --url overrides the submit URL (or the sync URL with --sync).
TaskQueueSettings ResolveSettings(const ClientOptions& options, const lipsync::runtime::config::QueueConfig& config,
                                  std::string token);

/*
  Runs one client invocation: submit (or resume --task), wait, download; or
  a single synchronous call with --sync.

  Returns the process exit code: 0 success, 1 usage or missing input,
  2 job or transport failure.
*/
int RunClient(const ClientOptions& options, const TaskQueueClient& client, std::ostream& out, std::ostream& err);

} // namespace lipsync::client
