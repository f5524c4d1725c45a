#include "client/cpp/client_cli.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/net/url.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/error_result.hpp"
#include "internal/util/errors.hpp"

namespace lipsync::client {

namespace {

int ParsePositive(const std::string& flag, const std::string& value) {
  std::size_t consumed = 0;
  int         parsed   = 0;
  try {
    parsed = std::stoi(value, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument("invalid value for " + flag + ": " + value);
  }
  if (consumed != value.size() || parsed <= 0) {
    throw std::invalid_argument("invalid value for " + flag + ": " + value);
  }
  return parsed;
}

std::string ReadBinary(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::ValidationError("Cannot read input file: " + path);
  }
  std::ostringstream bytes;
  bytes << in.rdbuf();
  return bytes.str();
}

// Sets either the *_url or the *_base64 field for one medium.
template <typename UrlSetter, typename Base64Setter>
void SetInput(const std::string& value, UrlSetter set_url, Base64Setter set_base64) {
  if (net::LooksLikeHttpUrl(value)) {
    set_url(value);
  } else {
    set_base64(util::Base64Encode(ReadBinary(value)));
  }
}

} // namespace

ClientOptions ParseClientArgs(const std::vector<std::string>& args) {
  ClientOptions options;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg   = args[i];
    auto        value = [&]() -> const std::string& {
      if (i + 1 >= args.size()) {
        throw std::invalid_argument("missing value for " + arg);
      }
      return args[++i];
    };

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "--url") {
      options.url = value();
    } else if (arg == "--mode") {
      options.mode = value();
      if (options.mode != "i2v" && options.mode != "v2v") {
        throw std::invalid_argument("--mode must be i2v or v2v, got " + options.mode);
      }
    } else if (arg == "-i" || arg == "--image") {
      options.image = value();
    } else if (arg == "-v" || arg == "--video") {
      options.video = value();
    } else if (arg == "-a" || arg == "--audio") {
      options.audio = value();
    } else if (arg == "-p" || arg == "--prompt") {
      options.prompt = value();
    } else if (arg == "-w" || arg == "--width") {
      options.width = ParsePositive(arg, value());
    } else if (arg == "-H" || arg == "--height") {
      options.height = ParsePositive(arg, value());
    } else if (arg == "-o" || arg == "--output") {
      options.output = value();
    } else if (arg == "--force-offload") {
      options.force_offload = true;
    } else if (arg == "--no-force-offload") {
      options.force_offload = false;
    } else if (arg == "--config") {
      options.config_path = value();
    } else if (arg == "--task") {
      options.task_id = value();
    } else if (arg == "--sync") {
      options.sync = true;
    } else {
      throw std::invalid_argument("unknown argument: " + arg);
    }
  }

  if (options.sync && !options.task_id.empty()) {
    throw std::invalid_argument("--sync and --task cannot be combined");
  }
  return options;
}

void PrintUsage(std::ostream& out) {
  out << "Usage:\n"
      << "  lipsyncctl --url <queue_url> -i <image> -a <audio> [options]\n"
      << "  lipsyncctl --url <queue_url> --mode v2v -v <video> -a <audio> [options]\n"
      << "  lipsyncctl --task <task_id> [-o <output>]\n"
      << "  lipsyncctl --sync --url <endpoint_url> -i <image> -a <audio> [options]\n"
      << "\n"
      << "Inputs are local paths (sent inline) or http(s) URLs.\n"
      << "\n"
      << "Options:\n"
      << "  --mode i2v|v2v           image-to-video (default) or video-to-video\n"
      << "  -p, --prompt <text>      default: \"A person talking naturally\"\n"
      << "  -w, --width <px>         default: 384 (i2v), 640 (v2v)\n"
      << "  -H, --height <px>        default: 384 (i2v), 640 (v2v)\n"
      << "  -o, --output <file>      default: output.mp4\n"
      << "  --force-offload          offload model weights between steps (worker default)\n"
      << "  --no-force-offload\n"
      << "  --config <yaml>          runtime config (queue section)\n"
      << "\n"
      << "The API token is read from $LIPSYNC_API_TOKEN (or queue.token_env).\n";
}

lipsync::v1::JobRequest BuildPayload(const ClientOptions& options) {
  lipsync::v1::JobRequest payload;

  const bool video_mode = options.mode == "v2v";
  if (video_mode) {
    if (options.video.empty()) {
      throw util::ValidationError("--video is required for V2V mode");
    }
  } else if (options.image.empty()) {
    throw util::ValidationError("--image is required for I2V mode");
  }
  if (options.audio.empty()) {
    throw util::ValidationError("--audio is required");
  }

  const int default_size = video_mode ? 640 : 384;
  payload.set_input_type(video_mode ? "video" : "image");
  payload.set_prompt(options.prompt);
  payload.set_width(options.width.value_or(default_size));
  payload.set_height(options.height.value_or(default_size));
  if (options.force_offload) {
    payload.set_force_offload(*options.force_offload);
  }

  if (video_mode) {
    SetInput(
        options.video, [&](const std::string& v) { payload.set_video_url(v); },
        [&](const std::string& v) { payload.set_video_base64(v); });
  } else {
    SetInput(
        options.image, [&](const std::string& v) { payload.set_image_url(v); },
        [&](const std::string& v) { payload.set_image_base64(v); });
  }
  SetInput(
      options.audio, [&](const std::string& v) { payload.set_wav_url(v); },
      [&](const std::string& v) { payload.set_wav_base64(v); });

  return payload;
}

TaskQueueSettings ResolveSettings(const ClientOptions& options, const lipsync::runtime::config::QueueConfig& config,
                                  std::string token) {
  auto settings = TaskQueueSettingsFrom(config, std::move(token));
  if (!options.url.empty()) {
    if (options.sync) {
      settings.sync_url = options.url;
    } else {
      settings.submit_url = options.url;
    }
  }

  if (options.sync && settings.sync_url.empty()) {
    throw std::invalid_argument("--sync needs --url or queue.sync_url");
  }
  if (!options.sync && options.task_id.empty() && settings.submit_url.empty()) {
    throw std::invalid_argument("--url is required (or queue.submit_url in --config)");
  }
  return settings;
}

int RunClient(const ClientOptions& options, const TaskQueueClient& client, std::ostream& out, std::ostream& err) {
  try {
    std::string task_id = options.task_id;

    if (task_id.empty()) {
      const auto payload = BuildPayload(options);
      out << "Mode: " << (payload.input_type() == "video" ? "V2V (Video-to-Video)" : "I2V (Image-to-Video)") << "\n";

      if (options.sync) {
        out << "Calling " << client.settings().sync_url << "...\n";
        const auto result = client.CallSync(client.settings().sync_url, payload);
        if (!result.error().empty()) {
          err << "Job failed: " << result.error() << "\n";
          return util::kExitFailure;
        }
        if (result.video().empty()) {
          throw util::NoOutputError("Synchronous call returned no video");
        }
        client.SaveInline(result.video(), options.output);
        out << "Video saved to " << options.output << "\n";
        return util::kExitSuccess;
      }

      out << "Submitting task to " << client.settings().submit_url << "...\n";
      task_id = client.Submit(payload);
      out << "Task ID: " << task_id << "\n";
    } else {
      out << "Resuming task " << task_id << "\n";
    }

    out << "Waiting for completion...\n";
    std::string shown;
    const auto  outcome = client.WaitForCompletion(task_id, [&](const std::string& status, int counter) {
      if (status != shown) {
        out << "Status: " << status << "\n";
        shown = status;
      }
      if (ParseTaskStatus(status) == TaskStatus::kRunning) {
        out << "  [" << counter << "/100]\n";
      }
    });

    if (!outcome.succeeded()) {
      err << "Task failed with status: " << outcome.response.status() << "\n";
      return util::kExitFailure;
    }

    out << "Task completed\n";
    client.Fetch(outcome.response, options.output);
    out << "Video saved to " << options.output << "\n";
    return util::kExitSuccess;
  } catch (const std::exception& e) {
    err << "Error: " << e.what() << "\n";
    return util::ToExitCode(e);
  }
}

} // namespace lipsync::client
