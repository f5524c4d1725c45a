#include "internal/factory.hpp"

#include "internal/input/input_materializer.hpp"
#include "internal/net/beast_event_channel.hpp"
#include "internal/net/beast_http_transport.hpp"
#include "internal/util/time.hpp"

namespace lipsync::factory {

using lipsync::runtime::config::InferenceServerConfig;
using lipsync::runtime::config::RuntimeConfig;
using lipsync::runtime::config::WorkerConfig;

namespace {

constexpr const char*   kDefaultHost = "127.0.0.1";
constexpr std::uint16_t kDefaultPort = 8188;

const util::Millis kDefaultRequestTimeout  = std::chrono::seconds(30);
const util::Millis kDefaultDownloadTimeout = std::chrono::seconds(60);

} // namespace

execution::MonitorSettings MonitorSettingsFrom(const InferenceServerConfig& config) {
  execution::MonitorSettings settings;
  settings.connect_retry_interval  = util::OrDefault(config.connect_retry_interval(), settings.connect_retry_interval);
  settings.connect_ceiling         = util::OrDefault(config.connect_ceiling(), settings.connect_ceiling);
  settings.connect_attempt_timeout = util::OrDefault(config.request_timeout(), kDefaultRequestTimeout);
  settings.execution_timeout       = util::OrDefault(config.execution_timeout(), settings.execution_timeout);
  settings.read_slice              = util::OrDefault(config.read_slice(), settings.read_slice);
  return settings;
}

worker::ReadinessSettings ReadinessSettingsFrom(const InferenceServerConfig& config) {
  worker::ReadinessSettings settings;
  settings.interval = util::OrDefault(config.ready_interval(), settings.interval);
  settings.ceiling  = util::OrDefault(config.ready_ceiling(), settings.ceiling);
  return settings;
}

worker::ProcessorSettings ProcessorSettingsFrom(const WorkerConfig& config) {
  worker::ProcessorSettings settings;
  if (!config.work_root().empty()) {
    settings.work_root = config.work_root();
  }
  if (!config.output_dir().empty()) {
    settings.output_dir = config.output_dir();
  }
  settings.upload_url     = config.upload_url();
  settings.keep_workspace = config.keep_workspace();

  if (!config.workflow().image_template().empty()) {
    settings.image_template = config.workflow().image_template();
  }
  if (!config.workflow().video_template().empty()) {
    settings.video_template = config.workflow().video_template();
  }

  if (!config.default_prompt().empty()) {
    settings.default_prompt = config.default_prompt();
  }
  if (config.default_width() > 0) {
    settings.default_width = static_cast<int>(config.default_width());
  }
  if (config.default_height() > 0) {
    settings.default_height = static_cast<int>(config.default_height());
  }
  if (config.has_default_force_offload()) {
    settings.default_force_offload = config.default_force_offload();
  }
  return settings;
}

workflow::FrameBudget FrameBudgetFrom(const WorkerConfig& config) {
  workflow::FrameBudget budget;
  if (config.fps() > 0) {
    budget.fps = static_cast<int>(config.fps());
  }
  if (config.lookahead_frames() > 0) {
    budget.lookahead_frames = static_cast<int>(config.lookahead_frames());
  }
  if (config.default_frame_count() > 0) {
    budget.default_frames = static_cast<int>(config.default_frame_count());
  }
  return budget;
}

workflow::RoleBindings RoleBindingsFrom(const WorkerConfig& config) {
  return workflow::MergeRoleBindings(workflow::DefaultRoleBindings(), config.workflow().roles());
}

WorkerRuntime BuildWorker(const RuntimeConfig& config, const observability::Logger& logger) {
  auto transport = std::make_shared<net::BeastHttpTransport>();
  return BuildWorker(config, transport, [] { return std::make_unique<net::BeastEventChannel>(); }, logger);
}

WorkerRuntime BuildWorker(const RuntimeConfig& config, net::HttpTransportPtr transport, execution::EventChannelFactory channels,
                          const observability::Logger& logger) {
  const auto& server = config.inference_server();
  const auto  host   = server.host().empty() ? std::string(kDefaultHost) : server.host();
  const auto  port   = server.port() > 0 ? static_cast<std::uint16_t>(server.port()) : kDefaultPort;

  WorkerRuntime runtime;
  runtime.transport = transport;
  runtime.readiness = ReadinessSettingsFrom(server);
  runtime.inference = std::make_shared<execution::InferenceApi>(
      transport, host, port, util::OrDefault(server.request_timeout(), kDefaultRequestTimeout), logger.WithName("inference"));

  input::InputMaterializer materializer(transport, util::OrDefault(config.worker().input_download_timeout(), kDefaultDownloadTimeout),
                                        logger.WithName("materializer"));
  workflow::ParameterInjector injector(RoleBindingsFrom(config.worker()), FrameBudgetFrom(config.worker()), logger.WithName("injector"));
  execution::ExecutionMonitor monitor(*runtime.inference, std::move(channels), MonitorSettingsFrom(server), logger.WithName("monitor"));

  runtime.processor = std::make_shared<worker::JobProcessor>(ProcessorSettingsFrom(config.worker()), std::move(materializer),
                                                             std::move(injector), std::move(monitor), transport,
                                                             logger.WithName("processor"));
  return runtime;
}

} // namespace lipsync::factory
