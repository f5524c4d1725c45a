#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/execution/execution_monitor.hpp"
#include "internal/execution/inference_api.hpp"
#include "internal/net/http_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/worker/job_processor.hpp"
#include "internal/worker/server_readiness.hpp"
#include "internal/workflow/parameter_injector.hpp"

namespace lipsync::factory {

/*
  WorkerRuntime

  Everything the worker process needs for its lifetime.
*/
struct WorkerRuntime {
  net::HttpTransportPtr                    transport;
  std::shared_ptr<execution::InferenceApi> inference;
  std::shared_ptr<worker::JobProcessor>    processor;
  worker::ReadinessSettings                readiness;
};

/*
  Config → component settings. Fields left at zero or empty take the
  built-in defaults of the settings structs.
*/
execution::MonitorSettings MonitorSettingsFrom(const lipsync::runtime::config::InferenceServerConfig& config);
worker::ReadinessSettings  ReadinessSettingsFrom(const lipsync::runtime::config::InferenceServerConfig& config);
worker::ProcessorSettings  ProcessorSettingsFrom(const lipsync::runtime::config::WorkerConfig& config);
workflow::FrameBudget      FrameBudgetFrom(const lipsync::runtime::config::WorkerConfig& config);
workflow::RoleBindings     RoleBindingsFrom(const lipsync::runtime::config::WorkerConfig& config);

/*
  BuildWorker

  Composition root of the worker. The only place that knows the concrete
  Boost.Beast transports; the overload taking transports is used by tests.
*/
WorkerRuntime BuildWorker(const lipsync::runtime::config::RuntimeConfig& config, const observability::Logger& logger);

WorkerRuntime BuildWorker(const lipsync::runtime::config::RuntimeConfig& config, net::HttpTransportPtr transport,
                          execution::EventChannelFactory channels, const observability::Logger& logger);

} // namespace lipsync::factory
