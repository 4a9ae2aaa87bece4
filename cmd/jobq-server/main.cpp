#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/queue_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using jobq::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: jobq-server <config.yaml> OR jobq-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = jobq::config::ConfigLoader::LoadFromYaml(config_path);

    jobq::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = jobq::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<jobq::grpc::QueueServer>(app.queue_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const std::string bind_address =
        config.server().bind_address().empty() ? "0.0.0.0:50051" : config.server().bind_address();
    Server server(bind_address, std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    JOBQ_LOG_INFO("jobq server started", {jobq::observability::StringField("bind_address", bind_address),
                                          jobq::observability::StringField("store", app.repository->StorageName())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    JOBQ_LOG_INFO("Shutting down jobq server");

    server.Stop();
    if (app.maintenance) app.maintenance->Stop();
    jobq::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    JOBQ_LOG_ERROR("Fatal error", {jobq::observability::StringField("error", e.what())});
    jobq::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
