#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/media_node_server.hpp"
#include "internal/grpc/provisioning_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/server.hpp"

using medianode::factory::Build;
using medianode::runtime::Server;

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
    std::cerr << "Usage: media-node-manager <config.yaml> OR media-node-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = medianode::config::ConfigLoader::LoadFromYaml(config_path);

    medianode::observability::InitializeMetrics(config);
    medianode::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<medianode::grpc::MediaNodeServer>(app.media_node_service));
    services.push_back(std::make_unique<medianode::grpc::ProvisioningServer>(app.provisioning_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    server.Start();
    MEDIANODE_LOG_INFO("Media node manager started", {medianode::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MEDIANODE_LOG_INFO("Shutting down media node manager");

    // Release long polls first so the server can finish in-flight calls.
    app.Shutdown();
    server.Stop();
    medianode::observability::ShutdownLogging();
    medianode::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    MEDIANODE_LOG_ERROR("Fatal error", {medianode::observability::StringField("error", e.what())});
    medianode::observability::ShutdownLogging();
    medianode::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
