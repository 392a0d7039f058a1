#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using upload::observability::IntField;
using upload::observability::SizeField;
using upload::observability::StringField;
using upload::runtime::Server;
using upload::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

struct Args {
  std::string config_path;
  bool        check_only = false;
};

std::optional<Args> ParseArgs(int argc, char** argv) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      args.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && args.config_path.empty()) {
      args.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (args.config_path.empty()) return std::nullopt;
  return args;
}

std::string DatabaseBackend(const RuntimeConfig& config) {
  if (config.database().has_sqlite()) return "sqlite";
  if (config.database().has_postgres()) return "postgres";
  return "memory";
}

std::string ObjectStoreBackend(const RuntimeConfig& config) {
  return config.object_store().has_s3() ? "s3" : "memory";
}

std::string BindAddress(const RuntimeConfig& config) {
  return config.server().bind_address().empty() ? kDefaultBindAddress : config.server().bind_address();
}

void ShutdownObservability() {
  upload::observability::ShutdownLogging();
  upload::observability::ShutdownMetrics();
  upload::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  const auto args = ParseArgs(argc, argv);
  if (!args) {
    std::cerr << "Usage: upload-manager [--check-config] <config.yaml> OR upload-manager [--check-config] --config <config.yaml>"
              << std::endl;
    return 1;
  }

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  RuntimeConfig config;
  try {
    config = upload::config::ConfigLoader::LoadFromYaml(args->config_path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 2;
  }

  const auto options = upload::factory::BuildUploadOptions(config.uploads());
  if (args->check_only) {
    std::cout << "config ok: " << args->config_path << "\n"
              << "  database:     " << DatabaseBackend(config) << "\n"
              << "  object store: " << ObjectStoreBackend(config) << "\n"
              << "  bind address: " << BindAddress(config) << "\n"
              << "  multipart threshold: " << options.multipart_threshold_bytes << " bytes\n"
              << "  categories:   " << config.categories_size() << std::endl;
    return 0;
  }

  try {
    upload::observability::InitializeTracing(config);
    upload::observability::InitializeMetrics(config);
    upload::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = upload::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(BindAddress(config), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    UPLOAD_LOG_INFO("Upload Manager started",
                    {StringField("bind_address", BindAddress(config)), StringField("database", DatabaseBackend(config)),
                     StringField("object_store", ObjectStoreBackend(config)),
                     SizeField("multipart_threshold_bytes", options.multipart_threshold_bytes),
                     IntField("categories", config.categories_size())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    UPLOAD_LOG_INFO("Shutting down upload manager");

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    UPLOAD_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
