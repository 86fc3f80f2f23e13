#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/metadata_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

namespace obs = mlmeta::observability;

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

struct CommandLine {
  std::string config_path;
  // Load and print the effective configuration, then exit.
  bool check_config = false;
};

std::optional<CommandLine> ParseCommandLine(int argc, char** argv) {
  CommandLine cmd;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      cmd.check_config = true;
    } else if (arg == "--config" && i + 1 < argc) {
      cmd.config_path = argv[++i];
    } else if (cmd.config_path.empty() && arg.rfind("--", 0) != 0) {
      cmd.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (cmd.config_path.empty()) {
    return std::nullopt;
  }
  return cmd;
}

std::string DescribeStore(const mlmeta::runtime::config::StoreConfig& store) {
  if (store.has_sqlite()) {
    return "sqlite:" + store.sqlite().path();
  }
  return "memory";
}

void PrintConfig(const mlmeta::runtime::config::RuntimeConfig& config) {
  std::cout << "bind_address: " << config.server().bind_address() << "\n"
            << "store: " << DescribeStore(config.store()) << "\n"
            << "query_page_size: " << config.store().query_page_size() << "\n"
            << "default_run_limit: " << config.listing().default_run_limit() << "\n"
            << "tracing: " << (config.observability().tracing_enabled() ? "on" : "off") << "\n";
}

int Serve(const mlmeta::runtime::config::RuntimeConfig& config) {
  auto app = mlmeta::factory::Build(config);

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<mlmeta::grpc::MetadataServer>(app.metadata_service));

  mlmeta::runtime::Server server(config.server().bind_address(), std::move(services));

  // Handlers go in before Start() so an early signal still stops cleanly.
  std::signal(SIGINT, RequestStop);
  std::signal(SIGTERM, RequestStop);

  server.Start();
  MLMETA_LOG_INFO("mlmeta server started", {obs::StringField("bind_address", config.server().bind_address()),
                                            obs::StringField("store", DescribeStore(config.store()))});

  while (!g_stop_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
  }

  MLMETA_LOG_INFO("stopping mlmeta server");
  server.Stop();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const auto cmd = ParseCommandLine(argc, argv);
  if (!cmd) {
    std::cerr << "Usage: mlmeta-server [--check-config] <config.yaml>\n"
              << "       mlmeta-server [--check-config] --config <config.yaml>\n";
    return 1;
  }

  int rc = 0;
  try {
    const auto config = mlmeta::config::ConfigLoader::LoadFromYaml(cmd->config_path);
    if (cmd->check_config) {
      PrintConfig(config);
      return 0;
    }

    obs::InitializeLogging(config);
    if (obs::InitializeTracing(config)) {
      MLMETA_LOG_INFO("tracing enabled", {obs::StringField("otlp_endpoint", config.observability().otlp_endpoint())});
    }
    rc = Serve(config);
  } catch (const std::exception& e) {
    MLMETA_LOG_ERROR("fatal error", {obs::StringField("config", cmd->config_path), obs::StringField("error", e.what())});
    rc = 2;
  }

  obs::ShutdownTracing();
  obs::ShutdownLogging();
  return rc;
}
