#include "maestro/api/api_server.hpp"
#include "maestro/config/config.hpp"
#include "maestro/orchestrator/orchestrator.hpp"
#include "maestro/runtime/podman_client.hpp"
#include "maestro/util/log.hpp"

#include <atomic>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("Maestro - build and run container images across remote hosts");
  std::println("Usage: {} -c <config.yaml> [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --log-level <level>   trace, debug, info, warn or error");
  std::println("  --host <host>         API server host (overrides config)");
  std::println("  --port <port>         API server port (overrides config)");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
}

void print_version() {
  std::println("Maestro v0.1.0");
}

struct Options {
  std::string config_file;
  std::optional<std::string> log_level;
  std::optional<std::string> host;
  std::optional<std::uint16_t> port;
};

auto parse_port(std::string_view text) -> std::optional<std::uint16_t> {
  std::uint16_t port = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
  if (ec != std::errc{} || ptr != text.data() + text.size() || port == 0) {
    return std::nullopt;
  }
  return port;
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        std::println(stderr, "Error: --config requires an argument");
        std::exit(1);
      }
      opts.config_file = argv[i];
    } else if (arg == "--log-level") {
      if (++i >= argc) {
        std::println(stderr, "Error: --log-level requires an argument");
        std::exit(1);
      }
      opts.log_level = argv[i];
    } else if (arg == "--host") {
      if (++i >= argc) {
        std::println(stderr, "Error: --host requires an argument");
        std::exit(1);
      }
      opts.host = argv[i];
    } else if (arg == "--port") {
      if (++i >= argc) {
        std::println(stderr, "Error: --port requires an argument");
        std::exit(1);
      }
      opts.port = parse_port(argv[i]);
      if (!opts.port) {
        std::println(stderr, "Error: invalid port: {}", argv[i]);
        std::exit(1);
      }
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto podman_factory(const maestro::RuntimeConfig& runtime)
    -> maestro::RuntimeFactory {
  return [runtime](const maestro::ServerInfo& server)
             -> maestro::Result<std::shared_ptr<maestro::runtime::RuntimeClient>> {
    auto client = maestro::runtime::PodmanClient::connect(server, runtime);
    if (!client) {
      return maestro::fail(client.error());
    }
    return maestro::ok(
        std::shared_ptr<maestro::runtime::RuntimeClient>(std::move(*client)));
  };
}

auto wait_for_shutdown() -> void {
  while (!g_shutdown_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(maestro::timing::kShutdownPollInterval);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.config_file.empty()) {
    std::println(stderr, "Error: Config file required. Use -c <file>");
    return 1;
  }
  if (!std::filesystem::exists(opts.config_file)) {
    std::println(stderr, "Error: Config file not found: {}", opts.config_file);
    return 1;
  }

  auto loaded = maestro::ConfigLoader::load_from_file(opts.config_file);
  if (!loaded) {
    std::println(stderr, "Error: Failed to load config: {}",
                 loaded.error().message());
    return 1;
  }
  auto config = std::move(*loaded);

  if (opts.log_level) {
    config.log.level = *opts.log_level;
  }
  if (opts.host) {
    config.api.host = *opts.host;
  }
  if (opts.port) {
    config.api.port = *opts.port;
  }

  if (!config.log.file.empty() && !maestro::log::set_file(config.log.file)) {
    std::println(stderr, "Error: Failed to open log file: {}", config.log.file);
    return 1;
  }
  maestro::log::set_level(config.log.level);
  maestro::log::start();

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGPIPE, SIG_IGN);

  auto runtime_config = config.runtime;
  auto api_config = config.api;
  maestro::Orchestrator orchestrator(std::move(config),
                                     podman_factory(runtime_config));

  if (auto started = orchestrator.start(); !started) {
    maestro::log::error("Failed to start: {}", started.error().message());
    maestro::log::stop();
    return 1;
  }

  std::unique_ptr<maestro::ApiServer> api;
  if (api_config.enabled) {
    api = std::make_unique<maestro::ApiServer>(orchestrator, api_config.port,
                                               api_config.host);
    api->start();
  }

  maestro::log::info("Maestro running; press Ctrl+C to stop");
  wait_for_shutdown();

  maestro::log::info("Shutting down...");
  if (api) {
    api->stop();
  }
  orchestrator.stop();

  maestro::log::info("Maestro stopped.");
  maestro::log::stop();
  return 0;
}
