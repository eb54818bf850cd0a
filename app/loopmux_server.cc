/**
 * @file loopmux_server.cc
 * @brief Loopback server exposing SSE, JSON-RPC POST and registration
 *
 * USAGE:
 *   loopmux_server [options]
 *
 * OPTIONS:
 *   --config <file>      JSON configuration file
 *   --min-port <port>    Lowest port to try (default: 10000)
 *   --max-port <port>    Highest port to try (default: 65535)
 *   --sse-path <path>    SSE stream path (default: /mcp)
 *   --no-sse             Disable the SSE and POST endpoints
 *   --verbose            Enable debug logging
 *   --help               Show this help message
 *
 * The chosen port is printed on stdout once the server is listening.
 * Methods registered here are samples; an embedding application installs
 * its own handler table.
 */

#include <signal.h>

#include <atomic>
#include <cstdlib>
#include <iostream>

#include "loopmux/config/server_config.h"
#include "loopmux/event/libevent_dispatcher.h"
#include "loopmux/logging/log_sink.h"
#include "loopmux/logging/logger_registry.h"
#include "loopmux/server/loopback_server.h"

using namespace loopmux;

namespace {

std::atomic<bool> g_shutdown(false);

void signalHandler(int /*signal*/) { g_shutdown = true; }

struct ServerOptions {
  std::string config_file;
  int min_port = -1;
  int max_port = -1;
  std::string sse_path;
  bool disable_sse = false;
  bool verbose = false;
};

void printUsage(const char* program) {
  std::cerr << "USAGE: " << program << " [options]\n\n";
  std::cerr << "OPTIONS:\n";
  std::cerr << "  --config <file>      JSON configuration file\n";
  std::cerr << "  --min-port <port>    Lowest port to try (default: 10000)\n";
  std::cerr << "  --max-port <port>    Highest port to try (default: 65535)\n";
  std::cerr << "  --sse-path <path>    SSE stream path (default: /mcp)\n";
  std::cerr << "  --no-sse             Disable the SSE and POST endpoints\n";
  std::cerr << "  --verbose            Enable debug logging\n";
  std::cerr << "  --help               Show this help message\n";
}

ServerOptions parseArguments(int argc, char* argv[]) {
  ServerOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      exit(0);
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_file = argv[++i];
    } else if (arg == "--min-port" && i + 1 < argc) {
      options.min_port = std::atoi(argv[++i]);
    } else if (arg == "--max-port" && i + 1 < argc) {
      options.max_port = std::atoi(argv[++i]);
    } else if (arg == "--sse-path" && i + 1 < argc) {
      options.sse_path = argv[++i];
    } else if (arg == "--no-sse") {
      options.disable_sse = true;
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else {
      std::cerr << "[ERROR] Unknown option: " << arg << std::endl;
      printUsage(argv[0]);
      exit(1);
    }
  }

  return options;
}

config::ServerConfig buildConfig(const ServerOptions& options) {
  config::ServerConfig config;
  if (!options.config_file.empty()) {
    config = config::loadServerConfigFile(options.config_file);
  }
  if (options.min_port > 0) {
    config.port_range.min = options.min_port;
  }
  if (options.max_port > 0) {
    config.port_range.max = options.max_port;
  }
  if (!options.sse_path.empty()) {
    config.sse.path = options.sse_path;
  }
  if (options.disable_sse) {
    config.sse.enabled = false;
  }
  if (options.verbose) {
    config.log_level = "debug";
  }
  config.validate();
  return config;
}

void registerSampleHandlers(server::LoopbackServer& loopback) {
  auto& handlers = loopback.handlers();

  handlers.setCapabilities({{"tools", {{"listChanged", true}}}});

  handlers.registerHandler(
      "ping", [](const server::ConnectionSharedPtr&, const json&) {
        return server::HandlerResult::success(json::object());
      });

  handlers.registerHandler(
      "echo", [](const server::ConnectionSharedPtr&, const json& params) {
        if (!params.contains("text")) {
          return server::HandlerResult::failure(
              Error(jsonrpc::INVALID_PARAMS, "Missing parameter: text"));
        }
        return server::HandlerResult::success({{"text", params["text"]}});
      });
}

}  // namespace

int main(int argc, char* argv[]) {
  ServerOptions options = parseArguments(argc, argv);

  config::ServerConfig config;
  try {
    config = buildConfig(options);
  } catch (const std::exception& e) {
    std::cerr << "[ERROR] " << e.what() << std::endl;
    return 1;
  }

  auto& registry = logging::LoggerRegistry::instance();
  registry.setDefaultSink(std::make_shared<logging::StdioSink>(stderr));
  // Validated by buildConfig
  registry.setGlobalLevel(logging::parseLogLevel(config.log_level)
                              .value_or(logging::LogLevel::Info));

  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  auto dispatcher = event::createLibeventDispatcherFactory()->createDispatcher(
      "loopmux_server");

  server::ServerCallbacks callbacks;
  callbacks.on_connect = [](server::Connection& client) {
    std::cerr << "[INFO] client " << client.id() << " connected ("
              << http::routeKindToString(client.clientType()) << ")"
              << std::endl;
  };
  callbacks.on_error = [](const std::string& message) {
    std::cerr << "[ERROR] " << message << std::endl;
  };

  auto loopback = std::make_unique<server::LoopbackServer>(*dispatcher, config,
                                                         std::move(callbacks));
  registerSampleHandlers(*loopback);

  auto started = loopback->start();
  if (is_error(started)) {
    std::cerr << "[ERROR] " << get_error(started)->message << std::endl;
    return 1;
  }
  std::cout << loopback->port() << std::endl;

  if (config.ping_interval.count() > 0) {
    loopback->startPingTimer(config.ping_interval);
  }

  // Polls the signal flag from inside the loop
  event::TimerPtr shutdown_timer;
  shutdown_timer = dispatcher->createTimer([&]() {
    if (g_shutdown) {
      loopback->stop();
      dispatcher->exit();
      return;
    }
    shutdown_timer->enableTimer(std::chrono::milliseconds(200));
  });
  shutdown_timer->enableTimer(std::chrono::milliseconds(200));

  dispatcher->run(event::RunType::RunUntilExit);

  shutdown_timer.reset();
  loopback.reset();
  return 0;
}
