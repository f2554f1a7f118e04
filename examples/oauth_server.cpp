#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <iostream>
#include <string>

#include "oauth/oauth.hpp"

using namespace oauth;

// ============================================================
// main
// ============================================================

int main(int argc, char* argv[]) {
  // ----- Configuration -----
  Config config;
  if (argc > 1) {
    std::string arg = argv[1];
    if (arg == "--version" || arg == "-v") {
      std::cout << "oauth-broker " << version() << "\n";
      return 0;
    }
    if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: " << argv[0] << " [config.json]\n";
      return 0;
    }
    config = Config::load(arg);
    config.apply_env();
  } else {
    config = Config::from_env();
  }

  oauth::init(config);

  if (config.providers.empty()) {
    spdlog::warn("[Server] No OAuth providers configured");
  }

  // ----- Components -----
  auto broker = Broker::from_config(config);

  asio::io_context io_ctx;
  net::HttpServer server(io_ctx, config.server.host, config.server.port,
                         [service = broker.service](const net::HttpRequest& request) { return service->handle(request); });

  if (!server.start()) {
    std::cerr << "Error: cannot listen on " << config.server.host << ":" << config.server.port << "\n";
    oauth::shutdown();
    return 1;
  }
  std::cout << "oauth-broker " << version() << " listening on " << config.server.host << ":" << server.port() << "\n";

  asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code& ec, int signo) {
    if (ec) return;
    spdlog::info("[Server] Signal {} received, stopping", signo);
    server.stop();
    io_ctx.stop();
  });

  io_ctx.run();

  oauth::shutdown();
  return 0;
}
