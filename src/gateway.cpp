#include "gateway.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace polygate {

static std::atomic<bool> g_running{true};
static std::atomic<bool> g_reload{false};

static void signal_handler(int sig) {
    if (sig == SIGHUP) g_reload = true;
    else g_running = false;
}

int cmd_gateway(const std::string& config_path, const std::string& host, int port) {
    Config cfg = Config::load(config_path);
    if (!std::getenv("POLYGATE_LOG")) set_log_level(parse_log_level(cfg.log_level));
    if (!host.empty()) cfg.gateway.host = host;
    if (port > 0) cfg.gateway.port = port;
    GatewayConfig gw = cfg.gateway;

    Pipeline pipeline(std::move(cfg));
    HttpServer server(pipeline, gw, config_path);
    server.start();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);

    std::cerr << "[gateway] Ready on http://" << server.host() << ":" << server.port()
              << ". Ctrl+C to quit, SIGHUP to reload.\n";

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (g_reload.exchange(false)) {
            try {
                Config next = Config::load(config_path);
                next.gateway = gw;
                pipeline.reload(std::move(next));
            } catch (const ConfigurationError& e) {
                log_error("gateway", std::string("Reload failed, keeping current configuration: ") + e.what());
            }
        }
    }

    std::cerr << "[gateway] Shutting down...\n";
    server.stop();
    std::cerr << "[gateway] Done.\n";
    return 0;
}

} // namespace polygate
