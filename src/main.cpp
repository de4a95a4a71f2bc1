#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include "config/config.hpp"
#include "rpc/dispatcher.hpp"
#include "rpc/stdio_server.hpp"
#include "runtime/docker_runtime.hpp"
#include "session/session_manager.hpp"
#include "util/logger.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr const char* VERSION = "0.1.0";

codebox::rpc::StdioServer* g_server = nullptr;

void signal_handler(int) {
    if (g_server) {
        g_server->stop();
    }
}

void install_signal_handlers() {
    // No SA_RESTART: a blocked read on stdin must return so the loop can exit
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Writes to a closed client pipe fail with EPIPE instead
    std::signal(SIGPIPE, SIG_IGN);
}

void print_usage(const char* prog) {
    fmt::print(stderr,
        "Usage: {} [options]\n"
        "\n"
        "Serve sandboxed code execution as JSON-RPC over stdio.\n"
        "\n"
        "Options:\n"
        "  --config PATH       Config file (default: $CODEBOX_CONFIG or ~/.codebox/config.json)\n"
        "  --log-level LEVEL   trace, debug, info, warn, error, critical, off\n"
        "  --version           Print version and exit\n"
        "  -h, --help          Show this help\n",
        prog);
}

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
};

} // namespace

int main(int argc, char** argv) {
    Options opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            opts.log_level = argv[++i];
        } else if (arg == "--version") {
            fmt::print("codebox {}\n", VERSION);
            return 0;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            fmt::print(stderr, fg(fmt::color::red), "Unknown argument: {}\n", arg);
            print_usage(argv[0]);
            return 2;
        }
    }

    codebox::config::Config config;
    try {
        config = codebox::config::Config::load(opts.config_path);
    } catch (const codebox::config::ConfigError& e) {
        fmt::print(stderr, fg(fmt::color::red), "Configuration error: {}\n", e.what());
        return 1;
    }

    codebox::util::init_logger(
        codebox::util::parse_log_level(opts.log_level.value_or(config.log_level)));

    spdlog::info("codebox {} starting", VERSION);
    spdlog::info("Image: {}  memory: {}  cpu: {}  timeout: {}s  network disabled: {}",
        config.container.image, config.container.memory_limit, config.container.cpu_limit,
        config.container.timeout.count(), config.container.network_disabled);

    codebox::runtime::DockerRuntime runtime;
    if (!runtime.image_exists(config.container.image)) {
        spdlog::warn("Image {} not found locally. Build it first, e.g. "
                     "`docker build -t {} docker/`", config.container.image, config.container.image);
    }

    codebox::session::SessionManager sessions(runtime, config);
    codebox::rpc::Dispatcher dispatcher(sessions, config.protocol);
    codebox::rpc::StdioServer server(dispatcher, std::cin, std::cout);

    g_server = &server;
    install_signal_handlers();

    server.run();

    g_server = nullptr;
    spdlog::info("Shutting down, removing {} session(s)", sessions.session_count());
    sessions.shutdown();

    return 0;
}
