/// Filesystem gateway: serves the sandboxed filesystem tools over stdio.
/// Usage: ./fsgate_server --allow DIR [--enable-write] [--config FILE] ...
/// Logs go to stderr; stdout carries only protocol frames.

#include <fsgate/fsgate.hpp>
#include <csignal>
#include <iostream>

int main(int argc, char* argv[]) {
    // A vanished client must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    fsgate::init_logging("info");

    fsgate::ServerConfig config;
    try {
        auto cli = fsgate::ConfigLoader::parse_args(argc, argv);
        if (cli.show_help) {
            std::cerr << fsgate::ConfigLoader::usage();
            return 0;
        }
        config = fsgate::ConfigLoader::load(fsgate::ConfigLoader::from_environment(), cli);
    } catch (const fsgate::ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        std::cerr << fsgate::ConfigLoader::usage();
        return 2;
    }

    try {
        fsgate::init_logging(config.log_level, config.log_file);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::critical("Cannot set up logging: {}", e.what());
        return 2;
    }

    for (const auto& dir : config.allowed_directories) {
        spdlog::info("Allowed directory: {}", dir);
    }

    try {
        fsgate::GatewayServer server{std::move(config)};
        server.serve_stdio();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }

    spdlog::info("fsgate stopped");
    return 0;
}
