/**
 * calc-server — Server Entry Point
 *
 * Loads config, sets up logging, binds the listening socket and runs the
 * accept loop until SIGINT or SIGTERM.
 */

#include <csignal>
#include <cstdlib>
#include <exception>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "config/server_config.h"
#include "network/background_context.h"
#include "network/server.h"

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::info("calc-server starting…");

    const std::string config_path = (argc > 1) ? argv[1] : "config.json";

    ServerConfig config;
    try {
        config = ServerConfig::load(config_path);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("Loaded config from {}", config_path);

    try {
        Server server(config);

        // Signals are waited on in their own context; the server itself
        // only does blocking I/O and never runs an io_context.
        asio::io_context signal_io;
        asio::signal_set signals(signal_io, SIGINT, SIGTERM);
        signals.async_wait([&server](const asio::error_code& ec, int signum) {
            if (ec) return;
            spdlog::info("Received signal {}, shutting down", signum);
            server.stop();
        });
        BackgroundContext signal_thread(signal_io);

        server.run();
    } catch (const asio::system_error& e) {
        spdlog::error("Server error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
