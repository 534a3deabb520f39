/**
 * Server — Listens for incoming TCP connections.
 *
 * Uses standalone ASIO with blocking calls. The acceptor runs non-blocking
 * and is polled so that stop() is noticed between connections. Every
 * accepted socket gets its own io_context and a detached thread running a
 * ClientHandler; what happens on that thread stays there and is only logged.
 */

#include "network/server.h"

#include <chrono>
#include <string>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

#include "network/client_handler.h"
#include "network/endpoint.h"

Server::Server(const ServerConfig& config)
    : config_(config)
    , acceptor_(io_)
    , running_(std::make_shared<std::atomic<bool>>(false)) {
    asio::ip::tcp::resolver resolver(io_);
    const auto results = resolver.resolve(config_.host, std::to_string(config_.port),
                                          asio::ip::tcp::resolver::passive);
    const asio::ip::tcp::endpoint endpoint = *results.begin();

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    // Set here rather than in run() so a stop() that lands first is kept.
    running_->store(true);
}

Server::~Server() {
    // Detached connection threads keep their own copy of the flag.
    running_->store(false);
}

void Server::run() {
    spdlog::info("Server is running on {}", endpoint_to_string(acceptor_.local_endpoint()));

    acceptor_.non_blocking(true);
    const auto poll_interval = std::chrono::milliseconds(config_.accept_poll_interval_ms);

    std::unique_ptr<asio::io_context> io;
    while (running_->load()) {
        if (!io) io = std::make_unique<asio::io_context>();

        asio::ip::tcp::socket socket(*io);
        asio::error_code ec;
        acceptor_.accept(socket, ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(poll_interval);
            continue;
        }
        if (ec) {
            spdlog::error("Error accepting connection: {}", ec.message());
            std::this_thread::sleep_for(poll_interval);
            continue;
        }

        spawn_connection(std::move(io), std::move(socket));
    }

    spdlog::info("Server stopped.");
}

void Server::stop() {
    if (running_->exchange(false)) {
        spdlog::info("Shutdown signal sent.");
    } else {
        spdlog::warn("Server was already stopped or not running.");
    }
}

void Server::spawn_connection(std::unique_ptr<asio::io_context> io, asio::ip::tcp::socket socket) {
    asio::error_code ec;
    const auto remote = socket.remote_endpoint(ec);
    const std::string peer = ec ? std::string("<unknown>") : endpoint_to_string(remote);
    spdlog::info("New client connected: {}", peer);

    auto handler = std::make_unique<ClientHandler>(std::move(io), std::move(socket), config_.read_buffer_size);

    try {
        std::thread([handler = std::move(handler), running = running_, peer]() {
            while (running->load()) {
                const auto handle_ec = handler->handle();
                if (handle_ec == asio::error::eof) break;
                if (handle_ec) {
                    spdlog::error("Error handling client {}: {}", peer, handle_ec.message());
                    break;
                }
            }
            spdlog::info("Client at {} disconnected", peer);
        }).detach();
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start connection thread for {}: {}", peer, e.what());
    }
}
