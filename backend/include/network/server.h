#pragma once

#include <asio.hpp>
#include <atomic>
#include <memory>

#include "config/server_config.h"

/**
 * TCP server with one detached thread per connection.
 *
 * The accept loop and every connection thread poll a shared running flag.
 * stop() is cooperative: a connection blocked in a read or write only sees
 * it once that call returns.
 */
class Server {
public:
    /// Bind and listen; the server counts as running from here on.
    /// Throws asio::system_error if that fails.
    explicit Server(const ServerConfig& config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Accept connections until stop() is called. Returns at once if
    /// stop() was called before.
    void run();

    /// Ask run() and every connection loop to finish. Safe from any thread.
    void stop();

    [[nodiscard]] bool is_running() const { return running_->load(); }
    [[nodiscard]] asio::ip::tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

private:
    void spawn_connection(std::unique_ptr<asio::io_context> io, asio::ip::tcp::socket socket);

    ServerConfig config_;
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<std::atomic<bool>> running_;
};
