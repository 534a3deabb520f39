#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "message/messages.h"

/**
 * Blocking TCP client for a single server connection.
 *
 * connect() and receive() take a timeout; send() blocks until the whole
 * frame is written.
 */
class Client {
public:
    Client();

    bool connect(const std::string& host, uint16_t port,
                 std::chrono::milliseconds timeout = std::chrono::seconds(2));

    /// Encode and send one message.
    bool send(const ClientMessage& message);

    /// Send bytes exactly as given, framed or not.
    bool send_raw(const std::vector<std::uint8_t>& bytes);

    /// Wait for the next complete frame and decode it. Returns std::nullopt
    /// on timeout, on a socket error, or if the frame does not decode.
    std::optional<ServerMessage> receive(std::chrono::milliseconds timeout);

    void disconnect();

    [[nodiscard]] bool is_connected() const { return socket_.is_open(); }

private:
    /// Run pending async work; cancel it if it is not done within `timeout`.
    void run_for(std::chrono::steady_clock::duration timeout);

    /// Pop the payload of a complete frame off the receive buffer.
    std::optional<std::vector<std::uint8_t>> take_frame();

    asio::io_context io_;
    asio::ip::tcp::socket socket_;
    std::vector<std::uint8_t> pending_;
};
