#pragma once

#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

/**
 * Serves one accepted connection, one message cycle per handle() call.
 *
 * Owns the socket and the io_context it is bound to, so the handler can
 * outlive the Server that accepted it.
 */
class ClientHandler {
public:
    /// `io` must be the context `socket` was opened on.
    ClientHandler(std::unique_ptr<asio::io_context> io,
                  asio::ip::tcp::socket socket,
                  std::size_t buffer_size);

    /**
     * Read once, drain stale bytes, decode, dispatch and respond.
     *
     * Undecodable input is dropped and does not count as an error.
     * Returns asio::error::eof when the peer closed the connection and
     * any other socket error as is; the connection is done after either.
     *
     * Blocks in the read until the peer sends something or closes.
     */
    [[nodiscard]] asio::error_code handle();

    [[nodiscard]] const asio::ip::tcp::socket& socket() const { return socket_; }

private:
    asio::error_code drain();
    asio::error_code process(const std::vector<std::uint8_t>& payload);

    std::unique_ptr<asio::io_context> io_;
    asio::ip::tcp::socket socket_;
    std::vector<std::uint8_t> buffer_;
    std::vector<std::uint8_t> scratch_;
};
