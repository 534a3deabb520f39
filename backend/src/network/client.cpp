/**
 * Client — Connects to a server and exchanges framed messages.
 *
 * Timeouts follow the usual ASIO recipe for blocking clients: start the
 * operation asynchronously, run the io_context for the allowed time, and
 * cancel whatever is still pending.
 */

#include "network/client.h"

#include <array>

#include <spdlog/spdlog.h>

#include "message/wire_codec.h"

Client::Client() : socket_(io_) {}

bool Client::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    asio::error_code ec;
    asio::ip::tcp::resolver resolver(io_);
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        spdlog::error("Cannot resolve {}: {}", host, ec.message());
        return false;
    }

    asio::error_code connect_ec = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
                        [&connect_ec](const asio::error_code& result, const asio::ip::tcp::endpoint&) {
                            connect_ec = result;
                        });
    run_for(timeout);

    if (connect_ec) {
        spdlog::error("Cannot connect to {}:{}: {}", host, port, connect_ec.message());
        disconnect();
        return false;
    }
    pending_.clear();
    return true;
}

bool Client::send(const ClientMessage& message) {
    return send_raw(WireCodec::encode(message));
}

bool Client::send_raw(const std::vector<std::uint8_t>& bytes) {
    asio::error_code ec;
    asio::write(socket_, asio::buffer(bytes), ec);
    if (ec) {
        spdlog::error("Failed to send {} bytes: {}", bytes.size(), ec.message());
        return false;
    }
    return true;
}

std::optional<ServerMessage> Client::receive(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        if (auto payload = take_frame()) {
            auto message = WireCodec::decode_server(*payload);
            if (!message) {
                spdlog::warn("Failed to decode server message ({} bytes)", payload->size());
            }
            return message;
        }

        const auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) return std::nullopt;

        std::array<std::uint8_t, 1024> chunk{};
        asio::error_code read_ec = asio::error::would_block;
        std::size_t bytes_read = 0;
        socket_.async_read_some(asio::buffer(chunk),
                                [&read_ec, &bytes_read](const asio::error_code& result, std::size_t n) {
                                    read_ec = result;
                                    bytes_read = n;
                                });
        run_for(remaining);

        if (read_ec == asio::error::operation_aborted) return std::nullopt;
        if (read_ec) {
            spdlog::debug("Receive failed: {}", read_ec.message());
            return std::nullopt;
        }
        pending_.insert(pending_.end(), chunk.begin(), chunk.begin() + bytes_read);
    }
}

void Client::disconnect() {
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    pending_.clear();
}

void Client::run_for(std::chrono::steady_clock::duration timeout) {
    io_.restart();
    io_.run_for(timeout);

    if (!io_.stopped()) {
        // Let the cancelled handler run so no operation outlives this call.
        asio::error_code ec;
        socket_.cancel(ec);
        io_.run();
    }
}

std::optional<std::vector<std::uint8_t>> Client::take_frame() {
    if (pending_.size() < WireCodec::kHeaderSize) return std::nullopt;

    const auto length = WireCodec::read_header(pending_.data());
    if (!length) {
        spdlog::warn("Discarding {} buffered bytes with an oversized frame header", pending_.size());
        pending_.clear();
        return std::nullopt;
    }
    if (pending_.size() < WireCodec::kHeaderSize + *length) return std::nullopt;

    const auto begin = pending_.begin() + WireCodec::kHeaderSize;
    const auto end = begin + static_cast<std::ptrdiff_t>(*length);
    std::vector<std::uint8_t> payload(begin, end);
    pending_.erase(pending_.begin(), end);
    return payload;
}
