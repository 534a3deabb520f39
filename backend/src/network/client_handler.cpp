/**
 * ClientHandler — Per-connection request/response cycle.
 *
 * Each cycle does one blocking read, drains whatever else the peer has
 * queued on the socket, and answers every complete frame found in the read.
 * Draining right after the read, before any response goes out, discards
 * only bytes the peer sent without waiting for an answer; a request sent
 * after the previous response always reaches the next read.
 * Malformed input is logged and dropped; it never closes the connection.
 */

#include "network/client_handler.h"

#include <spdlog/spdlog.h>

#include "message/dispatcher.h"
#include "message/wire_codec.h"

ClientHandler::ClientHandler(std::unique_ptr<asio::io_context> io,
                             asio::ip::tcp::socket socket,
                             std::size_t buffer_size)
    : io_(std::move(io))
    , socket_(std::move(socket))
    , buffer_(buffer_size)
    , scratch_(buffer_size) {}

asio::error_code ClientHandler::handle() {
    asio::error_code ec;
    const std::size_t bytes_read = socket_.read_some(asio::buffer(buffer_), ec);
    if (ec) return ec;

    // Drained after the read, not before it: a drain ahead of the read would
    // race with a request the peer sends right after our last response.
    if (auto drain_ec = drain()) return drain_ec;

    const auto frames = WireCodec::split_frames(buffer_.data(), bytes_read);
    if (frames.empty()) {
        spdlog::warn("Dropped {} bytes that do not form a complete frame", bytes_read);
        return {};
    }

    for (const auto& payload : frames) {
        if (auto write_ec = process(payload)) return write_ec;
    }
    return {};
}

asio::error_code ClientHandler::drain() {
    asio::error_code ec;
    socket_.non_blocking(true, ec);
    if (ec) return ec;

    std::size_t discarded = 0;
    asio::error_code read_ec;
    while (!read_ec) {
        discarded += socket_.read_some(asio::buffer(scratch_), read_ec);
    }
    if (discarded > 0) {
        spdlog::debug("Drained {} stale bytes", discarded);
    }

    // A read error here (eof included) surfaces again on the next blocking read.
    socket_.non_blocking(false, ec);
    return ec;
}

asio::error_code ClientHandler::process(const std::vector<std::uint8_t>& payload) {
    const auto message = WireCodec::decode_client(payload);
    if (!message) {
        spdlog::warn("Failed to decode message ({} bytes)", payload.size());
        return {};
    }

    if (const auto* echo = std::get_if<EchoMessage>(&*message)) {
        spdlog::info("Received: {}", echo->content);
    }

    const auto response = dispatch(*message);
    if (!response) {
        spdlog::debug("No response for message variant {}", message->index());
        return {};
    }

    const auto bytes = WireCodec::encode(*response);
    asio::error_code ec;
    asio::write(socket_, asio::buffer(bytes), ec);
    if (ec) {
        spdlog::error("Failed to write response: {}", ec.message());
    }
    return ec;
}
