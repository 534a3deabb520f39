#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "message/messages.h"

/**
 * Frames and (de)serializes messages.
 *
 * Frame layout: 4-byte big-endian payload length, then a MessagePack map
 * with a single key naming the variant, e.g. {"add_request": {"a": 2, "b": 3}}.
 */
class WireCodec {
public:
    using Bytes = std::vector<std::uint8_t>;

    static constexpr std::size_t kHeaderSize = 4;
    static constexpr std::size_t kMaxFrameSize = 64 * 1024;
    /// Deepest array/map nesting a payload may have.
    static constexpr std::size_t kMaxDepth = 16;

    /// Encode a message into a complete frame (header included).
    static Bytes encode(const ClientMessage& message);
    static Bytes encode(const ServerMessage& message);

    /// Decode one frame payload (header stripped).
    /// Returns std::nullopt if the payload is not a valid envelope or nests
    /// deeper than kMaxDepth.
    static std::optional<ClientMessage> decode_client(const Bytes& payload);
    static std::optional<ServerMessage> decode_server(const Bytes& payload);

    /// Cut `size` bytes into the payloads of the complete frames they hold,
    /// in order. Splitting stops at the first incomplete or oversized frame;
    /// the bytes from there on are left out.
    static std::vector<Bytes> split_frames(const std::uint8_t* data, std::size_t size);

    /// Payload length announced by a frame header, or std::nullopt if it
    /// exceeds kMaxFrameSize.
    static std::optional<std::size_t> read_header(const std::uint8_t* header);
};
