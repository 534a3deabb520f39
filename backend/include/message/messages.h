#pragma once

#include <cstdint>
#include <string>
#include <variant>

/// Ask the server to add two numbers.
struct AddRequest {
    std::int32_t a = 0;
    std::int32_t b = 0;
};

/// Sum of an AddRequest. Wraps around on overflow.
struct AddResponse {
    std::int32_t result = 0;
};

/// Text sent by a client and echoed back unchanged.
struct EchoMessage {
    std::string content;
};

/**
 * Everything a client can send.
 *
 * std::monostate stands for a well-formed envelope that carries no variant
 * this server knows about. It decodes fine but never gets a response.
 */
using ClientMessage = std::variant<std::monostate, AddRequest, EchoMessage>;

/// Everything the server can send back.
using ServerMessage = std::variant<AddResponse, EchoMessage>;

inline bool operator==(const AddRequest& lhs, const AddRequest& rhs) {
    return lhs.a == rhs.a && lhs.b == rhs.b;
}

inline bool operator==(const AddResponse& lhs, const AddResponse& rhs) {
    return lhs.result == rhs.result;
}

inline bool operator==(const EchoMessage& lhs, const EchoMessage& rhs) {
    return lhs.content == rhs.content;
}
