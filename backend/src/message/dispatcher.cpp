/**
 * Request dispatch — pure mapping from ClientMessage to ServerMessage.
 */

#include "message/dispatcher.h"

#include <cstdint>

namespace {

struct Dispatcher {
    std::optional<ServerMessage> operator()(const AddRequest& request) const {
        return ServerMessage{AddResponse{wrapping_add(request.a, request.b)}};
    }

    std::optional<ServerMessage> operator()(const EchoMessage& echo) const {
        return ServerMessage{echo};
    }

    std::optional<ServerMessage> operator()(std::monostate) const {
        return std::nullopt;
    }
};

} // namespace

std::int32_t wrapping_add(std::int32_t a, std::int32_t b) {
    // Unsigned arithmetic is modular; the conversion back is two's complement.
    const auto sum = static_cast<std::uint32_t>(a) + static_cast<std::uint32_t>(b);
    return static_cast<std::int32_t>(sum);
}

std::optional<ServerMessage> dispatch(const ClientMessage& message) {
    return std::visit(Dispatcher{}, message);
}
