#pragma once

#include <optional>

#include "message/messages.h"

/**
 * Map a decoded request to its response.
 *
 * AddRequest sums in 32 bits with two's-complement wraparound, so
 * INT32_MAX + 1 yields INT32_MIN. EchoMessage comes back unchanged.
 * Anything else gets no response.
 */
std::optional<ServerMessage> dispatch(const ClientMessage& message);

/// 32-bit add that wraps instead of overflowing.
std::int32_t wrapping_add(std::int32_t a, std::int32_t b);
