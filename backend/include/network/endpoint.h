#pragma once

#include <asio.hpp>
#include <string>

/// "address:port", with IPv6 addresses in brackets.
inline std::string endpoint_to_string(const asio::ip::tcp::endpoint& endpoint) {
    const auto address = endpoint.address();
    const std::string host = address.is_v6() ? "[" + address.to_string() + "]" : address.to_string();
    return host + ":" + std::to_string(endpoint.port());
}
