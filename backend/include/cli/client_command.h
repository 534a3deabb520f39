#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "message/messages.h"

/// One request to send, as given on the calc-client command line.
struct ClientCommand {
    std::string host;
    uint16_t port = 0;
    ClientMessage request;
};

/**
 * Parse `<host> <port> add <a> <b>` or `<host> <port> echo <text>`
 * (program name excluded).
 *
 * Returns std::nullopt on a wrong shape, a non-numeric argument, or a
 * value that does not fit: port outside 1..65535, operands outside int32.
 */
std::optional<ClientCommand> parse_client_command(const std::vector<std::string>& args);
