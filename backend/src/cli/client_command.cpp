/**
 * calc-client argument parsing.
 */

#include "cli/client_command.h"

#include <limits>
#include <stdexcept>

namespace {

/// Whole-string integer in [min, max], or std::nullopt.
std::optional<long long> parse_integer(const std::string& text, long long min, long long max) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    if (consumed != text.size() || value < min || value > max) return std::nullopt;
    return value;
}

std::optional<std::int32_t> parse_int32(const std::string& text) {
    const auto value = parse_integer(text, std::numeric_limits<std::int32_t>::min(),
                                     std::numeric_limits<std::int32_t>::max());
    if (!value) return std::nullopt;
    return static_cast<std::int32_t>(*value);
}

} // namespace

std::optional<ClientCommand> parse_client_command(const std::vector<std::string>& args) {
    if (args.size() < 4) return std::nullopt;

    const auto port = parse_integer(args[1], 1, std::numeric_limits<uint16_t>::max());
    if (!port) return std::nullopt;

    ClientCommand command;
    command.host = args[0];
    command.port = static_cast<uint16_t>(*port);

    const std::string& verb = args[2];
    if (verb == "add" && args.size() == 5) {
        const auto a = parse_int32(args[3]);
        const auto b = parse_int32(args[4]);
        if (!a || !b) return std::nullopt;
        command.request = AddRequest{*a, *b};
        return command;
    }
    if (verb == "echo" && args.size() == 4) {
        command.request = EchoMessage{args[3]};
        return command;
    }
    return std::nullopt;
}
