/**
 * calc-client — sends one request and prints the response.
 *
 *   calc-client <host> <port> add <a> <b>
 *   calc-client <host> <port> echo <text>
 */

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "cli/client_command.h"
#include "network/client.h"

namespace {

int usage(const char* program) {
    std::cerr << "usage: " << program << " <host> <port> add <a> <b>\n"
              << "       " << program << " <host> <port> echo <text>\n"
              << "  port is 1..65535, a and b are 32-bit signed integers\n";
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char* argv[]) {
    const auto command = parse_client_command(std::vector<std::string>(argv + 1, argv + argc));
    if (!command) return usage(argv[0]);

    Client client;
    if (!client.connect(command->host, command->port)) return EXIT_FAILURE;
    if (!client.send(command->request)) return EXIT_FAILURE;

    const auto response = client.receive(std::chrono::seconds(2));
    client.disconnect();
    if (!response) {
        spdlog::error("No response from {}:{}", command->host, command->port);
        return EXIT_FAILURE;
    }

    if (const auto* sum = std::get_if<AddResponse>(&*response)) {
        std::cout << sum->result << '\n';
    } else {
        std::cout << std::get<EchoMessage>(*response).content << '\n';
    }
    return EXIT_SUCCESS;
}
