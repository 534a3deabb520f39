#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

/**
 * Runtime settings for the server, read from a JSON file.
 *
 * {
 *   "server": { "host": "127.0.0.1", "port": 8080,
 *               "read_buffer_size": 512, "accept_poll_interval_ms": 100 },
 *   "log_level": "info"
 * }
 */
struct ServerConfig {
    static constexpr std::size_t kMaxReadBufferSize = 4096;

    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    std::size_t read_buffer_size = 512;
    int accept_poll_interval_ms = 100;
    std::string log_level = "info";

    /// Build from parsed JSON. Missing keys keep their defaults.
    /// Throws std::runtime_error on wrong types or out-of-range values.
    static ServerConfig from_json(const nlohmann::json& config);

    /// Parse the file at `path`. Throws std::runtime_error if it cannot be
    /// opened or parsed.
    static ServerConfig load(const std::string& path);
};
