/**
 * ServerConfig — JSON configuration loading.
 */

#include "config/server_config.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>

#include "message/wire_codec.h"

using json = nlohmann::json;

namespace {

template <typename T>
T get_or(const json& section, const char* key, T fallback) {
    const auto it = section.find(key);
    if (it == section.end()) return fallback;
    try {
        return it->get<T>();
    } catch (const json::type_error& e) {
        throw std::runtime_error(std::string("Invalid config value for '") + key + "': " + e.what());
    }
}

constexpr std::array<const char*, 9> kLogLevels = {
    "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};

} // namespace

ServerConfig ServerConfig::from_json(const json& config) {
    if (!config.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    ServerConfig result;
    result.log_level = get_or<std::string>(config, "log_level", result.log_level);
    if (std::find(kLogLevels.begin(), kLogLevels.end(), result.log_level) == kLogLevels.end()) {
        throw std::runtime_error("Unknown log_level: " + result.log_level);
    }

    const auto it = config.find("server");
    if (it == config.end()) return result;
    if (!it->is_object()) {
        throw std::runtime_error("Config section 'server' must be a JSON object");
    }
    const json& server = *it;

    result.host = get_or<std::string>(server, "host", result.host);

    const auto port = get_or<int64_t>(server, "port", result.port);
    if (port < 0 || port > 65535) {
        throw std::runtime_error("Config value 'port' out of range: " + std::to_string(port));
    }
    result.port = static_cast<uint16_t>(port);

    const auto buffer_size = get_or<int64_t>(server, "read_buffer_size",
                                             static_cast<int64_t>(result.read_buffer_size));
    if (buffer_size <= static_cast<int64_t>(WireCodec::kHeaderSize)) {
        throw std::runtime_error("Config value 'read_buffer_size' too small: " + std::to_string(buffer_size));
    }
    if (buffer_size > static_cast<int64_t>(kMaxReadBufferSize)) {
        throw std::runtime_error("Config value 'read_buffer_size' too large: " + std::to_string(buffer_size));
    }
    result.read_buffer_size = static_cast<std::size_t>(buffer_size);

    result.accept_poll_interval_ms = get_or<int>(server, "accept_poll_interval_ms",
                                                 result.accept_poll_interval_ms);
    if (result.accept_poll_interval_ms <= 0) {
        throw std::runtime_error("Config value 'accept_poll_interval_ms' must be positive");
    }

    return result;
}

ServerConfig ServerConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json config = json::parse(file, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (config.is_discarded()) {
        throw std::runtime_error("Cannot parse config file: " + path);
    }
    return from_json(config);
}
