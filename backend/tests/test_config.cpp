#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include "config/server_config.h"

using json = nlohmann::json;

TEST(ServerConfigTest, EmptyObjectKeepsDefaults) {
    const auto config = ServerConfig::from_json(json::object());
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.read_buffer_size, 512u);
    EXPECT_EQ(config.accept_poll_interval_ms, 100);
    EXPECT_EQ(config.log_level, "info");
}

TEST(ServerConfigTest, ReadsServerSection) {
    const auto config = ServerConfig::from_json(json::parse(R"({
        "server": { "host": "0.0.0.0", "port": 9000,
                    "read_buffer_size": 1024, "accept_poll_interval_ms": 25 },
        "log_level": "debug"
    })"));
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.read_buffer_size, 1024u);
    EXPECT_EQ(config.accept_poll_interval_ms, 25);
    EXPECT_EQ(config.log_level, "debug");
}

TEST(ServerConfigTest, RejectsBadValues) {
    EXPECT_THROW(ServerConfig::from_json(json::array()), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"server", 5}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"server", {{"port", "80"}}}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"server", {{"port", 70000}}}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"server", {{"read_buffer_size", 4}}}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"server", {{"read_buffer_size", 16384}}}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"server", {{"accept_poll_interval_ms", 0}}}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"log_level", "loud"}}), std::runtime_error);
}

TEST(ServerConfigTest, ReadBufferSizeUpToCapIsAccepted) {
    const auto config = ServerConfig::from_json({{"server", {{"read_buffer_size", ServerConfig::kMaxReadBufferSize}}}});
    EXPECT_EQ(config.read_buffer_size, ServerConfig::kMaxReadBufferSize);
}

TEST(ServerConfigTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "calc_server_config_test.json";
    {
        std::ofstream out(path);
        out << R"({ "server": { "port": 7070 } })";
    }
    const auto config = ServerConfig::load(path);
    EXPECT_EQ(config.port, 7070);
    std::remove(path.c_str());
}

TEST(ServerConfigTest, LoadFailsOnMissingOrBrokenFile) {
    EXPECT_THROW(ServerConfig::load("/nonexistent/calc-server.json"), std::runtime_error);

    const std::string path = ::testing::TempDir() + "calc_server_broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(ServerConfig::load(path), std::runtime_error);
    std::remove(path.c_str());
}
