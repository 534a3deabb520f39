#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "network/background_context.h"

using namespace std::chrono_literals;

TEST(BackgroundContextTest, RunsHandlersOnItsThread) {
    asio::io_context io;
    asio::steady_timer keep_alive(io, 1h);
    keep_alive.async_wait([](const asio::error_code&) {});

    std::atomic<bool> ran{false};
    {
        BackgroundContext background(io);
        asio::post(io, [&ran] { ran = true; });
        for (int i = 0; i < 200 && !ran; ++i) std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(ran);
    EXPECT_TRUE(io.stopped());
}

TEST(BackgroundContextTest, ExceptionInScopeStopsAndJoins) {
    asio::io_context io;
    asio::steady_timer keep_alive(io, 1h);
    keep_alive.async_wait([](const asio::error_code&) {});

    // Without the join on unwind this would end in std::terminate.
    EXPECT_THROW({
        BackgroundContext background(io);
        throw std::runtime_error("accept loop failed");
    }, std::runtime_error);
    EXPECT_TRUE(io.stopped());
}
