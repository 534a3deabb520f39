#pragma once

#include <asio.hpp>
#include <thread>

/**
 * Runs an io_context on its own thread for the lifetime of this object.
 *
 * The destructor stops the context and joins the thread, so leaving the
 * scope through an exception does not leave a joinable thread behind.
 */
class BackgroundContext {
public:
    explicit BackgroundContext(asio::io_context& io)
        : io_(io), thread_([&io] { io.run(); }) {}

    ~BackgroundContext() {
        io_.stop();
        thread_.join();
    }

    BackgroundContext(const BackgroundContext&) = delete;
    BackgroundContext& operator=(const BackgroundContext&) = delete;

private:
    asio::io_context& io_;
    std::thread thread_;
};
