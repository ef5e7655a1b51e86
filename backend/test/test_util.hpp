#pragma once
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>

// Drives `ioc` until `done()` holds or `timeout` passes. Returns done().
inline bool run_until(boost::asio::io_context& ioc, const std::function<bool()>& done,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        ioc.run_for(std::chrono::milliseconds(5));
        if (ioc.stopped()) ioc.restart();
    }
    return done();
}

// Runs one coroutine to completion on `ioc`, rethrowing what it threw.
template <typename T>
T run_awaitable(boost::asio::io_context& ioc, boost::asio::awaitable<T> aw,
                std::chrono::milliseconds timeout = std::chrono::seconds(30))
{
    std::optional<T> out;
    std::exception_ptr err;
    bool finished = false;
    boost::asio::co_spawn(ioc, std::move(aw), [&](std::exception_ptr e, T v) {
        err = e;
        if (!e) out.emplace(std::move(v));
        finished = true;
    });
    if (!run_until(ioc, [&] { return finished; }, timeout)) {
        throw std::runtime_error("coroutine did not finish in time");
    }
    if (err) std::rethrow_exception(err);
    return std::move(*out);
}

inline void run_awaitable(boost::asio::io_context& ioc, boost::asio::awaitable<void> aw,
                          std::chrono::milliseconds timeout = std::chrono::seconds(30))
{
    std::exception_ptr err;
    bool finished = false;
    boost::asio::co_spawn(ioc, std::move(aw), [&](std::exception_ptr e) {
        err = e;
        finished = true;
    });
    if (!run_until(ioc, [&] { return finished; }, timeout)) {
        throw std::runtime_error("coroutine did not finish in time");
    }
    if (err) std::rethrow_exception(err);
}
