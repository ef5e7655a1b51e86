#pragma once
#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <functional>
#include <string>
#include <vector>

// Set-once cancellation token shared by every supervised task.
// set(), on_set() and wait() run on the scheduler thread; is_set() may be
// read from anywhere.
class ShutdownSignal {
public:
    explicit ShutdownSignal(boost::asio::io_context& ioc);

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    bool is_set() const noexcept { return set_.load(std::memory_order_acquire); }
    const std::string& reason() const noexcept { return reason_; }

    // First call wins: records the reason, runs every hook once (in
    // registration order) and wakes all waiters. Later calls return false.
    bool set(std::string reason);

    // Runs immediately when the signal is already set.
    void on_set(std::function<void()> hook);

    // Suspends until the signal is set.
    boost::asio::awaitable<void> wait();

private:
    std::atomic<bool> set_{false};
    std::string reason_;
    std::vector<std::function<void()>> hooks_;
    boost::asio::steady_timer waiters_;
};
