#include "supervisor/shutdown_signal.hpp"
#include "util/log.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>

namespace net = boost::asio;

ShutdownSignal::ShutdownSignal(net::io_context& ioc) : waiters_(ioc)
{
    waiters_.expires_at(net::steady_timer::time_point::max());
}

bool ShutdownSignal::set(std::string reason)
{
    if (set_.exchange(true, std::memory_order_acq_rel)) return false;
    reason_ = std::move(reason);
    log_info("shutdown") << "shutdown requested: " << reason_;

    auto hooks = std::move(hooks_);
    hooks_.clear();
    for (auto& hook : hooks) {
        try {
            hook();
        } catch (const std::exception& e) {
            // keep tearing down the rest
            log_error("shutdown") << "shutdown hook failed: " << e.what();
        }
    }
    waiters_.cancel();
    return true;
}

void ShutdownSignal::on_set(std::function<void()> hook)
{
    if (is_set()) {
        hook();
        return;
    }
    hooks_.push_back(std::move(hook));
}

net::awaitable<void> ShutdownSignal::wait()
{
    while (!is_set()) {
        boost::system::error_code ec;
        co_await waiters_.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
}
