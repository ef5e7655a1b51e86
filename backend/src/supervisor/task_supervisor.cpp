#include "supervisor/task_supervisor.hpp"
#include "util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <csignal>
#include <exception>
#include <stdexcept>

namespace net = boost::asio;

TaskSupervisor::TaskSupervisor(net::io_context& ioc)
    : ioc_(ioc), signal_(ioc), os_signals_(ioc), watchdog_timer_(ioc)
{
    signal_.on_set([this] {
        boost::system::error_code ec;
        os_signals_.cancel(ec);
        watchdog_timer_.cancel();
    });
}

void TaskSupervisor::spawn(std::string name, Task task)
{
    if (signal_.is_set()) {
        log_warn("supervisor") << "not starting '" << name << "': shutting down";
        return;
    }
    auto& entry = tasks_.emplace_back(TaskEntry{std::move(name), std::move(task)});
    active_.fetch_add(1, std::memory_order_acq_rel);
    log_debug("supervisor") << "starting task '" << entry.name << "'";

    net::co_spawn(ioc_, entry.fn(), [this, &entry](std::exception_ptr ep) {
        active_.fetch_sub(1, std::memory_order_acq_rel);
        if (!ep) {
            log_info("supervisor") << "task '" << entry.name << "' finished";
            return;
        }
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // recorded below as a fault
        }
        log_error("supervisor") << "task '" << entry.name << "' failed: " << what;
        trigger("task '" + entry.name + "' failed: " + what, true);
    });
}

void TaskSupervisor::request_shutdown(std::string reason)
{
    net::post(ioc_, [this, reason = std::move(reason)]() mutable {
        trigger(std::move(reason), false);
    });
}

void TaskSupervisor::on_shutdown(std::function<void()> hook)
{
    signal_.on_set(std::move(hook));
}

void TaskSupervisor::add_health_probe(std::string name, std::function<bool()> probe)
{
    probes_.push_back(Probe{std::move(name), std::move(probe)});
}

void TaskSupervisor::spawn_watchdog(std::chrono::milliseconds interval)
{
    if (interval.count() <= 0) throw std::invalid_argument("watchdog interval must be positive");
    spawn("watchdog", [this, interval] { return watchdog_loop(interval); });
}

void TaskSupervisor::watch_os_signals()
{
    os_signals_.add(SIGINT);
    os_signals_.add(SIGTERM);
    os_signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) return; // cancelled during shutdown
        trigger(signo == SIGINT ? "SIGINT" : "SIGTERM", false);
    });
}

int TaskSupervisor::run()
{
    for (;;) {
        try {
            ioc_.run();
            break;
        } catch (const std::exception& e) {
            // A plain handler threw; tear down and let the rest drain.
            log_error("supervisor") << "handler failed: " << e.what();
            trigger(std::string("handler failed: ") + e.what(), true);
        }
    }
    const int code = faulted() ? 1 : 0;
    log_info("supervisor") << "scheduler stopped (exit " << code << ")";
    return code;
}

void TaskSupervisor::trigger(std::string reason, bool fault)
{
    if (fault) faulted_.store(true, std::memory_order_release);
    if (!signal_.set(std::move(reason))) {
        log_debug("supervisor") << "shutdown already in progress";
    }
}

net::awaitable<void> TaskSupervisor::watchdog_loop(std::chrono::milliseconds interval)
{
    while (!signal_.is_set()) {
        watchdog_timer_.expires_after(interval);
        boost::system::error_code ec;
        co_await watchdog_timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (signal_.is_set()) break;

        for (const auto& p : probes_) {
            if (p.check()) continue;
            log_error("watchdog") << "health probe '" << p.name << "' failed";
            trigger("health probe '" + p.name + "' failed", true);
            co_return;
        }
    }
}
