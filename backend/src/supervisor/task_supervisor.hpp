#pragma once
#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <string>
#include <vector>

#include "supervisor/shutdown_signal.hpp"

// Cooperative scheduler for the aggregator: a single-threaded io_context
// running named coroutine tasks.
//
// Every way of stopping funnels into trigger(): an OS signal, a task that
// exits with an exception, a failing health probe, or request_shutdown().
// trigger() sets the shared ShutdownSignal, whose hooks close sockets and
// cancel timers so each task wakes at its next suspension point and returns.
class TaskSupervisor {
public:
    using Task = std::function<boost::asio::awaitable<void>()>;

    explicit TaskSupervisor(boost::asio::io_context& ioc);

    TaskSupervisor(const TaskSupervisor&) = delete;
    TaskSupervisor& operator=(const TaskSupervisor&) = delete;

    // Starts `task` on the scheduler. An exception escaping it is logged and
    // turns into a shutdown with a non-zero exit code.
    void spawn(std::string name, Task task);

    // Safe from any thread.
    void request_shutdown(std::string reason);

    // Teardown to run once when shutdown starts (scheduler thread).
    void on_shutdown(std::function<void()> hook);

    // Polled by the watchdog; returning false escalates to shutdown.
    void add_health_probe(std::string name, std::function<bool()> probe);
    void spawn_watchdog(std::chrono::milliseconds interval);

    // SIGINT / SIGTERM -> shutdown.
    void watch_os_signals();

    // Runs the scheduler until every task and handler has finished.
    // Returns 0 after a requested shutdown, 1 if anything faulted.
    int run();

    ShutdownSignal& signal() noexcept { return signal_; }
    bool faulted() const noexcept { return faulted_.load(std::memory_order_acquire); }
    std::size_t active_tasks() const noexcept { return active_.load(std::memory_order_acquire); }

private:
    struct TaskEntry
    {
        std::string name;
        Task fn;
    };
    struct Probe
    {
        std::string name;
        std::function<bool()> check;
    };

    void trigger(std::string reason, bool fault);
    boost::asio::awaitable<void> watchdog_loop(std::chrono::milliseconds interval);

    boost::asio::io_context& ioc_;
    ShutdownSignal signal_;
    boost::asio::signal_set os_signals_;
    boost::asio::steady_timer watchdog_timer_;
    std::list<TaskEntry> tasks_; // stable storage for task callables
    std::vector<Probe> probes_;
    std::atomic<std::size_t> active_{0};
    std::atomic<bool> faulted_{false};
};
