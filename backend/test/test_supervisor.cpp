#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <stdexcept>
#include <thread>

#include "supervisor/shutdown_signal.hpp"
#include "supervisor/task_supervisor.hpp"

namespace net = boost::asio;
using namespace std::chrono_literals;

namespace {

// Idles in short slices until shutdown, then records that it saw it.
net::awaitable<void> idle_until_shutdown(const ShutdownSignal& sig, bool& cleaned_up)
{
    net::steady_timer t(co_await net::this_coro::executor);
    while (!sig.is_set()) {
        t.expires_after(5ms);
        co_await t.async_wait(net::use_awaitable);
    }
    cleaned_up = true;
}

net::awaitable<void> fail_after(std::chrono::milliseconds d)
{
    net::steady_timer t(co_await net::this_coro::executor);
    t.expires_after(d);
    co_await t.async_wait(net::use_awaitable);
    throw std::runtime_error("boom");
}

} // namespace

TEST(ShutdownSignal, SetOnceRunsHooksOnce)
{
    net::io_context ioc;
    ShutdownSignal sig{ioc};
    int calls = 0;
    sig.on_set([&] { ++calls; });

    EXPECT_FALSE(sig.is_set());
    EXPECT_TRUE(sig.set("first"));
    EXPECT_FALSE(sig.set("second"));
    EXPECT_TRUE(sig.is_set());
    EXPECT_EQ(sig.reason(), "first");
    EXPECT_EQ(calls, 1);

    // late registration runs right away
    sig.on_set([&] { ++calls; });
    EXPECT_EQ(calls, 2);
}

TEST(ShutdownSignal, WakesEveryWaiter)
{
    net::io_context ioc;
    ShutdownSignal sig{ioc};
    int woke = 0;
    for (int i = 0; i < 3; ++i) {
        net::co_spawn(ioc, [&]() -> net::awaitable<void> {
            co_await sig.wait();
            ++woke;
        }, net::detached);
    }
    ioc.poll();
    EXPECT_EQ(woke, 0);

    sig.set("stop");
    ioc.run_for(1s);
    EXPECT_EQ(woke, 3);
}

TEST(TaskSupervisor, RequestedShutdownExitsZero)
{
    net::io_context ioc;
    TaskSupervisor sup{ioc};
    bool a_clean = false, b_clean = false;
    int hook_calls = 0;
    sup.on_shutdown([&] { ++hook_calls; });

    sup.spawn("a", [&] { return idle_until_shutdown(sup.signal(), a_clean); });
    sup.spawn("b", [&] { return idle_until_shutdown(sup.signal(), b_clean); });
    EXPECT_EQ(sup.active_tasks(), 2u);

    std::thread requester([&] {
        std::this_thread::sleep_for(30ms);
        sup.request_shutdown("test");
        sup.request_shutdown("again");
    });
    const int code = sup.run();
    requester.join();

    EXPECT_EQ(code, 0);
    EXPECT_TRUE(a_clean);
    EXPECT_TRUE(b_clean);
    EXPECT_EQ(hook_calls, 1);
    EXPECT_EQ(sup.active_tasks(), 0u);
    EXPECT_EQ(sup.signal().reason(), "test");
}

TEST(TaskSupervisor, FaultingTaskStopsEverythingAndExitsNonZero)
{
    net::io_context ioc;
    TaskSupervisor sup{ioc};
    bool survivor_clean = false;

    sup.spawn("survivor", [&] { return idle_until_shutdown(sup.signal(), survivor_clean); });
    sup.spawn("faulty", [] { return fail_after(10ms); });

    EXPECT_EQ(sup.run(), 1);
    EXPECT_TRUE(sup.faulted());
    EXPECT_TRUE(survivor_clean);
    EXPECT_NE(sup.signal().reason().find("boom"), std::string::npos);
}

TEST(TaskSupervisor, WatchdogEscalatesFailedProbe)
{
    net::io_context ioc;
    TaskSupervisor sup{ioc};
    int polls = 0;
    sup.add_health_probe("flaky", [&] { return ++polls < 3; });
    sup.spawn_watchdog(5ms);

    EXPECT_EQ(sup.run(), 1);
    EXPECT_EQ(polls, 3);
    EXPECT_NE(sup.signal().reason().find("flaky"), std::string::npos);
}

TEST(TaskSupervisor, WatchdogStopsOnShutdown)
{
    net::io_context ioc;
    TaskSupervisor sup{ioc};
    sup.add_health_probe("ok", [] { return true; });
    sup.spawn_watchdog(1h);
    sup.request_shutdown("bye");
    EXPECT_EQ(sup.run(), 0);
}

TEST(TaskSupervisor, NoNewTasksAfterShutdown)
{
    net::io_context ioc;
    TaskSupervisor sup{ioc};
    sup.request_shutdown("early");
    ioc.poll();
    bool ran = false;
    sup.spawn("late", [&]() -> net::awaitable<void> {
        ran = true;
        co_return;
    });
    sup.run();
    EXPECT_FALSE(ran);
}
