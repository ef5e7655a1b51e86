#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "test_util.hpp"
#include "transport/address.hpp"
#include "transport/pull_socket.hpp"
#include "transport/push_socket.hpp"

namespace net = boost::asio;
using namespace std::chrono_literals;

namespace {

net::awaitable<std::vector<std::string>> receive_n(PullSocket& pull, std::size_t n)
{
    std::vector<std::string> out;
    while (out.size() < n) {
        auto frame = co_await pull.receive(2000ms);
        if (!frame) break;
        out.push_back(std::move(*frame));
    }
    co_return out;
}

} // namespace

TEST(Address, ParsesTcpForms)
{
    auto a = parse_address("tcp://127.0.0.1:5555");
    EXPECT_EQ(a.host, "127.0.0.1");
    EXPECT_EQ(a.port, 5555);

    EXPECT_EQ(parse_address("tcp://*:7000").host, "0.0.0.0");
    EXPECT_EQ(parse_address("tcp://[::1]:80").host, "::1");
    EXPECT_EQ(parse_address("tcp://localhost:0").port, 0);
}

TEST(Address, RejectsMalformed)
{
    EXPECT_THROW(parse_address("udp://127.0.0.1:5555"), ConfigError);
    EXPECT_THROW(parse_address("tcp://127.0.0.1"), ConfigError);
    EXPECT_THROW(parse_address("tcp://127.0.0.1:99999"), ConfigError);
    EXPECT_THROW(parse_address("tcp://:5555"), ConfigError);
    EXPECT_THROW(parse_address("127.0.0.1:5555"), ConfigError);
}

TEST(Transport, FramesArriveIntactAndInOrder)
{
    net::io_context ioc;
    PullSocket pull{ioc};
    pull.bind("tcp://127.0.0.1:0");
    ASSERT_TRUE(pull.is_bound());

    PushSocket push;
    push.connect(pull.bound_address());
    ASSERT_TRUE(run_until(ioc, [&] { return push.connected(); }));

    const std::vector<std::string> sent{"{\"a\":1}", "", std::string(5000, 'x'), "last"};
    for (const auto& f : sent) ASSERT_EQ(push.try_send(f), SendStatus::Ok);

    const auto got = run_awaitable(ioc, receive_n(pull, sent.size()));
    EXPECT_EQ(got, sent);
    EXPECT_EQ(pull.frames_received(), sent.size());
    EXPECT_EQ(pull.connections_accepted(), 1u);
}

TEST(Transport, ManyProducersFanIn)
{
    net::io_context ioc;
    PullSocket pull{ioc};
    pull.bind("tcp://127.0.0.1:0");

    PushSocket a, b;
    a.connect(pull.bound_address());
    b.connect(pull.bound_address());
    ASSERT_TRUE(run_until(ioc, [&] { return a.connected() && b.connected(); }));

    EXPECT_EQ(a.try_send("from-a"), SendStatus::Ok);
    EXPECT_EQ(b.try_send("from-b"), SendStatus::Ok);

    auto got = run_awaitable(ioc, receive_n(pull, 2));
    std::sort(got.begin(), got.end());
    EXPECT_EQ(got, (std::vector<std::string>{"from-a", "from-b"}));
}

TEST(Transport, ReceiveTimesOutWithoutFrames)
{
    net::io_context ioc;
    PullSocket pull{ioc};
    pull.bind("tcp://127.0.0.1:0");

    const auto start = std::chrono::steady_clock::now();
    auto frame = run_awaitable(ioc, pull.receive(50ms));
    EXPECT_FALSE(frame.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST(Transport, BindingAnAddressInUseFails)
{
    net::io_context ioc;
    PullSocket first{ioc};
    first.bind("tcp://127.0.0.1:0");

    PullSocket second{ioc};
    EXPECT_THROW(second.bind(first.bound_address()), BindError);
    EXPECT_FALSE(second.is_bound());
}

TEST(Transport, SendWithoutPeerIsQueueFull)
{
    PushSocket push{PushOptions{10}};
    EXPECT_EQ(push.try_send("x"), SendStatus::QueueFull);

    // nothing listens on port 1
    push.connect("tcp://127.0.0.1:1");
    EXPECT_FALSE(push.wait_connected(50ms));
    EXPECT_EQ(push.try_send("x"), SendStatus::QueueFull);

    push.close();
    EXPECT_EQ(push.try_send("x"), SendStatus::Error);
}

TEST(Transport, OversizedFrameIsAnError)
{
    PushSocket push{PushOptions{10, 100ms, 16}};
    EXPECT_EQ(push.try_send(std::string(17, 'x')), SendStatus::Error);
}

TEST(Transport, ReceiverDropsBeyondHighWaterMark)
{
    net::io_context ioc;
    PullSocket pull{ioc, PullOptions{2}};
    pull.bind("tcp://127.0.0.1:0");

    PushSocket push;
    push.connect(pull.bound_address());
    ASSERT_TRUE(run_until(ioc, [&] { return push.connected(); }));

    for (int i = 0; i < 5; ++i) ASSERT_EQ(push.try_send(std::to_string(i)), SendStatus::Ok);
    ASSERT_TRUE(run_until(ioc, [&] { return pull.frames_received() + pull.frames_dropped() == 5; }));
    EXPECT_EQ(pull.frames_received(), 2u);
    EXPECT_EQ(pull.frames_dropped(), 3u);

    const auto got = run_awaitable(ioc, receive_n(pull, 2));
    EXPECT_EQ(got, (std::vector<std::string>{"0", "1"}));
}

TEST(Transport, ProducerReconnectsAfterReceiverRestart)
{
    net::io_context ioc;
    std::string address;
    {
        PullSocket pull{ioc};
        pull.bind("tcp://127.0.0.1:0");
        address = pull.bound_address();
    }

    PushSocket push{PushOptions{100, 20ms}};
    push.connect(address);
    EXPECT_FALSE(push.wait_connected(50ms));

    PullSocket pull{ioc};
    pull.bind(address);
    ASSERT_TRUE(run_until(ioc, [&] { return push.connected(); }));
    ASSERT_EQ(push.try_send("hello"), SendStatus::Ok);
    const auto got = run_awaitable(ioc, receive_n(pull, 1));
    EXPECT_EQ(got, std::vector<std::string>{"hello"});
}

TEST(Transport, DrainSettlesAfterReceiverDiesMidStream)
{
    net::io_context ioc;
    PullSocket pull{ioc};
    pull.bind("tcp://127.0.0.1:0");

    PushSocket push{PushOptions{100, 20ms}};
    push.connect(pull.bound_address());
    ASSERT_TRUE(run_until(ioc, [&] { return push.connected(); }));

    std::atomic<bool> stop{false};
    std::thread producer([&] {
        const std::string frame(32 * 1024, 'x');
        while (!stop.load()) {
            if (push.try_send(frame) != SendStatus::Ok) std::this_thread::sleep_for(100us);
        }
    });

    ASSERT_TRUE(run_until(ioc, [&] { return pull.frames_received() + pull.frames_dropped() >= 50; }));
    pull.close();
    const bool lost = run_until(ioc, [&] { return !push.connected(); }, 2000ms);
    stop = true;
    producer.join();

    EXPECT_TRUE(lost);
    EXPECT_TRUE(push.drain(2000ms));
    EXPECT_GT(push.frames_written(), 0u);
}

TEST(Transport, DrainedWithNothingInFlight)
{
    PushSocket push;
    EXPECT_TRUE(push.drained());
    push.connect("tcp://127.0.0.1:1");
    EXPECT_EQ(push.try_send("x"), SendStatus::QueueFull);
    EXPECT_TRUE(push.drained());
}

TEST(Transport, ClosedReceiverReturnsNothing)
{
    net::io_context ioc;
    PullSocket pull{ioc};
    pull.bind("tcp://127.0.0.1:0");
    pull.close();
    EXPECT_FALSE(pull.is_bound());
    EXPECT_FALSE(run_awaitable(ioc, pull.receive(1000ms)).has_value());
}
