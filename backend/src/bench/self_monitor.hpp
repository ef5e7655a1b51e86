#pragma once
#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <string>
#include <vector>

#include "bench/trade_publisher.hpp"
#include "transport/push_socket.hpp"

class ShutdownSignal;

struct SelfMonitorOptions
{
    std::string connect_address{"tcp://127.0.0.1:5555"};
    std::chrono::milliseconds interval{5000};
    std::size_t send_hwm{100};
    double p95_alert_us{1000.0};
    double p99_alert_us{5000.0};
    double mean_alert_us{500.0};
};

// Sidecar task that watches the pipeline through the pipeline: it sends a
// heartbeat status every interval over its own producer socket, times those
// sends, and raises an alert when the latencies cross the thresholds.
class SelfMonitor {
public:
    static constexpr const char* kTestName = "self_monitor";

    SelfMonitor(boost::asio::io_context& ioc, SelfMonitorOptions opts);
    ~SelfMonitor();

    SelfMonitor(const SelfMonitor&) = delete;
    SelfMonitor& operator=(const SelfMonitor&) = delete;

    // Publishes started, then a heartbeat per interval, then completed.
    boost::asio::awaitable<void> run(const ShutdownSignal& shutdown);

    // Wakes run() so it can observe shutdown. Scheduler thread.
    void stop();

    // One message per crossed threshold; empty when healthy or without samples.
    std::vector<std::string> check_thresholds(const LatencyStats& s) const;

    std::uint64_t heartbeats() const noexcept { return heartbeats_; }
    std::uint64_t alerts() const noexcept { return alerts_; }

private:
    void publish_status(BenchmarkStatus status, const std::string& message);

    SelfMonitorOptions opts_;
    boost::asio::steady_timer timer_;
    PushSocket socket_;
    TradePublisher publisher_;
    bool stopping_ = false;
    std::uint64_t heartbeats_ = 0;
    std::uint64_t alerts_ = 0;
};
