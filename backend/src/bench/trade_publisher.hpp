#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "bench/benchmark_result.hpp"
#include "codec/events.hpp"
#include "transport/push_socket.hpp"

struct PublishResult
{
    SendStatus status{SendStatus::Error};
    std::chrono::nanoseconds elapsed{0}; // the try_send call only

    bool ok() const noexcept { return status == SendStatus::Ok; }
    bool queue_full() const noexcept { return status == SendStatus::QueueFull; }
    double elapsed_us() const noexcept { return static_cast<double>(elapsed.count()) / 1000.0; }
};

// Producer-side front end of a PushSocket: encodes an event, then times the
// non-blocking send. With benchmarking on it keeps the last `window` send
// latencies for latency_stats().
//
// Single producer thread, like the socket it wraps.
class TradePublisher {
public:
    static constexpr std::size_t kDefaultWindow = 10000;

    explicit TradePublisher(PushSocket& socket, bool benchmarking = false,
                            std::size_t window = kDefaultWindow);

    // ts = wall clock now
    PublishResult publish_trade(Side side, double qty);
    PublishResult publish(const Event& ev);

    // Sends an already encoded frame; the timed region is the send alone.
    PublishResult send_frame(std::string frame);

    LatencyStats latency_stats() const;
    void reset_stats();

    std::uint64_t published() const noexcept { return published_; }
    std::uint64_t dropped() const noexcept { return dropped_; }
    PushSocket& socket() noexcept { return socket_; }

private:
    void record(double us);

    PushSocket& socket_;
    bool benchmarking_;
    std::size_t window_;
    std::vector<double> samples_; // ring once full
    std::size_t next_ = 0;
    std::uint64_t published_ = 0;
    std::uint64_t dropped_ = 0;
};

// Seconds since the epoch, as carried in TradeEvent::timestamp.
double wall_clock_seconds();
