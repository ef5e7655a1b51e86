#pragma once
#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "codec/message_codec.hpp"
#include "metrics/metric_store.hpp"
#include "transport/pull_socket.hpp"

class ShutdownSignal;

enum class IngestionState : std::uint8_t
{
    Stopped = 0,
    Starting,
    Running,
    Stopping
};

std::string_view to_string(IngestionState s) noexcept;

struct IngestionOptions
{
    std::string bind_address{"tcp://0.0.0.0:5555"};
    std::chrono::milliseconds receive_timeout{1000};
    PullOptions pull;
};

struct IngestionHealth
{
    bool running{false};
    std::string bind_address;
    IngestionState state{IngestionState::Stopped};
    std::uint64_t frames_received{0};
    std::uint64_t events_applied{0};
    std::uint64_t decode_errors{0};
    std::uint64_t frames_dropped{0};
};

// Aggregator side of the bridge: owns the receive socket and the metric
// store, and is the store's only writer.
//
//   Stopped -> Starting -> Running -> Stopping -> Stopped
//
// A malformed frame is logged and skipped; it never ends the loop.
class IngestionService {
public:
    IngestionService(boost::asio::io_context& ioc, IngestionOptions opts);
    ~IngestionService();

    IngestionService(const IngestionService&) = delete;
    IngestionService& operator=(const IngestionService&) = delete;

    // Binds the receive socket. Throws BindError / ConfigError and returns to
    // Stopped on failure. No-op while already running.
    void start();

    // Closes the socket and discards queued frames. Idempotent.
    void stop() noexcept;

    // Receive loop; returns once `shutdown` is set or stop() is called.
    // The socket is closed on every exit path.
    boost::asio::awaitable<void> run(const ShutdownSignal& shutdown);

    // Decodes one frame and applies it to the store.
    // Returns false when the frame was dropped.
    bool apply_frame(std::string_view frame);

    MetricSnapshot snapshot() const { return store_.snapshot(); }
    const MetricStore& store() const noexcept { return store_; }

    IngestionState state() const noexcept { return state_.load(std::memory_order_acquire); }
    bool running() const noexcept { return state() == IngestionState::Running; }
    IngestionHealth health() const;

private:
    boost::asio::io_context& ioc_;
    IngestionOptions opts_;
    std::unique_ptr<PullSocket> pull_;
    std::string bound_address_;
    MessageCodec codec_;
    MetricStore store_;

    std::atomic<IngestionState> state_{IngestionState::Stopped};
    std::atomic<std::uint64_t> frames_received_{0};
    std::atomic<std::uint64_t> events_applied_{0};
    std::atomic<std::uint64_t> decode_errors_{0};
    std::uint64_t dropped_before_restart_{0};
};
