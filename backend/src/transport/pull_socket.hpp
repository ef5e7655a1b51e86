#pragma once
#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "transport/framing.hpp"

struct PullOptions
{
    std::size_t recv_hwm{10000};
    std::size_t max_frame_bytes{kDefaultMaxFrameBytes};
};

// Receiver end of the pipeline bridge: binds once, accepts any number of
// producers and fans their frames into a single bounded inbox.
// Lives on the caller's io_context; every member must be called from the
// thread running it.
class PullSocket {
public:
    PullSocket(boost::asio::io_context& ioc, PullOptions opts = {});
    ~PullSocket();

    PullSocket(const PullSocket&) = delete;
    PullSocket& operator=(const PullSocket&) = delete;

    // Throws BindError if the address cannot be acquired, ConfigError if malformed.
    void bind(const std::string& address);

    // Suspends until a frame arrives, `timeout` elapses (nullopt) or the
    // socket is closed (nullopt).
    boost::asio::awaitable<std::optional<std::string>> receive(std::chrono::milliseconds timeout);

    // Closes the acceptor and every producer connection; drops queued frames.
    void close() noexcept;

    bool is_bound() const noexcept;
    // tcp://host:port with the actual port (useful after binding port 0).
    std::string bound_address() const;

    std::uint64_t frames_received() const noexcept;
    std::uint64_t frames_dropped() const noexcept;
    std::uint64_t connections_accepted() const noexcept;

private:
    struct State;
    struct Connection;
    std::shared_ptr<State> state_;
};
