#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "transport/framing.hpp"

enum class SendStatus : std::uint8_t
{
    Ok = 0,        // handed to the send buffer
    QueueFull = 1, // no peer yet, or send high-water mark reached; frame dropped
    Error = 2      // socket closed or frame rejected; frame dropped
};

std::string_view to_string(SendStatus s) noexcept;

struct PushOptions
{
    std::size_t send_hwm{100};
    std::chrono::milliseconds reconnect_interval{100};
    std::size_t max_frame_bytes{kDefaultMaxFrameBytes};
};

// Producer end of the pipeline bridge.
//
// connect() starts a private I/O thread that dials the receiver and keeps
// redialing after refusals or peer loss. try_send() never blocks: the frame
// either lands in a bounded SPSC send buffer drained by the I/O thread, or is
// dropped and reported. Delivery is at-most-once; frames still buffered when
// the connection drops are discarded.
//
// Exactly one producer thread may call try_send on a given socket.
class PushSocket {
public:
    explicit PushSocket(PushOptions opts = {});
    ~PushSocket();

    PushSocket(const PushSocket&) = delete;
    PushSocket& operator=(const PushSocket&) = delete;

    // Returns immediately; throws ConfigError on a malformed address.
    void connect(const std::string& address);

    SendStatus try_send(std::string frame);

    // Stops the I/O thread; pending frames are discarded. Idempotent.
    void close() noexcept;

    bool connected() const noexcept;
    // Polls until connected or `timeout` elapses.
    bool wait_connected(std::chrono::milliseconds timeout) const;

    // True once every accepted frame has been written or discarded.
    bool drained() const noexcept;
    // Blocks the caller until drained() or `timeout` elapses.
    bool drain(std::chrono::milliseconds timeout) const;

    const std::string& address() const noexcept;
    std::uint64_t frames_written() const noexcept;
    std::uint64_t frames_discarded() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
