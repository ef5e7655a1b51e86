#include "transport/push_socket.hpp"
#include "transport/address.hpp"
#include "util/log.hpp"
#include "util/spsc_ring.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <atomic>
#include <optional>
#include <stdexcept>
#include <thread>

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace
{
    // Frames coalesced into one async_write.
    constexpr std::size_t kMaxBatch = 64;
}

std::string_view to_string(SendStatus s) noexcept
{
    switch (s) {
        case SendStatus::Ok:        return "ok";
        case SendStatus::QueueFull: return "queue_full";
        case SendStatus::Error:     return "error";
    }
    return "error";
}

struct PushSocket::Impl
{
    PushOptions opts;
    std::string address;
    TransportAddress target;

    net::io_context ioc{1};
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    tcp::socket socket{ioc};
    net::steady_timer retry{ioc};
    std::thread io_thread;

    SpscRing<std::string> ring;
    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> wake_pending{false};
    std::atomic<std::uint64_t> accepted{0};
    std::atomic<std::uint64_t> written{0};
    std::atomic<std::uint64_t> discarded{0};

    // I/O thread only
    std::uint64_t generation = 0;
    bool writing = false;
    std::size_t inflight = 0; // frames in out_buf while writing
    std::string out_buf;
    std::array<char, 64> probe{};

    explicit Impl(PushOptions o)
    : opts(o), ring(o.send_hwm) {}

    void start_connect()
    {
        if (closed.load(std::memory_order_acquire)) return;

        boost::system::error_code ec;
        tcp::resolver resolver{ioc};
        auto results = resolver.resolve(target.host, std::to_string(target.port), ec);
        if (ec) {
            log_warn("push") << "resolve " << address << " failed: " << ec.message();
            schedule_retry();
            return;
        }

        socket = tcp::socket(ioc);
        const std::uint64_t gen = ++generation;
        net::async_connect(socket, results,
            [this, gen](const boost::system::error_code& ec, const tcp::endpoint&) {
                if (closed.load(std::memory_order_acquire) || gen != generation) return;
                if (ec) {
                    log_debug("push") << "connect " << address << ": " << ec.message();
                    schedule_retry();
                    return;
                }
                boost::system::error_code opt_ec;
                socket.set_option(tcp::no_delay(true), opt_ec);
                connected.store(true, std::memory_order_release);
                log_info("push") << "connected to " << address;
                watch_peer(gen);
                flush();
            });
    }

    void schedule_retry()
    {
        retry.expires_after(opts.reconnect_interval);
        retry.async_wait([this](const boost::system::error_code& ec) {
            if (ec || closed.load(std::memory_order_acquire)) return;
            start_connect();
        });
    }

    // The receiver never writes back; a completed read means the peer went away.
    void watch_peer(std::uint64_t gen)
    {
        socket.async_read_some(net::buffer(probe),
            [this, gen](const boost::system::error_code& ec, std::size_t) {
                if (gen != generation) return;
                if (ec) {
                    peer_lost(ec);
                    return;
                }
                watch_peer(gen);
            });
    }

    void peer_lost(const boost::system::error_code& ec)
    {
        if (!connected.exchange(false, std::memory_order_acq_rel)) return;
        ++generation;
        boost::system::error_code ignored;
        socket.close(ignored);

        // linger 0: whatever is still buffered or mid-write is gone
        std::uint64_t dropped = abandon_write();
        std::string frame;
        while (ring.try_pop(frame)) ++dropped;
        discarded.fetch_add(dropped, std::memory_order_relaxed);

        if (closed.load(std::memory_order_acquire)) return;
        log_warn("push") << "lost connection to " << address << " (" << ec.message()
                         << "), discarded " << dropped << " buffered frames";
        schedule_retry();
    }

    void flush()
    {
        if (!connected.load(std::memory_order_acquire)) {
            // pushed while the connection was being torn down
            std::string frame;
            std::uint64_t dropped = 0;
            while (ring.try_pop(frame)) ++dropped;
            discarded.fetch_add(dropped, std::memory_order_relaxed);
            return;
        }
        if (writing) return;

        out_buf.clear();
        std::string frame;
        std::size_t batch = 0;
        while (batch < kMaxBatch && ring.try_pop(frame)) {
            append_frame(out_buf, frame);
            ++batch;
        }
        if (batch == 0) return;

        writing = true;
        inflight = batch;
        const std::uint64_t gen = generation;
        net::async_write(socket, net::buffer(out_buf),
            [this, gen, batch](const boost::system::error_code& ec, std::size_t) {
                if (gen != generation) return;
                writing = false;
                inflight = 0;
                if (ec) {
                    discarded.fetch_add(batch, std::memory_order_relaxed);
                    peer_lost(ec);
                    return;
                }
                written.fetch_add(batch, std::memory_order_relaxed);
                flush();
            });
    }

    // Drops the batch of an async_write whose handler will no longer count it.
    std::uint64_t abandon_write()
    {
        const std::uint64_t n = writing ? inflight : 0;
        writing = false;
        inflight = 0;
        out_buf.clear();
        return n;
    }

    void shutdown_on_io_thread()
    {
        retry.cancel();
        ++generation;
        boost::system::error_code ignored;
        socket.close(ignored);
        discarded.fetch_add(abandon_write(), std::memory_order_relaxed);
        connected.store(false, std::memory_order_release);
        work.reset();
    }
};

PushSocket::PushSocket(PushOptions opts) : impl_(std::make_unique<Impl>(opts)) {}

PushSocket::~PushSocket() { close(); }

void PushSocket::connect(const std::string& address)
{
    if (impl_->io_thread.joinable()) {
        throw std::logic_error("PushSocket::connect called twice");
    }
    impl_->target = parse_address(address);
    impl_->address = address;
    impl_->work.emplace(net::make_work_guard(impl_->ioc));

    Impl* impl = impl_.get();
    net::post(impl->ioc, [impl] { impl->start_connect(); });
    impl->io_thread = std::thread([impl] {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            impl->connected.store(false, std::memory_order_release);
            log_error("push") << "I/O thread for " << impl->address << " failed: " << e.what();
        }
    });
}

SendStatus PushSocket::try_send(std::string frame)
{
    Impl& im = *impl_;
    if (im.closed.load(std::memory_order_acquire)) return SendStatus::Error;
    if (frame.size() > im.opts.max_frame_bytes) return SendStatus::Error;
    if (!im.connected.load(std::memory_order_acquire)) return SendStatus::QueueFull;
    if (!im.ring.try_push(std::move(frame))) return SendStatus::QueueFull;
    im.accepted.fetch_add(1, std::memory_order_relaxed);

    if (!im.wake_pending.exchange(true, std::memory_order_acq_rel)) {
        Impl* impl = impl_.get();
        net::post(im.ioc, [impl] {
            impl->wake_pending.store(false, std::memory_order_release);
            impl->flush();
        });
    }
    return SendStatus::Ok;
}

void PushSocket::close() noexcept
{
    if (!impl_ || impl_->closed.exchange(true, std::memory_order_acq_rel)) return;
    if (impl_->io_thread.joinable()) {
        Impl* impl = impl_.get();
        net::post(impl->ioc, [impl] { impl->shutdown_on_io_thread(); });
        impl_->io_thread.join();
    }
}

bool PushSocket::connected() const noexcept
{
    return impl_->connected.load(std::memory_order_acquire);
}

bool PushSocket::wait_connected(std::chrono::milliseconds timeout) const
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!connected()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

bool PushSocket::drained() const noexcept
{
    const Impl& im = *impl_;
    const auto settled = im.written.load(std::memory_order_relaxed) + im.discarded.load(std::memory_order_relaxed);
    return settled >= im.accepted.load(std::memory_order_relaxed);
}

bool PushSocket::drain(std::chrono::milliseconds timeout) const
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (drained()) return true;
        if (impl_->closed.load(std::memory_order_acquire)) return false;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

const std::string& PushSocket::address() const noexcept { return impl_->address; }

std::uint64_t PushSocket::frames_written() const noexcept
{
    return impl_->written.load(std::memory_order_relaxed);
}

std::uint64_t PushSocket::frames_discarded() const noexcept
{
    return impl_->discarded.load(std::memory_order_relaxed);
}
