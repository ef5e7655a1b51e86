#include "transport/pull_socket.hpp"
#include "transport/address.hpp"
#include "errors.hpp"
#include "util/log.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <deque>
#include <vector>

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

struct PullSocket::State : public std::enable_shared_from_this<State>
{
    State(net::io_context& ioc, PullOptions o)
    : acceptor(ioc), wake(ioc), opts(o) {}

    tcp::acceptor acceptor;
    net::steady_timer wake;
    PullOptions opts;

    std::deque<std::string> inbox;
    std::vector<std::weak_ptr<Connection>> connections;
    bool bound = false;
    bool closed = false;
    std::string bound_address;

    std::atomic<std::uint64_t> received{0};
    std::atomic<std::uint64_t> dropped{0};
    std::atomic<std::uint64_t> accepted{0};

    void deliver(std::string frame)
    {
        if (closed) return;
        if (inbox.size() >= opts.recv_hwm) {
            dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        inbox.push_back(std::move(frame));
        received.fetch_add(1, std::memory_order_relaxed);
        wake.cancel();
    }

    void do_accept();
};

struct PullSocket::Connection : public std::enable_shared_from_this<Connection>
{
    Connection(tcp::socket s, std::shared_ptr<State> o)
    : socket(std::move(s)), owner(std::move(o)) {}

    tcp::socket socket;
    std::shared_ptr<State> owner;
    std::array<unsigned char, kFrameHeaderBytes> header{};
    std::string body;

    void run() { read_header(); }

    void read_header()
    {
        auto self = shared_from_this();
        net::async_read(socket, net::buffer(header),
            [self](const boost::system::error_code& ec, std::size_t) {
                if (ec) return self->finish(ec);
                const std::uint32_t len = read_frame_length(self->header.data());
                if (len > self->owner->opts.max_frame_bytes) {
                    log_warn("pull") << "frame of " << len << " bytes exceeds limit of "
                                     << self->owner->opts.max_frame_bytes << "; closing producer";
                    return self->finish({});
                }
                if (len == 0) {
                    self->owner->deliver(std::string());
                    return self->read_header();
                }
                self->body.resize(len);
                self->read_body();
            });
    }

    void read_body()
    {
        auto self = shared_from_this();
        net::async_read(socket, net::buffer(body),
            [self](const boost::system::error_code& ec, std::size_t) {
                if (ec) return self->finish(ec);
                self->owner->deliver(std::move(self->body));
                self->body = std::string();
                self->read_header();
            });
    }

    void finish(const boost::system::error_code& ec)
    {
        if (ec && ec != net::error::eof && ec != net::error::operation_aborted) {
            log_debug("pull") << "producer connection closed: " << ec.message();
        }
        boost::system::error_code ignored;
        socket.close(ignored);
    }
};

void PullSocket::State::do_accept()
{
    auto self = shared_from_this();
    acceptor.async_accept(
        [self](const boost::system::error_code& ec, tcp::socket s) {
            if (self->closed) return;
            if (ec) {
                if (ec == net::error::operation_aborted) return;
                log_warn("pull") << "accept failed: " << ec.message();
                return self->do_accept();
            }
            self->accepted.fetch_add(1, std::memory_order_relaxed);
            auto conn = std::make_shared<Connection>(std::move(s), self);
            auto& conns = self->connections;
            conns.erase(std::remove_if(conns.begin(), conns.end(),
                                       [](const std::weak_ptr<Connection>& w) { return w.expired(); }),
                        conns.end());
            conns.push_back(conn);
            conn->run();
            self->do_accept();
        });
}

PullSocket::PullSocket(net::io_context& ioc, PullOptions opts)
: state_(std::make_shared<State>(ioc, opts)) {}

PullSocket::~PullSocket() { close(); }

void PullSocket::bind(const std::string& address)
{
    State& st = *state_;
    if (st.bound) throw BindError("bind " + address + ": socket already bound to " + st.bound_address);
    if (st.closed) throw BindError("bind " + address + ": socket is closed");

    const TransportAddress addr = parse_address(address);

    boost::system::error_code ec;
    tcp::endpoint ep;
    auto ip = net::ip::make_address(addr.host, ec);
    if (!ec) {
        ep = tcp::endpoint{ip, addr.port};
    } else {
        tcp::resolver resolver{st.acceptor.get_executor()};
        auto results = resolver.resolve(addr.host, std::to_string(addr.port), ec);
        if (ec || results.empty()) {
            throw BindError("bind " + address + ": cannot resolve host: " + ec.message());
        }
        ep = results.begin()->endpoint();
    }

    st.acceptor.open(ep.protocol(), ec);
    if (ec) throw BindError("bind " + address + ": open: " + ec.message());
    st.acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw BindError("bind " + address + ": set_option: " + ec.message());
    st.acceptor.bind(ep, ec);
    if (ec) {
        boost::system::error_code ignored;
        st.acceptor.close(ignored);
        throw BindError("bind " + address + ": " + ec.message());
    }
    st.acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        boost::system::error_code ignored;
        st.acceptor.close(ignored);
        throw BindError("bind " + address + ": listen: " + ec.message());
    }

    TransportAddress actual = addr;
    actual.port = st.acceptor.local_endpoint().port();
    st.bound_address = actual.to_string();
    st.bound = true;
    log_info("pull") << "bound " << st.bound_address;

    st.do_accept();
}

net::awaitable<std::optional<std::string>> PullSocket::receive(std::chrono::milliseconds timeout)
{
    auto st = state_;
    if (st->inbox.empty() && !st->closed) {
        st->wake.expires_after(timeout);
        boost::system::error_code ec;
        co_await st->wake.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    if (st->inbox.empty()) co_return std::nullopt;

    std::optional<std::string> frame(std::move(st->inbox.front()));
    st->inbox.pop_front();
    co_return frame;
}

void PullSocket::close() noexcept
{
    State& st = *state_;
    if (st.closed) return;
    st.closed = true;

    boost::system::error_code ignored;
    st.acceptor.close(ignored);
    for (auto& w : st.connections) {
        if (auto conn = w.lock()) {
            conn->socket.close(ignored);
        }
    }
    st.connections.clear();
    st.inbox.clear();
    st.wake.cancel();
    if (st.bound) log_info("pull") << "closed " << st.bound_address;
}

bool PullSocket::is_bound() const noexcept { return state_->bound && !state_->closed; }

std::string PullSocket::bound_address() const { return state_->bound_address; }

std::uint64_t PullSocket::frames_received() const noexcept
{
    return state_->received.load(std::memory_order_relaxed);
}

std::uint64_t PullSocket::frames_dropped() const noexcept
{
    return state_->dropped.load(std::memory_order_relaxed);
}

std::uint64_t PullSocket::connections_accepted() const noexcept
{
    return state_->accepted.load(std::memory_order_relaxed);
}
