#include "ingest/ingestion_service.hpp"
#include "supervisor/shutdown_signal.hpp"
#include "util/log.hpp"

#include <stdexcept>
#include <type_traits>
#include <variant>

namespace net = boost::asio;

namespace {

// Closes the socket however the receive loop ends.
struct StopOnExit
{
    IngestionService& svc;
    ~StopOnExit() { svc.stop(); }
};

} // namespace

std::string_view to_string(IngestionState s) noexcept
{
    switch (s) {
        case IngestionState::Stopped:  return "stopped";
        case IngestionState::Starting: return "starting";
        case IngestionState::Running:  return "running";
        case IngestionState::Stopping: return "stopping";
    }
    return "unknown";
}

IngestionService::IngestionService(net::io_context& ioc, IngestionOptions opts)
    : ioc_(ioc), opts_(std::move(opts)), bound_address_(opts_.bind_address) {}

IngestionService::~IngestionService() { stop(); }

void IngestionService::start()
{
    auto expected = IngestionState::Stopped;
    if (!state_.compare_exchange_strong(expected, IngestionState::Starting)) {
        log_debug("ingest") << "start ignored in state " << to_string(expected);
        return;
    }

    if (pull_) dropped_before_restart_ += pull_->frames_dropped();
    auto sock = std::make_unique<PullSocket>(ioc_, opts_.pull);
    try {
        sock->bind(opts_.bind_address);
    } catch (const std::exception& e) {
        state_.store(IngestionState::Stopped, std::memory_order_release);
        log_error("ingest") << "failed to start: " << e.what();
        throw;
    }
    bound_address_ = sock->bound_address();
    pull_ = std::move(sock);
    state_.store(IngestionState::Running, std::memory_order_release);
    log_info("ingest") << "listening on " << bound_address_
                       << " (recv_hwm=" << opts_.pull.recv_hwm << ")";
}

void IngestionService::stop() noexcept
{
    auto expected = IngestionState::Running;
    if (!state_.compare_exchange_strong(expected, IngestionState::Stopping)) return;
    if (pull_) pull_->close();
    state_.store(IngestionState::Stopped, std::memory_order_release);
    log_info("ingest") << "stopped after " << frames_received_.load() << " frames ("
                       << decode_errors_.load() << " rejected)";
}

net::awaitable<void> IngestionService::run(const ShutdownSignal& shutdown)
{
    if (!running()) throw std::logic_error("ingestion loop started before start()");
    StopOnExit guard{*this};

    while (running() && !shutdown.is_set()) {
        auto frame = co_await pull_->receive(opts_.receive_timeout);
        if (!frame) continue; // timeout: re-check for shutdown
        apply_frame(*frame);
    }
    log_debug("ingest") << "receive loop exiting";
}

bool IngestionService::apply_frame(std::string_view frame)
{
    frames_received_.fetch_add(1, std::memory_order_relaxed);

    DecodeResult res = codec_.decode(frame);
    if (!res) {
        decode_errors_.fetch_add(1, std::memory_order_relaxed);
        log_warn("ingest") << "dropping frame: " << res.error.field << ": " << res.error.reason;
        return false;
    }

    try {
        std::visit([this](const auto& ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, TradeEvent>) {
                store_.record_trade(ev);
                log_debug("ingest") << "trade " << to_string(ev.side) << " qty=" << ev.quantity;
            } else if constexpr (std::is_same_v<T, BenchmarkEvent>) {
                store_.record_benchmark(ev);
                log_debug("ingest") << "benchmark " << ev.metric_name << "=" << ev.value;
            } else {
                store_.record_status(ev);
                const bool bad = ev.status == BenchmarkStatus::Failed || ev.status == BenchmarkStatus::Alert;
                LogLine line(bad ? LogLevel::Warn : LogLevel::Info, "bench-status");
                line << ev.test_name << " " << to_string(ev.status);
                if (!ev.message.empty()) line << ": " << ev.message;
            }
        }, *res.event);
    } catch (const std::invalid_argument& e) {
        decode_errors_.fetch_add(1, std::memory_order_relaxed);
        log_warn("ingest") << "dropping event: " << e.what();
        return false;
    }

    events_applied_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

IngestionHealth IngestionService::health() const
{
    IngestionHealth h;
    h.state = state();
    h.running = h.state == IngestionState::Running;
    h.bind_address = bound_address_;
    h.frames_received = frames_received_.load(std::memory_order_relaxed);
    h.events_applied = events_applied_.load(std::memory_order_relaxed);
    h.decode_errors = decode_errors_.load(std::memory_order_relaxed);
    h.frames_dropped = dropped_before_restart_ + (pull_ ? pull_->frames_dropped() : 0);
    return h;
}
