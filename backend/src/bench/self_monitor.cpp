#include "bench/self_monitor.hpp"
#include "supervisor/shutdown_signal.hpp"
#include "util/log.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <iomanip>
#include <sstream>

namespace net = boost::asio;

namespace {

std::string over(const char* what, double value, double limit)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << what << " latency high: " << value << "us (limit " << limit << "us)";
    return os.str();
}

} // namespace

SelfMonitor::SelfMonitor(net::io_context& ioc, SelfMonitorOptions opts)
    : opts_(std::move(opts)),
      timer_(ioc),
      socket_(PushOptions{opts_.send_hwm}),
      publisher_(socket_, /*benchmarking=*/true) {}

SelfMonitor::~SelfMonitor() { socket_.close(); }

std::vector<std::string> SelfMonitor::check_thresholds(const LatencyStats& s) const
{
    std::vector<std::string> out;
    if (s.count == 0) return out;
    if (s.p95_us > opts_.p95_alert_us) out.push_back(over("P95", s.p95_us, opts_.p95_alert_us));
    if (s.p99_us > opts_.p99_alert_us) out.push_back(over("P99", s.p99_us, opts_.p99_alert_us));
    if (s.mean_us > opts_.mean_alert_us) out.push_back(over("Mean", s.mean_us, opts_.mean_alert_us));
    return out;
}

void SelfMonitor::stop()
{
    stopping_ = true;
    timer_.cancel();
}

void SelfMonitor::publish_status(BenchmarkStatus status, const std::string& message)
{
    const auto r = publisher_.publish(BenchmarkStatusEvent{status, kTestName, message, wall_clock_seconds()});
    if (!r.ok()) {
        log_debug("self-monitor") << to_string(status) << " not sent: " << to_string(r.status);
    }
}

net::awaitable<void> SelfMonitor::run(const ShutdownSignal& shutdown)
{
    socket_.connect(opts_.connect_address);
    log_info("self-monitor") << "publishing to " << opts_.connect_address << " every "
                             << opts_.interval.count() << "ms";

    // give the dialer a chance so "started" is not refused outright
    timer_.expires_after(std::chrono::milliseconds(100));
    boost::system::error_code ec;
    co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
    publish_status(BenchmarkStatus::Started, "Benchmark self-monitoring started");

    while (!stopping_ && !shutdown.is_set()) {
        timer_.expires_after(opts_.interval);
        co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (stopping_ || shutdown.is_set()) break;

        ++heartbeats_;
        const LatencyStats s = publisher_.latency_stats();
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(1) << "Health: P95=" << s.p95_us << "us, samples=" << s.count;
        publish_status(BenchmarkStatus::Running, msg.str());

        for (const auto& alert : check_thresholds(s)) {
            ++alerts_;
            log_warn("self-monitor") << "benchmark system alert: " << alert;
            publish_status(BenchmarkStatus::Alert, "Benchmark system alert: " + alert);
        }
    }

    publish_status(BenchmarkStatus::Completed, "Benchmark self-monitoring stopped");

    // let the I/O thread flush "completed" without holding up the scheduler
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
    while (!socket_.drained() && std::chrono::steady_clock::now() < deadline) {
        timer_.expires_after(std::chrono::milliseconds(1));
        co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    if (!socket_.drained()) {
        log_debug("self-monitor") << "final status still buffered at close";
    }
    socket_.close();
    log_info("self-monitor") << "stopped after " << heartbeats_ << " heartbeats, " << alerts_ << " alerts";
}
