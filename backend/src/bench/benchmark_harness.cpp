#include "bench/benchmark_harness.hpp"
#include "codec/message_codec.hpp"
#include "util/log.hpp"
#include "util/text_format.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <iomanip>
#include <iterator>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace net = boost::asio;
using Clock = std::chrono::steady_clock;

namespace {

struct RunCounters
{
    std::vector<double> samples_us;
    std::uint64_t ok = 0;
    std::uint64_t queue_full = 0;
    std::uint64_t errors = 0;

    void add(const PublishResult& r)
    {
        samples_us.push_back(r.elapsed_us());
        switch (r.status) {
            case SendStatus::Ok:        ++ok; break;
            case SendStatus::QueueFull: ++queue_full; break;
            case SendStatus::Error:     ++errors; break;
        }
    }

    BenchmarkResult finish(std::string type, std::string name, Clock::duration wall)
    {
        BenchmarkResult r;
        r.test_type = std::move(type);
        r.test_name = std::move(name);
        r.total_count = samples_us.size();
        r.ok_count = ok;
        r.queue_full_count = queue_full;
        r.error_count = errors;
        r.duration_seconds = std::chrono::duration<double>(wall).count();
        r.throughput = r.duration_seconds > 0 ? static_cast<double>(r.total_count) / r.duration_seconds : 0.0;
        r.latency_stats = compute_latency_stats(samples_us);
        return r;
    }
};

Side side_for(std::uint64_t seq) { return seq % 2 == 0 ? Side::Buy : Side::Sell; }

net::awaitable<void> sleep_for(Clock::duration d)
{
    if (d <= Clock::duration::zero()) co_return;
    net::steady_timer t(co_await net::this_coro::executor);
    t.expires_after(d);
    co_await t.async_wait(net::use_awaitable);
}

} // namespace

std::string sustained_test_name(double rate)
{
    std::ostringstream os;
    os << "sustained_";
    write_number(os, rate);
    os << "tps";
    return os.str();
}

BenchmarkHarness::BenchmarkHarness(PushSocket& load, PushSocket* results, HarnessOptions opts)
    : load_(load), results_(results ? *results : load), opts_(opts) {}

BenchmarkResult BenchmarkHarness::run_burst(std::size_t n)
{
    RunCounters c;
    c.samples_us.reserve(n);
    log_info("bench") << "burst of " << n << " trades to " << load_.socket().address();

    const auto start = Clock::now();
    for (std::size_t i = 0; i < n; ++i) {
        std::string frame = MessageCodec::encode(TradeEvent{side_for(seq_++), opts_.qty, wall_clock_seconds()});
        c.add(load_.send_frame(std::move(frame)));
    }
    auto r = c.finish("burst", "burst_" + std::to_string(n), Clock::now() - start);
    report(r);
    return r;
}

net::awaitable<BenchmarkResult> BenchmarkHarness::run_sustained(std::chrono::duration<double> duration, double rate)
{
    if (!(rate > 0)) throw std::invalid_argument("sustained rate must be positive");
    const auto period = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / rate));
    const auto span = std::chrono::duration_cast<Clock::duration>(duration);
    log_info("bench") << "sustained " << duration.count() << "s at " << rate << " tps to "
                      << load_.socket().address();

    RunCounters c;
    const auto start = Clock::now();
    while (Clock::now() - start < span) {
        std::string frame = MessageCodec::encode(TradeEvent{side_for(seq_++), opts_.qty, wall_clock_seconds()});
        const PublishResult pr = load_.send_frame(std::move(frame));
        c.add(pr);
        co_await sleep_for(period - pr.elapsed);
    }
    auto r = c.finish("sustained", sustained_test_name(rate), Clock::now() - start);
    r.target_rate = rate;
    report(r);
    co_return r;
}

net::awaitable<std::vector<BenchmarkResult>> BenchmarkHarness::run_comprehensive()
{
    std::vector<BenchmarkResult> out;
    const std::size_t bursts[] = {100, 1000, 5000};
    const double rates[] = {50, 200, 500};
    const std::size_t total = std::size(bursts) + std::size(rates);

    for (std::size_t n : bursts) {
        publish_status(BenchmarkStatus::Running, "comprehensive", "Running burst_" + std::to_string(n));
        out.push_back(run_burst(n));
        publish_result(out.back());
        co_await sleep_for(opts_.suite_pause);
    }
    for (double rate : rates) {
        publish_status(BenchmarkStatus::Running, "comprehensive", "Running " + sustained_test_name(rate));
        out.push_back(co_await run_sustained(std::chrono::seconds(10), rate));
        publish_result(out.back());
        if (out.size() < total) co_await sleep_for(opts_.suite_pause);
    }
    co_return out;
}

net::awaitable<DegradationReport> BenchmarkHarness::run_profile(double max_rate, double step)
{
    if (!(step > 0) || max_rate < step) {
        throw std::invalid_argument("profile needs 0 < step <= max_rate");
    }
    std::vector<BenchmarkResult> steps;
    for (double rate = step; rate <= max_rate + 1e-9; rate += step) {
        std::ostringstream msg;
        msg << "Testing " << rate << " trades/sec";
        publish_status(BenchmarkStatus::Running, "profile", msg.str());

        steps.push_back(co_await run_sustained(opts_.step_duration, rate));
        publish_result(steps.back());
        co_await sleep_for(opts_.profile_pause);
    }
    DegradationReport d = analyze_degradation(std::move(steps));
    if (opts_.report) print_degradation(*opts_.report, d);
    co_return d;
}

std::size_t BenchmarkHarness::publish_result(const BenchmarkResult& r)
{
    std::size_t accepted = 0;
    for (const auto& ev : to_benchmark_events(r, result_labels(r))) {
        if (results_.publish(ev).ok()) ++accepted;
    }
    if (accepted < kBenchmarkMetrics.size()) {
        log_warn("bench") << r.test_name << ": only " << accepted << "/" << kBenchmarkMetrics.size()
                          << " result events accepted by " << results_.socket().address();
    }
    return accepted;
}

SendStatus BenchmarkHarness::publish_status(BenchmarkStatus status, const std::string& test_name,
                                            const std::string& message)
{
    const auto pr = results_.publish(BenchmarkStatusEvent{status, test_name, message, wall_clock_seconds()});
    if (!pr.ok()) {
        log_debug("bench") << "status '" << to_string(status) << "' for " << test_name
                           << " not sent: " << to_string(pr.status);
    }
    return pr.status;
}

void BenchmarkHarness::report(const BenchmarkResult& r) const
{
    if (opts_.report) print_report(*opts_.report, r);
}

DegradationReport analyze_degradation(std::vector<BenchmarkResult> steps)
{
    DegradationReport d;
    d.steps = std::move(steps);
    if (d.steps.empty()) return d;

    const double base_p95 = d.steps.front().latency_stats.p95_us;
    for (const auto& s : d.steps) {
        const double target = s.target_rate;
        if (!d.latency_knee_rate && base_p95 > 0 && s.latency_stats.p95_us > 2.0 * base_p95) {
            d.latency_knee_rate = target;
        }
        if (!d.saturation_rate && s.total_count > 0 &&
            static_cast<double>(s.queue_full_count) / static_cast<double>(s.total_count) > 0.01) {
            d.saturation_rate = target;
        }
    }
    return d;
}

void print_report(std::ostream& os, const BenchmarkResult& r)
{
    const LatencyStats& l = r.latency_stats;
    os << "=== " << r.test_name << " (" << r.test_type << ") ===\n"
       << std::fixed << std::setprecision(1)
       << "  trades      : " << r.total_count << " in " << std::setprecision(3) << r.duration_seconds << " s\n"
       << std::setprecision(1)
       << "  throughput  : " << r.throughput << " trades/s\n"
       << "  ok          : " << r.ok_count << "\n"
       << "  queue full  : " << r.queue_full_count << "\n"
       << "  errors      : " << r.error_count << "\n"
       << "  latency (us): min " << l.min_us << "  mean " << l.mean_us << "  p50 " << l.p50_us
       << "  p95 " << l.p95_us << "  p99 " << l.p99_us << "  max " << l.max_us << "\n";
    os.unsetf(std::ios_base::floatfield);
    os << std::setprecision(6);
}

void print_degradation(std::ostream& os, const DegradationReport& d)
{
    os << "=== latency profile ===\n";
    for (const auto& s : d.steps) {
        os << "  " << s.test_name << ": p95 " << s.latency_stats.p95_us << " us, queue full "
           << s.queue_full_count << "/" << s.total_count << "\n";
    }
    if (d.latency_knee_rate) os << "  p95 more than doubled at " << *d.latency_knee_rate << " tps\n";
    else os << "  no latency degradation observed\n";
    if (d.saturation_rate) os << "  send buffer saturated (>1% queue full) at " << *d.saturation_rate << " tps\n";
    else os << "  no send buffer saturation observed\n";
}
