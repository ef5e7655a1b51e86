#pragma once
#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without including it
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "bench/benchmark_result.hpp"
#include "bench/trade_publisher.hpp"
#include "codec/events.hpp"

struct HarnessOptions
{
    // Pause between tests of the comprehensive suite.
    std::chrono::milliseconds suite_pause{1000};
    // Pause between profile steps.
    std::chrono::milliseconds profile_pause{500};
    std::chrono::milliseconds step_duration{5000};
    double qty{1.0};
    // Print a report after each run.
    std::ostream* report{nullptr};
};

struct DegradationReport
{
    std::vector<BenchmarkResult> steps;
    // first rate whose p95 exceeds twice the first step's p95
    std::optional<double> latency_knee_rate;
    // first rate where more than 1 % of sends hit the high-water mark
    std::optional<double> saturation_rate;
};

// Scans profile steps in rate order.
DegradationReport analyze_degradation(std::vector<BenchmarkResult> steps);

// Drives load through the producer socket and measures each non-blocking
// send. Results and status notices go to `results` (the load socket when
// null), so the aggregator ends up observing its own benchmark.
class BenchmarkHarness {
public:
    explicit BenchmarkHarness(PushSocket& load, PushSocket* results = nullptr, HarnessOptions opts = {});

    // N back-to-back sends, alternating buy/sell.
    BenchmarkResult run_burst(std::size_t n);

    // Paces sends at `rate` per second for `duration`; suspends between sends.
    // Throws std::invalid_argument if rate <= 0.
    boost::asio::awaitable<BenchmarkResult> run_sustained(std::chrono::duration<double> duration, double rate);

    // Bursts of 100, 1000 and 5000, then 10 s sustained at 50, 200 and 500 tps.
    // Every result is published.
    boost::asio::awaitable<std::vector<BenchmarkResult>> run_comprehensive();

    // Sustained steps at step, 2*step, ... max_rate; each result is published.
    boost::asio::awaitable<DegradationReport> run_profile(double max_rate, double step);

    // Returns how many of the eleven events were accepted by the socket.
    std::size_t publish_result(const BenchmarkResult& r);
    SendStatus publish_status(BenchmarkStatus status, const std::string& test_name, const std::string& message);

private:
    void report(const BenchmarkResult& r) const;

    TradePublisher load_;
    TradePublisher results_;
    HarnessOptions opts_;
    std::uint64_t seq_ = 0;
};

std::string sustained_test_name(double rate);
void print_report(std::ostream& os, const BenchmarkResult& r);
void print_degradation(std::ostream& os, const DegradationReport& d);
