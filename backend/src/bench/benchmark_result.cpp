#include "bench/benchmark_result.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

std::size_t nearest_rank_index(double p, std::size_t n) noexcept
{
    if (n == 0) return 0;
    const double rank = std::ceil(p * static_cast<double>(n));
    if (rank <= 1.0) return 0;
    const auto idx = static_cast<std::size_t>(rank) - 1;
    return std::min(idx, n - 1);
}

LatencyStats compute_latency_stats(std::vector<double>& samples_us)
{
    LatencyStats s;
    if (samples_us.empty()) return s;

    std::sort(samples_us.begin(), samples_us.end());
    const std::size_t n = samples_us.size();

    s.count   = n;
    s.min_us  = samples_us.front();
    s.max_us  = samples_us.back();
    s.mean_us = std::accumulate(samples_us.begin(), samples_us.end(), 0.0) / static_cast<double>(n);
    s.p50_us  = samples_us[nearest_rank_index(0.50, n)];
    s.p95_us  = samples_us[nearest_rank_index(0.95, n)];
    s.p99_us  = samples_us[nearest_rank_index(0.99, n)];
    return s;
}

std::vector<BenchmarkEvent> to_benchmark_events(const BenchmarkResult& r, const Labels& labels)
{
    const LatencyStats& l = r.latency_stats;
    std::vector<BenchmarkEvent> out;
    out.reserve(kBenchmarkMetrics.size());
    auto add = [&](const char* name, double v) {
        out.push_back(BenchmarkEvent{name, v, labels});
    };
    add("benchmark_tests_total", 1.0);
    add("benchmark_trades_published_total", static_cast<double>(r.total_count));
    add("benchmark_throughput_trades_per_second", r.throughput);
    add("benchmark_latency_min_microseconds", l.min_us);
    add("benchmark_latency_mean_microseconds", l.mean_us);
    add("benchmark_latency_p50_microseconds", l.p50_us);
    add("benchmark_latency_p95_microseconds", l.p95_us);
    add("benchmark_latency_p99_microseconds", l.p99_us);
    add("benchmark_latency_max_microseconds", l.max_us);
    add("benchmark_queue_full_events_total", static_cast<double>(r.queue_full_count));
    add("benchmark_errors_total", static_cast<double>(r.error_count));
    return out;
}

Labels result_labels(const BenchmarkResult& r)
{
    return Labels{{"test_type", r.test_type}, {"test_name", r.test_name}};
}
