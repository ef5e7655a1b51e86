#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "codec/events.hpp"

// Send-latency summary in microseconds. Percentiles use the nearest-rank
// method, so min <= p50 <= p95 <= p99 <= max always holds.
struct LatencyStats
{
    std::size_t count{0};
    double min_us{0};
    double mean_us{0};
    double p50_us{0};
    double p95_us{0};
    double p99_us{0};
    double max_us{0};
};

// ceil(p * n) - 1 clamped to [0, n - 1]; n must be > 0.
std::size_t nearest_rank_index(double p, std::size_t n) noexcept;

// Sorts `samples_us` in place. Empty input yields all-zero stats.
LatencyStats compute_latency_stats(std::vector<double>& samples_us);

struct BenchmarkResult
{
    std::string test_type; // "burst" | "sustained"
    std::string test_name; // "burst_1000", "sustained_200tps"
    std::uint64_t total_count{0};
    std::uint64_t ok_count{0};
    std::uint64_t queue_full_count{0};
    std::uint64_t error_count{0};
    double duration_seconds{0};
    double throughput{0}; // total_count / duration_seconds
    double target_rate{0}; // sustained runs only
    LatencyStats latency_stats;
};

// The eleven benchmark metric events describing one run.
std::vector<BenchmarkEvent> to_benchmark_events(const BenchmarkResult& r, const Labels& labels);

// {test_type, test_name} label set used when publishing a result.
Labels result_labels(const BenchmarkResult& r);
