#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

enum class Side : std::uint8_t
{
    Buy = 0,
    Sell = 1
};

inline std::string_view to_string(Side s) noexcept
{
    return s == Side::Buy ? "buy" : "sell";
}

using Labels = std::map<std::string, std::string>; // ordered => stable exposition

// One executed trade as emitted by the producer.
struct TradeEvent
{
    Side side{Side::Buy};
    double quantity{0}; // >= 0
    double timestamp{0}; // unix seconds
};

// One benchmark metric sample (see kBenchmarkMetrics for the closed name set).
struct BenchmarkEvent
{
    std::string metric_name;
    double value{0};
    Labels labels;
};

enum class BenchmarkStatus : std::uint8_t
{
    Started = 0,
    Running,
    Completed,
    Failed,
    Alert
};

std::string_view to_string(BenchmarkStatus s) noexcept;
bool parse_status(std::string_view s, BenchmarkStatus& out) noexcept;

// Lifecycle / alert notice from the benchmark runner or the self-monitor.
struct BenchmarkStatusEvent
{
    BenchmarkStatus status{BenchmarkStatus::Running};
    std::string test_name;
    std::string message;
    double timestamp{0};
};

using Event = std::variant<TradeEvent, BenchmarkEvent, BenchmarkStatusEvent>;

enum class MetricKind : std::uint8_t
{
    Counter = 0,
    Gauge = 1
};

struct BenchmarkMetricDef
{
    std::string_view name;
    MetricKind kind;
    std::string_view help;
};

inline constexpr std::array<BenchmarkMetricDef, 11> kBenchmarkMetrics{{
    {"benchmark_tests_total",                     MetricKind::Counter, "Number of completed benchmark runs"},
    {"benchmark_trades_published_total",          MetricKind::Counter, "Trades sent by benchmark runs"},
    {"benchmark_throughput_trades_per_second",    MetricKind::Gauge,   "Throughput of the last benchmark run"},
    {"benchmark_latency_min_microseconds",        MetricKind::Gauge,   "Minimum send latency of the last run"},
    {"benchmark_latency_mean_microseconds",       MetricKind::Gauge,   "Mean send latency of the last run"},
    {"benchmark_latency_p50_microseconds",        MetricKind::Gauge,   "p50 send latency of the last run"},
    {"benchmark_latency_p95_microseconds",        MetricKind::Gauge,   "p95 send latency of the last run"},
    {"benchmark_latency_p99_microseconds",        MetricKind::Gauge,   "p99 send latency of the last run"},
    {"benchmark_latency_max_microseconds",        MetricKind::Gauge,   "Maximum send latency of the last run"},
    {"benchmark_queue_full_events_total",         MetricKind::Counter, "Sends refused at the send high-water mark"},
    {"benchmark_errors_total",                    MetricKind::Counter, "Sends failed with a transport error"},
}};

// nullptr when `name` is not a benchmark metric.
const BenchmarkMetricDef* find_benchmark_metric(std::string_view name) noexcept;
