#pragma once
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "codec/events.hpp"
#include "bench/benchmark_result.hpp"

// Metric identity: name plus label set.
struct MetricKey
{
    std::string name;
    Labels labels;

    bool operator<(const MetricKey& o) const
    {
        if (name != o.name) return name < o.name;
        return labels < o.labels;
    }
    bool operator==(const MetricKey& o) const
    {
        return name == o.name && labels == o.labels;
    }
};

struct MetricSample
{
    MetricKind kind{MetricKind::Gauge};
    double value{0};
};

using MetricSnapshot = std::map<MetricKey, MetricSample>;

// In-memory counters and gauges fed by the ingestion service.
// - One writer (the ingestion loop), any number of readers.
// - Each record_* call is applied under one exclusive lock, so readers see
//   either none or all of its updates.
// - Counters only grow; nothing is ever reset short of a process restart.
class MetricStore {
public:
    // trades_total / volume_total for both sides and last_trade_ts_seconds
    // are registered at zero.
    MetricStore();

    MetricStore(const MetricStore&) = delete;
    MetricStore& operator=(const MetricStore&) = delete;

    // Throws std::invalid_argument for a negative or non-finite quantity.
    void record_trade(Side side, double qty, double ts);
    void record_trade(const TradeEvent& t) { record_trade(t.side, t.quantity, t.timestamp); }

    // One benchmark metric as it arrives over the wire: counters add `value`,
    // gauges take it. Throws std::invalid_argument for an unknown metric or a
    // negative counter increment.
    void record_benchmark(const BenchmarkEvent& ev);

    // The whole gauge/counter set of one run, applied atomically.
    void record_benchmark(const BenchmarkResult& result, const Labels& labels);

    void record_status(const BenchmarkStatusEvent& ev);

    // Copy-on-read
    MetricSnapshot snapshot() const;

    // Current value, 0 when the series does not exist yet.
    double value(std::string_view name, const Labels& labels = {}) const;

private:
    void apply_benchmark_unlocked(const BenchmarkEvent& ev);
    void add_unlocked(MetricKey key, double delta);
    void set_unlocked(MetricKey key, double v);

    mutable std::shared_mutex m_;
    MetricSnapshot metrics_;
};

// Prometheus text exposition (format 0.0.4) of a snapshot.
std::string render_exposition(const MetricSnapshot& snap);
