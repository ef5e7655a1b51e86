#include "metrics/metric_store.hpp"
#include "util/text_format.hpp"

#include <cmath>
#include <mutex>
#include <stdexcept>

namespace
{
    const char* const kTrades = "trades_total";
    const char* const kVolume = "volume_total";
    const char* const kLastTs = "last_trade_ts_seconds";
    const char* const kStatus = "benchmark_status_events_total";

    Labels side_labels(Side s)
    {
        return Labels{{"side", std::string(to_string(s))}};
    }

    const BenchmarkMetricDef& validate(const BenchmarkEvent& ev)
    {
        const BenchmarkMetricDef* def = find_benchmark_metric(ev.metric_name);
        if (!def) {
            throw std::invalid_argument("record_benchmark: unknown metric '" + ev.metric_name + "'");
        }
        if (!std::isfinite(ev.value)) {
            throw std::invalid_argument("record_benchmark: value must be finite");
        }
        if (def->kind == MetricKind::Counter && ev.value < 0.0) {
            throw std::invalid_argument("record_benchmark: counter increment must be >= 0");
        }
        for (const auto& [k, v] : ev.labels) {
            if (!valid_label_name(k)) {
                throw std::invalid_argument("record_benchmark: invalid label name '" + k + "'");
            }
        }
        return *def;
    }
}

MetricStore::MetricStore()
{
    for (Side s : {Side::Buy, Side::Sell}) {
        metrics_[MetricKey{kTrades, side_labels(s)}] = MetricSample{MetricKind::Counter, 0.0};
        metrics_[MetricKey{kVolume, side_labels(s)}] = MetricSample{MetricKind::Counter, 0.0};
    }
    metrics_[MetricKey{kLastTs, {}}] = MetricSample{MetricKind::Gauge, 0.0};
}

void MetricStore::record_trade(Side side, double qty, double ts)
{
    if (!std::isfinite(qty) || qty < 0.0) {
        throw std::invalid_argument("record_trade: quantity must be a finite value >= 0");
    }
    if (!std::isfinite(ts)) {
        throw std::invalid_argument("record_trade: timestamp must be finite");
    }
    std::unique_lock lk(m_);
    add_unlocked(MetricKey{kTrades, side_labels(side)}, 1.0);
    add_unlocked(MetricKey{kVolume, side_labels(side)}, qty);
    set_unlocked(MetricKey{kLastTs, {}}, ts);
}

void MetricStore::record_benchmark(const BenchmarkEvent& ev)
{
    validate(ev);
    std::unique_lock lk(m_);
    apply_benchmark_unlocked(ev);
}

void MetricStore::record_benchmark(const BenchmarkResult& result, const Labels& labels)
{
    const auto events = to_benchmark_events(result, labels);
    for (const auto& ev : events) validate(ev);
    std::unique_lock lk(m_);
    for (const auto& ev : events) {
        apply_benchmark_unlocked(ev);
    }
}

void MetricStore::record_status(const BenchmarkStatusEvent& ev)
{
    std::unique_lock lk(m_);
    add_unlocked(MetricKey{kStatus, Labels{{"status", std::string(to_string(ev.status))}}}, 1.0);
}

MetricSnapshot MetricStore::snapshot() const
{
    std::shared_lock lk(m_);
    return metrics_;
}

double MetricStore::value(std::string_view name, const Labels& labels) const
{
    std::shared_lock lk(m_);
    auto it = metrics_.find(MetricKey{std::string(name), labels});
    return it == metrics_.end() ? 0.0 : it->second.value;
}

// Caller has validated `ev`.
void MetricStore::apply_benchmark_unlocked(const BenchmarkEvent& ev)
{
    if (find_benchmark_metric(ev.metric_name)->kind == MetricKind::Counter) {
        add_unlocked(MetricKey{ev.metric_name, ev.labels}, ev.value);
    } else {
        set_unlocked(MetricKey{ev.metric_name, ev.labels}, ev.value);
    }
}

void MetricStore::add_unlocked(MetricKey key, double delta)
{
    auto& sample = metrics_[std::move(key)];
    sample.kind = MetricKind::Counter;
    sample.value += delta;
}

void MetricStore::set_unlocked(MetricKey key, double v)
{
    auto& sample = metrics_[std::move(key)];
    sample.kind = MetricKind::Gauge;
    sample.value = v;
}
