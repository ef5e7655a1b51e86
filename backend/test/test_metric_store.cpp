#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <stdexcept>
#include <thread>

#include "metrics/metric_store.hpp"

namespace {

const Labels kBuy{{"side", "buy"}};
const Labels kSell{{"side", "sell"}};

} // namespace

TEST(MetricStore, StartsWithZeroedTradeSeries)
{
    MetricStore store;
    const MetricSnapshot snap = store.snapshot();
    EXPECT_EQ(snap.size(), 5u);
    EXPECT_EQ(store.value("trades_total", kBuy), 0.0);
    EXPECT_EQ(store.value("volume_total", kSell), 0.0);
    EXPECT_EQ(store.value("last_trade_ts_seconds"), 0.0);
}

TEST(MetricStore, RecordsTradesPerSide)
{
    MetricStore store;
    store.record_trade(Side::Buy, 1.0, 100.0);
    store.record_trade(Side::Sell, 3.0, 101.0);
    store.record_trade(Side::Buy, 0.5, 102.0);

    EXPECT_EQ(store.value("trades_total", kBuy), 2.0);
    EXPECT_EQ(store.value("trades_total", kSell), 1.0);
    EXPECT_DOUBLE_EQ(store.value("volume_total", kBuy), 1.5);
    EXPECT_DOUBLE_EQ(store.value("volume_total", kSell), 3.0);
    EXPECT_EQ(store.value("last_trade_ts_seconds"), 102.0);
}

TEST(MetricStore, LastTimestampFollowsArrivalOrder)
{
    MetricStore store;
    store.record_trade(Side::Buy, 1.0, 200.0);
    store.record_trade(Side::Buy, 1.0, 150.0);
    EXPECT_EQ(store.value("last_trade_ts_seconds"), 150.0);
}

TEST(MetricStore, RefusesBadTradesWithoutSideEffects)
{
    MetricStore store;
    EXPECT_THROW(store.record_trade(Side::Buy, -1.0, 1.0), std::invalid_argument);
    EXPECT_THROW(store.record_trade(Side::Buy, std::numeric_limits<double>::infinity(), 1.0),
                 std::invalid_argument);
    EXPECT_EQ(store.value("trades_total", kBuy), 0.0);
    EXPECT_EQ(store.value("last_trade_ts_seconds"), 0.0);
}

TEST(MetricStore, BenchmarkCountersAddAndGaugesReplace)
{
    MetricStore store;
    const Labels l{{"test_type", "burst"}, {"test_name", "burst_10"}};
    store.record_benchmark(BenchmarkEvent{"benchmark_tests_total", 1, l});
    store.record_benchmark(BenchmarkEvent{"benchmark_tests_total", 1, l});
    store.record_benchmark(BenchmarkEvent{"benchmark_latency_p95_microseconds", 10, l});
    store.record_benchmark(BenchmarkEvent{"benchmark_latency_p95_microseconds", 7, l});

    EXPECT_EQ(store.value("benchmark_tests_total", l), 2.0);
    EXPECT_EQ(store.value("benchmark_latency_p95_microseconds", l), 7.0);

    EXPECT_THROW(store.record_benchmark(BenchmarkEvent{"bogus", 1, l}), std::invalid_argument);
    EXPECT_THROW(store.record_benchmark(BenchmarkEvent{"benchmark_errors_total", -2, l}), std::invalid_argument);
}

TEST(MetricStore, RecordsAWholeResult)
{
    MetricStore store;
    BenchmarkResult r;
    r.test_type = "burst";
    r.test_name = "burst_4";
    r.total_count = 4;
    r.ok_count = 3;
    r.queue_full_count = 1;
    r.throughput = 400;
    r.latency_stats.p99_us = 9;

    const Labels l = result_labels(r);
    store.record_benchmark(r, l);
    store.record_benchmark(r, l);

    EXPECT_EQ(store.value("benchmark_tests_total", l), 2.0);
    EXPECT_EQ(store.value("benchmark_trades_published_total", l), 8.0);
    EXPECT_EQ(store.value("benchmark_queue_full_events_total", l), 2.0);
    EXPECT_EQ(store.value("benchmark_throughput_trades_per_second", l), 400.0);
    EXPECT_EQ(store.value("benchmark_latency_p99_microseconds", l), 9.0);
}

TEST(MetricStore, CountsStatusNotices)
{
    MetricStore store;
    store.record_status(BenchmarkStatusEvent{BenchmarkStatus::Started, "burst_10", "", 0});
    store.record_status(BenchmarkStatusEvent{BenchmarkStatus::Completed, "burst_10", "", 0});
    store.record_status(BenchmarkStatusEvent{BenchmarkStatus::Completed, "burst_20", "", 0});
    EXPECT_EQ(store.value("benchmark_status_events_total", {{"status", "completed"}}), 2.0);
    EXPECT_EQ(store.value("benchmark_status_events_total", {{"status", "started"}}), 1.0);
}

TEST(MetricStore, ReadersNeverSeeAHalfAppliedTrade)
{
    MetricStore store;
    std::atomic<bool> done{false};
    std::thread writer([&] {
        for (int i = 0; i < 20000; ++i) store.record_trade(Side::Buy, 2.0, i);
        done = true;
    });

    while (!done) {
        const MetricSnapshot snap = store.snapshot();
        const double trades = snap.at(MetricKey{"trades_total", kBuy}).value;
        const double volume = snap.at(MetricKey{"volume_total", kBuy}).value;
        ASSERT_DOUBLE_EQ(volume, trades * 2.0);
    }
    writer.join();
    EXPECT_EQ(store.value("trades_total", kBuy), 20000.0);
}

TEST(Exposition, RendersHelpTypeAndSamples)
{
    MetricStore store;
    store.record_trade(Side::Buy, 1.0, 1700000000.0);
    store.record_trade(Side::Sell, 3.0, 1700000001.5);

    const std::string text = render_exposition(store.snapshot());
    EXPECT_NE(text.find("# TYPE trades_total counter\n"), std::string::npos);
    EXPECT_NE(text.find("# TYPE last_trade_ts_seconds gauge\n"), std::string::npos);
    EXPECT_NE(text.find("# HELP volume_total "), std::string::npos);
    EXPECT_NE(text.find("trades_total{side=\"buy\"} 1\n"), std::string::npos);
    EXPECT_NE(text.find("trades_total{side=\"sell\"} 1\n"), std::string::npos);
    EXPECT_NE(text.find("volume_total{side=\"sell\"} 3\n"), std::string::npos);
    EXPECT_NE(text.find("last_trade_ts_seconds 1700000001.5\n"), std::string::npos);

    // one HELP/TYPE block per family
    const auto first = text.find("# TYPE trades_total");
    EXPECT_EQ(text.find("# TYPE trades_total", first + 1), std::string::npos);
}

TEST(Exposition, EscapesLabelValues)
{
    MetricStore store;
    store.record_benchmark(BenchmarkEvent{"benchmark_errors_total", 1, {{"test_name", "a\"b\\c\nd"}}});
    const std::string text = render_exposition(store.snapshot());
    EXPECT_NE(text.find(R"(benchmark_errors_total{test_name="a\"b\\c\nd"} 1)"), std::string::npos);
}

TEST(Exposition, LabelNamesCannotForgeSeries)
{
    MetricStore store;
    const std::string forged = "x\"} 1\ntrades_total{side=\"buy\"} 999999\n#";
    EXPECT_THROW(store.record_benchmark(BenchmarkEvent{"benchmark_errors_total", 1, {{forged, "v"}}}),
                 std::invalid_argument);
    EXPECT_THROW(store.record_benchmark(BenchmarkEvent{"benchmark_errors_total", 1, {{"bad key", "v"}}}),
                 std::invalid_argument);
    EXPECT_THROW(store.record_benchmark(BenchmarkEvent{"benchmark_errors_total", 1, {{"__name__", "v"}}}),
                 std::invalid_argument);

    BenchmarkResult result;
    result.test_name = "burst_10";
    EXPECT_THROW(store.record_benchmark(result, Labels{{"run id", "r1"}}), std::invalid_argument);

    const std::string text = render_exposition(store.snapshot());
    EXPECT_EQ(text.find("999999"), std::string::npos);
    EXPECT_EQ(text.find("bad key"), std::string::npos);
    EXPECT_EQ(text.find("benchmark_errors_total{"), std::string::npos);
    EXPECT_EQ(store.value("trades_total", kBuy), 0.0);
}
