#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "bench/benchmark_harness.hpp"
#include "bench/cli_args.hpp"
#include "config/config.hpp"
#include "transport/push_socket.hpp"
#include "util/log.hpp"

namespace net = boost::asio;

namespace {

void usage()
{
    std::cerr << "Usage: telemetry_bench <command> [args...]\n"
              << "Commands:\n"
              << "  burst [num_trades]           (default 1000)\n"
              << "  sustained [seconds] [rate]   (default 30 100)\n"
              << "  comprehensive\n"
              << "  profile [max_rate] [step]    (default 1000 100)\n"
              << "  trade <buy|sell> <qty>\n";
}

double arg_number(int argc, char** argv, int i, double fallback)
{
    return argc <= i ? fallback : parse_number_arg(argv[i]);
}

// Upper bound for a burst; every send keeps a latency sample.
constexpr std::size_t kMaxBurst = 100'000'000;

std::size_t arg_count(int argc, char** argv, int i, std::size_t fallback)
{
    return argc <= i ? fallback : parse_count_arg(argv[i], kMaxBurst);
}

// Runs `body` on a fresh io_context; status notices bracket it.
int run_command(BenchmarkHarness& harness, const std::string& test_name, const std::string& start_msg,
                std::function<net::awaitable<std::string>()> body)
{
    harness.publish_status(BenchmarkStatus::Started, test_name, start_msg);

    net::io_context ioc{1};
    std::exception_ptr failure;
    std::string summary;
    net::co_spawn(ioc, body(), [&](std::exception_ptr ep, std::string s) {
        failure = ep;
        summary = std::move(s);
    });
    ioc.run();

    if (failure) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // reported as failed below
        }
        harness.publish_status(BenchmarkStatus::Failed, test_name, what);
        log_error("bench") << test_name << " failed: " << what;
        return 1;
    }
    harness.publish_status(BenchmarkStatus::Completed, test_name, summary);
    log_info("bench") << test_name << " completed: " << summary;
    return 0;
}

std::string completed_summary(const BenchmarkResult& r)
{
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os.precision(1);
    os << "Completed: " << r.throughput << " tps, P95: " << r.latency_stats.p95_us << "us";
    return os.str();
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }
    load_env_file();

    BridgeConfig cfg;
    try {
        cfg = load_config_from_env();
    } catch (const std::exception& e) {
        std::cerr << "[setup] invalid configuration: " << e.what() << std::endl;
        return 2;
    }
    set_log_level(cfg.log_level);

    const std::string command = argv[1];

    PushSocket load{PushOptions{cfg.send_hwm}};
    std::unique_ptr<PushSocket> results;
    try {
        load.connect(cfg.producer_connect_addr);
        if (cfg.results_connect_addr != cfg.producer_connect_addr) {
            results = std::make_unique<PushSocket>(PushOptions{cfg.send_hwm});
            results->connect(cfg.results_connect_addr);
        }
    } catch (const std::exception& e) {
        log_error("setup") << "cannot create producer socket: " << e.what();
        return 1;
    }
    if (!load.wait_connected(std::chrono::seconds(1))) {
        log_warn("setup") << "no receiver at " << cfg.producer_connect_addr
                          << " yet; sends will report queue_full until it appears";
    }
    if (results && !results->wait_connected(std::chrono::seconds(1))) {
        log_warn("setup") << "no receiver at " << cfg.results_connect_addr << " for results yet";
    }

    std::cout << "Trading messages to: " << cfg.producer_connect_addr << "\n"
              << "Benchmark metrics to: " << cfg.results_connect_addr << std::endl;

    HarnessOptions hopts;
    hopts.report = &std::cout;
    BenchmarkHarness harness{load, results.get(), hopts};

    int rc = 0;
    try {
        if (command == "burst") {
            const std::size_t n = arg_count(argc, argv, 2, 1000);
            rc = run_command(harness, "burst_" + std::to_string(n),
                             "Starting burst test with " + std::to_string(n) + " trades",
                             [&]() -> net::awaitable<std::string> {
                                 const auto r = harness.run_burst(n);
                                 harness.publish_result(r);
                                 co_return completed_summary(r);
                             });
        } else if (command == "sustained") {
            const double secs = arg_number(argc, argv, 2, 30);
            const double rate = arg_number(argc, argv, 3, 100);
            std::ostringstream start;
            start << "Starting sustained test: " << secs << "s at " << rate << " tps";
            rc = run_command(harness, sustained_test_name(rate), start.str(),
                             [&]() -> net::awaitable<std::string> {
                                 const auto r = co_await harness.run_sustained(std::chrono::duration<double>(secs), rate);
                                 harness.publish_result(r);
                                 co_return completed_summary(r);
                             });
        } else if (command == "comprehensive") {
            rc = run_command(harness, "comprehensive", "Starting comprehensive benchmark suite",
                             [&]() -> net::awaitable<std::string> {
                                 co_await harness.run_comprehensive();
                                 co_return std::string("All tests completed successfully");
                             });
        } else if (command == "profile") {
            const double max_rate = arg_number(argc, argv, 2, 1000);
            const double step = arg_number(argc, argv, 3, 100);
            std::ostringstream start;
            start << "Starting latency profile: max_rate=" << max_rate << ", step=" << step;
            rc = run_command(harness, "profile", start.str(),
                             [&]() -> net::awaitable<std::string> {
                                 co_await harness.run_profile(max_rate, step);
                                 std::ostringstream os;
                                 os << "Profile completed up to " << max_rate << " trades/sec";
                                 co_return os.str();
                             });
        } else if (command == "trade") {
            if (argc < 4) {
                usage();
                return 1;
            }
            const std::string side_s = argv[2];
            if (side_s != "buy" && side_s != "sell") throw std::invalid_argument("side must be buy or sell");
            const Side side = side_s == "buy" ? Side::Buy : Side::Sell;
            const double qty = arg_number(argc, argv, 3, 0);
            TradePublisher pub{load};
            const auto r = pub.publish_trade(side, qty);
            std::cout << "trade " << side_s << " " << qty << ": " << to_string(r.status)
                      << " (" << r.elapsed_us() << "us)" << std::endl;
            rc = r.ok() ? 0 : 1;
        } else {
            std::cerr << "Unknown command: " << command << std::endl;
            usage();
            return 1;
        }
    } catch (const std::exception& e) {
        log_error("bench") << e.what();
        rc = 1;
    }

    // at-most-once: give the I/O threads a moment to write what was accepted
    if (!load.drain(std::chrono::seconds(2))) log_warn("bench") << "load socket did not drain";
    if (results && !results->drain(std::chrono::seconds(2))) log_warn("bench") << "results socket did not drain";
    return rc;
}
