#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <exception>
#include <iostream>
#include <memory>

#include "config/config.hpp"
#include "ingest/ingestion_service.hpp"
#include "bench/self_monitor.hpp"
#include "server/http_server.hpp"
#include "server/http_routes.hpp"
#include "supervisor/task_supervisor.hpp"
#include "util/log.hpp"

using tcp = boost::asio::ip::tcp;

int main() {
    load_env_file();

    BridgeConfig cfg;
    try {
        cfg = load_config_from_env();
    } catch (const std::exception& e) {
        std::cerr << "[setup] invalid configuration: " << e.what() << std::endl;
        return 2;
    }
    set_log_level(cfg.log_level);
    log_info("setup") << "mode=" << cfg.mode;

    boost::asio::io_context ioc{1};
    TaskSupervisor supervisor{ioc};

    IngestionOptions ingest_opts;
    ingest_opts.bind_address = cfg.sidecar_bind_addr;
    ingest_opts.receive_timeout = cfg.receive_timeout;
    ingest_opts.pull.recv_hwm = cfg.recv_hwm;
    IngestionService ingest{ioc, ingest_opts};

    std::unique_ptr<HttpServer> http_server;
    try {
        ingest.start();
        tcp::endpoint ep{boost::asio::ip::make_address(cfg.http_host), cfg.http_port};
        http_server = std::make_unique<HttpServer>(ioc, ep, [&](auto const& req, auto& res){
            handle_request(ingest, req, res);
        });
    } catch (const std::exception& e) {
        log_error("setup") << "startup failed: " << e.what();
        return 1;
    }
    http_server->run();
    log_info("setup") << "HTTP listening on " << cfg.http_host << ":" << http_server->port();

    supervisor.on_shutdown([&] { ingest.stop(); });
    supervisor.on_shutdown([&] { http_server->stop(); });
    supervisor.watch_os_signals();

    ShutdownSignal& signal = supervisor.signal();
    supervisor.spawn("ingestion", [&] { return ingest.run(signal); });

    supervisor.add_health_probe("ingestion", [&] {
        return signal.is_set() || ingest.running();
    });
    supervisor.spawn_watchdog(cfg.watchdog_interval);

    std::unique_ptr<SelfMonitor> monitor;
    if (cfg.self_monitor_enabled) {
        SelfMonitorOptions mopts;
        mopts.connect_address = cfg.producer_connect_addr;
        mopts.interval = cfg.self_monitor_interval;
        mopts.send_hwm = cfg.send_hwm;
        monitor = std::make_unique<SelfMonitor>(ioc, mopts);
        supervisor.on_shutdown([&] { monitor->stop(); });
        supervisor.spawn("self-monitor", [&] { return monitor->run(signal); });
    }

    std::cout << "Sidecar started successfully" << std::endl;
    return supervisor.run();
}
