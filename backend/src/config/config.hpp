#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "util/log.hpp"

// Process configuration, built once at startup and handed to constructors.
struct BridgeConfig
{
    // aggregator
    std::string sidecar_bind_addr{"tcp://0.0.0.0:5555"};
    std::string http_host{"0.0.0.0"};
    std::uint16_t http_port{8001};
    std::size_t recv_hwm{10000};
    std::chrono::milliseconds receive_timeout{1000};
    std::chrono::milliseconds watchdog_interval{1000};
    bool self_monitor_enabled{false};
    std::chrono::milliseconds self_monitor_interval{5000};

    // producer
    std::string producer_connect_addr{"tcp://127.0.0.1:5555"};
    std::string results_connect_addr{"tcp://127.0.0.1:5555"};
    std::size_t send_hwm{100};

    std::string mode{"dev"};
    LogLevel log_level{LogLevel::Debug};
};

// Reads KEY=VALUE lines from `filepath` (then backend/<filepath>) into the
// environment. Variables that are already set win. A missing file is fine.
void load_env_file(const std::string& filepath = ".env");

// Defaults overridden by the environment. Throws ConfigError on a value that
// does not parse or is out of range.
BridgeConfig load_config_from_env();
