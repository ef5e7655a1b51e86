#include "config/config.hpp"
#include "errors.hpp"
#include "transport/address.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace {

const char* env(const char* key)
{
    const char* v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

std::string env_string(const char* key, const std::string& fallback)
{
    const char* v = env(key);
    return v ? std::string(v) : fallback;
}

std::uint64_t env_unsigned(const char* key, std::uint64_t fallback, std::uint64_t min, std::uint64_t max)
{
    const char* v = env(key);
    if (!v) return fallback;
    errno = 0;
    char* end = nullptr;
    const unsigned long long n = std::strtoull(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || *v == '-') {
        throw ConfigError(std::string(key) + ": not a number: '" + v + "'");
    }
    if (n < min || n > max) {
        throw ConfigError(std::string(key) + ": " + v + " is outside [" + std::to_string(min) + ", " +
                          std::to_string(max) + "]");
    }
    return n;
}

std::chrono::milliseconds env_millis(const char* key, std::chrono::milliseconds fallback)
{
    return std::chrono::milliseconds(env_unsigned(key, fallback.count(), 1, 24ull * 3600 * 1000));
}

bool env_bool(const char* key, bool fallback)
{
    const char* v = env(key);
    if (!v) return fallback;
    const std::string s(v);
    if (s == "1" || s == "true" || s == "TRUE" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "FALSE" || s == "no" || s == "off") return false;
    throw ConfigError(std::string(key) + ": not a boolean: '" + s + "'");
}

void trim(std::string& s)
{
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

} // namespace

void load_env_file(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        file.open("backend/" + filepath);
        if (!file.is_open()) return; // environment only
    }

    std::string line;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line.erase(0, 7);

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);
        if (key.empty()) continue;

        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                  (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        setenv(key.c_str(), value.c_str(), 0);
    }
}

BridgeConfig load_config_from_env()
{
    BridgeConfig c;

    c.sidecar_bind_addr = env_string("SIDECAR_BIND_ADDR", c.sidecar_bind_addr);
    c.http_host = env_string("SIDECAR_HTTP_HOST", c.http_host);
    c.http_port = static_cast<std::uint16_t>(
        env_unsigned("SIDECAR_HTTP_PORT", c.http_port, 0, std::numeric_limits<std::uint16_t>::max()));
    c.recv_hwm = env_unsigned("RECV_HWM", c.recv_hwm, 1, 1u << 24);
    c.receive_timeout = env_millis("RECEIVE_TIMEOUT_MS", c.receive_timeout);
    c.watchdog_interval = env_millis("WATCHDOG_INTERVAL_MS", c.watchdog_interval);
    c.self_monitor_enabled = env_bool("SELF_MONITOR_ENABLED", c.self_monitor_enabled);
    c.self_monitor_interval = env_millis("SELF_MONITOR_INTERVAL_MS", c.self_monitor_interval);

    c.producer_connect_addr = env_string("PRODUCER_CONNECT_ADDR", c.producer_connect_addr);
    c.results_connect_addr = env_string("RESULTS_CONNECT_ADDR", c.producer_connect_addr);
    c.send_hwm = env_unsigned("SEND_HWM", c.send_hwm, 1, 1u << 24);

    // validate addresses up front so a typo fails at startup
    parse_address(c.sidecar_bind_addr);
    parse_address(c.producer_connect_addr);
    parse_address(c.results_connect_addr);

    c.mode = env_string("MODE", c.mode);
    c.log_level = c.mode == "dev" ? LogLevel::Debug : LogLevel::Info;
    if (const char* lvl = env("LOG_LEVEL")) {
        if (!parse_log_level(lvl, c.log_level)) {
            throw ConfigError(std::string("LOG_LEVEL: unknown level '") + lvl + "'");
        }
    }
    return c;
}
