#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include "config/config.hpp"
#include "errors.hpp"

namespace {

const char* const kKeys[] = {
    "SIDECAR_BIND_ADDR", "SIDECAR_HTTP_HOST", "SIDECAR_HTTP_PORT", "PRODUCER_CONNECT_ADDR",
    "RESULTS_CONNECT_ADDR", "SEND_HWM", "RECV_HWM", "RECEIVE_TIMEOUT_MS", "WATCHDOG_INTERVAL_MS",
    "SELF_MONITOR_ENABLED", "SELF_MONITOR_INTERVAL_MS", "MODE", "LOG_LEVEL", "CONFIG_TEST_ONLY",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear()
    {
        for (const char* k : kKeys) unsetenv(k);
    }
};

} // namespace

TEST_F(ConfigTest, Defaults)
{
    const BridgeConfig c = load_config_from_env();
    EXPECT_EQ(c.sidecar_bind_addr, "tcp://0.0.0.0:5555");
    EXPECT_EQ(c.http_host, "0.0.0.0");
    EXPECT_EQ(c.http_port, 8001);
    EXPECT_EQ(c.producer_connect_addr, "tcp://127.0.0.1:5555");
    EXPECT_EQ(c.results_connect_addr, "tcp://127.0.0.1:5555");
    EXPECT_EQ(c.send_hwm, 100u);
    EXPECT_EQ(c.recv_hwm, 10000u);
    EXPECT_EQ(c.receive_timeout.count(), 1000);
    EXPECT_EQ(c.watchdog_interval.count(), 1000);
    EXPECT_FALSE(c.self_monitor_enabled);
    EXPECT_EQ(c.self_monitor_interval.count(), 5000);
    EXPECT_EQ(c.mode, "dev");
    EXPECT_EQ(c.log_level, LogLevel::Debug);
}

TEST_F(ConfigTest, EnvironmentOverrides)
{
    setenv("SIDECAR_BIND_ADDR", "tcp://127.0.0.1:6000", 1);
    setenv("SIDECAR_HTTP_PORT", "9100", 1);
    setenv("PRODUCER_CONNECT_ADDR", "tcp://10.0.0.5:6000", 1);
    setenv("SEND_HWM", "5", 1);
    setenv("SELF_MONITOR_ENABLED", "true", 1);
    setenv("MODE", "prod", 1);

    const BridgeConfig c = load_config_from_env();
    EXPECT_EQ(c.sidecar_bind_addr, "tcp://127.0.0.1:6000");
    EXPECT_EQ(c.http_port, 9100);
    EXPECT_EQ(c.results_connect_addr, "tcp://10.0.0.5:6000"); // follows the producer
    EXPECT_EQ(c.send_hwm, 5u);
    EXPECT_TRUE(c.self_monitor_enabled);
    EXPECT_EQ(c.log_level, LogLevel::Info);

    setenv("LOG_LEVEL", "warn", 1);
    EXPECT_EQ(load_config_from_env().log_level, LogLevel::Warn);
}

TEST_F(ConfigTest, InvalidValuesRaise)
{
    setenv("SEND_HWM", "lots", 1);
    EXPECT_THROW(load_config_from_env(), ConfigError);
    unsetenv("SEND_HWM");

    setenv("SIDECAR_HTTP_PORT", "70000", 1);
    EXPECT_THROW(load_config_from_env(), ConfigError);
    unsetenv("SIDECAR_HTTP_PORT");

    setenv("RECV_HWM", "-3", 1);
    EXPECT_THROW(load_config_from_env(), ConfigError);
    unsetenv("RECV_HWM");

    setenv("SELF_MONITOR_ENABLED", "maybe", 1);
    EXPECT_THROW(load_config_from_env(), ConfigError);
    unsetenv("SELF_MONITOR_ENABLED");

    setenv("SIDECAR_BIND_ADDR", "localhost:5555", 1);
    EXPECT_THROW(load_config_from_env(), ConfigError);
    unsetenv("SIDECAR_BIND_ADDR");

    setenv("LOG_LEVEL", "chatty", 1);
    EXPECT_THROW(load_config_from_env(), ConfigError);
}

TEST_F(ConfigTest, EnvFileFillsButNeverOverrides)
{
    const std::string path = ::testing::TempDir() + "telemetry_config_test.env";
    {
        std::ofstream f(path);
        f << "# comment\n"
          << "\n"
          << "SEND_HWM=250\n"
          << "export RECV_HWM = 42\n"
          << "SIDECAR_HTTP_HOST=\"127.0.0.1\"\n"
          << "MODE='prod'\n"
          << "not a pair\n";
    }
    setenv("MODE", "dev", 1);

    load_env_file(path);
    const BridgeConfig c = load_config_from_env();
    EXPECT_EQ(c.send_hwm, 250u);
    EXPECT_EQ(c.recv_hwm, 42u);
    EXPECT_EQ(c.http_host, "127.0.0.1");
    EXPECT_EQ(c.mode, "dev");
    std::remove(path.c_str());
}

TEST_F(ConfigTest, MissingEnvFileIsFine)
{
    load_env_file("/nonexistent/definitely-not-here.env");
    EXPECT_EQ(load_config_from_env().send_hwm, 100u);
}
