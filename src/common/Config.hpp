#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "config/LogLevel.h"

namespace mse::common {

// Layered as defaults < config file < environment < command line.
struct Config {
    std::vector<std::string> symbols{"BTCUSDT", "ETHUSDT"};
    std::vector<std::string> timeframes{"3m", "1h", "4h"};
    std::size_t cacheCapacity = 100;
    std::size_t bootstrapLimit = 100;
    std::size_t analysisLimit = 200;

    std::string wsHost = "fstream.binance.com";
    std::string wsPort = "443";
    std::string wsPath = "/stream";
    std::uint32_t wsConnectTimeoutMs = 10000;
    std::uint32_t wsPingIntervalMs = 20000;
    std::uint32_t subscribeDelayMs = 100;
    std::uint32_t reconnectDelayMs = 3000;
    std::uint32_t maxReconnectAttempts = 10;

    std::string restHost = "fapi.binance.com";
    std::string restKlinesPath = "/fapi/v1/klines";
    int restTimeoutSec = 30;

    bool httpEnabled = true;
    std::uint16_t httpPort = 8080;
    std::size_t httpThreads = 2;

    config::LogLevel logLevel = config::LogLevel::Info;
    std::string configFile;
    bool showHelp = false;

    static Config fromArgs(int argc, char** argv);

    // Applies one `key=value` setting; keys use the config-file spelling (e.g. "cache_capacity").
    // Throws std::runtime_error naming the key on unknown keys or invalid values.
    void apply(const std::string& key, const std::string& value);

    void validate() const;

    static const char* usage();
};

}  // namespace mse::common
