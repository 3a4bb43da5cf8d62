#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "adapters/binance/IntervalMap.hpp"
#include "domain/Types.h"
#include "logging/Log.h"

namespace mse::common {
namespace {

constexpr const char* kEnvPrefix = "MSE_";
constexpr const char* kEnvConfigPath = "MSE_CONFIG";

// Every key the file, the environment and the command line understand.
constexpr const char* kKnownKeys[] = {
    "symbols",           "timeframes",         "cache_capacity",      "bootstrap_limit",
    "analysis_limit",    "ws_host",            "ws_port",             "ws_path",
    "ws_connect_timeout_ms", "ws_ping_interval_ms", "subscribe_delay_ms", "reconnect_delay_ms",
    "max_reconnect_attempts", "rest_host",     "rest_klines_path",    "rest_timeout_sec",
    "http_enabled",      "http_port",          "http_threads",        "log_level",
};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::runtime_error invalidValue(const std::string& key, const std::string& value) {
    return std::runtime_error("Invalid value for " + key + ": '" + value + "'");
}

unsigned long long parseUnsigned(const std::string& key, const std::string& value, unsigned long long maxValue) {
    const auto trimmed = trim(value);
    if (trimmed.empty() || !std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        throw invalidValue(key, value);
    }
    try {
        const auto parsed = std::stoull(trimmed);
        if (parsed > maxValue) {
            throw std::out_of_range("value out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw invalidValue(key, value);
    }
}

std::uint32_t parseUint32(const std::string& key, const std::string& value) {
    return static_cast<std::uint32_t>(parseUnsigned(key, value, std::numeric_limits<std::uint32_t>::max()));
}

std::size_t parseSize(const std::string& key, const std::string& value) {
    return static_cast<std::size_t>(parseUnsigned(key, value, std::numeric_limits<std::size_t>::max()));
}

std::uint16_t parsePort(const std::string& key, const std::string& value) {
    const auto parsed = parseUnsigned(key, value, 65535U);
    if (parsed == 0U) {
        throw invalidValue(key, value);
    }
    return static_cast<std::uint16_t>(parsed);
}

bool parseBool(const std::string& key, const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw invalidValue(key, value);
}

std::string requireNonEmpty(const std::string& key, const std::string& value) {
    auto trimmed = trim(value);
    if (trimmed.empty()) {
        throw invalidValue(key, value);
    }
    return trimmed;
}

bool isKnownKey(const std::string& key) {
    return std::any_of(std::begin(kKnownKeys), std::end(kKnownKeys), [&](const char* known) {
        return key == known;
    });
}

std::string keyFromFlag(const std::string& flag) {
    std::string key = flag.substr(2);
    std::replace(key.begin(), key.end(), '-', '_');
    return key;
}

void parseFile(Config& config, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Config file not found: " + path);
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const auto hashPos = line.find('#');
        if (hashPos != std::string::npos) {
            line.erase(hashPos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        const auto eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            throw std::runtime_error("Config file " + path + ":" + std::to_string(lineNo) +
                                     ": expected key=value");
        }
        config.apply(toLower(trim(line.substr(0, eqPos))), trim(line.substr(eqPos + 1)));
    }
    config.configFile = path;
}

void parseEnv(Config& config) {
    for (const char* key : kKnownKeys) {
        const std::string envName = kEnvPrefix + toUpper(key);
        if (const char* value = std::getenv(envName.c_str())) {
            config.apply(key, value);
        }
    }
    // Conventional aliases honoured when the prefixed form is absent.
    if (std::getenv("MSE_HTTP_PORT") == nullptr) {
        if (const char* port = std::getenv("PORT")) {
            config.apply("http_port", port);
        }
    }
    if (std::getenv("MSE_LOG_LEVEL") == nullptr) {
        if (const char* level = std::getenv("LOG_LEVEL")) {
            config.apply("log_level", level);
        }
    }
}

void parseCli(Config& config, int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg{argv[i]};
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw std::runtime_error("Unexpected argument: " + arg);
        }

        std::string flag = arg;
        std::string value;
        const auto eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            flag = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + arg);
            }
            value = argv[++i];
        }

        if (flag == "--config") {
            continue;
        }
        const auto key = keyFromFlag(flag);
        if (!isKnownKey(key)) {
            throw std::runtime_error("Unknown option: " + flag);
        }
        config.apply(key, value);
    }
}

std::string configPathFromArgs(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg{argv[i]};
        if (arg == "--config") {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for --config");
            }
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(std::string{"--config="}.size());
        }
    }
    if (const char* envPath = std::getenv(kEnvConfigPath)) {
        return envPath;
    }
    return {};
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const auto path = configPathFromArgs(argc, argv); !path.empty()) {
        parseFile(config, path);
    }
    parseEnv(config);
    parseCli(config, argc, argv);

    if (!config.showHelp) {
        config.validate();
    }
    return config;
}

void Config::apply(const std::string& key, const std::string& value) {
    if (key == "symbols") {
        std::vector<std::string> list;
        for (const auto& item : parseCsvList(value)) {
            list.push_back(domain::to_upper_symbol(item));
        }
        symbols = std::move(list);
    } else if (key == "timeframes") {
        timeframes = parseCsvList(value);
    } else if (key == "cache_capacity") {
        cacheCapacity = parseSize(key, value);
    } else if (key == "bootstrap_limit") {
        bootstrapLimit = parseSize(key, value);
    } else if (key == "analysis_limit") {
        analysisLimit = parseSize(key, value);
    } else if (key == "ws_host") {
        wsHost = requireNonEmpty(key, value);
    } else if (key == "ws_port") {
        wsPort = std::to_string(parsePort(key, value));
    } else if (key == "ws_path") {
        wsPath = requireNonEmpty(key, value);
    } else if (key == "ws_connect_timeout_ms") {
        wsConnectTimeoutMs = parseUint32(key, value);
    } else if (key == "ws_ping_interval_ms") {
        wsPingIntervalMs = parseUint32(key, value);
    } else if (key == "subscribe_delay_ms") {
        subscribeDelayMs = parseUint32(key, value);
    } else if (key == "reconnect_delay_ms") {
        reconnectDelayMs = parseUint32(key, value);
    } else if (key == "max_reconnect_attempts") {
        maxReconnectAttempts = parseUint32(key, value);
    } else if (key == "rest_host") {
        restHost = requireNonEmpty(key, value);
    } else if (key == "rest_klines_path") {
        restKlinesPath = requireNonEmpty(key, value);
    } else if (key == "rest_timeout_sec") {
        restTimeoutSec = static_cast<int>(parseUnsigned(key, value, 3600U));
    } else if (key == "http_enabled") {
        httpEnabled = parseBool(key, value);
    } else if (key == "http_port") {
        httpPort = parsePort(key, value);
    } else if (key == "http_threads") {
        httpThreads = parseSize(key, value);
    } else if (key == "log_level") {
        if (!logging::Log::try_parse_log_level(trim(value), logLevel)) {
            throw invalidValue(key, value);
        }
    } else {
        throw std::runtime_error("Unknown config key: " + key);
    }
}

void Config::validate() const {
    if (symbols.empty()) {
        throw std::runtime_error("Invalid value for symbols: at least one symbol is required");
    }
    if (timeframes.empty()) {
        throw std::runtime_error("Invalid value for timeframes: at least one timeframe is required");
    }
    for (const auto& timeframe : timeframes) {
        if (!adapters::binance::is_supported_interval(timeframe)) {
            throw std::runtime_error("Invalid value for timeframes: unsupported interval '" + timeframe + "'");
        }
    }
    if (cacheCapacity < 1) {
        throw std::runtime_error("Invalid value for cache_capacity: must be at least 1");
    }
    if (analysisLimit < 1) {
        throw std::runtime_error("Invalid value for analysis_limit: must be at least 1");
    }
    if (wsConnectTimeoutMs == 0) {
        throw std::runtime_error("Invalid value for ws_connect_timeout_ms: must be positive");
    }
    if (wsPingIntervalMs == 0) {
        throw std::runtime_error("Invalid value for ws_ping_interval_ms: must be positive");
    }
    if (restTimeoutSec <= 0) {
        throw std::runtime_error("Invalid value for rest_timeout_sec: must be positive");
    }
    if (httpThreads < 1) {
        throw std::runtime_error("Invalid value for http_threads: must be at least 1");
    }
}

const char* Config::usage() {
    return "Usage: mse_service [--config <file>] [--symbols A,B] [--timeframes 3m,1h,4h]\n"
           "                   [--cache-capacity N] [--bootstrap-limit N] [--analysis-limit N]\n"
           "                   [--ws-host H] [--ws-port P] [--ws-path /stream]\n"
           "                   [--ws-connect-timeout-ms MS] [--ws-ping-interval-ms MS]\n"
           "                   [--subscribe-delay-ms MS] [--reconnect-delay-ms MS]\n"
           "                   [--max-reconnect-attempts N] [--rest-host H] [--rest-klines-path P]\n"
           "                   [--rest-timeout-sec S] [--http-enabled true|false] [--http-port P]\n"
           "                   [--http-threads N] [--log-level trace|debug|info|warn|error]\n"
           "Every option may also be set as key=value in the config file (e.g. cache_capacity=100)\n"
           "or through MSE_<KEY> environment variables (e.g. MSE_CACHE_CAPACITY).\n";
}

}  // namespace mse::common
