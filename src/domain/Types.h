#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using TimestampMs = long long;
using TradeCount = std::int64_t;
using Symbol = std::string;

// One OHLCV bar. openTime is the series key; isFinal is set once the exchange closes the bar.
struct Kline {
    Symbol symbol;
    std::string timeframe;
    TimestampMs openTime{0};
    TimestampMs closeTime{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
    double quoteVolume{0};
    TradeCount tradeCount{0};
    double takerBuyBaseVolume{0};
    double takerBuyQuoteVolume{0};
    bool isFinal{false};
};

struct SeriesKey {
    Symbol symbol;
    std::string timeframe;

    bool operator==(const SeriesKey& other) const noexcept {
        return symbol == other.symbol && timeframe == other.timeframe;
    }
    bool operator<(const SeriesKey& other) const noexcept {
        return symbol != other.symbol ? symbol < other.symbol : timeframe < other.timeframe;
    }
};

enum class ConnectionState { Disconnected, Connecting, Connected, Reconnecting, TerminallyFailed };

inline const char* to_string(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected:
        return "disconnected";
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Connected:
        return "connected";
    case ConnectionState::Reconnecting:
        return "reconnecting";
    case ConnectionState::TerminallyFailed:
        return "terminally_failed";
    }
    return "unknown";
}

struct ConnectionStatus {
    ConnectionState state{ConnectionState::Disconnected};
    std::uint32_t reconnectCount{0};
    std::optional<TimestampMs> lastMessageTimeMs{};
    std::string lastError;
};

inline std::string to_upper_symbol(std::string_view symbol) {
    std::string result;
    result.reserve(symbol.size());
    for (unsigned char ch : symbol) {
        if (!std::isspace(ch)) {
            result.push_back(static_cast<char>(std::toupper(ch)));
        }
    }
    return result;
}

inline std::string to_lower_symbol(std::string_view symbol) {
    std::string result;
    result.reserve(symbol.size());
    for (unsigned char ch : symbol) {
        if (!std::isspace(ch)) {
            result.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    return result;
}

}  // namespace domain
