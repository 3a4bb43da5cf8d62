#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "domain/Types.h"

namespace adapters::binance {

// Raised for frames that look like kline updates but fail validation, and for
// payloads that are not JSON objects at all.
class StreamFrameError : public std::runtime_error {
public:
    explicit StreamFrameError(const std::string& message)
        : std::runtime_error("KlineStreamParser: " + message) {}
};

enum class FrameKind { KlineUpdate, SubscriptionAck, Error, Unrecognized };

struct StreamFrame {
    FrameKind kind{FrameKind::Unrecognized};
    std::optional<domain::Kline> kline;
    std::optional<std::int64_t> id;
    std::string detail;
};

StreamFrame parse_stream_frame(std::string_view payload);

// "<symbol_lower>@kline_<interval>"
std::string kline_stream_name(const std::string& symbol, const std::string& timeframe);

std::string build_subscribe_message(const std::string& symbol,
                                    const std::vector<std::string>& timeframes,
                                    std::int64_t id);

const char* to_string(FrameKind kind);

}  // namespace adapters::binance
