#include "adapters/binance/KlineStreamParser.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

#include <boost/json.hpp>

namespace adapters::binance {
namespace {

constexpr std::string_view kKlineMarker = "@kline_";

double parse_json_number(const boost::json::value& value, const char* field) {
    double parsed = 0.0;
    if (value.is_double()) {
        parsed = value.as_double();
    } else if (value.is_int64()) {
        parsed = static_cast<double>(value.as_int64());
    } else if (value.is_uint64()) {
        parsed = static_cast<double>(value.as_uint64());
    } else if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        char* end = nullptr;
        errno = 0;
        parsed = std::strtod(str.c_str(), &end);
        if (str.empty() || end != str.c_str() + str.size() || errno == ERANGE) {
            throw StreamFrameError(std::string("field '") + field + "' is not a number: " + str);
        }
    } else {
        throw StreamFrameError(std::string("field '") + field + "' has unsupported JSON type");
    }
    if (!std::isfinite(parsed)) {
        throw StreamFrameError(std::string("field '") + field + "' is not finite");
    }
    return parsed;
}

std::int64_t parse_json_int(const boost::json::value& value, const char* field) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        const auto raw = value.as_uint64();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw StreamFrameError(std::string("field '") + field + "' is out of range");
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_double()) {
        // 2^63 is exactly representable; anything at or beyond it overflows int64.
        const double raw = value.as_double();
        if (!std::isfinite(raw) || std::trunc(raw) != raw) {
            throw StreamFrameError(std::string("field '") + field + "' is not an integer");
        }
        if (raw < -9223372036854775808.0 || raw >= 9223372036854775808.0) {
            throw StreamFrameError(std::string("field '") + field + "' is out of range");
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        char* end = nullptr;
        errno = 0;
        const long long parsed = std::strtoll(str.c_str(), &end, 10);
        if (str.empty() || end != str.c_str() + str.size() || errno == ERANGE) {
            throw StreamFrameError(std::string("field '") + field + "' is not an integer: " + str);
        }
        return parsed;
    }
    throw StreamFrameError(std::string("field '") + field + "' has unsupported JSON type");
}

const boost::json::value& require(const boost::json::object& obj, const char* field) {
    const auto* value = obj.if_contains(field);
    if (value == nullptr || value->is_null()) {
        throw StreamFrameError(std::string("kline missing field '") + field + "'");
    }
    return *value;
}

std::string optional_string(const boost::json::object& obj, const char* field) {
    const auto* value = obj.if_contains(field);
    if (value == nullptr || !value->is_string()) {
        return {};
    }
    return std::string(value->as_string().c_str());
}

std::string timeframe_from_stream(const std::string& stream) {
    const auto pos = stream.find(kKlineMarker);
    if (pos == std::string::npos) {
        return {};
    }
    return stream.substr(pos + kKlineMarker.size());
}

domain::Kline parse_kline(const boost::json::object& root,
                          const boost::json::object& data,
                          const boost::json::object& k) {
    domain::Kline kline;

    std::string symbol = optional_string(data, "s");
    if (symbol.empty()) {
        symbol = optional_string(k, "s");
    }
    kline.symbol = domain::to_upper_symbol(symbol);
    if (kline.symbol.empty()) {
        throw StreamFrameError("kline missing symbol");
    }

    kline.timeframe = optional_string(k, "i");
    if (kline.timeframe.empty()) {
        kline.timeframe = timeframe_from_stream(optional_string(root, "stream"));
    }
    if (kline.timeframe.empty()) {
        throw StreamFrameError("kline missing interval");
    }

    kline.openTime = parse_json_int(require(k, "t"), "t");
    kline.closeTime = parse_json_int(require(k, "T"), "T");
    if (kline.openTime <= 0) {
        throw StreamFrameError("kline open time must be positive");
    }
    if (kline.closeTime < kline.openTime) {
        throw StreamFrameError("kline close time precedes open time");
    }

    kline.open = parse_json_number(require(k, "o"), "o");
    kline.high = parse_json_number(require(k, "h"), "h");
    kline.low = parse_json_number(require(k, "l"), "l");
    kline.close = parse_json_number(require(k, "c"), "c");
    kline.volume = parse_json_number(require(k, "v"), "v");
    kline.quoteVolume = parse_json_number(require(k, "q"), "q");
    kline.tradeCount = parse_json_int(require(k, "n"), "n");
    kline.takerBuyBaseVolume = parse_json_number(require(k, "V"), "V");
    kline.takerBuyQuoteVolume = parse_json_number(require(k, "Q"), "Q");

    if (kline.high < kline.low) {
        throw StreamFrameError("kline high below low");
    }
    if (kline.volume < 0 || kline.quoteVolume < 0 || kline.takerBuyBaseVolume < 0 ||
        kline.takerBuyQuoteVolume < 0 || kline.tradeCount < 0) {
        throw StreamFrameError("kline volume fields must be non-negative");
    }

    const auto& finalFlag = require(k, "x");
    if (!finalFlag.is_bool()) {
        throw StreamFrameError("kline close flag is not a boolean");
    }
    kline.isFinal = finalFlag.as_bool();
    return kline;
}

}  // namespace

StreamFrame parse_stream_frame(std::string_view payload) {
    boost::json::error_code ec;
    auto json = boost::json::parse(payload, ec);
    if (ec) {
        throw StreamFrameError("invalid JSON payload: " + ec.message());
    }
    if (!json.is_object()) {
        throw StreamFrameError("payload is not a JSON object");
    }

    const auto& root = json.as_object();
    StreamFrame frame;

    if (const auto* data = root.if_contains("data"); data != nullptr && data->is_object()) {
        const auto& dataObj = data->as_object();
        if (const auto* k = dataObj.if_contains("k"); k != nullptr && k->is_object()) {
            frame.kind = FrameKind::KlineUpdate;
            frame.kline = parse_kline(root, dataObj, k->as_object());
            return frame;
        }
    }

    const auto* id = root.if_contains("id");
    if (id != nullptr && (id->is_int64() || id->is_uint64())) {
        frame.id = id->is_int64() ? id->as_int64() : static_cast<std::int64_t>(id->as_uint64());
    }

    if (const auto* error = root.if_contains("error"); error != nullptr && !error->is_null()) {
        frame.kind = FrameKind::Error;
        if (error->is_object()) {
            const auto& errObj = error->as_object();
            if (const auto* msg = errObj.if_contains("msg"); msg != nullptr && msg->is_string()) {
                frame.detail = std::string(msg->as_string().c_str());
            }
        }
        if (frame.detail.empty()) {
            frame.detail = boost::json::serialize(*error);
        }
        return frame;
    }

    if (root.contains("result") && id != nullptr) {
        frame.kind = FrameKind::SubscriptionAck;
        return frame;
    }

    frame.kind = FrameKind::Unrecognized;
    return frame;
}

std::string kline_stream_name(const std::string& symbol, const std::string& timeframe) {
    return domain::to_lower_symbol(symbol) + std::string(kKlineMarker) + timeframe;
}

std::string build_subscribe_message(const std::string& symbol,
                                    const std::vector<std::string>& timeframes,
                                    std::int64_t id) {
    boost::json::array params;
    params.reserve(timeframes.size());
    for (const auto& timeframe : timeframes) {
        params.emplace_back(kline_stream_name(symbol, timeframe));
    }

    boost::json::object message;
    message["method"] = "SUBSCRIBE";
    message["params"] = std::move(params);
    message["id"] = id;
    return boost::json::serialize(message);
}

const char* to_string(FrameKind kind) {
    switch (kind) {
    case FrameKind::KlineUpdate:
        return "kline";
    case FrameKind::SubscriptionAck:
        return "ack";
    case FrameKind::Error:
        return "error";
    case FrameKind::Unrecognized:
        return "unrecognized";
    }
    return "unknown";
}

}  // namespace adapters::binance
