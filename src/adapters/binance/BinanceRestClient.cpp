#include "adapters/binance/BinanceRestClient.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <boost/json.hpp>

#include "adapters/binance/IntervalMap.hpp"
#include "logging/Log.h"

namespace {

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        const double raw = value.as_double();
        // 2^63 is exactly representable; anything at or beyond it overflows int64.
        if (!std::isfinite(raw) || std::trunc(raw) != raw || raw < -9223372036854775808.0 ||
            raw >= 9223372036854775808.0) {
            throw std::runtime_error("Non-integral or out-of-range integer value");
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

double json_to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stod(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse floating value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for floating conversion");
}

}  // namespace

namespace adapters::binance {

namespace {
constexpr int kMaxRetries = 5;
constexpr std::size_t kMinRowSize = 11;
constexpr std::chrono::seconds kMaxRetryAfter{120};
}  // namespace

BinanceRestClient::BinanceRestClient(RestEndpoint endpoint)
    : endpoint_(std::move(endpoint)),
      http_(endpoint_.host, std::chrono::seconds(endpoint_.timeoutSec)) {}

std::chrono::milliseconds rest_backoff_delay(int attempt, std::optional<std::chrono::seconds> retryAfter) {
    const int exponent = std::clamp(attempt - 1, 0, 6);
    const std::chrono::milliseconds exponential = std::chrono::seconds(1LL << exponent);
    if (retryAfter && *retryAfter > exponential) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::min(*retryAfter, kMaxRetryAfter));
    }
    return exponential;
}

std::vector<domain::Kline> BinanceRestClient::fetch_klines(const std::string& symbol,
                                                          const std::string& interval,
                                                          std::size_t limit) {
    const std::string symbolUpper = domain::to_upper_symbol(symbol);
    if (symbolUpper.empty()) {
        throw std::invalid_argument("BinanceRestClient: symbol cannot be empty");
    }
    if (!is_supported_interval(interval)) {
        throw std::invalid_argument("BinanceRestClient: unsupported interval " + interval);
    }
    const auto requestLimit = std::clamp<std::size_t>(limit == 0 ? 100 : limit, 1, kMaxLimit);

    std::ostringstream target;
    target << endpoint_.klinesPath << "?symbol=" << symbolUpper << "&interval=" << interval
           << "&limit=" << requestLimit;
    const std::string requestTarget = target.str();
    LOG_INFO(logging::LogCategory::NET, "Binance REST %s", requestTarget.c_str());

    infra::http::HttpsResponse response;
    for (int attempt = 1; attempt <= kMaxRetries; ++attempt) {
        response = http_.get(requestTarget);
        const unsigned status = response.status;
        if (status == 200U) {
            break;
        }

        if (status == 429U || (status >= 500U && status < 600U)) {
            if (attempt == kMaxRetries) {
                std::ostringstream oss;
                oss << "Binance REST request " << requestTarget << " failed after " << kMaxRetries
                    << " attempts with HTTP " << status;
                throw std::runtime_error(oss.str());
            }
            const auto delay = rest_backoff_delay(attempt, response.retryAfter);
            LOG_WARN(logging::LogCategory::NET,
                     "Binance REST backoff attempt %d due to HTTP %u, sleeping %lld ms",
                     attempt,
                     status,
                     static_cast<long long>(delay.count()));
            std::this_thread::sleep_for(delay);
            continue;
        }

        std::ostringstream oss;
        oss << "Binance REST request " << requestTarget << " returned unexpected HTTP " << status;
        throw std::runtime_error(oss.str());
    }

    if (!response.usedWeight.empty()) {
        LOG_DEBUG(logging::LogCategory::NET,
                  "Binance REST used weight %s after %s",
                  response.usedWeight.c_str(),
                  requestTarget.c_str());
    }

    const auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    auto klines = parse_klines_payload(response.body, symbolUpper, interval, static_cast<std::int64_t>(nowMs));
    LOG_INFO(logging::LogCategory::DATA,
             "Fetched %s %s historical klines count=%zu",
             symbolUpper.c_str(),
             interval.c_str(),
             klines.size());
    return klines;
}

std::vector<domain::Kline> parse_klines_payload(const std::string& body,
                                                const std::string& symbol,
                                                const std::string& interval,
                                                std::int64_t nowMs) {
    boost::json::value json;
    try {
        json = boost::json::parse(body);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string{"Failed to parse Binance response: "} + ex.what());
    }

    if (!json.is_array()) {
        throw std::runtime_error("Unexpected Binance response type (expected array)");
    }

    std::vector<domain::Kline> rows;
    const auto& outer = json.as_array();
    rows.reserve(outer.size());
    for (const auto& rowValue : outer) {
        if (!rowValue.is_array()) {
            throw std::runtime_error("Unexpected Binance kline row type");
        }
        const auto& row = rowValue.as_array();
        if (row.size() < kMinRowSize) {
            throw std::runtime_error("Incomplete Binance kline row");
        }

        const std::int64_t openMs = json_to_int64(row.at(0));
        if (!rows.empty() && openMs <= rows.back().openTime) {
            continue;
        }

        domain::Kline kline{};
        kline.symbol = symbol;
        kline.timeframe = interval;
        kline.openTime = openMs;
        kline.open = json_to_double(row.at(1));
        kline.high = json_to_double(row.at(2));
        kline.low = json_to_double(row.at(3));
        kline.close = json_to_double(row.at(4));
        kline.volume = json_to_double(row.at(5));
        kline.closeTime = json_to_int64(row.at(6));
        kline.quoteVolume = json_to_double(row.at(7));
        kline.tradeCount = static_cast<domain::TradeCount>(json_to_int64(row.at(8)));
        kline.takerBuyBaseVolume = json_to_double(row.at(9));
        kline.takerBuyQuoteVolume = json_to_double(row.at(10));
        kline.isFinal = kline.closeTime < nowMs;
        rows.push_back(std::move(kline));
    }
    return rows;
}

}  // namespace adapters::binance
