#pragma once

#include <string_view>

#include "domain/Types.h"

namespace adapters::binance {

// Kline interval labels accepted by the futures stream and REST endpoints.
bool is_supported_interval(std::string_view label);

namespace detail {

constexpr domain::TimestampMs kMinute = 60'000;

struct IntervalEntry {
    std::string_view label;
    domain::TimestampMs ms;
};

constexpr IntervalEntry kIntervals[] = {
    {"1m", kMinute},
    {"3m", 3 * kMinute},
    {"5m", 5 * kMinute},
    {"15m", 15 * kMinute},
    {"30m", 30 * kMinute},
    {"1h", 60 * kMinute},
    {"2h", 120 * kMinute},
    {"4h", 240 * kMinute},
    {"6h", 360 * kMinute},
    {"8h", 480 * kMinute},
    {"12h", 720 * kMinute},
    {"1d", 1440 * kMinute},
    {"3d", 3 * 1440 * kMinute},
    {"1w", 7 * 1440 * kMinute},
};

// Duration of a labelled interval, or 0 when the label is not supported.
constexpr domain::TimestampMs interval_ms(std::string_view label) {
    for (const auto &entry : kIntervals) {
        if (entry.label == label) {
            return entry.ms;
        }
    }
    return 0;
}

} // namespace detail

static_assert(detail::interval_ms("3m") == 3 * 60'000);
static_assert(detail::interval_ms("4h") == 4 * 60 * 60'000);
static_assert(detail::interval_ms("1d") == 24 * 60 * 60'000);
static_assert(detail::interval_ms("7m") == 0);

} // namespace adapters::binance
