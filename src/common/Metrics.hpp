#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mse::common::metrics {

enum class Counter : std::size_t {
    FramesReceived,
    FramesMalformed,
    FramesUnrecognized,
    KlinesRejected,
    ReconnectAttempts,
    ListenerErrors,
    SubscribeFailures,
};

enum class Gauge : std::size_t {
    WsState,
    ReconnectCount,
    CacheSeries,
};

inline constexpr std::size_t kCounterCount = 7;
inline constexpr std::size_t kGaugeCount = 3;

// Exported names, e.g. "frames_received_total" or "ws_state".
const char* name(Counter counter);
const char* name(Gauge gauge);

// Process-wide ingestion and API metrics. Counters and gauges are lock-free;
// per-route request counts take a mutex since routes are keyed by string.
class Registry {
public:
    struct Snapshot {
        std::chrono::steady_clock::duration uptime{};
        std::vector<std::pair<const char*, std::uint64_t>> counters;
        std::vector<std::pair<const char*, double>> gauges;
        std::map<std::string, std::uint64_t> routeRequests;
    };

    static Registry& instance();

    void increment(Counter counter, std::uint64_t by = 1U);
    void set(Gauge gauge, double value);
    void countRequest(const std::string& routeKey);

    std::uint64_t value(Counter counter) const;
    double value(Gauge gauge) const;

    Snapshot snapshot() const;

private:
    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    std::array<std::atomic<std::uint64_t>, kCounterCount> counters_{};
    std::array<std::atomic<double>, kGaugeCount> gauges_{};
    mutable std::mutex routesMutex_;
    std::map<std::string, std::uint64_t> routeRequests_;
};

}  // namespace mse::common::metrics
