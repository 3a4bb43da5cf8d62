#include "common/Metrics.hpp"

namespace mse::common::metrics {

const char* name(Counter counter) {
    switch (counter) {
    case Counter::FramesReceived:
        return "frames_received_total";
    case Counter::FramesMalformed:
        return "frames_malformed_total";
    case Counter::FramesUnrecognized:
        return "frames_unrecognized_total";
    case Counter::KlinesRejected:
        return "klines_rejected_total";
    case Counter::ReconnectAttempts:
        return "reconnect_attempts_total";
    case Counter::ListenerErrors:
        return "listener_errors_total";
    case Counter::SubscribeFailures:
        return "subscribe_failures_total";
    }
    return "unknown";
}

const char* name(Gauge gauge) {
    switch (gauge) {
    case Gauge::WsState:
        return "ws_state";
    case Gauge::ReconnectCount:
        return "reconnect_count";
    case Gauge::CacheSeries:
        return "cache_series";
    }
    return "unknown";
}

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry registry;
    return registry;
}

void Registry::increment(Counter counter, std::uint64_t by) {
    counters_[static_cast<std::size_t>(counter)].fetch_add(by, std::memory_order_relaxed);
}

void Registry::set(Gauge gauge, double value) {
    gauges_[static_cast<std::size_t>(gauge)].store(value, std::memory_order_relaxed);
}

void Registry::countRequest(const std::string& routeKey) {
    std::lock_guard<std::mutex> lock(routesMutex_);
    ++routeRequests_[routeKey];
}

std::uint64_t Registry::value(Counter counter) const {
    return counters_[static_cast<std::size_t>(counter)].load(std::memory_order_relaxed);
}

double Registry::value(Gauge gauge) const {
    return gauges_[static_cast<std::size_t>(gauge)].load(std::memory_order_relaxed);
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot out;
    out.uptime = std::chrono::steady_clock::now() - startTime_;

    out.counters.reserve(kCounterCount);
    for (std::size_t i = 0; i < kCounterCount; ++i) {
        const auto counter = static_cast<Counter>(i);
        out.counters.emplace_back(name(counter), value(counter));
    }
    out.gauges.reserve(kGaugeCount);
    for (std::size_t i = 0; i < kGaugeCount; ++i) {
        const auto gauge = static_cast<Gauge>(i);
        out.gauges.emplace_back(name(gauge), value(gauge));
    }

    std::lock_guard<std::mutex> lock(routesMutex_);
    out.routeRequests = routeRequests_;
    return out;
}

}  // namespace mse::common::metrics
