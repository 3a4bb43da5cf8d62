#include "app/StreamIngestor.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "adapters/binance/KlineStreamParser.hpp"
#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;

domain::TimestampMs now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

using mse::common::metrics::Counter;
using mse::common::metrics::Gauge;

mse::common::metrics::Registry& metrics() {
    return mse::common::metrics::Registry::instance();
}

}  // namespace

StreamIngestor::StreamIngestor(core::CandleCache& cache,
                               domain::IStreamTransport& transport,
                               IngestorSettings settings)
    : cache_(cache), transport_(transport), settings_(std::move(settings)) {
    metrics().set(Gauge::WsState, static_cast<double>(domain::ConnectionState::Disconnected));
    metrics().set(Gauge::ReconnectCount, 0.0);
}

StreamIngestor::~StreamIngestor() {
    disconnect();
    join();
}

void StreamIngestor::connect() {
    active_.store(true, std::memory_order_release);
    try {
        open_connection_(domain::ConnectionState::Disconnected);
    } catch (const std::exception&) {
        active_.store(false, std::memory_order_release);
        throw;
    }
}

void StreamIngestor::open_connection_(domain::ConnectionState stateOnFailure) {
    set_state_(domain::ConnectionState::Connecting);
    LOG_INFO(kLogCategory,
             "StreamIngestor connecting to %s:%s%s",
             settings_.endpoint.host.c_str(),
             settings_.endpoint.port.c_str(),
             settings_.endpoint.path.c_str());
    try {
        transport_.connect(settings_.endpoint);
    } catch (const std::exception& ex) {
        record_error_(ex.what());
        set_state_(stateOnFailure);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        status_.reconnectCount = 0;
        status_.lastMessageTimeMs = now_epoch_ms();
    }
    metrics().set(Gauge::ReconnectCount, 0.0);
    set_state_(domain::ConnectionState::Connected);
    LOG_INFO(kLogCategory, "StreamIngestor connected");
}

std::size_t StreamIngestor::subscribe_all() {
    return subscribe_all(settings_.symbols, settings_.timeframes);
}

std::size_t StreamIngestor::subscribe_all(const std::vector<std::string>& symbols,
                                          const std::vector<std::string>& timeframes) {
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        subscribedSymbols_ = symbols;
        subscribedTimeframes_ = timeframes;
    }

    std::size_t written = 0;
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        if (i > 0 && !wait_interruptible_(settings_.subscribeDelay)) {
            break;
        }

        const auto id = nextRequestId_.fetch_add(1, std::memory_order_relaxed);
        const auto message = adapters::binance::build_subscribe_message(symbols[i], timeframes, id);
        try {
            transport_.send(message);
            ++written;
            LOG_INFO(kLogCategory,
                     "StreamIngestor subscribe sent symbol=%s timeframes=%zu id=%lld",
                     symbols[i].c_str(),
                     timeframes.size(),
                     static_cast<long long>(id));
        } catch (const std::exception& ex) {
            metrics().increment(Counter::SubscribeFailures);
            LOG_WARN(kLogCategory,
                     "StreamIngestor subscribe failed symbol=%s: %s",
                     symbols[i].c_str(),
                     ex.what());
        }
    }
    return written;
}

void StreamIngestor::run_receive_loop() {
    if (!active_.load(std::memory_order_acquire)) {
        LOG_WARN(kLogCategory, "StreamIngestor receive loop started without an active connection");
        return;
    }

    LOG_INFO(kLogCategory, "StreamIngestor receive loop starting");
    while (active_.load(std::memory_order_acquire)) {
        receive_until_closed_();
        if (!active_.load(std::memory_order_acquire)) {
            break;
        }
        if (!reconnect_()) {
            break;
        }
    }

    if (status().state != domain::ConnectionState::TerminallyFailed) {
        set_state_(domain::ConnectionState::Disconnected);
    }
    LOG_INFO(kLogCategory, "StreamIngestor receive loop stopped");
}

void StreamIngestor::receive_until_closed_() {
    std::string payload;
    std::string error;
    while (active_.load(std::memory_order_acquire)) {
        payload.clear();
        error.clear();
        if (transport_.receive(payload, error) == domain::ReceiveStatus::Closed) {
            if (active_.load(std::memory_order_acquire)) {
                record_error_(error.empty() ? std::string("connection closed") : error);
                LOG_WARN(kLogCategory, "StreamIngestor connection lost: %s", error.c_str());
            }
            return;
        }

        {
            std::lock_guard<std::mutex> lock(statusMutex_);
            status_.lastMessageTimeMs = now_epoch_ms();
        }
        metrics().increment(Counter::FramesReceived);
        handle_frame_(payload);
    }
}

bool StreamIngestor::reconnect_() {
    while (active_.load(std::memory_order_acquire)) {
        std::uint32_t attempt = 0;
        {
            std::lock_guard<std::mutex> lock(statusMutex_);
            attempt = ++status_.reconnectCount;
        }
        set_state_(domain::ConnectionState::Reconnecting);
        metrics().increment(Counter::ReconnectAttempts);
        metrics().set(Gauge::ReconnectCount, static_cast<double>(attempt));

        if (attempt > settings_.maxReconnectAttempts) {
            active_.store(false, std::memory_order_release);
            set_state_(domain::ConnectionState::TerminallyFailed);
            const auto snapshot = status();
            LOG_ERROR(kLogCategory,
                      "StreamIngestor giving up after %u reconnect attempts, last error: %s",
                      settings_.maxReconnectAttempts,
                      snapshot.lastError.c_str());

            TerminalFailureHandler handler;
            {
                std::lock_guard<std::mutex> lock(listenerMutex_);
                handler = onTerminalFailure_;
            }
            if (handler) {
                handler(snapshot);
            }
            return false;
        }

        transport_.close();
        LOG_WARN(kLogCategory,
                 "StreamIngestor reconnect attempt=%u/%u in %lld ms",
                 attempt,
                 settings_.maxReconnectAttempts,
                 static_cast<long long>(settings_.reconnectDelay.count()));
        if (!wait_interruptible_(settings_.reconnectDelay)) {
            return false;
        }

        try {
            open_connection_(domain::ConnectionState::Reconnecting);
        } catch (const std::exception& ex) {
            LOG_WARN(kLogCategory, "StreamIngestor reconnect attempt=%u failed: %s", attempt, ex.what());
            continue;
        }

        if (!active_.load(std::memory_order_acquire)) {
            transport_.close();
            return false;
        }

        std::vector<std::string> symbols;
        std::vector<std::string> timeframes;
        {
            std::lock_guard<std::mutex> lock(subscriptionMutex_);
            symbols = subscribedSymbols_;
            timeframes = subscribedTimeframes_;
        }
        subscribe_all(symbols, timeframes);
        return true;
    }
    return false;
}

bool StreamIngestor::wait_interruptible_(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(waitMutex_);
    waitCv_.wait_for(lock, delay, [this]() { return !active_.load(std::memory_order_acquire); });
    return active_.load(std::memory_order_acquire);
}

void StreamIngestor::handle_frame_(const std::string& payload) {
    adapters::binance::StreamFrame frame;
    try {
        frame = adapters::binance::parse_stream_frame(payload);
    } catch (const adapters::binance::StreamFrameError& ex) {
        metrics().increment(Counter::FramesMalformed);
        LOG_WARN_THROTTLED(malformedThrottle_,
                           logging::LogCategory::DATA,
                           "StreamIngestor skipped malformed frame: %s",
                           ex.what());
        return;
    }

    switch (frame.kind) {
    case adapters::binance::FrameKind::KlineUpdate: {
        const auto& kline = *frame.kline;
        const auto result = cache_.upsert(kline);
        if (result == core::UpsertResult::Rejected) {
            metrics().increment(Counter::KlinesRejected);
            return;
        }
        LOG_TRACE(logging::LogCategory::DATA,
                  "StreamIngestor %s %s %s open_ms=%lld final=%s",
                  core::to_string(result),
                  kline.symbol.c_str(),
                  kline.timeframe.c_str(),
                  kline.openTime,
                  kline.isFinal ? "true" : "false");
        notify_listeners_(kline);
        return;
    }
    case adapters::binance::FrameKind::SubscriptionAck:
        LOG_DEBUG(kLogCategory,
                  "StreamIngestor subscription acknowledged id=%lld",
                  static_cast<long long>(frame.id.value_or(-1)));
        return;
    case adapters::binance::FrameKind::Error:
        LOG_WARN(kLogCategory, "StreamIngestor exchange error frame: %s", frame.detail.c_str());
        return;
    case adapters::binance::FrameKind::Unrecognized:
        metrics().increment(Counter::FramesUnrecognized);
        LOG_DEBUG(logging::LogCategory::DATA, "StreamIngestor skipped unrecognized frame bytes=%zu", payload.size());
        return;
    }
}

void StreamIngestor::notify_listeners_(const domain::Kline& kline) {
    std::vector<ICandleListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = listeners_;
    }

    for (auto* listener : listeners) {
        try {
            listener->on_candle(kline);
        } catch (const std::exception& ex) {
            metrics().increment(Counter::ListenerErrors);
            LOG_WARN(logging::LogCategory::DATA, "StreamIngestor listener failed: %s", ex.what());
        } catch (...) {
            metrics().increment(Counter::ListenerErrors);
            LOG_WARN(logging::LogCategory::DATA, "StreamIngestor listener failed with unknown error");
        }
    }
}

void StreamIngestor::start() {
    if (worker_.joinable()) {
        throw std::logic_error("StreamIngestor already started");
    }
    worker_ = std::thread([this]() {
        try {
            run_receive_loop();
        } catch (const std::exception& ex) {
            record_error_(ex.what());
            LOG_ERROR(kLogCategory, "StreamIngestor thread crashed: %s", ex.what());
        } catch (...) {
            LOG_ERROR(kLogCategory, "StreamIngestor thread crashed: unknown exception");
        }
    });
}

void StreamIngestor::join() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void StreamIngestor::disconnect() {
    const bool wasActive = active_.exchange(false, std::memory_order_acq_rel);
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
    }
    waitCv_.notify_all();
    transport_.close();
    if (status().state != domain::ConnectionState::TerminallyFailed) {
        set_state_(domain::ConnectionState::Disconnected);
    }
    if (wasActive) {
        LOG_INFO(kLogCategory, "StreamIngestor disconnected");
    }
}

void StreamIngestor::add_listener(ICandleListener& listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.push_back(&listener);
}

void StreamIngestor::set_on_terminal_failure(TerminalFailureHandler handler) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    onTerminalFailure_ = std::move(handler);
}

domain::ConnectionStatus StreamIngestor::status() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return status_;
}

void StreamIngestor::set_state_(domain::ConnectionState state) {
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        status_.state = state;
    }
    metrics().set(Gauge::WsState, static_cast<double>(state));
}

void StreamIngestor::record_error_(const std::string& error) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    status_.lastError = error;
}

}  // namespace app
