#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "app/ICandleListener.hpp"
#include "core/CandleCache.h"
#include "domain/Types.h"
#include "domain/exchange/IExchangeKlines.hpp"
#include "logging/Log.h"

namespace app {

struct IngestorSettings {
    domain::StreamEndpoint endpoint;
    std::vector<std::string> symbols;
    std::vector<std::string> timeframes;
    std::chrono::milliseconds subscribeDelay{100};
    std::chrono::milliseconds reconnectDelay{3000};
    std::uint32_t maxReconnectAttempts{10};
};

// Owns the streaming session: connection state machine, subscriptions and the
// receive loop. It is the only writer to the cache it is given.
//
//   disconnected -> connecting -> connected <-> reconnecting -> terminally_failed
class StreamIngestor {
public:
    using TerminalFailureHandler = std::function<void(const domain::ConnectionStatus&)>;

    StreamIngestor(core::CandleCache& cache, domain::IStreamTransport& transport, IngestorSettings settings);
    ~StreamIngestor();

    StreamIngestor(const StreamIngestor&) = delete;
    StreamIngestor& operator=(const StreamIngestor&) = delete;

    // Throws std::runtime_error when the connection cannot be opened; state stays disconnected.
    void connect();

    // One SUBSCRIBE request per symbol covering all timeframes. Returns the number of
    // symbols whose request was written; failures are logged and skipped.
    std::size_t subscribe_all();
    std::size_t subscribe_all(const std::vector<std::string>& symbols, const std::vector<std::string>& timeframes);

    // Blocks until disconnect() or terminal failure.
    void run_receive_loop();

    // Runs run_receive_loop() on a dedicated thread.
    void start();
    void join();

    // Safe from any thread; unblocks a pending receive and any reconnect wait.
    // A terminally failed ingestor keeps reporting terminally_failed.
    void disconnect();

    void add_listener(ICandleListener& listener);
    void set_on_terminal_failure(TerminalFailureHandler handler);

    domain::ConnectionStatus status() const;

private:
    void open_connection_(domain::ConnectionState stateOnFailure);
    void receive_until_closed_();
    bool reconnect_();
    bool wait_interruptible_(std::chrono::milliseconds delay);
    void handle_frame_(const std::string& payload);
    void notify_listeners_(const domain::Kline& kline);
    void set_state_(domain::ConnectionState state);
    void record_error_(const std::string& error);

    core::CandleCache& cache_;
    domain::IStreamTransport& transport_;
    const IngestorSettings settings_;

    std::atomic<bool> active_{false};
    std::atomic<std::int64_t> nextRequestId_{1};

    mutable std::mutex statusMutex_;
    domain::ConnectionStatus status_;

    std::mutex waitMutex_;
    std::condition_variable waitCv_;

    std::mutex subscriptionMutex_;
    std::vector<std::string> subscribedSymbols_;
    std::vector<std::string> subscribedTimeframes_;

    std::mutex listenerMutex_;
    std::vector<ICandleListener*> listeners_;
    TerminalFailureHandler onTerminalFailure_;

    logging::Throttle malformedThrottle_{std::chrono::seconds(5)};
    std::thread worker_;
};

}  // namespace app
