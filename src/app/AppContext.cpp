#include "app/AppContext.hpp"

#include <chrono>
#include <utility>

#include "logging/Log.h"

namespace app {

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;

adapters::binance::RestEndpoint makeRestEndpoint(const mse::common::Config& config) {
    adapters::binance::RestEndpoint endpoint;
    endpoint.host = config.restHost;
    endpoint.klinesPath = config.restKlinesPath;
    endpoint.timeoutSec = config.restTimeoutSec;
    return endpoint;
}

}  // namespace

AppContext::AppContext(mse::common::Config config)
    : config_(std::move(config)),
      cache_(config_.cacheCapacity),
      restClient_(makeRestEndpoint(config_)),
      transport_(),
      ingestor_(cache_, transport_, makeIngestorSettings(config_)),
      analysis_(cache_, config_.timeframes, config_.analysisLimit) {}

AppContext::~AppContext() { shutdown(); }

IngestorSettings AppContext::makeIngestorSettings(const mse::common::Config& config) {
    IngestorSettings settings;
    settings.endpoint.host = config.wsHost;
    settings.endpoint.port = config.wsPort;
    settings.endpoint.path = config.wsPath;
    settings.endpoint.connectTimeout = std::chrono::milliseconds(config.wsConnectTimeoutMs);
    settings.endpoint.pingInterval = std::chrono::milliseconds(config.wsPingIntervalMs);
    settings.symbols = config.symbols;
    settings.timeframes = config.timeframes;
    settings.subscribeDelay = std::chrono::milliseconds(config.subscribeDelayMs);
    settings.reconnectDelay = std::chrono::milliseconds(config.reconnectDelayMs);
    settings.maxReconnectAttempts = config.maxReconnectAttempts;
    return settings;
}

HistoryBootstrapper::Report AppContext::bootstrap() {
    HistoryBootstrapper bootstrapper(restClient_, cache_);
    return bootstrapper.run(config_.symbols, config_.timeframes, config_.bootstrapLimit);
}

void AppContext::start_streaming() {
    ingestor_.connect();
    const auto subscribed = ingestor_.subscribe_all();
    if (subscribed < config_.symbols.size()) {
        LOG_WARN(kLogCategory, "subscribed %zu of %zu symbols", subscribed, config_.symbols.size());
    }
    ingestor_.start();
}

void AppContext::start_http() {
    if (!config_.httpEnabled) {
        LOG_INFO(logging::LogCategory::API, "HTTP API disabled");
        return;
    }
    controllers_ = std::make_unique<mse::api::Controllers>(
        cache_, analysis_, [this]() { return ingestor_.status(); });
    router_ = std::make_unique<mse::api::Router>(*controllers_);
    httpServer_ = std::make_unique<mse::api::HttpServer>(
        *router_, mse::api::Endpoint{"0.0.0.0", config_.httpPort}, config_.httpThreads);
    httpServer_->start();
}

void AppContext::shutdown() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;

    if (httpServer_) {
        httpServer_->stop();
    }
    ingestor_.disconnect();
    ingestor_.join();
    httpServer_.reset();
    router_.reset();
    controllers_.reset();
}

}  // namespace app
