#pragma once

#include <memory>

#include "adapters/binance/BinanceRestClient.hpp"
#include "adapters/binance/BinanceWsTransport.hpp"
#include "api/Controllers.hpp"
#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "app/HistoryBootstrapper.hpp"
#include "app/MarketAnalysisService.hpp"
#include "app/StreamIngestor.hpp"
#include "common/Config.hpp"
#include "core/CandleCache.h"

namespace app {

// Owns every long-lived component of the service. Members are declared in
// construction order and therefore torn down in reverse.
class AppContext {
public:
    explicit AppContext(mse::common::Config config);
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    HistoryBootstrapper::Report bootstrap();

    // Connects and subscribes. Throws when the initial connection fails.
    void start_streaming();

    // Starts the HTTP API when enabled in the configuration.
    void start_http();

    void shutdown();

    const mse::common::Config& config() const noexcept { return config_; }
    core::CandleCache& cache() noexcept { return cache_; }
    StreamIngestor& ingestor() noexcept { return ingestor_; }
    const MarketAnalysisService& analysis() const noexcept { return analysis_; }

private:
    static IngestorSettings makeIngestorSettings(const mse::common::Config& config);

    const mse::common::Config config_;
    core::CandleCache cache_;
    adapters::binance::BinanceRestClient restClient_;
    adapters::binance::BinanceWsTransport transport_;
    StreamIngestor ingestor_;
    MarketAnalysisService analysis_;
    std::unique_ptr<mse::api::Controllers> controllers_;
    std::unique_ptr<mse::api::Router> router_;
    std::unique_ptr<mse::api::HttpServer> httpServer_;
    bool shutDown_{false};
};

}  // namespace app
