#include "api/Controllers.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <thread>

#include <boost/json/object.hpp>

#include "adapters/binance/IntervalMap.hpp"
#include "app/MarketAnalysisService.hpp"
#include "common/Metrics.hpp"
#include "core/CandleCache.h"
#include "http/ErrorCodes.hpp"
#include "http/HttpJson.hpp"
#include "http/MarketJson.hpp"
#include "http/QueryParams.hpp"
#include "http/json_error.hpp"
#include "logging/Log.h"

namespace mse::api {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::API;

std::optional<std::string> required_symbol(const http::QueryParams& params) {
    auto symbol = params.get("symbol");
    if (!symbol) {
        return std::nullopt;
    }
    auto normalized = domain::to_upper_symbol(*symbol);
    if (normalized.empty()) {
        return std::nullopt;
    }
    return normalized;
}

}  // namespace

Controllers::Controllers(const core::CandleCache& cache,
                         const app::MarketAnalysisService& analysis,
                         StatusProvider statusProvider)
    : cache_(cache), analysis_(analysis), statusProvider_(std::move(statusProvider)) {
    if (!statusProvider_) {
        throw std::invalid_argument("Controllers requires a connection status provider");
    }
}

Response Controllers::healthz(const Request&) const {
    const auto status = statusProvider_();
    const bool failed = status.state == domain::ConnectionState::TerminallyFailed;

    boost::json::object payload;
    payload["status"] = failed ? "error" : "ok";
    payload["connection"] = http::to_json(status);
    payload["cache"] = http::to_json(cache_.diagnostics());

    Response response;
    http::write_json(response, payload, failed ? 503 : 200);
    return response;
}

Response Controllers::analysis(const Request& request) const {
    Response response;
    const auto symbol = required_symbol(http::QueryParams(request.query));
    if (!symbol) {
        http::json_error(response, 400, http::errors::symbol_required);
        return response;
    }

    try {
        const auto result = analysis_.get_multi_timeframe_analysis(*symbol);
        http::write_json(response, http::to_json(result));
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "analysis failed for %s: %s", symbol->c_str(), ex.what());
        http::json_error(response, 500, http::errors::internal_error);
    }
    return response;
}

Response Controllers::klines(const Request& request) const {
    Response response;
    const http::QueryParams params(request.query);
    const auto symbol = required_symbol(params);
    if (!symbol) {
        http::json_error(response, 400, http::errors::symbol_required);
        return response;
    }

    const auto interval = params.get("interval");
    if (!interval || !adapters::binance::is_supported_interval(*interval)) {
        http::json_error(response, 400, http::errors::interval_invalid);
        return response;
    }

    std::size_t limit = 0;
    try {
        if (const auto requested = params.get_int("limit")) {
            if (*requested <= 0 || static_cast<std::size_t>(*requested) > kMaxKlinesLimit) {
                http::json_error(response, 400, http::errors::limit_invalid);
                return response;
            }
            limit = static_cast<std::size_t>(*requested);
        }
    } catch (const std::invalid_argument&) {
        http::json_error(response, 400, http::errors::limit_invalid);
        return response;
    }

    const auto rows = cache_.get(*symbol, *interval, limit);
    boost::json::object payload;
    payload["symbol"] = *symbol;
    payload["interval"] = *interval;
    payload["count"] = rows.size();
    payload["data"] = http::to_json(rows);
    http::write_json(response, payload);
    LOG_DEBUG(kLogCategory,
              "klines symbol=%s interval=%s rows=%zu",
              symbol->c_str(),
              interval->c_str(),
              rows.size());
    return response;
}

Response Controllers::stats(const Request&) const {
    const auto snapshot = common::metrics::Registry::instance().snapshot();
    const auto uptimeSeconds = std::chrono::duration_cast<std::chrono::duration<double>>(snapshot.uptime).count();

    auto threadCount = std::thread::hardware_concurrency();
    if (threadCount == 0U) {
        threadCount = 1U;
    }

    boost::json::object counters;
    for (const auto& [counterName, value] : snapshot.counters) {
        counters[counterName] = value;
    }

    boost::json::object gauges;
    for (const auto& [gaugeName, value] : snapshot.gauges) {
        gauges[gaugeName] = value;
    }

    boost::json::object routes;
    for (const auto& [route, requests] : snapshot.routeRequests) {
        routes[route] = requests;
    }

    boost::json::object payload;
    payload["uptime_seconds"] = uptimeSeconds;
    payload["threads"] = threadCount;
    payload["connection_state"] = domain::to_string(statusProvider_().state);
    payload["counters"] = std::move(counters);
    payload["gauges"] = std::move(gauges);
    payload["routes"] = std::move(routes);

    Response response;
    http::write_json(response, payload);
    return response;
}

}  // namespace mse::api
