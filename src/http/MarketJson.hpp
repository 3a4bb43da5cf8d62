#pragma once

#include <string>
#include <vector>

#include <boost/json/value.hpp>

#include "core/CandleCache.h"
#include "domain/Types.h"
#include "indicators/IndicatorTypes.h"

namespace mse::http {

// UTC, millisecond precision: 2024-05-01T12:00:00.000Z
std::string format_iso8601_utc(domain::TimestampMs epochMs);

boost::json::value to_json(const domain::Kline& kline);
boost::json::value to_json(const std::vector<domain::Kline>& klines);
boost::json::value to_json(const core::CacheDiagnostics& diagnostics);
boost::json::value to_json(const domain::ConnectionStatus& status);
boost::json::value to_json(const indicators::IndicatorSnapshot& snapshot);
boost::json::value to_json(const indicators::ConsensusSignal& consensus);
boost::json::value to_json(const indicators::MultiTimeframeAnalysis& analysis);

}  // namespace mse::http
