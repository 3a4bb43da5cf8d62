#include "app/MarketAnalysisService.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "indicators/IndicatorEngine.h"
#include "indicators/SignalAggregator.h"
#include "logging/Log.h"

namespace app {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::INDICATOR;
constexpr const char* kNoCachedData = "no cached data";
}  // namespace

MarketAnalysisService::MarketAnalysisService(const core::CandleCache& cache,
                                             std::vector<std::string> timeframes,
                                             std::size_t analysisLimit)
    : cache_(cache), timeframes_(std::move(timeframes)), analysisLimit_(analysisLimit) {}

indicators::MultiTimeframeAnalysis MarketAnalysisService::get_multi_timeframe_analysis(
    const std::string& symbol) const {
    indicators::MultiTimeframeAnalysis analysis;
    analysis.symbol = domain::to_upper_symbol(symbol);
    analysis.timeframes.reserve(timeframes_.size());

    for (const auto& timeframe : timeframes_) {
        analysis.timeframes.push_back(analyze_timeframe(analysis.symbol, timeframe));
    }

    analysis.overallSignals = indicators::SignalAggregator::aggregate(analysis.timeframes);
    analysis.analysisTimestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::system_clock::now().time_since_epoch())
                                       .count();
    LOG_INFO(kLogCategory,
             "Multi-timeframe analysis complete symbol=%s timeframes=%zu",
             analysis.symbol.c_str(),
             analysis.timeframes.size());
    return analysis;
}

indicators::TimeframeAnalysis MarketAnalysisService::analyze_timeframe(const std::string& symbol,
                                                                      const std::string& timeframe) const {
    indicators::TimeframeAnalysis entry;
    entry.timeframe = timeframe;

    const auto candles = cache_.get(symbol, timeframe, analysisLimit_);
    entry.dataPointCount = candles.size();
    if (candles.empty()) {
        LOG_WARN(kLogCategory, "%s %s has no cached data", symbol.c_str(), timeframe.c_str());
        entry.error = kNoCachedData;
        return entry;
    }

    try {
        entry.snapshot = indicators::IndicatorEngine::computeSnapshot(symbol, timeframe, candles);
    } catch (const std::exception& ex) {
        LOG_WARN(kLogCategory,
                 "Indicator computation failed for %s %s: %s",
                 symbol.c_str(),
                 timeframe.c_str(),
                 ex.what());
        entry.error = ex.what();
    }
    return entry;
}

}  // namespace app
