#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/CandleCache.h"
#include "indicators/IndicatorTypes.h"

namespace app {

// On-demand multi-timeframe analysis over point-in-time cache copies. Nothing is cached.
class MarketAnalysisService {
public:
    static constexpr std::size_t kDefaultAnalysisLimit = 200;

    MarketAnalysisService(const core::CandleCache& cache,
                          std::vector<std::string> timeframes,
                          std::size_t analysisLimit = kDefaultAnalysisLimit);

    indicators::MultiTimeframeAnalysis get_multi_timeframe_analysis(const std::string& symbol) const;

    indicators::TimeframeAnalysis analyze_timeframe(const std::string& symbol, const std::string& timeframe) const;

    const std::vector<std::string>& timeframes() const noexcept { return timeframes_; }

private:
    const core::CandleCache& cache_;
    const std::vector<std::string> timeframes_;
    const std::size_t analysisLimit_;
};

}  // namespace app
