#pragma once

#include <string>
#include <vector>

#include "domain/Types.h"
#include "indicators/IndicatorTypes.h"

namespace indicators {

// Stateless: every call works on the copy of the series it is given.
class IndicatorEngine {
public:
    static IndicatorSnapshot computeSnapshot(const std::string& symbol,
                                             const std::string& timeframe,
                                             const std::vector<domain::Kline>& candles);

    static IndicatorSet computeIndicators(const std::vector<domain::Kline>& candles);

    static const char* bollingerLabel(double position);
    static const char* trendStrengthLabel(double adx);
};

}  // namespace indicators
