#pragma once

#include <vector>

#include "indicators/IndicatorTypes.h"

namespace indicators {

// Cross-timeframe consensus. Entries without a snapshot are ignored, and an
// aggregate stays absent when no timeframe contributes a value to it.
class SignalAggregator {
public:
    static ConsensusSignal aggregate(const std::vector<TimeframeAnalysis>& timeframes);

    static const char* trendDirectionLabel(double consistency);
    static const char* rsiLabel(double rsi);
    static const char* marketRegimeLabel(double adx);
};

}  // namespace indicators
