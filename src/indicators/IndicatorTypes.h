#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace indicators {

// Minimum candle counts below which a field is reported absent.
struct LookbackPolicy {
    static constexpr std::size_t kEma20 = 20;
    static constexpr std::size_t kEma50 = 50;
    static constexpr std::size_t kMacd = 26;
    static constexpr std::size_t kRsi7 = 7;
    static constexpr std::size_t kRsi14 = 14;
    static constexpr std::size_t kNatr = 14;
    static constexpr std::size_t kBollinger = 20;
    static constexpr std::size_t kAdx = 14;
    static constexpr std::size_t kObv = 1;
    static constexpr std::size_t kObvTrend = 5;
    static constexpr std::size_t kVwap = 1;
    static constexpr std::size_t kVwapWindow = 50;
    static constexpr std::size_t kSupportResistance = 20;
};

struct IndicatorSet {
    std::optional<double> ema20;
    std::optional<double> ema50;
    std::optional<double> macdLine;
    std::optional<double> macdSignal;
    std::optional<double> macdHistogram;
    std::optional<double> rsi7;
    std::optional<double> rsi14;
    std::optional<double> natr;
    std::optional<double> bollingerUpper;
    std::optional<double> bollingerMiddle;
    std::optional<double> bollingerLower;
    std::optional<double> bollingerPosition;
    std::optional<std::string> bollingerSignal;
    std::optional<double> adx;
    std::optional<std::string> trendStrength;
    std::optional<double> obv;
    std::optional<std::string> obvTrend;
    std::optional<double> vwap;
    std::optional<double> vwapRatio;
    std::optional<std::string> vwapSignal;
    std::optional<double> supportLevel;
    std::optional<double> resistanceLevel;
    std::optional<double> distanceToSupportPct;
    std::optional<double> distanceToResistancePct;
};

struct IndicatorSnapshot {
    std::string symbol;
    std::string timeframe;
    double currentPrice{0.0};
    double priceChange{0.0};
    double priceChangePercent{0.0};
    std::size_t dataPointCount{0};
    domain::TimestampMs latestOpenTime{0};
    IndicatorSet indicators;
};

// Per-timeframe result: either a snapshot or the reason there is none.
struct TimeframeAnalysis {
    std::string timeframe;
    std::optional<IndicatorSnapshot> snapshot;
    std::string error;
    std::size_t dataPointCount{0};

    bool ok() const noexcept { return snapshot.has_value(); }
};

struct ConsensusSignal {
    std::optional<std::string> trendDirection;
    std::optional<double> trendConsistency;
    std::optional<double> averageRsi7;
    std::optional<std::string> rsi7Signal;
    std::optional<double> averageRsi14;
    std::optional<std::string> rsi14Signal;
    std::optional<std::string> macdConsensus;
    std::optional<double> averageAdx;
    std::optional<std::string> marketRegime;
    std::optional<double> averageBollingerPosition;
    std::optional<std::string> bollingerSignal;
    std::optional<std::string> obvConsensus;
};

struct MultiTimeframeAnalysis {
    std::string symbol;
    std::vector<TimeframeAnalysis> timeframes;
    ConsensusSignal overallSignals;
    domain::TimestampMs analysisTimestampMs{0};
};

}  // namespace indicators
