#include "indicators/SignalAggregator.h"

#include <string>

#include "indicators/IndicatorEngine.h"

namespace indicators {
namespace {

class Mean {
public:
    void add(const std::optional<double>& value) {
        if (value) {
            sum_ += *value;
            ++count_;
        }
    }

    std::optional<double> value() const {
        if (count_ == 0) {
            return std::nullopt;
        }
        return sum_ / static_cast<double>(count_);
    }

private:
    double sum_{0.0};
    std::size_t count_{0};
};

// Neutral votes abstain; equal bullish and bearish counts resolve to neutral.
const char* obvConsensusLabel(std::size_t bullish, std::size_t bearish) {
    if (bullish > bearish) {
        return "bullish";
    }
    if (bearish > bullish) {
        return "bearish";
    }
    return "neutral";
}

}  // namespace

ConsensusSignal SignalAggregator::aggregate(const std::vector<TimeframeAnalysis>& timeframes) {
    ConsensusSignal consensus;

    std::size_t trendSamples = 0;
    std::size_t bullishTrends = 0;
    Mean rsi7;
    Mean rsi14;
    Mean histogram;
    Mean adx;
    Mean bollinger;
    std::size_t obvSamples = 0;
    std::size_t obvBullish = 0;
    std::size_t obvBearish = 0;

    for (const auto& entry : timeframes) {
        if (!entry.ok()) {
            continue;
        }
        const auto& ind = entry.snapshot->indicators;
        if (ind.ema20 && ind.ema50) {
            ++trendSamples;
            if (*ind.ema20 > *ind.ema50) {
                ++bullishTrends;
            }
        }
        rsi7.add(ind.rsi7);
        rsi14.add(ind.rsi14);
        histogram.add(ind.macdHistogram);
        adx.add(ind.adx);
        bollinger.add(ind.bollingerPosition);
        if (ind.obvTrend) {
            ++obvSamples;
            if (*ind.obvTrend == "bullish") {
                ++obvBullish;
            } else if (*ind.obvTrend == "bearish") {
                ++obvBearish;
            }
        }
    }

    if (trendSamples > 0) {
        const double consistency = static_cast<double>(bullishTrends) / static_cast<double>(trendSamples);
        consensus.trendConsistency = consistency;
        consensus.trendDirection = trendDirectionLabel(consistency);
    }

    consensus.averageRsi7 = rsi7.value();
    if (consensus.averageRsi7) {
        consensus.rsi7Signal = rsiLabel(*consensus.averageRsi7);
    }
    consensus.averageRsi14 = rsi14.value();
    if (consensus.averageRsi14) {
        consensus.rsi14Signal = rsiLabel(*consensus.averageRsi14);
    }

    if (const auto meanHistogram = histogram.value()) {
        consensus.macdConsensus = *meanHistogram > 0.0 ? "bullish" : "bearish";
    }

    consensus.averageAdx = adx.value();
    if (consensus.averageAdx) {
        consensus.marketRegime = marketRegimeLabel(*consensus.averageAdx);
    }

    consensus.averageBollingerPosition = bollinger.value();
    if (consensus.averageBollingerPosition) {
        consensus.bollingerSignal = IndicatorEngine::bollingerLabel(*consensus.averageBollingerPosition);
    }

    if (obvSamples > 0) {
        consensus.obvConsensus = obvConsensusLabel(obvBullish, obvBearish);
    }
    return consensus;
}

const char* SignalAggregator::trendDirectionLabel(double consistency) {
    if (consistency > 0.6) {
        return "up";
    }
    if (consistency < 0.4) {
        return "down";
    }
    return "choppy";
}

const char* SignalAggregator::rsiLabel(double rsi) {
    if (rsi > 70.0) {
        return "overbought";
    }
    if (rsi < 30.0) {
        return "oversold";
    }
    return "neutral";
}

const char* SignalAggregator::marketRegimeLabel(double adx) {
    if (adx > 25.0) {
        return "strong_trend";
    }
    if (adx < 20.0) {
        return "ranging";
    }
    return "moderate_trend";
}

}  // namespace indicators
