#include "indicators/IndicatorEngine.h"

#include <algorithm>
#include <cmath>

#include "indicators/IndicatorCalculator.h"

namespace indicators {
namespace {

struct PriceColumns {
    std::vector<double> highs;
    std::vector<double> lows;
    std::vector<double> closes;
    std::vector<double> volumes;
};

PriceColumns splitColumns(const std::vector<domain::Kline>& candles) {
    PriceColumns columns;
    columns.highs.reserve(candles.size());
    columns.lows.reserve(candles.size());
    columns.closes.reserve(candles.size());
    columns.volumes.reserve(candles.size());
    for (const auto& candle : candles) {
        columns.highs.push_back(candle.high);
        columns.lows.push_back(candle.low);
        columns.closes.push_back(candle.close);
        columns.volumes.push_back(candle.volume);
    }
    return columns;
}

std::optional<double> gated(std::size_t count, std::size_t minimum, const std::vector<double>& series) {
    if (count < minimum) {
        return std::nullopt;
    }
    return IndicatorCalculator::last(series);
}

void fillTrend(const PriceColumns& cols, IndicatorSet& out) {
    const std::size_t n = cols.closes.size();
    out.ema20 = gated(n, LookbackPolicy::kEma20, IndicatorCalculator::ema(cols.closes, 20));
    out.ema50 = gated(n, LookbackPolicy::kEma50, IndicatorCalculator::ema(cols.closes, 50));

    if (n >= LookbackPolicy::kMacd) {
        const auto macd = IndicatorCalculator::macd(cols.closes, 12, 26, 9);
        out.macdLine = IndicatorCalculator::last(macd.line);
        out.macdSignal = IndicatorCalculator::last(macd.signal);
        out.macdHistogram = IndicatorCalculator::last(macd.histogram);
    }

    if (n >= LookbackPolicy::kAdx) {
        out.adx = IndicatorCalculator::last(IndicatorCalculator::adx(cols.highs, cols.lows, cols.closes, 14));
        if (out.adx) {
            out.trendStrength = IndicatorEngine::trendStrengthLabel(*out.adx);
        }
    }
}

void fillMomentum(const PriceColumns& cols, IndicatorSet& out) {
    const std::size_t n = cols.closes.size();
    out.rsi7 = gated(n, LookbackPolicy::kRsi7, IndicatorCalculator::rsi(cols.closes, 7));
    out.rsi14 = gated(n, LookbackPolicy::kRsi14, IndicatorCalculator::rsi(cols.closes, 14));
    if (n >= LookbackPolicy::kNatr) {
        out.natr = IndicatorCalculator::last(IndicatorCalculator::natr(cols.highs, cols.lows, cols.closes, 14));
    }
}

void fillBands(const PriceColumns& cols, double price, IndicatorSet& out) {
    if (cols.closes.size() < LookbackPolicy::kBollinger) {
        return;
    }
    const auto bands = IndicatorCalculator::bollinger(cols.closes, 20, 2.0);
    if (!bands) {
        return;
    }
    out.bollingerUpper = bands->upper;
    out.bollingerMiddle = bands->middle;
    out.bollingerLower = bands->lower;

    const double width = bands->upper - bands->lower;
    if (width > 0.0) {
        const double position = (price - bands->lower) / width;
        out.bollingerPosition = position;
        out.bollingerSignal = IndicatorEngine::bollingerLabel(position);
    }
}

void fillVolume(const PriceColumns& cols, double price, IndicatorSet& out) {
    const std::size_t n = cols.closes.size();
    if (n >= LookbackPolicy::kObv) {
        const auto obv = IndicatorCalculator::obv(cols.closes, cols.volumes);
        out.obv = IndicatorCalculator::last(obv);

        if (n >= LookbackPolicy::kObvTrend) {
            const double newest = obv[n - 1];
            const double oldest = obv[n - LookbackPolicy::kObvTrend];
            const double slope = oldest != 0.0 ? (newest - oldest) / static_cast<double>(LookbackPolicy::kObvTrend) : 0.0;
            out.obvTrend = slope > 0.0 ? "bullish" : (slope < 0.0 ? "bearish" : "neutral");
        }
    }

    if (n >= LookbackPolicy::kVwap) {
        out.vwap = IndicatorCalculator::vwap(cols.closes, cols.volumes, LookbackPolicy::kVwapWindow);
        if (out.vwap) {
            out.vwapRatio = *out.vwap > 0.0 ? (price - *out.vwap) / *out.vwap * 100.0 : 0.0;
            out.vwapSignal = price > *out.vwap ? "above_vwap" : "below_vwap";
        }
    }
}

void fillLevels(const PriceColumns& cols, double price, IndicatorSet& out) {
    const std::size_t n = cols.closes.size();
    if (n < LookbackPolicy::kSupportResistance) {
        return;
    }
    const auto from = static_cast<std::ptrdiff_t>(n - LookbackPolicy::kSupportResistance);
    const double resistance = *std::max_element(cols.highs.begin() + from, cols.highs.end());
    const double support = *std::min_element(cols.lows.begin() + from, cols.lows.end());
    out.resistanceLevel = resistance;
    out.supportLevel = support;

    if (resistance > support) {
        const double range = resistance - support;
        out.distanceToResistancePct = (resistance - price) / range * 100.0;
        out.distanceToSupportPct = (price - support) / range * 100.0;
    }
}

}  // namespace

IndicatorSnapshot IndicatorEngine::computeSnapshot(const std::string& symbol,
                                                   const std::string& timeframe,
                                                   const std::vector<domain::Kline>& candles) {
    IndicatorSnapshot snapshot;
    snapshot.symbol = symbol;
    snapshot.timeframe = timeframe;
    snapshot.dataPointCount = candles.size();
    if (candles.empty()) {
        return snapshot;
    }

    snapshot.currentPrice = candles.back().close;
    snapshot.latestOpenTime = candles.back().openTime;
    if (candles.size() >= 2) {
        const double previous = candles[candles.size() - 2].close;
        snapshot.priceChange = snapshot.currentPrice - previous;
        snapshot.priceChangePercent = previous > 0.0 ? snapshot.priceChange / previous * 100.0 : 0.0;
    }

    snapshot.indicators = computeIndicators(candles);
    return snapshot;
}

IndicatorSet IndicatorEngine::computeIndicators(const std::vector<domain::Kline>& candles) {
    IndicatorSet set;
    if (candles.empty()) {
        return set;
    }

    const auto columns = splitColumns(candles);
    const double price = columns.closes.back();
    fillTrend(columns, set);
    fillMomentum(columns, set);
    fillBands(columns, price, set);
    fillVolume(columns, price, set);
    fillLevels(columns, price, set);
    return set;
}

const char* IndicatorEngine::bollingerLabel(double position) {
    if (position > 0.8) {
        return "overbought";
    }
    if (position < 0.2) {
        return "oversold";
    }
    return "normal";
}

const char* IndicatorEngine::trendStrengthLabel(double adx) {
    if (adx > 25.0) {
        return "strong";
    }
    if (adx < 20.0) {
        return "weak";
    }
    return "moderate";
}

}  // namespace indicators
