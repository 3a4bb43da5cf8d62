#include <cmath>
#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "indicators/IndicatorCalculator.h"
#include "indicators/IndicatorEngine.h"

namespace {

std::vector<domain::Kline> makeSeries(const std::vector<double>& closes, double volume = 10.0) {
    std::vector<domain::Kline> candles;
    candles.reserve(closes.size());
    long long openTime = 1'700'000'000'000LL;
    for (double close : closes) {
        domain::Kline k;
        k.symbol = "BTCUSDT";
        k.timeframe = "1h";
        k.openTime = openTime;
        k.closeTime = openTime + 3'599'999;
        k.open = close;
        k.high = close + 2.0;
        k.low = close - 2.0;
        k.close = close;
        k.volume = volume;
        k.isFinal = true;
        candles.push_back(k);
        openTime += 3'600'000;
    }
    return candles;
}

std::vector<double> rising(std::size_t count, double start = 100.0, double step = 1.0) {
    std::vector<double> closes;
    for (std::size_t i = 0; i < count; ++i) {
        closes.push_back(start + step * static_cast<double>(i));
    }
    return closes;
}

bool near(double a, double b, double tolerance = 1e-9) {
    return std::fabs(a - b) <= tolerance;
}

bool expectNear(const std::optional<double>& value, double expected, const char* what) {
    if (!value) {
        std::cerr << "Expected " << what << " to be present\n";
        return false;
    }
    if (!near(*value, expected, 1e-6)) {
        std::cerr << "Expected " << what << "=" << expected << " but got " << *value << "\n";
        return false;
    }
    return true;
}

double referenceEma(const std::vector<double>& closes, int period) {
    double value = 0.0;
    for (int i = 0; i < period; ++i) {
        value += closes[static_cast<std::size_t>(i)];
    }
    value /= period;
    const double alpha = 2.0 / (period + 1.0);
    for (std::size_t i = static_cast<std::size_t>(period); i < closes.size(); ++i) {
        value = closes[i] * alpha + value * (1.0 - alpha);
    }
    return value;
}

// Forty candles of an oscillating uptrend with uneven wicks.
const std::vector<double> kHighs = {
    101.5,  103.04, 104.13, 105.23, 105.79, 105.55, 104.63, 103.52, 102.86, 102.28,
    101.94, 102.01, 103.14, 104.76, 106.42, 107.84, 109.08, 110.28, 110.71, 110.32,
    109.3,  108.54, 107.8,  107.12, 106.69, 106.96, 108.21, 109.74, 111.27, 112.61,
    114.19, 115.28, 115.56, 115.04, 114.21, 113.53, 112.68, 111.88, 111.4,  112.04};
const std::vector<double> kLows = {
    99.0,   100.34, 101.66, 102.81, 103.14, 102.69, 102.07, 101.42, 100.15, 99.4,
    99.4,   99.75,  100.49, 101.99, 103.94, 105.28, 106.59, 107.73, 108.02, 107.56,
    106.94, 106.25, 105.0,  104.27, 104.3,  104.65, 105.42, 106.94, 108.87, 110.22,
    111.53, 112.65, 112.9,  112.42, 111.8,  111.09, 109.85, 109.14, 109.21, 109.55};
const std::vector<double> kCloses = {
    100.0,  101.65, 103.05, 103.98, 104.32, 104.08, 103.38, 102.42, 101.47, 100.78,
    100.57, 100.93, 101.88, 103.29, 104.95, 106.6,  107.98, 108.89, 109.21, 108.95,
    108.24, 107.27, 106.33, 105.65, 105.46, 105.85, 106.81, 108.24, 109.9,  111.54,
    112.91, 113.8,  114.1,  113.82, 113.09, 112.12, 111.18, 110.52, 110.35, 110.76};

std::vector<domain::Kline> makeOhlcSeries(std::size_t count) {
    auto candles = makeSeries(std::vector<double>(kCloses.begin(), kCloses.begin() + static_cast<std::ptrdiff_t>(count)));
    for (std::size_t i = 0; i < count; ++i) {
        candles[i].high = kHighs[i];
        candles[i].low = kLows[i];
    }
    return candles;
}

bool expectSeriesValue(const std::vector<double>& series, std::size_t index, double expected, double tolerance,
                       const char* what) {
    if (index >= series.size() || !std::isfinite(series[index])) {
        std::cerr << "Expected " << what << " at index " << index << " to be defined\n";
        return false;
    }
    if (!near(series[index], expected, tolerance)) {
        std::cerr << "Expected " << what << "[" << index << "]=" << expected << " but got " << series[index] << "\n";
        return false;
    }
    return true;
}

bool expectUndefinedBefore(const std::vector<double>& series, std::size_t index, const char* what) {
    for (std::size_t i = 0; i < index && i < series.size(); ++i) {
        if (std::isfinite(series[i])) {
            std::cerr << "Expected " << what << " undefined before index " << index << ", defined at " << i << "\n";
            return false;
        }
    }
    return true;
}

}  // namespace

int main() {
    using indicators::IndicatorEngine;

    // EMA20 needs twenty candles and matches the SMA-seeded recurrence.
    {
        const auto nineteen = IndicatorEngine::computeIndicators(makeSeries(rising(19)));
        if (nineteen.ema20) {
            std::cerr << "Expected ema20 to be absent with 19 candles\n";
            return 1;
        }

        const auto twentyCloses = rising(20);
        const auto twenty = IndicatorEngine::computeIndicators(makeSeries(twentyCloses));
        if (!expectNear(twenty.ema20, 109.5, "ema20 with 20 candles")) {
            return 1;
        }

        std::vector<double> closes;
        for (int i = 0; i < 60; ++i) {
            closes.push_back(100.0 + 5.0 * std::sin(i * 0.3) + i * 0.2);
        }
        const auto set = IndicatorEngine::computeIndicators(makeSeries(closes));
        if (!expectNear(set.ema20, referenceEma(closes, 20), "ema20") ||
            !expectNear(set.ema50, referenceEma(closes, 50), "ema50")) {
            return 1;
        }
    }

    // MACD line appears with 26 candles, the signal line once 9 line values exist.
    {
        const auto short25 = IndicatorEngine::computeIndicators(makeSeries(rising(25)));
        if (short25.macdLine || short25.macdSignal || short25.macdHistogram) {
            std::cerr << "Expected MACD to be absent with 25 candles\n";
            return 1;
        }
        const auto at26 = IndicatorEngine::computeIndicators(makeSeries(rising(26)));
        if (!at26.macdLine || at26.macdSignal) {
            std::cerr << "Expected MACD line without signal at 26 candles\n";
            return 1;
        }
        const auto at34 = IndicatorEngine::computeIndicators(makeSeries(rising(34)));
        if (!at34.macdLine || !at34.macdSignal || !at34.macdHistogram) {
            std::cerr << "Expected full MACD at 34 candles\n";
            return 1;
        }
        if (!near(*at34.macdHistogram, *at34.macdLine - *at34.macdSignal)) {
            std::cerr << "Expected histogram to equal line minus signal\n";
            return 1;
        }
    }

    // RSI: rising closes saturate at 100, flat closes report 0.
    {
        const auto seven = IndicatorEngine::computeIndicators(makeSeries(rising(7)));
        if (seven.rsi7) {
            std::cerr << "Expected rsi7 to be absent without a full change window\n";
            return 1;
        }
        const auto up = IndicatorEngine::computeIndicators(makeSeries(rising(20)));
        if (!expectNear(up.rsi7, 100.0, "rsi7 on rising closes") ||
            !expectNear(up.rsi14, 100.0, "rsi14 on rising closes")) {
            return 1;
        }
        const auto flat = IndicatorEngine::computeIndicators(makeSeries(std::vector<double>(20, 50.0)));
        if (!expectNear(flat.rsi14, 0.0, "rsi14 on flat closes")) {
            return 1;
        }
    }

    // Bollinger bands on a flat series collapse, so there is no position.
    {
        const auto flat = IndicatorEngine::computeIndicators(makeSeries(std::vector<double>(20, 50.0)));
        if (!expectNear(flat.bollingerUpper, 50.0, "bb upper") || !expectNear(flat.bollingerLower, 50.0, "bb lower")) {
            return 1;
        }
        if (flat.bollingerPosition || flat.bollingerSignal) {
            std::cerr << "Expected no Bollinger position for zero-width bands\n";
            return 1;
        }

        const auto up = IndicatorEngine::computeIndicators(makeSeries(rising(30)));
        if (!up.bollingerSignal || *up.bollingerSignal != "overbought") {
            std::cerr << "Expected rising closes to sit in the upper band\n";
            return 1;
        }
    }

    // OBV accumulates volume on up closes; VWAP and levels follow the trailing window.
    {
        const auto set = IndicatorEngine::computeIndicators(makeSeries(rising(20), 10.0));
        if (!expectNear(set.obv, 200.0, "obv")) {
            return 1;
        }
        if (!set.obvTrend || *set.obvTrend != "bullish") {
            std::cerr << "Expected bullish OBV trend\n";
            return 1;
        }
        if (!expectNear(set.vwap, 109.5, "vwap") || !set.vwapSignal || *set.vwapSignal != "above_vwap") {
            return 1;
        }
        if (!expectNear(set.supportLevel, 98.0, "support") || !expectNear(set.resistanceLevel, 121.0, "resistance")) {
            return 1;
        }
        if (!expectNear(set.distanceToResistancePct, 2.0 / 23.0 * 100.0, "distance to resistance")) {
            return 1;
        }

        const auto four = IndicatorEngine::computeIndicators(makeSeries(rising(4)));
        if (!four.obv || four.obvTrend || four.supportLevel) {
            std::cerr << "Expected OBV without trend or levels on four candles\n";
            return 1;
        }
    }

    // ATR-based and ADX fields need their full smoothing windows.
    {
        const auto fourteen = IndicatorEngine::computeIndicators(makeSeries(rising(14)));
        if (fourteen.natr || fourteen.adx) {
            std::cerr << "Expected NATR and ADX absent with 14 candles\n";
            return 1;
        }
        const auto fifteen = IndicatorEngine::computeIndicators(makeSeries(rising(15)));
        if (!fifteen.natr) {
            std::cerr << "Expected NATR with 15 candles\n";
            return 1;
        }
        const auto trend = IndicatorEngine::computeIndicators(makeSeries(rising(40)));
        if (!trend.adx || !trend.trendStrength || *trend.trendStrength != "strong") {
            std::cerr << "Expected strong ADX on a steady trend\n";
            return 1;
        }
    }

    // Wilder RSI14 on the classic 33-close sample series.
    {
        using indicators::IndicatorCalculator;
        const std::vector<double> closes = {44.34, 44.09, 44.15, 43.61, 44.33, 44.83, 45.10, 45.42, 45.84,
                                            46.08, 45.89, 46.03, 45.61, 46.28, 46.28, 46.00, 46.03, 46.41,
                                            46.22, 45.64, 46.21, 46.25, 45.71, 46.45, 45.78, 45.35, 44.03,
                                            44.18, 44.22, 44.57, 43.42, 42.66, 43.13};
        const std::vector<double> expected = {70.46, 66.25, 66.48, 69.35, 66.29, 57.92, 62.88,
                                              63.21, 56.01, 62.34, 54.67, 50.39, 40.02, 41.49,
                                              41.90, 45.50, 37.32, 33.09, 37.79};
        const auto rsi = IndicatorCalculator::rsi(closes, 14);
        if (!expectUndefinedBefore(rsi, 14, "rsi14")) {
            return 1;
        }
        for (std::size_t i = 0; i < expected.size(); ++i) {
            if (!expectSeriesValue(rsi, 14 + i, expected[i], 0.005, "rsi14")) {
                return 1;
            }
        }
    }

    // NATR14, ADX14 and MACD(12,26,9) against hand-computed values on a fixed OHLC series.
    {
        using indicators::IndicatorCalculator;
        const auto natr = IndicatorCalculator::natr(kHighs, kLows, kCloses, 14);
        if (!expectUndefinedBefore(natr, 14, "natr14") ||
            !expectSeriesValue(natr, 14, 2.5290954876, 1e-8, "natr14") ||
            !expectSeriesValue(natr, 39, 2.3555020195, 1e-8, "natr14")) {
            return 1;
        }

        const auto adx = IndicatorCalculator::adx(kHighs, kLows, kCloses, 14);
        if (!expectUndefinedBefore(adx, 27, "adx14") || !expectSeriesValue(adx, 27, 37.0768801454, 1e-8, "adx14") ||
            !expectSeriesValue(adx, 39, 36.8665744657, 1e-8, "adx14")) {
            return 1;
        }

        const auto macd = IndicatorCalculator::macd(kCloses, 12, 26, 9);
        if (!expectUndefinedBefore(macd.line, 25, "macd line") ||
            !expectSeriesValue(macd.line, 25, 1.6446456544, 1e-8, "macd line") ||
            !expectSeriesValue(macd.line, 39, 1.8362699382, 1e-8, "macd line") ||
            !expectUndefinedBefore(macd.signal, 33, "macd signal") ||
            !expectSeriesValue(macd.signal, 33, 2.0934814527, 1e-8, "macd signal") ||
            !expectSeriesValue(macd.signal, 39, 2.1740106864, 1e-8, "macd signal")) {
            return 1;
        }

        // The engine reports the newest value of each series.
        const auto set = IndicatorEngine::computeIndicators(makeOhlcSeries(kCloses.size()));
        if (!expectNear(set.natr, 2.3555020195, "engine natr") || !expectNear(set.adx, 36.8665744657, "engine adx") ||
            !expectNear(set.macdLine, 1.8362699382, "engine macd line") ||
            !expectNear(set.macdSignal, 2.1740106864, "engine macd signal") ||
            !expectNear(set.rsi14, 59.2223279530, "engine rsi14")) {
            return 1;
        }
        if (!set.trendStrength || *set.trendStrength != "strong") {
            std::cerr << "Expected ADX above 25 to be labelled strong\n";
            return 1;
        }

        // ADX needs 28 candles.
        if (IndicatorEngine::computeIndicators(makeOhlcSeries(27)).adx ||
            !expectNear(IndicatorEngine::computeIndicators(makeOhlcSeries(28)).adx, 37.0768801454, "adx at 28")) {
            return 1;
        }
    }

    // Snapshot carries price change against the previous close.
    {
        const auto snapshot = IndicatorEngine::computeSnapshot("BTCUSDT", "1h", makeSeries({100.0, 110.0}));
        if (snapshot.dataPointCount != 2 || !near(snapshot.currentPrice, 110.0) || !near(snapshot.priceChange, 10.0) ||
            !near(snapshot.priceChangePercent, 10.0)) {
            std::cerr << "Unexpected snapshot price fields\n";
            return 1;
        }
        const auto empty = IndicatorEngine::computeSnapshot("BTCUSDT", "1h", {});
        if (empty.dataPointCount != 0 || empty.indicators.ema20) {
            std::cerr << "Expected empty snapshot for no candles\n";
            return 1;
        }
    }

    // Calculator rejects nonsensical parameters.
    try {
        indicators::IndicatorCalculator::ema({1.0, 2.0}, 0);
        std::cerr << "Expected zero EMA period to throw\n";
        return 1;
    } catch (const std::invalid_argument&) {
    }

    std::cout << "test_indicator_engine passed\n";
    return 0;
}
