#include "indicators/IndicatorCalculator.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace indicators {
namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double smoothingFactor(int period) {
    return 2.0 / (static_cast<double>(period) + 1.0);
}

void requirePositive(int period, const char* name) {
    if (period <= 0) {
        throw std::invalid_argument(std::string(name) + " period must be positive");
    }
}

void requireSameSize(std::size_t a, std::size_t b, std::size_t c) {
    if (a != b || b != c) {
        throw std::invalid_argument("high/low/close series must have equal length");
    }
}

std::vector<double> trueRange(const std::vector<double>& highs,
                              const std::vector<double>& lows,
                              const std::vector<double>& closes) {
    std::vector<double> tr(closes.size(), kNaN);
    for (std::size_t i = 1; i < closes.size(); ++i) {
        const double prevClose = closes[i - 1];
        tr[i] = std::max({highs[i] - lows[i], std::fabs(highs[i] - prevClose), std::fabs(lows[i] - prevClose)});
    }
    return tr;
}

}  // namespace

std::vector<double> IndicatorCalculator::ema(const std::vector<double>& values, int period) {
    requirePositive(period, "EMA");
    std::vector<double> out(values.size(), kNaN);

    std::size_t start = 0;
    while (start < values.size() && !std::isfinite(values[start])) {
        ++start;
    }
    const auto p = static_cast<std::size_t>(period);
    if (values.size() - start < p) {
        return out;
    }

    double sum = 0.0;
    for (std::size_t i = start; i < start + p; ++i) {
        sum += values[i];
    }
    double value = sum / static_cast<double>(period);
    out[start + p - 1] = value;

    const double alpha = smoothingFactor(period);
    for (std::size_t i = start + p; i < values.size(); ++i) {
        value = (values[i] - value) * alpha + value;
        out[i] = value;
    }
    return out;
}

std::vector<double> IndicatorCalculator::rsi(const std::vector<double>& closes, int period) {
    requirePositive(period, "RSI");
    std::vector<double> out(closes.size(), kNaN);
    const auto p = static_cast<std::size_t>(period);
    if (closes.size() <= p) {
        return out;
    }

    double avgGain = 0.0;
    double avgLoss = 0.0;
    for (std::size_t i = 1; i <= p; ++i) {
        const double change = closes[i] - closes[i - 1];
        if (change > 0) {
            avgGain += change;
        } else {
            avgLoss -= change;
        }
    }
    avgGain /= static_cast<double>(period);
    avgLoss /= static_cast<double>(period);

    auto toRsi = [](double gain, double loss) {
        const double total = gain + loss;
        return total == 0.0 ? 0.0 : 100.0 * gain / total;
    };
    out[p] = toRsi(avgGain, avgLoss);

    for (std::size_t i = p + 1; i < closes.size(); ++i) {
        const double change = closes[i] - closes[i - 1];
        const double gain = change > 0 ? change : 0.0;
        const double loss = change < 0 ? -change : 0.0;
        avgGain = (avgGain * static_cast<double>(period - 1) + gain) / static_cast<double>(period);
        avgLoss = (avgLoss * static_cast<double>(period - 1) + loss) / static_cast<double>(period);
        out[i] = toRsi(avgGain, avgLoss);
    }
    return out;
}

IndicatorCalculator::MacdSeries IndicatorCalculator::macd(const std::vector<double>& closes,
                                                          int fastPeriod,
                                                          int slowPeriod,
                                                          int signalPeriod) {
    requirePositive(fastPeriod, "MACD fast");
    requirePositive(slowPeriod, "MACD slow");
    requirePositive(signalPeriod, "MACD signal");
    if (fastPeriod >= slowPeriod) {
        throw std::invalid_argument("MACD fast period must be shorter than slow period");
    }

    MacdSeries result;
    const auto fast = ema(closes, fastPeriod);
    const auto slow = ema(closes, slowPeriod);

    result.line.assign(closes.size(), kNaN);
    for (std::size_t i = 0; i < closes.size(); ++i) {
        if (std::isfinite(fast[i]) && std::isfinite(slow[i])) {
            result.line[i] = fast[i] - slow[i];
        }
    }

    result.signal = ema(result.line, signalPeriod);
    result.histogram.assign(closes.size(), kNaN);
    for (std::size_t i = 0; i < closes.size(); ++i) {
        if (std::isfinite(result.line[i]) && std::isfinite(result.signal[i])) {
            result.histogram[i] = result.line[i] - result.signal[i];
        }
    }
    return result;
}

std::vector<double> IndicatorCalculator::atr(const std::vector<double>& highs,
                                             const std::vector<double>& lows,
                                             const std::vector<double>& closes,
                                             int period) {
    requirePositive(period, "ATR");
    requireSameSize(highs.size(), lows.size(), closes.size());
    std::vector<double> out(closes.size(), kNaN);
    const auto p = static_cast<std::size_t>(period);
    if (closes.size() <= p) {
        return out;
    }

    const auto tr = trueRange(highs, lows, closes);
    double value = 0.0;
    for (std::size_t i = 1; i <= p; ++i) {
        value += tr[i];
    }
    value /= static_cast<double>(period);
    out[p] = value;

    for (std::size_t i = p + 1; i < closes.size(); ++i) {
        value = (value * static_cast<double>(period - 1) + tr[i]) / static_cast<double>(period);
        out[i] = value;
    }
    return out;
}

std::vector<double> IndicatorCalculator::natr(const std::vector<double>& highs,
                                              const std::vector<double>& lows,
                                              const std::vector<double>& closes,
                                              int period) {
    auto out = atr(highs, lows, closes, period);
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (!std::isfinite(out[i])) {
            continue;
        }
        out[i] = closes[i] != 0.0 ? out[i] / closes[i] * 100.0 : 0.0;
    }
    return out;
}

std::vector<double> IndicatorCalculator::adx(const std::vector<double>& highs,
                                             const std::vector<double>& lows,
                                             const std::vector<double>& closes,
                                             int period) {
    requirePositive(period, "ADX");
    requireSameSize(highs.size(), lows.size(), closes.size());
    const std::size_t n = closes.size();
    const auto p = static_cast<std::size_t>(period);
    std::vector<double> out(n, kNaN);
    if (n < 2 * p) {
        return out;
    }

    const auto tr = trueRange(highs, lows, closes);
    std::vector<double> plusDm(n, 0.0);
    std::vector<double> minusDm(n, 0.0);
    for (std::size_t i = 1; i < n; ++i) {
        const double up = highs[i] - highs[i - 1];
        const double down = lows[i - 1] - lows[i];
        plusDm[i] = (up > down && up > 0) ? up : 0.0;
        minusDm[i] = (down > up && down > 0) ? down : 0.0;
    }

    // TA-Lib seeding: sums over the first period-1 moves, then one Wilder step per bar.
    double smoothTr = 0.0;
    double smoothPlus = 0.0;
    double smoothMinus = 0.0;
    for (std::size_t i = 1; i < p; ++i) {
        smoothTr += tr[i];
        smoothPlus += plusDm[i];
        smoothMinus += minusDm[i];
    }

    // NaN when the range or the directional sum is zero; such bars leave ADX unchanged.
    auto directionalIndex = [](double plus, double minus, double range) {
        if (range == 0.0) {
            return kNaN;
        }
        const double plusDi = 100.0 * plus / range;
        const double minusDi = 100.0 * minus / range;
        const double total = plusDi + minusDi;
        return total == 0.0 ? kNaN : 100.0 * std::fabs(plusDi - minusDi) / total;
    };

    const double decay = static_cast<double>(period);
    std::vector<double> dx(n, kNaN);
    for (std::size_t i = p; i < n; ++i) {
        smoothTr = smoothTr - smoothTr / decay + tr[i];
        smoothPlus = smoothPlus - smoothPlus / decay + plusDm[i];
        smoothMinus = smoothMinus - smoothMinus / decay + minusDm[i];
        dx[i] = directionalIndex(smoothPlus, smoothMinus, smoothTr);
    }

    const std::size_t first = 2 * p - 1;
    double value = 0.0;
    for (std::size_t i = p; i <= first; ++i) {
        if (std::isfinite(dx[i])) {
            value += dx[i];
        }
    }
    value /= decay;
    out[first] = value;
    for (std::size_t i = first + 1; i < n; ++i) {
        if (std::isfinite(dx[i])) {
            value = (value * (decay - 1.0) + dx[i]) / decay;
        }
        out[i] = value;
    }
    return out;
}

std::vector<double> IndicatorCalculator::obv(const std::vector<double>& closes, const std::vector<double>& volumes) {
    if (closes.size() != volumes.size()) {
        throw std::invalid_argument("close/volume series must have equal length");
    }
    std::vector<double> out(closes.size(), kNaN);
    if (closes.empty()) {
        return out;
    }

    double value = volumes[0];
    out[0] = value;
    for (std::size_t i = 1; i < closes.size(); ++i) {
        if (closes[i] > closes[i - 1]) {
            value += volumes[i];
        } else if (closes[i] < closes[i - 1]) {
            value -= volumes[i];
        }
        out[i] = value;
    }
    return out;
}

std::optional<IndicatorCalculator::Bands> IndicatorCalculator::bollinger(const std::vector<double>& closes,
                                                                         int period,
                                                                         double deviations) {
    requirePositive(period, "Bollinger");
    const auto p = static_cast<std::size_t>(period);
    if (closes.size() < p) {
        return std::nullopt;
    }

    const auto begin = closes.end() - static_cast<std::ptrdiff_t>(p);
    double sum = 0.0;
    for (auto it = begin; it != closes.end(); ++it) {
        sum += *it;
    }
    const double mean = sum / static_cast<double>(period);

    double variance = 0.0;
    for (auto it = begin; it != closes.end(); ++it) {
        variance += (*it - mean) * (*it - mean);
    }
    const double stddev = std::sqrt(variance / static_cast<double>(period));

    return Bands{mean + deviations * stddev, mean, mean - deviations * stddev};
}

std::optional<double> IndicatorCalculator::vwap(const std::vector<double>& closes,
                                                const std::vector<double>& volumes,
                                                std::size_t window) {
    if (closes.size() != volumes.size()) {
        throw std::invalid_argument("close/volume series must have equal length");
    }
    const std::size_t lookback = std::min(window, closes.size());
    if (lookback == 0) {
        return std::nullopt;
    }

    double weighted = 0.0;
    double totalVolume = 0.0;
    for (std::size_t i = closes.size() - lookback; i < closes.size(); ++i) {
        weighted += closes[i] * volumes[i];
        totalVolume += volumes[i];
    }
    if (totalVolume <= 0.0) {
        return std::nullopt;
    }
    return weighted / totalVolume;
}

std::optional<double> IndicatorCalculator::last(const std::vector<double>& series) {
    if (series.empty() || !std::isfinite(series.back())) {
        return std::nullopt;
    }
    return series.back();
}

}  // namespace indicators
