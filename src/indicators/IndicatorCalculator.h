#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace indicators {

// Series-level indicator math. Every output is aligned with its input and
// holds NaN until enough history exists for a defined value.
class IndicatorCalculator {
public:
    struct MacdSeries {
        std::vector<double> line;
        std::vector<double> signal;
        std::vector<double> histogram;
    };

    struct Bands {
        double upper{0.0};
        double middle{0.0};
        double lower{0.0};
    };

    // SMA-seeded EMA. Leading NaN values are skipped, so the function also
    // smooths series that are themselves derived (e.g. the MACD line).
    static std::vector<double> ema(const std::vector<double>& values, int period);

    static std::vector<double> rsi(const std::vector<double>& closes, int period);

    static MacdSeries macd(const std::vector<double>& closes, int fastPeriod, int slowPeriod, int signalPeriod);

    static std::vector<double> atr(const std::vector<double>& highs,
                                   const std::vector<double>& lows,
                                   const std::vector<double>& closes,
                                   int period);

    static std::vector<double> natr(const std::vector<double>& highs,
                                    const std::vector<double>& lows,
                                    const std::vector<double>& closes,
                                    int period);

    static std::vector<double> adx(const std::vector<double>& highs,
                                   const std::vector<double>& lows,
                                   const std::vector<double>& closes,
                                   int period);

    static std::vector<double> obv(const std::vector<double>& closes, const std::vector<double>& volumes);

    // Bands over the trailing `period` closes (population standard deviation).
    static std::optional<Bands> bollinger(const std::vector<double>& closes, int period, double deviations);

    // Volume-weighted close over the trailing `window` candles; nullopt when volume sums to zero.
    static std::optional<double> vwap(const std::vector<double>& closes,
                                      const std::vector<double>& volumes,
                                      std::size_t window);

    static std::optional<double> last(const std::vector<double>& series);
};

}  // namespace indicators
