#include "http/MarketJson.hpp"

#include <cstdio>
#include <ctime>
#include <optional>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>

namespace mse::http {
namespace {

void put(boost::json::object& obj, const char* key, const std::optional<double>& value) {
    if (value) {
        obj[key] = *value;
    } else {
        obj[key] = nullptr;
    }
}

void put(boost::json::object& obj, const char* key, const std::optional<std::string>& value) {
    if (value) {
        obj[key] = *value;
    } else {
        obj[key] = nullptr;
    }
}

// Consensus fields are omitted entirely when nothing contributed to them.
template <typename T>
void put_if(boost::json::object& obj, const char* key, const std::optional<T>& value) {
    if (value) {
        obj[key] = *value;
    }
}

}  // namespace

std::string format_iso8601_utc(domain::TimestampMs epochMs) {
    const std::time_t seconds = static_cast<std::time_t>(epochMs / 1000);
    const int millis = static_cast<int>(epochMs % 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);

    char buffer[32];
    std::snprintf(buffer,
                  sizeof(buffer),
                  "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900,
                  tm.tm_mon + 1,
                  tm.tm_mday,
                  tm.tm_hour,
                  tm.tm_min,
                  tm.tm_sec,
                  millis);
    return buffer;
}

boost::json::value to_json(const domain::Kline& kline) {
    boost::json::object obj;
    obj["symbol"] = kline.symbol;
    obj["timeframe"] = kline.timeframe;
    obj["open_time"] = kline.openTime;
    obj["close_time"] = kline.closeTime;
    obj["open"] = kline.open;
    obj["high"] = kline.high;
    obj["low"] = kline.low;
    obj["close"] = kline.close;
    obj["volume"] = kline.volume;
    obj["quote_volume"] = kline.quoteVolume;
    obj["trade_count"] = kline.tradeCount;
    obj["taker_buy_base_volume"] = kline.takerBuyBaseVolume;
    obj["taker_buy_quote_volume"] = kline.takerBuyQuoteVolume;
    obj["is_final"] = kline.isFinal;
    return obj;
}

boost::json::value to_json(const std::vector<domain::Kline>& klines) {
    boost::json::array arr;
    arr.reserve(klines.size());
    for (const auto& kline : klines) {
        arr.push_back(to_json(kline));
    }
    return arr;
}

boost::json::value to_json(const core::CacheDiagnostics& diagnostics) {
    boost::json::object obj;
    obj["total_symbols"] = diagnostics.totalSymbols;
    obj["total_series"] = diagnostics.totalSeries;
    obj["max_klines_per_series"] = diagnostics.maxKlinesPerSeries;

    boost::json::object symbols;
    for (const auto& entry : diagnostics.symbols) {
        boost::json::object timeframes;
        for (const auto& [timeframe, count] : entry.timeframeCounts) {
            timeframes[timeframe] = count;
        }
        boost::json::object symbolObj;
        symbolObj["timeframes"] = std::move(timeframes);
        symbolObj["total_klines"] = entry.totalKlines;
        symbols[entry.symbol] = std::move(symbolObj);
    }
    obj["symbols"] = std::move(symbols);
    return obj;
}

boost::json::value to_json(const domain::ConnectionStatus& status) {
    boost::json::object obj;
    obj["state"] = domain::to_string(status.state);
    obj["reconnect_count"] = status.reconnectCount;
    if (status.lastMessageTimeMs) {
        obj["last_message_time"] = format_iso8601_utc(*status.lastMessageTimeMs);
    } else {
        obj["last_message_time"] = nullptr;
    }
    if (status.lastError.empty()) {
        obj["last_error"] = nullptr;
    } else {
        obj["last_error"] = status.lastError;
    }
    return obj;
}

boost::json::value to_json(const indicators::IndicatorSnapshot& snapshot) {
    const auto& ind = snapshot.indicators;
    boost::json::object obj;
    obj["current_price"] = snapshot.currentPrice;
    obj["price_change"] = snapshot.priceChange;
    obj["price_change_percent"] = snapshot.priceChangePercent;
    obj["data_points"] = snapshot.dataPointCount;
    obj["latest_open_time"] = snapshot.latestOpenTime;
    obj["latest_timestamp"] = format_iso8601_utc(snapshot.latestOpenTime);
    put(obj, "ema20", ind.ema20);
    put(obj, "ema50", ind.ema50);
    put(obj, "macd_line", ind.macdLine);
    put(obj, "macd_signal", ind.macdSignal);
    put(obj, "macd_histogram", ind.macdHistogram);
    put(obj, "rsi7", ind.rsi7);
    put(obj, "rsi14", ind.rsi14);
    put(obj, "natr", ind.natr);
    put(obj, "bb_upper", ind.bollingerUpper);
    put(obj, "bb_middle", ind.bollingerMiddle);
    put(obj, "bb_lower", ind.bollingerLower);
    put(obj, "bb_position", ind.bollingerPosition);
    put(obj, "bb_signal", ind.bollingerSignal);
    put(obj, "adx", ind.adx);
    put(obj, "trend_strength", ind.trendStrength);
    put(obj, "obv", ind.obv);
    put(obj, "obv_trend", ind.obvTrend);
    put(obj, "vwap", ind.vwap);
    put(obj, "vwap_ratio", ind.vwapRatio);
    put(obj, "vwap_signal", ind.vwapSignal);
    put(obj, "support_level", ind.supportLevel);
    put(obj, "resistance_level", ind.resistanceLevel);
    put(obj, "distance_to_support_pct", ind.distanceToSupportPct);
    put(obj, "distance_to_resistance_pct", ind.distanceToResistancePct);
    return obj;
}

boost::json::value to_json(const indicators::ConsensusSignal& consensus) {
    boost::json::object obj;
    put_if(obj, "trend_direction", consensus.trendDirection);
    put_if(obj, "trend_consistency", consensus.trendConsistency);
    put_if(obj, "avg_rsi7", consensus.averageRsi7);
    put_if(obj, "rsi7_signal", consensus.rsi7Signal);
    put_if(obj, "avg_rsi14", consensus.averageRsi14);
    put_if(obj, "rsi14_signal", consensus.rsi14Signal);
    put_if(obj, "macd_consensus", consensus.macdConsensus);
    put_if(obj, "avg_adx", consensus.averageAdx);
    put_if(obj, "market_regime", consensus.marketRegime);
    put_if(obj, "avg_bb_position", consensus.averageBollingerPosition);
    put_if(obj, "bb_signal", consensus.bollingerSignal);
    put_if(obj, "obv_consensus", consensus.obvConsensus);
    return obj;
}

boost::json::value to_json(const indicators::MultiTimeframeAnalysis& analysis) {
    boost::json::object timeframes;
    for (const auto& entry : analysis.timeframes) {
        if (entry.ok()) {
            timeframes[entry.timeframe] = to_json(*entry.snapshot);
        } else {
            boost::json::object error;
            error["error"] = entry.error;
            error["data_points"] = entry.dataPointCount;
            timeframes[entry.timeframe] = std::move(error);
        }
    }

    boost::json::object obj;
    obj["symbol"] = analysis.symbol;
    obj["timeframes"] = std::move(timeframes);
    obj["overall_signals"] = to_json(analysis.overallSignals);
    obj["analysis_timestamp"] = format_iso8601_utc(analysis.analysisTimestampMs);
    return obj;
}

}  // namespace mse::http
