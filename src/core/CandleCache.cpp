#include "core/CandleCache.h"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <stdexcept>

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace core {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::CACHE;
}  // namespace

CandleCache::CandleCache(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("CandleCache capacity must be at least 1");
    }
}

UpsertResult CandleCache::upsert(const domain::Kline& kline) {
    std::unique_lock lock(mutex_);
    auto& series = series_[domain::SeriesKey{kline.symbol, kline.timeframe}];

    if (!series.empty()) {
        auto& last = series.back();
        if (kline.openTime < last.openTime) {
            LOG_DEBUG(kLogCategory,
                      "CandleCache reject out-of-order %s %s open_ms=%lld last_open_ms=%lld",
                      kline.symbol.c_str(),
                      kline.timeframe.c_str(),
                      kline.openTime,
                      last.openTime);
            return UpsertResult::Rejected;
        }
        if (kline.openTime == last.openTime) {
            if (last.isFinal && !kline.isFinal) {
                LOG_DEBUG(kLogCategory,
                          "CandleCache reject re-open of final %s %s open_ms=%lld",
                          kline.symbol.c_str(),
                          kline.timeframe.c_str(),
                          kline.openTime);
                return UpsertResult::Rejected;
            }
            last = kline;
            return UpsertResult::Replaced;
        }
    }

    series.push_back(kline);
    if (series.size() == 1) {
        mse::common::metrics::Registry::instance().set(mse::common::metrics::Gauge::CacheSeries,
                                                       static_cast<double>(series_.size()));
    }
    while (series.size() > capacity_) {
        series.pop_front();
    }
    return UpsertResult::Appended;
}

std::vector<domain::Kline> CandleCache::get(const std::string& symbol,
                                            const std::string& timeframe,
                                            std::size_t limit) const {
    std::shared_lock lock(mutex_);
    const auto it = series_.find(domain::SeriesKey{symbol, timeframe});
    if (it == series_.end()) {
        return {};
    }

    const auto& series = it->second;
    const std::size_t count = (limit == 0) ? series.size() : std::min(limit, series.size());
    return std::vector<domain::Kline>(std::prev(series.end(), static_cast<std::ptrdiff_t>(count)), series.end());
}

std::optional<domain::Kline> CandleCache::get_latest(const std::string& symbol, const std::string& timeframe) const {
    std::shared_lock lock(mutex_);
    const auto it = series_.find(domain::SeriesKey{symbol, timeframe});
    if (it == series_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

CacheDiagnostics CandleCache::diagnostics() const {
    CacheDiagnostics diag;
    diag.maxKlinesPerSeries = capacity_;

    std::shared_lock lock(mutex_);
    diag.totalSeries = series_.size();
    for (const auto& [key, series] : series_) {
        if (diag.symbols.empty() || diag.symbols.back().symbol != key.symbol) {
            diag.symbols.push_back(CacheDiagnostics::SymbolEntry{key.symbol, {}, 0});
        }
        auto& entry = diag.symbols.back();
        entry.timeframeCounts[key.timeframe] = series.size();
        entry.totalKlines += series.size();
    }
    diag.totalSymbols = diag.symbols.size();
    return diag;
}

const char* to_string(UpsertResult result) {
    switch (result) {
    case UpsertResult::Appended:
        return "appended";
    case UpsertResult::Replaced:
        return "replaced";
    case UpsertResult::Rejected:
        return "rejected";
    }
    return "unknown";
}

}  // namespace core
