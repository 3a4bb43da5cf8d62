#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace core {

enum class UpsertResult { Appended, Replaced, Rejected };

struct CacheDiagnostics {
    struct SymbolEntry {
        std::string symbol;
        std::map<std::string, std::size_t> timeframeCounts;
        std::size_t totalKlines{0};
    };

    std::size_t totalSymbols{0};
    std::size_t totalSeries{0};
    std::size_t maxKlinesPerSeries{0};
    std::vector<SymbolEntry> symbols;
};

// Bounded rolling window of klines per (symbol, timeframe).
// Writes take the exclusive lock; reads copy under a shared lock so callers never hold it.
class CandleCache {
public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit CandleCache(std::size_t capacity = kDefaultCapacity);

    UpsertResult upsert(const domain::Kline& kline);

    // Most recent `limit` entries oldest->newest; limit == 0 returns the whole series.
    std::vector<domain::Kline> get(const std::string& symbol,
                                   const std::string& timeframe,
                                   std::size_t limit = 0) const;

    std::optional<domain::Kline> get_latest(const std::string& symbol, const std::string& timeframe) const;

    CacheDiagnostics diagnostics() const;

    std::size_t capacity() const noexcept { return capacity_; }

private:
    using Series = std::deque<domain::Kline>;

    const std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::map<domain::SeriesKey, Series> series_;
};

const char* to_string(UpsertResult result);

}  // namespace core
