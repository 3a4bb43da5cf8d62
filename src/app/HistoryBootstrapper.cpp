#include "app/HistoryBootstrapper.hpp"

#include <exception>

#include "logging/Log.h"

namespace app {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::DATA;
}  // namespace

HistoryBootstrapper::HistoryBootstrapper(domain::IExchangeKlines& source, core::CandleCache& cache)
    : source_(source), cache_(cache) {}

HistoryBootstrapper::Report HistoryBootstrapper::run(const std::vector<std::string>& symbols,
                                                     const std::vector<std::string>& timeframes,
                                                     std::size_t limit) {
    Report report;
    LOG_INFO(kLogCategory,
             "History bootstrap starting symbols=%zu timeframes=%zu limit=%zu",
             symbols.size(),
             timeframes.size(),
             limit);

    for (const auto& symbol : symbols) {
        for (const auto& timeframe : timeframes) {
            std::vector<domain::Kline> klines;
            try {
                klines = source_.fetch_klines(symbol, timeframe, limit);
            } catch (const std::exception& ex) {
                ++report.pairsFailed;
                LOG_WARN(kLogCategory,
                         "History bootstrap failed for %s %s: %s",
                         symbol.c_str(),
                         timeframe.c_str(),
                         ex.what());
                continue;
            }

            std::size_t accepted = 0;
            for (const auto& kline : klines) {
                if (cache_.upsert(kline) != core::UpsertResult::Rejected) {
                    ++accepted;
                }
            }
            ++report.pairsLoaded;
            report.klinesAccepted += accepted;
            LOG_INFO(kLogCategory,
                     "Initialized %s %s with %zu historical klines",
                     symbol.c_str(),
                     timeframe.c_str(),
                     accepted);
        }
    }

    LOG_INFO(kLogCategory,
             "History bootstrap finished loaded=%zu failed=%zu klines=%zu",
             report.pairsLoaded,
             report.pairsFailed,
             report.klinesAccepted);
    return report;
}

}  // namespace app
