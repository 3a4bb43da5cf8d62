#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/CandleCache.h"
#include "domain/exchange/IExchangeKlines.hpp"

namespace app {

// Warms the cache from the REST history endpoint before streaming starts.
class HistoryBootstrapper {
public:
    struct Report {
        std::size_t pairsLoaded{0};
        std::size_t pairsFailed{0};
        std::size_t klinesAccepted{0};
    };

    HistoryBootstrapper(domain::IExchangeKlines& source, core::CandleCache& cache);

    // A failing (symbol, timeframe) pair is logged and skipped.
    Report run(const std::vector<std::string>& symbols,
               const std::vector<std::string>& timeframes,
               std::size_t limit);

private:
    domain::IExchangeKlines& source_;
    core::CandleCache& cache_;
};

}  // namespace app
