#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "domain/Types.h"

namespace core {
class CandleCache;
}

namespace app {
class MarketAnalysisService;
}

namespace mse::api {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string version;
};

struct Response {
    int statusCode{200};
    std::string statusText{"OK"};
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

// Read-only HTTP views over the running engine.
class Controllers {
public:
    using StatusProvider = std::function<domain::ConnectionStatus()>;

    static constexpr std::size_t kMaxKlinesLimit = 1000;

    Controllers(const core::CandleCache& cache,
                const app::MarketAnalysisService& analysis,
                StatusProvider statusProvider);

    Response healthz(const Request& request) const;
    Response analysis(const Request& request) const;
    Response klines(const Request& request) const;
    Response stats(const Request& request) const;

private:
    const core::CandleCache& cache_;
    const app::MarketAnalysisService& analysis_;
    StatusProvider statusProvider_;
};

}  // namespace mse::api
