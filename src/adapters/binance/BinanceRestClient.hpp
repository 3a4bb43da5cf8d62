#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/exchange/IExchangeKlines.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::binance {

struct RestEndpoint {
    std::string host = "fapi.binance.com";
    std::string klinesPath = "/fapi/v1/klines";
    int timeoutSec = 30;
};

class BinanceRestClient : public domain::IExchangeKlines {
public:
    explicit BinanceRestClient(RestEndpoint endpoint = {});
    ~BinanceRestClient() override = default;

    // Klines oldest->newest; the newest may still be open. Throws std::runtime_error
    // on HTTP or payload failures.
    std::vector<domain::Kline> fetch_klines(const std::string& symbol,
                                            const std::string& interval,
                                            std::size_t limit) override;

    static constexpr std::size_t kMaxLimit = 1500;

private:
    RestEndpoint endpoint_;
    infra::http::TlsHttpClient http_;
};

// Wait before retrying a throttled (429) or failing (5xx) request: 1, 2, 4 ... s,
// stretched to the server's Retry-After (capped at two minutes) when that is longer.
std::chrono::milliseconds rest_backoff_delay(int attempt, std::optional<std::chrono::seconds> retryAfter);

// Decodes the array-of-arrays klines payload. Rows whose open time does not
// advance are skipped. A row is final only when its close time is before nowMs,
// so the candle still open on the exchange stays replaceable by stream updates.
std::vector<domain::Kline> parse_klines_payload(const std::string& body,
                                                const std::string& symbol,
                                                const std::string& interval,
                                                std::int64_t nowMs);

}  // namespace adapters::binance
