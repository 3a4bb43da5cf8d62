#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "adapters/binance/BinanceRestClient.hpp"
#include "adapters/binance/IntervalMap.hpp"
#include "infra/http/TlsHttpClient.hpp"

int main() {
    using adapters::binance::parse_klines_payload;

    // Array-of-arrays payload; a row that does not advance the open time is dropped.
    // The clock sits inside the second candle, so only the first one is closed.
    {
        const long long nowMs = 1714528000000LL;
        const std::string body =
            R"([[1714521600000,"60000.0","60500.0","59900.0","60400.0","12.5",1714525199999,"755000.0",420,"6.0","362000.0","0"],)"
            R"([1714525200000,"60400.0","60800.0","60300.0","60700.0","9.0",1714528799999,"546000.0",300,"4.0","242000.0","0"],)"
            R"([1714525200000,"1","1","1","1","1",1714528799999,"1",1,"1","1","0"]])";
        const auto rows = parse_klines_payload(body, "BTCUSDT", "1h", nowMs);
        if (rows.size() != 2) {
            std::cerr << "Expected two rows, got " << rows.size() << "\n";
            return 1;
        }
        const auto& first = rows.front();
        if (first.symbol != "BTCUSDT" || first.timeframe != "1h" || first.openTime != 1714521600000LL ||
            first.close != 60400.0 || first.tradeCount != 420 || !first.isFinal) {
            std::cerr << "Unexpected first row fields\n";
            return 1;
        }
        if (rows.back().close != 60700.0) {
            std::cerr << "Expected second row close 60700\n";
            return 1;
        }
        if (rows.back().isFinal) {
            std::cerr << "Expected the still-open candle to be non-final\n";
            return 1;
        }
    }

    // Once the clock passes the close time every row is final.
    {
        const std::string body =
            R"([[1714521600000,"1","2","0.5","1.5","3",1714525199999,"4",5,"1","2","0"]])";
        const auto rows = parse_klines_payload(body, "BTCUSDT", "1h", 1714525200000LL);
        if (rows.size() != 1 || !rows.front().isFinal) {
            std::cerr << "Expected a closed row to be final\n";
            return 1;
        }
    }

    // Malformed payloads raise.
    for (const char* body : {"{\"code\":-1121,\"msg\":\"Invalid symbol.\"}",
                             "[[1,2,3]]",
                             "not json",
                             "[[1714521600000.5,\"1\",\"1\",\"1\",\"1\",\"1\",1714525199999,\"1\",1,\"1\",\"1\",\"0\"]]",
                             "[[1e30,\"1\",\"1\",\"1\",\"1\",\"1\",1714525199999,\"1\",1,\"1\",\"1\",\"0\"]]"}) {
        try {
            parse_klines_payload(body, "BTCUSDT", "1h", 0);
            std::cerr << "Expected failure for payload " << body << "\n";
            return 1;
        } catch (const std::runtime_error&) {
        }
    }

    // Retry-After accepts delay-seconds only.
    {
        using infra::http::parse_retry_after;
        const auto plain = parse_retry_after(" 30 ");
        if (!plain || plain->count() != 30 || parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT") ||
            parse_retry_after("") || parse_retry_after("-5") || parse_retry_after("1.5")) {
            std::cerr << "Unexpected Retry-After parsing\n";
            return 1;
        }
    }

    // Backoff doubles per attempt and honours a longer Retry-After up to two minutes.
    {
        using adapters::binance::rest_backoff_delay;
        using std::chrono::milliseconds;
        using std::chrono::seconds;
        if (rest_backoff_delay(1, std::nullopt) != milliseconds(1000) ||
            rest_backoff_delay(3, std::nullopt) != milliseconds(4000) ||
            rest_backoff_delay(2, seconds(1)) != milliseconds(2000) ||
            rest_backoff_delay(1, seconds(10)) != milliseconds(10000) ||
            rest_backoff_delay(1, seconds(900)) != milliseconds(120000)) {
            std::cerr << "Unexpected REST backoff schedule\n";
            return 1;
        }
    }

    // Interval table.
    if (!adapters::binance::is_supported_interval("3m") || !adapters::binance::is_supported_interval("1w") ||
        adapters::binance::is_supported_interval("7m") || adapters::binance::is_supported_interval("")) {
        std::cerr << "Unexpected interval support table\n";
        return 1;
    }

    std::cout << "test_rest_payload passed\n";
    return 0;
}
