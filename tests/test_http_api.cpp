#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "api/Controllers.hpp"
#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "http/QueryParams.hpp"
#include "app/MarketAnalysisService.hpp"
#include "core/CandleCache.h"

namespace {

void fillSeries(core::CandleCache& cache, const std::string& symbol, const std::string& tf, int count) {
    long long openTime = 1'714'521'600'000LL;
    for (int i = 0; i < count; ++i) {
        domain::Kline k;
        k.symbol = symbol;
        k.timeframe = tf;
        k.openTime = openTime;
        k.closeTime = openTime + 3'599'999;
        k.close = 100.0 + i;
        k.open = k.close - 0.5;
        k.high = k.close + 1.0;
        k.low = k.close - 1.0;
        k.volume = 5.0;
        k.isFinal = true;
        cache.upsert(k);
        openTime += 3'600'000;
    }
}

mse::api::Response get(const mse::api::Router& router, const std::string& target) {
    return router.handle(*mse::api::parse_request_head("GET " + target + " HTTP/1.1\r\nHost: test\r\n\r\n"));
}

bool expectError(const mse::api::Response& response, int status, const char* code) {
    if (response.statusCode != status) {
        std::cerr << "Expected status " << status << " got " << response.statusCode << " body=" << response.body << "\n";
        return false;
    }
    const auto body = boost::json::parse(response.body).as_object();
    if (body.at("error").as_string() != code) {
        std::cerr << "Expected error code " << code << " in " << response.body << "\n";
        return false;
    }
    return true;
}

// Sends `raw` to 127.0.0.1:port and reads until the server closes the connection.
std::string roundTrip(std::uint16_t port, const std::string& raw) {
    mse::api::UniqueFd fd(::socket(AF_INET, SOCK_STREAM, 0));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (!fd.valid() || ::connect(fd.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        return "connect failed";
    }
    std::size_t offset = 0;
    while (offset < raw.size()) {
        const auto sent = ::send(fd.get(), raw.data() + offset, raw.size() - offset, MSG_NOSIGNAL);
        if (sent <= 0) {
            break;
        }
        offset += static_cast<std::size_t>(sent);
    }
    std::string reply;
    char chunk[4096];
    for (;;) {
        const auto got = ::recv(fd.get(), chunk, sizeof(chunk), 0);
        if (got <= 0) {
            break;
        }
        reply.append(chunk, static_cast<std::size_t>(got));
    }
    return reply;
}

}  // namespace

int main() {
    core::CandleCache cache(100);
    fillSeries(cache, "BTCUSDT", "1h", 60);
    fillSeries(cache, "BTCUSDT", "4h", 10);

    app::MarketAnalysisService analysis(cache, {"3m", "1h", "4h"});
    domain::ConnectionStatus status;
    status.state = domain::ConnectionState::Connected;
    mse::api::Controllers controllers(cache, analysis, [&status]() { return status; });
    mse::api::Router router(controllers);

    // Request line parsing splits path and query and rejects malformed lines.
    {
        const auto request = mse::api::parse_request_head("GET /api/v1/klines?symbol=btcusdt&limit=5 HTTP/1.1\r\n\r\n");
        if (!request || request->method != "GET" || request->path != "/api/v1/klines" ||
            request->query != "symbol=btcusdt&limit=5" || request->version != "HTTP/1.1") {
            std::cerr << "Unexpected request line split\n";
            return 1;
        }
        for (const char* bad : {"", "GET\r\n\r\n", "GET /healthz\r\n\r\n", "GET healthz HTTP/1.1\r\n\r\n",
                                "GET /healthz FTP/1.0\r\n\r\n"}) {
            if (mse::api::parse_request_head(bad)) {
                std::cerr << "Expected malformed request line to be rejected: " << bad << "\n";
                return 1;
            }
        }

        mse::api::Response response;
        response.statusCode = 404;
        response.statusText = "Not Found";
        response.body = "{}";
        response.headers.emplace_back("Cache-Control", "no-store");
        const std::string wire = mse::api::serialize_response(response);
        const std::string expected =
            "HTTP/1.1 404 Not Found\r\nContent-Type: application/json\r\nCache-Control: no-store\r\n"
            "Content-Length: 2\r\nConnection: close\r\n\r\n{}";
        if (wire != expected) {
            std::cerr << "Unexpected serialized response: " << wire << "\n";
            return 1;
        }
    }

    // Query strings decode percent escapes and '+', and the first repeated key wins.
    {
        const mse::http::QueryParams params("symbol=btc%75sdt&interval=1h&interval=4h&note=a+b%2&flag&&limit=-3");
        if (params.get("symbol") != std::optional<std::string>("btcusdt") ||
            params.get("interval") != std::optional<std::string>("1h") ||
            params.get("note") != std::optional<std::string>("a b%2") ||
            params.get("flag") != std::optional<std::string>("") || params.get("missing") || params.size() != 6) {
            std::cerr << "Unexpected query decoding\n";
            return 1;
        }
        if (params.get_int("limit") != std::optional<std::int64_t>(-3) || params.get_int("missing")) {
            std::cerr << "Unexpected integer query values\n";
            return 1;
        }
        try {
            params.get_int("interval");
            std::cerr << "Expected a non-integer value to throw\n";
            return 1;
        } catch (const std::invalid_argument&) {
        }
    }

    // Health reflects the connection state.
    {
        const auto ok = get(router, "/healthz");
        const auto body = boost::json::parse(ok.body).as_object();
        if (ok.statusCode != 200 || body.at("connection").as_object().at("state").as_string() != "connected") {
            std::cerr << "Expected healthy response, got " << ok.body << "\n";
            return 1;
        }
        if (body.at("cache").as_object().at("total_series").to_number<std::int64_t>() != 2) {
            std::cerr << "Expected cache diagnostics in health payload\n";
            return 1;
        }

        status.state = domain::ConnectionState::TerminallyFailed;
        status.lastError = "connect refused";
        const auto failed = get(router, "/healthz");
        if (failed.statusCode != 503) {
            std::cerr << "Expected 503 when ingestion terminally failed\n";
            return 1;
        }
        status.state = domain::ConnectionState::Connected;
    }

    // Klines endpoint validates its query and returns the newest rows oldest first.
    {
        if (!expectError(get(router, "/api/v1/klines?interval=1h"), 400, "symbol_required") ||
            !expectError(get(router, "/api/v1/klines?symbol=BTCUSDT&interval=7x"), 400, "interval_invalid") ||
            !expectError(get(router, "/api/v1/klines?symbol=BTCUSDT&interval=1h&limit=abc"), 400, "limit_invalid") ||
            !expectError(get(router, "/api/v1/klines?symbol=BTCUSDT&interval=1h&limit=0"), 400, "limit_invalid")) {
            return 1;
        }

        const auto response = get(router, "/api/v1/klines?symbol=btcusdt&interval=1h&limit=3");
        if (response.statusCode != 200) {
            std::cerr << "Expected klines 200, got " << response.statusCode << "\n";
            return 1;
        }
        const auto body = boost::json::parse(response.body).as_object();
        const auto& data = body.at("data").as_array();
        if (data.size() != 3 || body.at("symbol").as_string() != "BTCUSDT") {
            std::cerr << "Expected three BTCUSDT rows, got " << response.body << "\n";
            return 1;
        }
        const auto firstClose = data.at(0).as_object().at("close").to_number<double>();
        const auto lastClose = data.at(2).as_object().at("close").to_number<double>();
        if (firstClose != 157.0 || lastClose != 159.0) {
            std::cerr << "Expected closes 157..159 oldest first\n";
            return 1;
        }
    }

    // Analysis reports per-timeframe results and the consensus block.
    {
        if (!expectError(get(router, "/api/v1/analysis"), 400, "symbol_required")) {
            return 1;
        }
        const auto response = get(router, "/api/v1/analysis?symbol=btcusdt");
        if (response.statusCode != 200) {
            std::cerr << "Expected analysis 200, got " << response.statusCode << "\n";
            return 1;
        }
        const auto body = boost::json::parse(response.body).as_object();
        const auto& timeframes = body.at("timeframes").as_object();
        if (body.at("symbol").as_string() != "BTCUSDT" || timeframes.size() != 3) {
            std::cerr << "Unexpected analysis payload " << response.body << "\n";
            return 1;
        }
        if (timeframes.at("3m").as_object().at("error").as_string() != "no cached data") {
            std::cerr << "Expected empty timeframe to report no cached data\n";
            return 1;
        }
        if (!timeframes.at("1h").as_object().at("ema20").is_double()) {
            std::cerr << "Expected ema20 on the 1h timeframe\n";
            return 1;
        }
        const auto& overall = body.at("overall_signals").as_object();
        if (overall.at("trend_direction").as_string() != "up") {
            std::cerr << "Expected upward trend consensus\n";
            return 1;
        }
    }

    // Unknown routes and stats.
    {
        if (!expectError(get(router, "/nope"), 404, "not_found")) {
            return 1;
        }
        const auto stats = get(router, "/stats");
        const auto body = boost::json::parse(stats.body).as_object();
        if (stats.statusCode != 200 || !body.at("routes").as_object().contains("GET /healthz")) {
            std::cerr << "Expected route metrics in stats, got " << stats.body << "\n";
            return 1;
        }
        if (body.at("routes").as_object().contains("GET /nope")) {
            std::cerr << "Expected unknown routes to stay out of the route counts\n";
            return 1;
        }
        const auto& counters = body.at("counters").as_object();
        const auto& gauges = body.at("gauges").as_object();
        if (!counters.contains("frames_received_total") || !counters.contains("klines_rejected_total") ||
            !gauges.contains("ws_state") || !gauges.contains("cache_series")) {
            std::cerr << "Expected ingestion counters and gauges in stats, got " << stats.body << "\n";
            return 1;
        }
    }

    // Loopback round trip through the socket server.
    {
        mse::api::HttpServer server(router, mse::api::Endpoint{"127.0.0.1", 0}, 2);
        server.start();
        if (!server.running() || server.boundPort() == 0) {
            std::cerr << "Expected the server to bind an ephemeral port\n";
            return 1;
        }

        const std::string healthz = roundTrip(server.boundPort(), "GET /healthz HTTP/1.1\r\nHost: test\r\n\r\n");
        if (healthz.rfind("HTTP/1.1 200 OK\r\n", 0) != 0 || healthz.find("Connection: close\r\n") == std::string::npos ||
            healthz.find("\"connected\"") == std::string::npos) {
            std::cerr << "Unexpected /healthz over the socket: " << healthz << "\n";
            return 1;
        }

        const std::string garbage = roundTrip(server.boundPort(), "HELLO\r\n\r\n");
        if (garbage.rfind("HTTP/1.1 400 Bad Request\r\n", 0) != 0 || garbage.find("bad_request") == std::string::npos) {
            std::cerr << "Expected 400 for a malformed request line, got " << garbage << "\n";
            return 1;
        }

        const std::string oversized =
            roundTrip(server.boundPort(), "GET /healthz HTTP/1.1\r\nX-Pad: " + std::string(9000, 'a') + "\r\n\r\n");
        if (oversized.rfind("HTTP/1.1 431 ", 0) != 0) {
            std::cerr << "Expected 431 for an oversized request head, got " << oversized.substr(0, 64) << "\n";
            return 1;
        }

        server.stop();
        if (server.running()) {
            std::cerr << "Expected the server to stop\n";
            return 1;
        }
    }

    std::cout << "test_http_api passed\n";
    return 0;
}
