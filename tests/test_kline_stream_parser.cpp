#include <iostream>
#include <string>

#include "adapters/binance/KlineStreamParser.hpp"

namespace {

using adapters::binance::FrameKind;
using adapters::binance::StreamFrameError;
using adapters::binance::parse_stream_frame;

const std::string kKlineFrame = R"({"stream":"btcusdt@kline_3m","data":{"e":"kline","E":1714564805000,"s":"BTCUSDT",)"
                                R"("k":{"t":1714564800000,"T":1714564979999,"s":"BTCUSDT","i":"3m","o":"60000.10",)"
                                R"("h":"60100.00","l":"59950.50","c":"60050.25","v":"12.5","n":321,"x":false,)"
                                R"("q":"750000.0","V":"6.25","Q":"375000.0","B":"0"}}})";

bool expectThrows(const std::string& payload, const char* what) {
    try {
        parse_stream_frame(payload);
    } catch (const StreamFrameError&) {
        return true;
    }
    std::cerr << "Expected StreamFrameError for " << what << "\n";
    return false;
}

}  // namespace

int main() {
    // Kline update envelope.
    {
        const auto frame = parse_stream_frame(kKlineFrame);
        if (frame.kind != FrameKind::KlineUpdate || !frame.kline) {
            std::cerr << "Expected kline frame, got " << adapters::binance::to_string(frame.kind) << "\n";
            return 1;
        }
        const auto& k = *frame.kline;
        if (k.symbol != "BTCUSDT" || k.timeframe != "3m" || k.openTime != 1714564800000LL ||
            k.closeTime != 1714564979999LL || k.close != 60050.25 || k.high != 60100.0 || k.tradeCount != 321 ||
            k.isFinal) {
            std::cerr << "Unexpected kline fields\n";
            return 1;
        }
    }

    // Interval falls back to the stream name, symbol to the inner object.
    {
        const std::string payload = R"({"stream":"ethusdt@kline_4h","data":{"k":{"t":1,"T":2,"s":"ethusdt","o":1,)"
                                    R"("h":2,"l":0.5,"c":1.5,"v":3,"n":4,"x":true,"q":4.5,"V":1,"Q":1.5}}})";
        const auto frame = parse_stream_frame(payload);
        if (!frame.kline || frame.kline->symbol != "ETHUSDT" || frame.kline->timeframe != "4h" ||
            !frame.kline->isFinal) {
            std::cerr << "Expected fallback symbol/interval resolution\n";
            return 1;
        }
    }

    // Acknowledgement and error envelopes.
    {
        const auto ack = parse_stream_frame(R"({"result":null,"id":7})");
        if (ack.kind != FrameKind::SubscriptionAck || !ack.id || *ack.id != 7) {
            std::cerr << "Expected subscription ack with id 7\n";
            return 1;
        }
        const auto error = parse_stream_frame(R"({"error":{"code":2,"msg":"Invalid request"},"id":3})");
        if (error.kind != FrameKind::Error || error.detail != "Invalid request") {
            std::cerr << "Expected error frame with detail\n";
            return 1;
        }
        const auto other = parse_stream_frame(R"({"stream":"btcusdt@trade","data":{"e":"trade"}})");
        if (other.kind != FrameKind::Unrecognized) {
            std::cerr << "Expected unrecognized frame for non-kline stream\n";
            return 1;
        }
    }

    // Malformed payloads and invalid klines raise.
    if (!expectThrows("{not json", "invalid JSON") || !expectThrows("[1,2,3]", "array payload") ||
        !expectThrows(R"({"data":{"k":{"t":1,"T":2,"s":"X","i":"1m","o":1,"h":2,"l":0.5,"c":1,"v":1,"n":1,"q":1,"V":1,"Q":1}}})",
                      "missing close flag") ||
        !expectThrows(R"({"data":{"k":{"t":10,"T":5,"s":"X","i":"1m","o":1,"h":2,"l":0.5,"c":1,"v":1,"n":1,"x":true,"q":1,"V":1,"Q":1}}})",
                      "close before open") ||
        !expectThrows(R"({"data":{"k":{"t":1,"T":2,"s":"X","i":"1m","o":1,"h":0.1,"l":0.5,"c":1,"v":1,"n":1,"x":true,"q":1,"V":1,"Q":1}}})",
                      "high below low") ||
        !expectThrows(R"({"data":{"k":{"t":1,"T":2,"s":"X","i":"1m","o":"abc","h":2,"l":0.5,"c":1,"v":1,"n":1,"x":true,"q":1,"V":1,"Q":1}}})",
                      "non-numeric price") ||
        !expectThrows(R"({"data":{"k":{"t":1.5,"T":2,"s":"X","i":"1m","o":1,"h":2,"l":0.5,"c":1,"v":1,"n":1,"x":true,"q":1,"V":1,"Q":1}}})",
                      "fractional open time") ||
        !expectThrows(R"({"data":{"k":{"t":1,"T":1e300,"s":"X","i":"1m","o":1,"h":2,"l":0.5,"c":1,"v":1,"n":1,"x":true,"q":1,"V":1,"Q":1}}})",
                      "close time beyond int64") ||
        !expectThrows(R"({"data":{"k":{"t":1,"T":2,"s":"X","i":"1m","o":1,"h":2,"l":0.5,"c":1,"v":1,"n":18446744073709551615,"x":true,"q":1,"V":1,"Q":1}}})",
                      "trade count beyond int64") ||
        !expectThrows(R"({"data":{"k":{"t":1,"T":2,"s":"X","i":"1m","o":1,"h":2,"l":0.5,"c":1,"v":1,"n":2.5,"x":true,"q":1,"V":1,"Q":1}}})",
                      "fractional trade count")) {
        return 1;
    }

    // Integral values written as JSON doubles are accepted exactly.
    {
        const auto frame = parse_stream_frame(
            R"({"data":{"k":{"t":1000.0,"T":1999.0,"s":"X","i":"1m","o":1,"h":2,"l":0.5,"c":1,"v":1,"n":4.0,"x":true,"q":1,"V":1,"Q":1}}})");
        if (frame.kind != FrameKind::KlineUpdate || !frame.kline || frame.kline->openTime != 1000 ||
            frame.kline->closeTime != 1999 || frame.kline->tradeCount != 4) {
            std::cerr << "Expected integral doubles to decode exactly\n";
            return 1;
        }
    }

    // Subscribe request shape.
    {
        const auto message = adapters::binance::build_subscribe_message("BTCUSDT", {"3m", "1h"}, 1);
        const std::string expected = R"({"method":"SUBSCRIBE","params":["btcusdt@kline_3m","btcusdt@kline_1h"],"id":1})";
        if (message != expected) {
            std::cerr << "Unexpected subscribe message: " << message << "\n";
            return 1;
        }
    }

    std::cout << "test_kline_stream_parser passed\n";
    return 0;
}
