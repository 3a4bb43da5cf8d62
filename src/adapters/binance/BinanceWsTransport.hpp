#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "domain/exchange/IExchangeKlines.hpp"

namespace adapters::binance {

// TLS WebSocket connection to the Binance combined-stream endpoint. All
// socket work runs on a private io thread; the public calls block on it.
class BinanceWsTransport : public domain::IStreamTransport {
public:
    BinanceWsTransport();
    ~BinanceWsTransport() override;

    BinanceWsTransport(const BinanceWsTransport&) = delete;
    BinanceWsTransport& operator=(const BinanceWsTransport&) = delete;

    void connect(const domain::StreamEndpoint& endpoint) override;
    void send(const std::string& text) override;
    domain::ReceiveStatus receive(std::string& payloadOut, std::string& errorOut) override;
    void close() override;

private:
    using WsStream = boost::beast::websocket::stream<
        boost::asio::ssl::stream<boost::beast::tcp_stream>>;

    std::shared_ptr<WsStream> current_stream_();
    void drop_stream_(const std::shared_ptr<WsStream>& ws);

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::ssl::context sslCtx_;
    std::thread ioThread_;

    std::mutex mutex_;
    std::shared_ptr<WsStream> ws_;
    std::atomic<bool> open_{false};
};

}  // namespace adapters::binance
