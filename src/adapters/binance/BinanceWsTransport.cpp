#include "adapters/binance/BinanceWsTransport.hpp"

#include <chrono>
#include <future>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Log.h"

namespace adapters::binance {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

namespace {

std::runtime_error make_error(const std::string& message) {
    return std::runtime_error("BinanceWsTransport: " + message);
}

// Starts an async operation on the io thread and blocks until its handler runs.
template <typename Initiator>
beast::error_code run_on_io(net::io_context& ioc, Initiator initiate) {
    auto promise = std::make_shared<std::promise<beast::error_code>>();
    auto future = promise->get_future();
    net::post(ioc, [initiate = std::move(initiate), promise]() mutable {
        initiate([promise](const beast::error_code& ec, auto&&...) { promise->set_value(ec); });
    });
    return future.get();
}

void force_close(beast::tcp_stream& stream) {
    beast::error_code ec;
    stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
    stream.socket().close(ec);
}

}  // namespace

BinanceWsTransport::BinanceWsTransport()
    : work_(net::make_work_guard(ioc_)),
      sslCtx_(ssl::context::tls_client) {
    sslCtx_.set_default_verify_paths();
    sslCtx_.set_verify_mode(ssl::verify_peer);
    ioThread_ = std::thread([this]() { ioc_.run(); });
}

BinanceWsTransport::~BinanceWsTransport() {
    close();
    work_.reset();
    ioc_.stop();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }
}

void BinanceWsTransport::connect(const domain::StreamEndpoint& endpoint) {
    if (auto previous = current_stream_()) {
        drop_stream_(previous);
    }

    auto ws = std::make_shared<WsStream>(ioc_, sslCtx_);
    ws->next_layer().set_verify_mode(ssl::verify_peer);
    ws->next_layer().set_verify_callback(ssl::rfc2818_verification(endpoint.host));
    if (!::SSL_set_tlsext_host_name(ws->next_layer().native_handle(), endpoint.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI host name to '" << endpoint.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw make_error(oss.str());
    }

    LOG_INFO(logging::LogCategory::NET,
             "BinanceWsTransport resolving host=%s port=%s",
             endpoint.host.c_str(),
             endpoint.port.c_str());
    beast::error_code ec;
    net::ip::tcp::resolver resolver(ioc_);
    const auto results = resolver.resolve(endpoint.host, endpoint.port, ec);
    if (ec) {
        throw make_error("DNS resolve failed: " + ec.message());
    }

    beast::get_lowest_layer(*ws).expires_after(endpoint.connectTimeout);
    ec = run_on_io(ioc_, [ws, results](auto handler) {
        beast::get_lowest_layer(*ws).async_connect(results, std::move(handler));
    });
    if (ec) {
        throw make_error("connect failed: " + ec.message());
    }

    beast::get_lowest_layer(*ws).expires_after(endpoint.connectTimeout);
    ec = run_on_io(ioc_, [ws](auto handler) {
        ws->next_layer().async_handshake(ssl::stream_base::client, std::move(handler));
    });
    if (ec) {
        force_close(beast::get_lowest_layer(*ws));
        throw make_error("TLS handshake failed: " + ec.message());
    }

    // From here the websocket layer owns the timeouts, including keep-alive pings.
    beast::get_lowest_layer(*ws).expires_never();
    websocket::stream_base::timeout timeouts{};
    timeouts.handshake_timeout = endpoint.connectTimeout;
    timeouts.idle_timeout = endpoint.pingInterval * 2;
    timeouts.keep_alive_pings = true;
    ws->set_option(timeouts);
    ws->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "MarketSignalEngine-BinanceWsTransport");
    }));
    ws->text(true);

    const std::string hostHeader = endpoint.host + ":" + endpoint.port;
    ec = run_on_io(ioc_, [ws, hostHeader, path = endpoint.path](auto handler) {
        ws->async_handshake(hostHeader, path, std::move(handler));
    });
    if (ec) {
        force_close(beast::get_lowest_layer(*ws));
        throw make_error("WebSocket handshake failed: " + ec.message());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ws_ = ws;
    }
    open_.store(true, std::memory_order_release);
    LOG_INFO(logging::LogCategory::NET,
             "BinanceWsTransport connected to %s%s",
             endpoint.host.c_str(),
             endpoint.path.c_str());
}

void BinanceWsTransport::send(const std::string& text) {
    auto ws = current_stream_();
    if (!ws || !open_.load(std::memory_order_acquire)) {
        throw make_error("send on closed connection");
    }

    auto payload = std::make_shared<std::string>(text);
    const auto ec = run_on_io(ioc_, [ws, payload](auto handler) {
        ws->async_write(net::buffer(*payload), std::move(handler));
    });
    if (ec) {
        throw make_error("write failed: " + ec.message());
    }
}

domain::ReceiveStatus BinanceWsTransport::receive(std::string& payloadOut, std::string& errorOut) {
    auto ws = current_stream_();
    if (!ws || !open_.load(std::memory_order_acquire)) {
        errorOut = "connection is not open";
        return domain::ReceiveStatus::Closed;
    }

    auto buffer = std::make_shared<beast::flat_buffer>();
    const auto ec = run_on_io(ioc_, [ws, buffer](auto handler) {
        ws->async_read(*buffer, std::move(handler));
    });
    if (ec) {
        open_.store(false, std::memory_order_release);
        if (ec == websocket::error::closed) {
            errorOut = "closed by peer";
        } else {
            errorOut = "read failed: " + ec.message();
        }
        return domain::ReceiveStatus::Closed;
    }

    payloadOut = beast::buffers_to_string(buffer->cdata());
    return domain::ReceiveStatus::Message;
}

void BinanceWsTransport::close() {
    open_.store(false, std::memory_order_release);
    std::shared_ptr<WsStream> ws;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ws = std::move(ws_);
    }
    if (ws) {
        drop_stream_(ws);
    }
}

std::shared_ptr<BinanceWsTransport::WsStream> BinanceWsTransport::current_stream_() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ws_;
}

// Closing the socket on the io thread aborts any pending read or write, which
// is how a blocked receive() is released.
void BinanceWsTransport::drop_stream_(const std::shared_ptr<WsStream>& ws) {
    net::post(ioc_, [ws]() { force_close(beast::get_lowest_layer(*ws)); });
    std::lock_guard<std::mutex> lock(mutex_);
    if (ws_ == ws) {
        ws_.reset();
    }
}

}  // namespace adapters::binance
