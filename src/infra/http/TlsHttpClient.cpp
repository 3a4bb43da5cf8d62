#include "infra/http/TlsHttpClient.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>

#include "logging/Log.h"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr const char* kUserAgent = "MarketSignalEngine/1.0";

// One verified TLS session to `host:443`, torn down on destruction.
class Session {
public:
    Session(const std::string& host, std::chrono::seconds timeout)
        : host_(host),
          timeout_(timeout),
          tls_(ssl::context::tls_client),
          stream_(ioc_, prepare(tls_)) {
        stream_.set_verify_callback(ssl::rfc2818_verification(host_));
        if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str())) {
            const unsigned long code = ::ERR_get_error();
            const char* reason = code != 0 ? ::ERR_reason_error_string(code) : nullptr;
            fail("SNI setup", reason != nullptr ? reason : "unknown OpenSSL error");
        }
    }

    ~Session() {
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().close(ignored);
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void open() {
        beast::error_code ec;
        net::ip::tcp::resolver resolver(ioc_);
        const auto endpoints = resolver.resolve(host_, "443", ec);
        check(ec, "resolve");

        auto& tcp = beast::get_lowest_layer(stream_);
        tcp.expires_after(timeout_);
        tcp.connect(endpoints, ec);
        check(ec, "connect");

        tcp.expires_after(timeout_);
        stream_.handshake(ssl::stream_base::client, ec);
        check(ec, "handshake");
    }

    bhttp::response<bhttp::string_body> exchange(const std::string& target) {
        bhttp::request<bhttp::empty_body> request{bhttp::verb::get, target, 11};
        request.set(bhttp::field::host, host_);
        request.set(bhttp::field::user_agent, kUserAgent);
        request.set(bhttp::field::accept, "application/json");
        request.set(bhttp::field::connection, "close");

        beast::error_code ec;
        auto& tcp = beast::get_lowest_layer(stream_);
        tcp.expires_after(timeout_);
        bhttp::write(stream_, request, ec);
        check(ec, "write");

        beast::flat_buffer buffer;
        bhttp::response<bhttp::string_body> response;
        tcp.expires_after(timeout_);
        bhttp::read(stream_, buffer, response, ec);
        check(ec, "read");
        return response;
    }

    // Servers commonly drop the connection instead of answering close_notify.
    void close() {
        beast::error_code ec;
        stream_.shutdown(ec);
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            LOG_DEBUG(logging::LogCategory::NET, "TLS shutdown with %s: %s", host_.c_str(), ec.message().c_str());
        }
    }

private:
    static ssl::context& prepare(ssl::context& tls) {
        tls.set_default_verify_paths();
        tls.set_verify_mode(ssl::verify_peer);
        return tls;
    }

    void check(const beast::error_code& ec, const char* step) const {
        if (ec) {
            fail(step, ec.message());
        }
    }

    [[noreturn]] void fail(const char* step, const std::string& detail) const {
        throw std::runtime_error("TlsHttpClient " + host_ + " " + step + " failed: " + detail);
    }

    std::string host_;
    std::chrono::seconds timeout_;
    net::io_context ioc_;
    ssl::context tls_;
    ssl::stream<beast::tcp_stream> stream_;
};

}  // namespace

TlsHttpClient::TlsHttpClient(std::string host, std::chrono::seconds timeout)
    : host_(std::move(host)),
      timeout_(timeout) {
    if (host_.empty()) {
        throw std::invalid_argument("TlsHttpClient requires a host");
    }
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("TlsHttpClient timeout must be positive");
    }
}

HttpsResponse TlsHttpClient::get(const std::string& target) const {
    const std::string path = (target.empty() || target.front() != '/') ? "/" + target : target;

    Session session(host_, timeout_);
    session.open();
    auto response = session.exchange(path);
    session.close();

    HttpsResponse result;
    result.status = response.result_int();
    result.body = std::move(response.body());
    if (const auto it = response.find("X-MBX-USED-WEIGHT-1M"); it != response.end()) {
        result.usedWeight.assign(it->value().data(), it->value().size());
    }
    if (const auto it = response.find(bhttp::field::retry_after); it != response.end()) {
        result.retryAfter = parse_retry_after(std::string_view(it->value().data(), it->value().size()));
    }
    return result;
}

std::optional<std::chrono::seconds> parse_retry_after(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    if (value.empty() || value.size() > 9) {
        return std::nullopt;
    }
    long long seconds = 0;
    for (const char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        seconds = seconds * 10 + (c - '0');
    }
    return std::chrono::seconds(seconds);
}

}  // namespace infra::http
