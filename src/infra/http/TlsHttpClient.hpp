#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace infra::http {

struct HttpsResponse {
    unsigned status = 0U;
    std::string body;
    // X-MBX-USED-WEIGHT-1M, empty when absent.
    std::string usedWeight;
    std::optional<std::chrono::seconds> retryAfter;
};

// Blocking HTTPS GET client bound to one host. Each request opens a fresh
// verified TLS connection and closes it afterwards (`Connection: close`).
class TlsHttpClient {
public:
    TlsHttpClient(std::string host, std::chrono::seconds timeout);

    // Throws std::runtime_error on DNS, TCP, TLS or read failures. Non-2xx
    // statuses are returned, not thrown.
    HttpsResponse get(const std::string& target) const;

    const std::string& host() const { return host_; }

private:
    std::string host_;
    std::chrono::seconds timeout_;
};

// Delay-seconds form of Retry-After; nullopt for HTTP dates or garbage.
std::optional<std::chrono::seconds> parse_retry_after(std::string_view value);

}  // namespace infra::http
