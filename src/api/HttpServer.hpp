#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "api/Router.hpp"

namespace mse::api {

struct Endpoint {
    std::string address;
    std::uint16_t port;
};

// Owns a POSIX descriptor; closes it on destruction.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    int release() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1) noexcept;

private:
    int fd_ = -1;
};

// Blocking HTTP/1.1 listener over raw sockets. Worker threads share one
// listening socket and each serves one request per connection.
class HttpServer {
public:
    static constexpr std::size_t kMaxRequestBytes = 8192;
    static constexpr std::chrono::seconds kClientTimeout{5};

    HttpServer(const Router& router, Endpoint endpoint, std::size_t threadCount);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts the workers. Port 0 binds an ephemeral port; see boundPort().
    void start();
    void stop();

    bool running() const noexcept { return running_.load(); }
    std::uint16_t boundPort() const noexcept { return boundPort_.load(); }

private:
    void serve(std::size_t workerId);
    void respond(UniqueFd client) const;

    const Router& router_;
    const Endpoint endpoint_;
    const std::size_t threadCount_;
    UniqueFd listener_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> boundPort_{0};
};

// Request line and target of a raw request head; nullopt when the request
// line is not "<METHOD> <target> HTTP/<version>".
std::optional<Request> parse_request_head(const std::string& head);

// Status line, headers and body, always with Content-Length and Connection: close.
std::string serialize_response(const Response& response);

}  // namespace mse::api
