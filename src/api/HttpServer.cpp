#include "api/HttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "http/ErrorCodes.hpp"
#include "http/json_error.hpp"
#include "logging/Log.h"

namespace mse::api {

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::API;

enum class ReadOutcome { Complete, TooLarge, Incomplete };

std::runtime_error socketError(const std::string& what) {
    return std::runtime_error("HttpServer: " + what + ": " + std::strerror(errno));
}

// Reads until the blank line ending the request head. Bodies are ignored since
// every route is a GET.
ReadOutcome readHead(int fd, std::string& head) {
    char chunk[1024];
    while (head.find("\r\n\r\n") == std::string::npos) {
        if (head.size() > HttpServer::kMaxRequestBytes) {
            return ReadOutcome::TooLarge;
        }
        const auto got = ::recv(fd, chunk, sizeof(chunk), 0);
        if (got < 0 && errno == EINTR) {
            continue;
        }
        if (got <= 0) {
            return ReadOutcome::Incomplete;
        }
        head.append(chunk, static_cast<std::size_t>(got));
    }
    return ReadOutcome::Complete;
}

void sendAll(int fd, const std::string& bytes) {
    std::size_t offset = 0;
    while (offset < bytes.size()) {
        const auto sent = ::send(fd, bytes.data() + offset, bytes.size() - offset, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            LOG_DEBUG(kLogCategory, "client went away after %zu of %zu bytes", offset, bytes.size());
            return;
        }
        offset += static_cast<std::size_t>(sent);
    }
}

// Half-closes and discards whatever the client still sends, so unread request
// bytes do not turn the close into a reset that destroys the response in flight.
void lingeringClose(int fd) {
    constexpr std::size_t kMaxDrainBytes = 64 * 1024;
    ::shutdown(fd, SHUT_WR);
    char sink[1024];
    std::size_t drained = 0;
    while (drained < kMaxDrainBytes) {
        const auto got = ::recv(fd, sink, sizeof(sink), 0);
        if (got < 0 && errno == EINTR) {
            continue;
        }
        if (got <= 0) {
            break;
        }
        drained += static_cast<std::size_t>(got);
    }
}

Response errorResponse(int statusCode, std::string_view code) {
    Response response;
    http::json_error(response, statusCode, code);
    return response;
}

}  // namespace

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

std::optional<Request> parse_request_head(const std::string& head) {
    const auto lineEnd = head.find("\r\n");
    const std::string line = head.substr(0, lineEnd);

    const auto firstSpace = line.find(' ');
    const auto lastSpace = line.rfind(' ');
    if (firstSpace == std::string::npos || firstSpace == 0 || lastSpace == firstSpace) {
        return std::nullopt;
    }

    Request request;
    request.method = line.substr(0, firstSpace);
    request.target = line.substr(firstSpace + 1, lastSpace - firstSpace - 1);
    request.version = line.substr(lastSpace + 1);
    if (request.target.empty() || request.target.front() != '/' || request.version.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }

    const auto queryPos = request.target.find('?');
    request.path = request.target.substr(0, queryPos);
    if (queryPos != std::string::npos) {
        request.query = request.target.substr(queryPos + 1);
    }
    return request;
}

std::string serialize_response(const Response& response) {
    std::string out = "HTTP/1.1 " + std::to_string(response.statusCode) + ' ' + response.statusText + "\r\n";
    out += "Content-Type: ";
    out += response.contentType.empty() ? "application/json" : response.contentType;
    out += "\r\n";
    for (const auto& [name, value] : response.headers) {
        if (!name.empty()) {
            out += name + ": " + value + "\r\n";
        }
    }
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += response.body;
    return out;
}

HttpServer::HttpServer(const Router& router, Endpoint endpoint, std::size_t threadCount)
    : router_(router),
      endpoint_(std::move(endpoint)),
      threadCount_(threadCount == 0 ? 1 : threadCount) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_.load()) {
        return;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint_.port);
    const std::string host = endpoint_.address.empty() ? "0.0.0.0" : endpoint_.address;
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        throw std::invalid_argument("HttpServer: invalid IPv4 address " + host);
    }

    UniqueFd listener(::socket(AF_INET, SOCK_STREAM, 0));
    if (!listener.valid()) {
        throw socketError("socket");
    }
    const int reuse = 1;
    if (::setsockopt(listener.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        LOG_WARN(kLogCategory, "SO_REUSEADDR not set: %s", std::strerror(errno));
    }
    if (::bind(listener.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw socketError("bind " + host + ":" + std::to_string(endpoint_.port));
    }
    if (::listen(listener.get(), SOMAXCONN) < 0) {
        throw socketError("listen");
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(listener.get(), reinterpret_cast<sockaddr*>(&bound), &boundLen) < 0) {
        throw socketError("getsockname");
    }
    boundPort_.store(ntohs(bound.sin_port));

    listener_ = std::move(listener);
    running_.store(true);
    workers_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        workers_.emplace_back([this, i] { serve(i); });
    }
    LOG_INFO(kLogCategory,
             "HTTP API listening on %s:%u with %zu workers",
             host.c_str(),
             static_cast<unsigned>(boundPort_.load()),
             threadCount_);
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // Unblocks accept() in every worker.
    ::shutdown(listener_.get(), SHUT_RDWR);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    listener_.reset();
    LOG_INFO(kLogCategory, "HTTP API stopped");
}

void HttpServer::serve(std::size_t workerId) {
    LOG_DEBUG(kLogCategory, "HTTP worker %zu up", workerId);
    while (running_.load()) {
        UniqueFd client(::accept(listener_.get(), nullptr, nullptr));
        if (client.valid()) {
            respond(std::move(client));
            continue;
        }
        if (!running_.load() || errno == EBADF || errno == EINVAL) {
            break;
        }
        if (errno != EINTR && errno != ECONNABORTED) {
            LOG_WARN(kLogCategory, "accept failed: %s", std::strerror(errno));
        }
    }
    LOG_DEBUG(kLogCategory, "HTTP worker %zu down", workerId);
}

void HttpServer::respond(UniqueFd client) const {
    timeval timeout{};
    timeout.tv_sec = static_cast<decltype(timeout.tv_sec)>(kClientTimeout.count());
    if (::setsockopt(client.get(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0 ||
        ::setsockopt(client.get(), SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) < 0) {
        LOG_DEBUG(kLogCategory, "client timeouts not set: %s", std::strerror(errno));
    }

    std::string head;
    const auto outcome = readHead(client.get(), head);
    Response response;
    if (outcome == ReadOutcome::Incomplete) {
        return;
    }
    if (outcome == ReadOutcome::TooLarge) {
        response = errorResponse(431, http::errors::request_too_large);
    } else if (const auto request = parse_request_head(head)) {
        response = router_.handle(*request);
    } else {
        response = errorResponse(400, http::errors::bad_request);
    }

    sendAll(client.get(), serialize_response(response));
    lingeringClose(client.get());
}

}  // namespace mse::api
