#include "api/Router.hpp"

#include <exception>

#include "common/Metrics.hpp"
#include "http/ErrorCodes.hpp"
#include "http/json_error.hpp"
#include "logging/Log.h"

namespace mse::api {

namespace {

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

}  // namespace

Router::Router(const Controllers& controllers) {
    routes_.emplace(makeKey("GET", "/healthz"), [&controllers](const Request& r) { return controllers.healthz(r); });
    routes_.emplace(makeKey("GET", "/api/v1/analysis"),
                    [&controllers](const Request& r) { return controllers.analysis(r); });
    routes_.emplace(makeKey("GET", "/api/v1/klines"), [&controllers](const Request& r) { return controllers.klines(r); });
    routes_.emplace(makeKey("GET", "/stats"), [&controllers](const Request& r) { return controllers.stats(r); });
}

Response Router::handle(const Request& request) const {
    const auto key = makeKey(request.method, request.path);
    const auto it = routes_.find(key);
    if (it == routes_.end()) {
        Response response;
        http::json_error(response, 404, http::errors::not_found);
        return response;
    }

    common::metrics::Registry::instance().countRequest(key);
    try {
        return it->second(request);
    } catch (const std::exception& ex) {
        LOG_ERROR(logging::LogCategory::API, "%s failed: %s", key.c_str(), ex.what());
        Response response;
        http::json_error(response, 500, http::errors::internal_error);
        return response;
    }
}

}  // namespace mse::api
