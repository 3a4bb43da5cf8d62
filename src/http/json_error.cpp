#include "http/json_error.hpp"

#include <boost/json/object.hpp>

#include "http/HttpJson.hpp"

namespace mse::http {

void json_error(mse::api::Response& response, int statusCode, std::string_view errorCode) {
    boost::json::object payload;
    payload["error"] = boost::json::string_view(errorCode.data(), errorCode.size());
    write_json(response, payload, statusCode);
}

}  // namespace mse::http
