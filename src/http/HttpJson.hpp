#pragma once

#include <string>

#include <boost/json/value.hpp>

#include "api/Controllers.hpp"

namespace mse::http {

std::string serialize_json(const boost::json::value& value);

// Serializes `value` into the response body and sets status and content type.
void write_json(mse::api::Response& response, const boost::json::value& value, int statusCode = 200);

}  // namespace mse::http
