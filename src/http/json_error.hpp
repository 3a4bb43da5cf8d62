#pragma once

#include <string_view>

#include "api/Controllers.hpp"

namespace mse::http {

// Writes {"error":"<code>"} with the given status.
void json_error(mse::api::Response& response, int statusCode, std::string_view errorCode);

}  // namespace mse::http
