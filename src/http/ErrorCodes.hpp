#pragma once

#include <string_view>

namespace mse::http::errors {

inline constexpr std::string_view symbol_required = "symbol_required";
inline constexpr std::string_view interval_invalid = "interval_invalid";
inline constexpr std::string_view limit_invalid = "limit_invalid";
inline constexpr std::string_view not_found = "not_found";
inline constexpr std::string_view bad_request = "bad_request";
inline constexpr std::string_view request_too_large = "request_too_large";
inline constexpr std::string_view internal_error = "internal_error";

}  // namespace mse::http::errors
