#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mse::http {

// Decoded `application/x-www-form-urlencoded` query string. When a key repeats,
// the first occurrence wins.
class QueryParams {
public:
    explicit QueryParams(std::string_view query);

    std::optional<std::string> get(std::string_view key) const;

    // nullopt when the key is missing; throws std::invalid_argument when the
    // value is not a base-10 integer.
    std::optional<std::int64_t> get_int(std::string_view key) const;

    std::size_t size() const noexcept { return pairs_.size(); }

private:
    std::vector<std::pair<std::string, std::string>> pairs_;
};

// '+' becomes a space and %XX a byte; malformed escapes are kept verbatim.
std::string percent_decode(std::string_view text);

}  // namespace mse::http
