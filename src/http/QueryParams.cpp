#include "http/QueryParams.hpp"

#include <charconv>
#include <stdexcept>

namespace mse::http {
namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out.push_back(' ');
            continue;
        }
        if (c == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

QueryParams::QueryParams(std::string_view query) {
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto field = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (field.empty()) {
            continue;
        }
        const auto eq = field.find('=');
        std::string key = percent_decode(field.substr(0, eq));
        std::string value = eq == std::string_view::npos ? std::string{} : percent_decode(field.substr(eq + 1));
        pairs_.emplace_back(std::move(key), std::move(value));
    }
}

std::optional<std::string> QueryParams::get(std::string_view key) const {
    for (const auto& [name, value] : pairs_) {
        if (name == key) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::int64_t> QueryParams::get_int(std::string_view key) const {
    const auto text = get(key);
    if (!text) {
        return std::nullopt;
    }
    std::int64_t parsed = 0;
    const char* first = text->data();
    const char* last = first + text->size();
    const auto [end, ec] = std::from_chars(first, last, parsed);
    if (text->empty() || ec != std::errc() || end != last) {
        throw std::invalid_argument("query parameter '" + std::string(key) + "' is not an integer: " + *text);
    }
    return parsed;
}

}  // namespace mse::http
