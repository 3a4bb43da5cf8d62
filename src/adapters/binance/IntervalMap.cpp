#include "adapters/binance/IntervalMap.hpp"

namespace adapters::binance {

bool is_supported_interval(std::string_view label) {
    return detail::interval_ms(label) > 0;
}

} // namespace adapters::binance
