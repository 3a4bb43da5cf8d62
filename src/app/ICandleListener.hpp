#pragma once

#include "domain/Types.h"

namespace app {

// Receives every kline the cache accepted, on the ingestion thread, in
// registration order. Exceptions are logged and do not reach other listeners.
class ICandleListener {
public:
    virtual ~ICandleListener() = default;
    virtual void on_candle(const domain::Kline& kline) = 0;
};

}  // namespace app
