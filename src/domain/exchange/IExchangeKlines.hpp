#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace domain {

// One-shot historical source used to warm the cache before streaming starts.
class IExchangeKlines {
 public:
  virtual ~IExchangeKlines() = default;
  virtual std::vector<Kline> fetch_klines(const std::string& symbol,
                                          const std::string& interval,
                                          std::size_t limit) = 0;
};

struct StreamEndpoint {
  std::string host;
  std::string port;
  std::string path;
  std::chrono::milliseconds connectTimeout{10000};
  std::chrono::milliseconds pingInterval{20000};
};

enum class ReceiveStatus { Message, Closed };

// Message-oriented duplex connection to the exchange streaming endpoint.
// receive() blocks; close() may be called from any thread and unblocks it.
class IStreamTransport {
 public:
  virtual ~IStreamTransport() = default;

  // Throws std::runtime_error when the connection cannot be established.
  virtual void connect(const StreamEndpoint& endpoint) = 0;

  // Throws std::runtime_error when the frame cannot be written.
  virtual void send(const std::string& text) = 0;

  // Returns Closed on orderly close, local close() or a transport failure;
  // errorOut receives a description of the failure when there is one.
  virtual ReceiveStatus receive(std::string& payloadOut, std::string& errorOut) = 0;

  virtual void close() = 0;
};

}  // namespace domain
