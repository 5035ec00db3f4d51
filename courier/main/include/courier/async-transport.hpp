#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "courier/http-header.hpp"
#include "courier/request.hpp"
#include "courier/transport-response.hpp"

namespace courier {

// Credentials were rejected by the transport before any response was received.
struct AuthFailure {
  std::string message;
};

enum class TransportFailureKind : uint8_t {
  Timeout,           // socket or connection timeout (cancellation also surfaces as a timeout)
  ConnectionFailed,  // connection could not be established
  Io,                // any other I/O failure, including an unexpected status code or a failed body read
  MalformedUrl,      // request url rejected by the transport
};

constexpr std::string_view TransportFailureKindToString(TransportFailureKind kind) noexcept {
  switch (kind) {
    case TransportFailureKind::Timeout:
      return "timeout";
    case TransportFailureKind::ConnectionFailed:
      return "connection failed";
    case TransportFailureKind::Io:
      return "io";
    case TransportFailureKind::MalformedUrl:
      return "malformed url";
    default:
      return "unknown";
  }
}

struct TransportFailure {
  TransportFailureKind kind{TransportFailureKind::Io};
  std::string message;
};

// Outcome of one attempt, as reported by a transport.
using TransportResult = std::variant<TransportResponse, AuthFailure, TransportFailure>;

using TransportCallback = std::function<void(TransportResult)>;

// Performs the network I/O of a single attempt of a request.
// The callback must be invoked exactly once per executeRequest call, from any thread, possibly before executeRequest
// returns. Transports should honor request->timeout() for the attempt.
class AsyncTransport {
 public:
  AsyncTransport() noexcept = default;

  AsyncTransport(const AsyncTransport &) = delete;
  AsyncTransport(AsyncTransport &&) = delete;
  AsyncTransport &operator=(const AsyncTransport &) = delete;
  AsyncTransport &operator=(AsyncTransport &&) = delete;

  virtual ~AsyncTransport() = default;

  // extraHeaders are to be sent in addition to request->headers() (cache validation headers for instance).
  virtual void executeRequest(const std::shared_ptr<Request> &request, std::vector<http::Header> extraHeaders,
                              TransportCallback callback) = 0;
};

}  // namespace courier
