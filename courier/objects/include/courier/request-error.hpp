#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "courier/network-response.hpp"

namespace courier {

enum class ErrorKind : uint8_t {
  AuthFailure,   // credentials rejected, by the transport or by a 401 / 403 answer
  BadUrl,        // the request url cannot be used by the transport
  Client,        // 4xx answer (other than 401 / 403)
  Network,       // bytes could not be fully received
  NoConnection,  // no connection could be established
  Server,        // 5xx (or unexpected) answer
  Timeout,       // socket or connection timeout
};

std::string_view ErrorKindToString(ErrorKind kind) noexcept;

// Terminal failure of a logical request, delivered to the caller's onError continuation.
// It may carry the response that was received when the failure comes from the status code.
class RequestError : public std::runtime_error {
 public:
  explicit RequestError(ErrorKind kind, std::string_view details = {}, std::optional<NetworkResponse> response = {},
                        std::chrono::milliseconds networkTime = {});

  [[nodiscard]] ErrorKind kind() const noexcept { return _kind; }

  [[nodiscard]] const std::optional<NetworkResponse> &response() const noexcept { return _response; }

  // Status code of the attached response, if any.
  [[nodiscard]] std::optional<http::StatusCode> statusCode() const noexcept;

  [[nodiscard]] std::chrono::milliseconds networkTime() const noexcept { return _networkTime; }

 private:
  std::optional<NetworkResponse> _response;
  std::chrono::milliseconds _networkTime;
  ErrorKind _kind;
};

}  // namespace courier
