#include "courier/request-error.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace courier {

namespace {

std::string BuildMessage(ErrorKind kind, std::string_view details, const std::optional<NetworkResponse> &response) {
  std::string msg(ErrorKindToString(kind));
  if (response) {
    msg.append(fmt::format(" (status {})", response->statusCode()));
  }
  if (!details.empty()) {
    msg.append(": ");
    msg.append(details);
  }
  return msg;
}

}  // namespace

std::string_view ErrorKindToString(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::AuthFailure:
      return "auth failure";
    case ErrorKind::BadUrl:
      return "bad url";
    case ErrorKind::Client:
      return "client error";
    case ErrorKind::Network:
      return "network error";
    case ErrorKind::NoConnection:
      return "no connection";
    case ErrorKind::Server:
      return "server error";
    case ErrorKind::Timeout:
      return "timeout";
    default:
      return "unknown error";
  }
}

RequestError::RequestError(ErrorKind kind, std::string_view details, std::optional<NetworkResponse> response,
                           std::chrono::milliseconds networkTime)
    : std::runtime_error(BuildMessage(kind, details, response)),
      _response(std::move(response)),
      _networkTime(networkTime),
      _kind(kind) {}

std::optional<http::StatusCode> RequestError::statusCode() const noexcept {
  if (_response) {
    return _response->statusCode();
  }
  return std::nullopt;
}

}  // namespace courier
