#pragma once

#include <cstdint>

namespace courier::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeNoContent = 204;
inline constexpr StatusCode StatusCodeNotModified = 304;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeUnauthorized = 401;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeTooManyRequests = 429;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;

// Inclusive range of status codes considered as a successful exchange.
constexpr bool IsSuccess(StatusCode statusCode) noexcept { return statusCode >= 200 && statusCode <= 299; }

constexpr bool IsClientError(StatusCode statusCode) noexcept { return statusCode >= 400 && statusCode <= 499; }

constexpr bool IsServerError(StatusCode statusCode) noexcept { return statusCode >= 500 && statusCode <= 599; }

}  // namespace courier::http
