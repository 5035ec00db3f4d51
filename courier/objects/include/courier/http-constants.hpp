#pragma once

#include <string_view>

namespace courier::http {

// Header field names in their conventional canonical form.
// Comparisons against received headers must remain case-insensitive (RFC 7230).
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view ETag = "ETag";
inline constexpr std::string_view LastModified = "Last-Modified";
inline constexpr std::string_view IfModifiedSince = "If-Modified-Since";
inline constexpr std::string_view IfNoneMatch = "If-None-Match";
inline constexpr std::string_view RetryAfter = "Retry-After";
inline constexpr std::string_view WWWAuthenticate = "WWW-Authenticate";

inline constexpr std::string_view HeaderSep = ": ";

}  // namespace courier::http
