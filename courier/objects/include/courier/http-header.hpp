#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "courier/http-constants.hpp"

namespace courier::http {

// Represents a single HTTP header field.
// The name and value are validated upon construction.
class Header {
 public:
  // Constructs a Header with the given name and value.
  // The value is trimmed.
  Header(std::string_view name, std::string_view value);

  // Returns the header name.
  [[nodiscard]] std::string_view name() const noexcept { return {_data.data(), _colonPos}; }

  // Returns the header value.
  [[nodiscard]] std::string_view value() const noexcept {
    return std::string_view(_data).substr(_colonPos + HeaderSep.size());
  }

  // Returns the raw header as "Name: Value".
  [[nodiscard]] std::string_view raw() const noexcept { return _data; }

  bool operator==(const Header &) const noexcept = default;

 private:
  std::string _data;
  uint32_t _colonPos;
};

// RFC 7230 §3.2: Header field values can be preceded and followed by optional whitespace (OWS).
// OWS is defined as zero or more spaces (SP) or horizontal tabs (HTAB).
constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// Validates that a header name consists only of tchar characters as per RFC 7230 §3.2.6.
bool IsValidHeaderName(std::string_view name) noexcept;

// Validates that a header value does not contain any invalid characters.
// Specifically, it must not contain CR, LF or other control characters, but may contain HTAB, visible ASCII
// characters and obs-text (bytes >= 0x80).
// The empty value is allowed.
bool IsValidHeaderValue(std::string_view value) noexcept;

// Returns the value of the first header whose name matches case-insensitively, if any.
std::optional<std::string_view> FindHeaderValue(std::span<const Header> headers, std::string_view name) noexcept;

}  // namespace courier::http
