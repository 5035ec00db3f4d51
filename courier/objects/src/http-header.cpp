#include "courier/http-header.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "courier/http-constants.hpp"
#include "courier/invalid_argument_exception.hpp"
#include "courier/string-equal-ignore-case.hpp"

namespace courier::http {

namespace {

// RFC 7230 §3.2.6 token characters.
constexpr bool IsTChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  switch (ch) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

constexpr std::string_view TrimOws(std::string_view value) noexcept {
  while (!value.empty() && IsHeaderWhitespace(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && IsHeaderWhitespace(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace

Header::Header(std::string_view name, std::string_view value) : _colonPos(static_cast<uint32_t>(name.size())) {
  value = TrimOws(value);
  if (!IsValidHeaderName(name)) {
    throw invalid_argument("HTTP header name is invalid");
  }
  if (!IsValidHeaderValue(value)) {
    throw invalid_argument("HTTP header value is invalid");
  }
  _data.reserve(name.size() + HeaderSep.size() + value.size());
  _data.append(name);
  _data.append(HeaderSep);
  _data.append(value);
}

bool IsValidHeaderName(std::string_view name) noexcept {
  return !name.empty() && std::ranges::all_of(name, [](char ch) { return IsTChar(ch); });
}

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, [](unsigned char ch) {
    if (ch == '\r' || ch == '\n') {
      return false;
    }
    if (ch == '\t') {
      return true;
    }
    // Visible ASCII characters and obs-text, which servers may still send
    return (ch >= 0x20 && ch <= 0x7E) || ch >= 0x80;
  });
}

std::optional<std::string_view> FindHeaderValue(std::span<const Header> headers, std::string_view name) noexcept {
  const auto it =
      std::ranges::find_if(headers, [name](const Header &header) { return CaseInsensitiveEqual(header.name(), name); });
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->value();
}

}  // namespace courier::http
