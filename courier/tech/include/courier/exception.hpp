#pragma once

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstring>
#include <exception>
#include <utility>

namespace courier {

// Base exception of courier. The message is stored inline so that constructing it does not allocate.
// Formatted messages longer than kMsgMaxLen are truncated and terminated by "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 87;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_msg, str, N);
  }

  template <typename... Args>
  explicit exception(fmt::format_string<Args...> fmt, Args &&...args) {
    const auto res = fmt::format_to_n(_msg, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (res.size > kMsgMaxLen) {
      std::memcpy(_msg + kMsgMaxLen - 3U, "...", 3U);
      _msg[kMsgMaxLen] = '\0';
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char *what() const noexcept override { return _msg; }

 private:
  char _msg[kMsgMaxLen + 1];
};

}  // namespace courier
