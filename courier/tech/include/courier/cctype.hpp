#pragma once

namespace courier {

constexpr char tolower(char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch | 0x20);
  }
  return ch;
}

}  // namespace courier
