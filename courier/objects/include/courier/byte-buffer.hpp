#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace courier {

// Finalized body bytes of a response.
using ByteBuffer = std::vector<std::byte>;

inline ByteBuffer ToByteBuffer(std::string_view str) {
  const auto *first = reinterpret_cast<const std::byte *>(str.data());
  return {first, first + str.size()};
}

inline std::string_view AsStringView(const ByteBuffer &bytes) noexcept {
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

}  // namespace courier
