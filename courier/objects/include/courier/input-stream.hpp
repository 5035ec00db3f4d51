#pragma once

#include <cstddef>
#include <span>

namespace courier {

// Blocking source of response body bytes provided by a transport.
class InputStream {
 public:
  InputStream() noexcept = default;

  InputStream(const InputStream &) = delete;
  InputStream(InputStream &&) = delete;
  InputStream &operator=(const InputStream &) = delete;
  InputStream &operator=(InputStream &&) = delete;

  virtual ~InputStream() = default;

  // Reads at most dst.size() bytes into dst and returns the number of bytes read.
  // Returns 0 only at end of stream (dst is never empty). Throws a std::exception on read failure.
  virtual std::size_t read(std::span<std::byte> dst) = 0;

  // Releases the underlying resource. May throw on failure.
  virtual void close() = 0;
};

// Closes given stream, logging (and not propagating) any close failure.
void CloseQuietly(InputStream &stream) noexcept;

}  // namespace courier
