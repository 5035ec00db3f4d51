#include "courier/stream-materializer.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>
#include <vector>

#include "courier/byte-array-pool.hpp"
#include "courier/byte-buffer.hpp"
#include "courier/cache-headers.hpp"
#include "courier/http-status-code.hpp"
#include "courier/input-stream.hpp"

namespace courier {

namespace {

// Size of the scratch area used to detect the end of the stream when the copy buffer is full.
constexpr std::size_t kEndProbeSize = 64;

class StreamCloser {
 public:
  explicit StreamCloser(InputStream &stream) noexcept : _stream(stream) {}

  StreamCloser(const StreamCloser &) = delete;
  StreamCloser(StreamCloser &&) = delete;
  StreamCloser &operator=(const StreamCloser &) = delete;
  StreamCloser &operator=(StreamCloser &&) = delete;

  ~StreamCloser() { CloseQuietly(_stream); }

 private:
  InputStream &_stream;
};

}  // namespace

ByteBuffer MaterializeStream(InputStream &stream, int64_t contentLength, BufferPool &pool,
                             std::size_t defaultBufferSize) {
  // destroyed after the lease: the stream is closed last
  StreamCloser closer(stream);

  const std::size_t initialSize = contentLength > 0 ? static_cast<std::size_t>(contentLength) : defaultBufferSize;
  BufferLease lease(pool, initialSize);
  std::size_t size = 0;
  while (true) {
    if (size == lease.capacity()) {
      std::array<std::byte, kEndProbeSize> probe;
      const std::size_t nbRead = stream.read(probe);
      if (nbRead == 0) {
        break;
      }
      lease.grow((size + nbRead) * 2U, size);
      std::memcpy(lease.data() + size, probe.data(), nbRead);
      size += nbRead;
      continue;
    }
    const std::size_t nbRead = stream.read(std::span<std::byte>(lease.data() + size, lease.capacity() - size));
    if (nbRead == 0) {
      break;
    }
    size += nbRead;
  }
  return ByteBuffer(lease.data(), lease.data() + size);
}

NetworkResponse NotModifiedResponse(std::span<const http::Header> responseHeaders, const CacheEntry *entry,
                                    std::chrono::milliseconds networkTime) {
  if (entry == nullptr) {
    return {http::StatusCodeNotModified, ByteBuffer{}, true, networkTime,
            std::vector<http::Header>(responseHeaders.begin(), responseHeaders.end())};
  }
  return {http::StatusCodeNotModified, entry->data, true, networkTime, CombineHeaders(responseHeaders, *entry)};
}

}  // namespace courier
