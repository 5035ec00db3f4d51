#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

#include "courier/byte-array-pool.hpp"
#include "courier/byte-buffer.hpp"
#include "courier/cache-entry.hpp"
#include "courier/http-header.hpp"
#include "courier/input-stream.hpp"
#include "courier/network-response.hpp"

namespace courier {

// Reads given stream until its end and returns its content.
// The copy buffer is leased from pool, with an initial capacity of contentLength if positive, defaultBufferSize
// otherwise, and replaced by a larger one each time it is full. If contentLength is exact, a single buffer is leased.
// The stream is closed and all leased buffers are released whatever the outcome.
// Propagates any exception thrown by the stream read, in which case no partial content is returned.
[[nodiscard]] ByteBuffer MaterializeStream(InputStream &stream, int64_t contentLength, BufferPool &pool,
                                           std::size_t defaultBufferSize);

// Builds the response of a 304 Not Modified answer.
// If the request had a cache entry, its data is returned along with the combined headers.
[[nodiscard]] NetworkResponse NotModifiedResponse(std::span<const http::Header> responseHeaders,
                                                  const CacheEntry *entry, std::chrono::milliseconds networkTime);

}  // namespace courier
