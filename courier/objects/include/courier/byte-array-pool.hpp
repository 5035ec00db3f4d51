#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace courier {

// Byte array leased from a BufferPool. Move-only: a buffer has a single owner at any time.
class PooledBuffer {
 public:
  PooledBuffer() noexcept = default;

  // Allocates a new uninitialized buffer of given capacity.
  explicit PooledBuffer(std::size_t capacity);

  [[nodiscard]] std::byte *data() noexcept { return _data.get(); }
  [[nodiscard]] const std::byte *data() const noexcept { return _data.get(); }

  [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

  [[nodiscard]] std::span<std::byte> span() noexcept { return {_data.get(), _capacity}; }

  explicit operator bool() const noexcept { return _data != nullptr; }

 private:
  std::unique_ptr<std::byte[]> _data;
  std::size_t _capacity{0};
};

// Shared source of reusable byte buffers. Implementations must be thread-safe.
class BufferPool {
 public:
  BufferPool() noexcept = default;

  BufferPool(const BufferPool &) = delete;
  BufferPool(BufferPool &&) = delete;
  BufferPool &operator=(const BufferPool &) = delete;
  BufferPool &operator=(BufferPool &&) = delete;

  virtual ~BufferPool() = default;

  // Returns a buffer of capacity at least minSize. Never blocks waiting for a buffer to be released.
  [[nodiscard]] virtual PooledBuffer lease(std::size_t minSize) = 0;

  // Gives back a buffer previously returned by lease().
  virtual void release(PooledBuffer buffer) noexcept = 0;
};

// RAII lease of a pooled buffer: the buffer goes back to its pool when the lease is destroyed, whatever the exit path.
class BufferLease {
 public:
  BufferLease(BufferPool &pool, std::size_t minSize) : _pool(&pool), _buffer(pool.lease(minSize)) {}

  BufferLease(const BufferLease &) = delete;
  BufferLease(BufferLease &&) = delete;
  BufferLease &operator=(const BufferLease &) = delete;
  BufferLease &operator=(BufferLease &&) = delete;

  ~BufferLease() { _pool->release(std::move(_buffer)); }

  // Replaces the leased buffer by a new one of capacity at least minSize, preserving its first nbBytesToKeep bytes.
  // The previous buffer is returned to the pool.
  void grow(std::size_t minSize, std::size_t nbBytesToKeep);

  [[nodiscard]] std::byte *data() noexcept { return _buffer.data(); }

  [[nodiscard]] std::size_t capacity() const noexcept { return _buffer.capacity(); }

 private:
  BufferPool *_pool;
  PooledBuffer _buffer;
};

// Pool of byte arrays, inspired by a bounded LRU cache.
// Released buffers are kept both in release order (to evict the least recently used ones) and in size order (to
// serve each lease with the smallest suitable buffer). The total capacity kept in the pool never exceeds the size
// limit given at construction, and buffers larger than this limit are simply freed on release.
class ByteArrayPool final : public BufferPool {
 public:
  static constexpr std::size_t kDefaultSizeLimit = 4096;

  explicit ByteArrayPool(std::size_t sizeLimit = kDefaultSizeLimit) noexcept : _sizeLimit(sizeLimit) {}

  [[nodiscard]] PooledBuffer lease(std::size_t minSize) override;

  void release(PooledBuffer buffer) noexcept override;

  // Total capacity of the buffers currently cached in the pool.
  [[nodiscard]] std::size_t cachedBytes() const;

  // Number of buffers currently cached in the pool.
  [[nodiscard]] std::size_t nbCachedBuffers() const;

  [[nodiscard]] std::size_t sizeLimit() const noexcept { return _sizeLimit; }

 private:
  using BuffersByLastUse = std::list<PooledBuffer>;

  void trim() noexcept;

  mutable std::mutex _mutex;
  // oldest released buffer first
  BuffersByLastUse _buffersByLastUse;
  // same buffers as above, sorted by increasing capacity
  std::vector<BuffersByLastUse::iterator> _buffersBySize;
  std::size_t _currentSize{0};
  std::size_t _sizeLimit;
};

}  // namespace courier
