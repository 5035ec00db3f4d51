#include "courier/byte-array-pool.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <iterator>
#include <memory>
#include <mutex>
#include <new>
#include <utility>

namespace courier {

PooledBuffer::PooledBuffer(std::size_t capacity)
    : _data(std::make_unique_for_overwrite<std::byte[]>(capacity)), _capacity(capacity) {}

void BufferLease::grow(std::size_t minSize, std::size_t nbBytesToKeep) {
  PooledBuffer newBuffer = _pool->lease(minSize);
  if (nbBytesToKeep != 0) {
    std::memcpy(newBuffer.data(), _buffer.data(), nbBytesToKeep);
  }
  _pool->release(std::exchange(_buffer, std::move(newBuffer)));
}

PooledBuffer ByteArrayPool::lease(std::size_t minSize) {
  {
    std::scoped_lock lock(_mutex);
    const auto sizeIt = std::ranges::find_if(
        _buffersBySize, [minSize](BuffersByLastUse::iterator it) { return it->capacity() >= minSize; });
    if (sizeIt != _buffersBySize.end()) {
      BuffersByLastUse::iterator lruIt = *sizeIt;
      PooledBuffer ret = std::move(*lruIt);
      _currentSize -= ret.capacity();
      _buffersBySize.erase(sizeIt);
      _buffersByLastUse.erase(lruIt);
      return ret;
    }
  }
  return PooledBuffer(minSize);
}

void ByteArrayPool::release(PooledBuffer buffer) noexcept {
  if (!buffer || buffer.capacity() > _sizeLimit) {
    return;
  }
  std::scoped_lock lock(_mutex);
  try {
    _buffersBySize.reserve(_buffersBySize.size() + 1U);
    _buffersByLastUse.push_back(std::move(buffer));
  } catch (const std::bad_alloc &) {
    // the buffer is freed instead of being cached
    return;
  }
  auto lruIt = std::prev(_buffersByLastUse.end());
  const auto insertPos = std::ranges::upper_bound(_buffersBySize, lruIt->capacity(), {},
                                                  [](BuffersByLastUse::iterator it) { return it->capacity(); });
  _buffersBySize.insert(insertPos, lruIt);
  _currentSize += lruIt->capacity();
  trim();
}

void ByteArrayPool::trim() noexcept {
  while (_currentSize > _sizeLimit) {
    auto lruIt = _buffersByLastUse.begin();
    _currentSize -= lruIt->capacity();
    _buffersBySize.erase(std::ranges::find(_buffersBySize, lruIt));
    _buffersByLastUse.erase(lruIt);
  }
}

std::size_t ByteArrayPool::cachedBytes() const {
  std::scoped_lock lock(_mutex);
  return _currentSize;
}

std::size_t ByteArrayPool::nbCachedBuffers() const {
  std::scoped_lock lock(_mutex);
  return _buffersByLastUse.size();
}

}  // namespace courier
