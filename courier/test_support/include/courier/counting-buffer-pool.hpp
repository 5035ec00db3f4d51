#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <vector>

#include "courier/byte-array-pool.hpp"

namespace courier::test {

// BufferPool allocating exactly the requested size and counting leases and releases.
class CountingBufferPool final : public BufferPool {
 public:
  [[nodiscard]] PooledBuffer lease(std::size_t minSize) override {
    {
      std::scoped_lock lock(_mutex);
      _leaseSizes.push_back(minSize);
    }
    _nbLeases.fetch_add(1, std::memory_order_relaxed);
    return PooledBuffer(minSize);
  }

  void release(PooledBuffer buffer) noexcept override {
    if (buffer) {
      _nbReleases.fetch_add(1, std::memory_order_relaxed);
    }
  }

  [[nodiscard]] std::size_t nbLeases() const noexcept { return _nbLeases.load(std::memory_order_relaxed); }

  [[nodiscard]] std::size_t nbReleases() const noexcept { return _nbReleases.load(std::memory_order_relaxed); }

  [[nodiscard]] std::size_t nbOutstanding() const noexcept { return nbLeases() - nbReleases(); }

  // Requested sizes, in lease order.
  [[nodiscard]] std::vector<std::size_t> leaseSizes() const {
    std::scoped_lock lock(_mutex);
    return _leaseSizes;
  }

 private:
  mutable std::mutex _mutex;
  std::vector<std::size_t> _leaseSizes;
  std::atomic<std::size_t> _nbLeases{0};
  std::atomic<std::size_t> _nbReleases{0};
};

}  // namespace courier::test
