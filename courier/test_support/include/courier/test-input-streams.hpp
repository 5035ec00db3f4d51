#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstring>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <thread>
#include <utility>

#include "courier/byte-buffer.hpp"
#include "courier/input-stream.hpp"

namespace courier::test {

// Returns n bytes of a repeating 'a' to 'z' pattern.
inline ByteBuffer PatternBytes(std::size_t n) {
  ByteBuffer bytes(n);
  for (std::size_t pos = 0; pos < n; ++pos) {
    bytes[pos] = static_cast<std::byte>('a' + (pos % 26));
  }
  return bytes;
}

// Observation point of a test stream. Shared with the test so that it outlives the stream.
class StreamProbe {
 public:
  void recordRead(std::size_t nbBytes) {
    _nbBytesRead.fetch_add(nbBytes, std::memory_order_relaxed);
    std::scoped_lock lock(_mutex);
    _readerThread = std::this_thread::get_id();
  }

  void recordClose() noexcept { _nbCloses.fetch_add(1, std::memory_order_relaxed); }

  [[nodiscard]] int nbCloses() const noexcept { return _nbCloses.load(std::memory_order_relaxed); }

  [[nodiscard]] std::size_t nbBytesRead() const noexcept { return _nbBytesRead.load(std::memory_order_relaxed); }

  // Thread of the last read, default constructed id if the stream was never read.
  [[nodiscard]] std::thread::id readerThread() const {
    std::scoped_lock lock(_mutex);
    return _readerThread;
  }

 private:
  mutable std::mutex _mutex;
  std::thread::id _readerThread;
  std::atomic<std::size_t> _nbBytesRead{0};
  std::atomic<int> _nbCloses{0};
};

// Serves given content in chunks of at most chunkSize bytes.
class ChunkedInputStream final : public InputStream {
 public:
  ChunkedInputStream(ByteBuffer content, std::size_t chunkSize,
                     std::shared_ptr<StreamProbe> probe = std::make_shared<StreamProbe>())
      : _content(std::move(content)), _probe(std::move(probe)), _chunkSize(chunkSize) {}

  std::size_t read(std::span<std::byte> dst) override {
    const std::size_t nbBytes = std::min({dst.size(), _chunkSize, _content.size() - _pos});
    if (nbBytes != 0) {
      std::memcpy(dst.data(), _content.data() + _pos, nbBytes);
      _pos += nbBytes;
    }
    _probe->recordRead(nbBytes);
    return nbBytes;
  }

  void close() override {
    _probe->recordClose();
    if (_throwOnClose) {
      throw std::runtime_error("close failed");
    }
  }

  void setThrowOnClose(bool throwOnClose = true) noexcept { _throwOnClose = throwOnClose; }

 private:
  ByteBuffer _content;
  std::shared_ptr<StreamProbe> _probe;
  std::size_t _chunkSize;
  std::size_t _pos{0};
  bool _throwOnClose{false};
};

// Serves given prefix in chunks of at most chunkSize bytes, then throws on the following read.
class FailingInputStream final : public InputStream {
 public:
  FailingInputStream(ByteBuffer prefix, std::size_t chunkSize,
                     std::shared_ptr<StreamProbe> probe = std::make_shared<StreamProbe>())
      : _prefix(std::move(prefix)), _probe(std::move(probe)), _chunkSize(chunkSize) {}

  std::size_t read(std::span<std::byte> dst) override {
    if (_pos == _prefix.size()) {
      throw std::runtime_error("connection reset by peer");
    }
    const std::size_t nbBytes = std::min({dst.size(), _chunkSize, _prefix.size() - _pos});
    std::memcpy(dst.data(), _prefix.data() + _pos, nbBytes);
    _pos += nbBytes;
    _probe->recordRead(nbBytes);
    return nbBytes;
  }

  void close() override { _probe->recordClose(); }

 private:
  ByteBuffer _prefix;
  std::shared_ptr<StreamProbe> _probe;
  std::size_t _chunkSize;
  std::size_t _pos{0};
};

}  // namespace courier::test
