#pragma once

#include <chrono>
#include <cstddef>

namespace courier {

// Configuration of an AsyncNetwork.
struct NetworkConfig {
  static constexpr std::chrono::milliseconds kDefaultSlowRequestThreshold{3000};
  static constexpr std::size_t kDefaultBufferPoolSizeLimit = 4096;
  static constexpr std::size_t kDefaultBodyBufferSize = 256;

  // Throws invalid_argument if the configuration is not consistent.
  void validate() const;

  NetworkConfig& withSlowRequestThreshold(std::chrono::milliseconds threshold);

  NetworkConfig& withLogAllRequests(bool on = true);

  NetworkConfig& withBufferPoolSizeLimit(std::size_t sizeLimit);

  NetworkConfig& withDefaultBodyBufferSize(std::size_t size);

  // Requests whose attempt lasts longer than this threshold are logged once their body is received.
  std::chrono::milliseconds slowRequestThreshold{kDefaultSlowRequestThreshold};

  // Log every received response as if it was slow. Useful for debugging.
  bool logAllRequests{false};

  // Size limit of the ByteArrayPool created when the network is not given an explicit pool.
  std::size_t bufferPoolSizeLimit{kDefaultBufferPoolSizeLimit};

  // Initial buffer size used to copy a streamed body whose length is unknown.
  // Growth is exponential from there.
  std::size_t defaultBodyBufferSize{kDefaultBodyBufferSize};
};

}  // namespace courier
