#include "courier/network-config.hpp"

#include <chrono>
#include <cstddef>

#include "courier/invalid_argument_exception.hpp"

namespace courier {

void NetworkConfig::validate() const {
  if (slowRequestThreshold.count() < 0) {
    throw invalid_argument("slowRequestThreshold must be >= 0");
  }
  if (defaultBodyBufferSize == 0) {
    throw invalid_argument("defaultBodyBufferSize must be > 0");
  }
}

NetworkConfig& NetworkConfig::withSlowRequestThreshold(std::chrono::milliseconds threshold) {
  slowRequestThreshold = threshold;
  return *this;
}

NetworkConfig& NetworkConfig::withLogAllRequests(bool on) {
  logAllRequests = on;
  return *this;
}

NetworkConfig& NetworkConfig::withBufferPoolSizeLimit(std::size_t sizeLimit) {
  bufferPoolSizeLimit = sizeLimit;
  return *this;
}

NetworkConfig& NetworkConfig::withDefaultBodyBufferSize(std::size_t size) {
  defaultBodyBufferSize = size;
  return *this;
}

}  // namespace courier
