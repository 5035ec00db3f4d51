#include "courier/retry-policy.hpp"

#include <chrono>
#include <cstdint>

#include "courier/invalid_argument_exception.hpp"
#include "courier/log.hpp"
#include "courier/request-error.hpp"

namespace courier {

DefaultRetryPolicy::DefaultRetryPolicy(std::chrono::milliseconds initialTimeout, uint32_t maxRetries,
                                       float backoffMultiplier)
    : _currentTimeout(initialTimeout), _maxRetries(maxRetries), _backoffMultiplier(backoffMultiplier) {
  if (initialTimeout.count() < 0) {
    throw invalid_argument("Retry policy timeout should be non negative, got {} ms", initialTimeout.count());
  }
  if (backoffMultiplier < 0.0F) {
    throw invalid_argument("Retry policy backoff multiplier should be non negative");
  }
}

bool DefaultRetryPolicy::retry(const RequestError &error) {
  ++_currentRetryCount;
  _currentTimeout += std::chrono::milliseconds{
      static_cast<std::chrono::milliseconds::rep>(static_cast<float>(_currentTimeout.count()) * _backoffMultiplier)};
  if (!hasAttemptRemaining()) {
    log::debug("No attempt remaining after {} retries, last error: {}", _currentRetryCount - 1U, error.what());
    return false;
  }
  return true;
}

}  // namespace courier
