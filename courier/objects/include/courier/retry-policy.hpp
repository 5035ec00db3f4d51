#pragma once

#include <chrono>
#include <cstdint>

#include "courier/request-error.hpp"

namespace courier {

// Retry state of a single request. Consulted and mutated by the failure classification after each failed attempt.
// Attempts of a request are sequential, so implementations do not need to be thread-safe.
class RetryPolicy {
 public:
  RetryPolicy() noexcept = default;

  RetryPolicy(const RetryPolicy &) = delete;
  RetryPolicy(RetryPolicy &&) = delete;
  RetryPolicy &operator=(const RetryPolicy &) = delete;
  RetryPolicy &operator=(RetryPolicy &&) = delete;

  virtual ~RetryPolicy() = default;

  // Timeout the transport should apply to the next attempt.
  [[nodiscard]] virtual std::chrono::milliseconds currentTimeout() const noexcept = 0;

  // Number of retries performed so far.
  [[nodiscard]] virtual uint32_t currentRetryCount() const noexcept = 0;

  // Prepares for the next attempt following given error.
  // Returns false if no attempt remains, in which case the error becomes terminal.
  [[nodiscard]] virtual bool retry(const RequestError &error) = 0;
};

// Retry policy with a bounded number of retries and a timeout growing linearly with a backoff multiplier.
class DefaultRetryPolicy final : public RetryPolicy {
 public:
  static constexpr std::chrono::milliseconds kDefaultTimeout{2500};
  static constexpr uint32_t kDefaultMaxRetries = 1;
  static constexpr float kDefaultBackoffMultiplier = 1.0F;

  DefaultRetryPolicy() noexcept = default;

  // Throws invalid_argument if timeout or backoffMultiplier are negative.
  DefaultRetryPolicy(std::chrono::milliseconds initialTimeout, uint32_t maxRetries, float backoffMultiplier);

  [[nodiscard]] std::chrono::milliseconds currentTimeout() const noexcept override { return _currentTimeout; }

  [[nodiscard]] uint32_t currentRetryCount() const noexcept override { return _currentRetryCount; }

  [[nodiscard]] bool retry(const RequestError &error) override;

  [[nodiscard]] uint32_t maxRetries() const noexcept { return _maxRetries; }

  [[nodiscard]] float backoffMultiplier() const noexcept { return _backoffMultiplier; }

  [[nodiscard]] bool hasAttemptRemaining() const noexcept { return _currentRetryCount <= _maxRetries; }

 private:
  std::chrono::milliseconds _currentTimeout{kDefaultTimeout};
  uint32_t _currentRetryCount{0};
  uint32_t _maxRetries{kDefaultMaxRetries};
  float _backoffMultiplier{kDefaultBackoffMultiplier};
};

}  // namespace courier
