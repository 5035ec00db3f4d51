#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "courier/async-transport.hpp"
#include "courier/byte-buffer.hpp"
#include "courier/http-header.hpp"
#include "courier/http-status-code.hpp"
#include "courier/request-error.hpp"
#include "courier/request.hpp"

namespace courier {

// Response received before an attempt failed.
struct ReceivedResponse {
  http::StatusCode statusCode;
  std::vector<http::Header> headers;
  // Absent when the body could not be read.
  std::optional<ByteBuffer> body;
};

// Everything known about a failed attempt.
struct FailureContext {
  TransportFailure failure;
  // Absent when no response was received.
  std::optional<ReceivedResponse> response;
  std::chrono::milliseconds networkTime{};
};

// Instructs the network to dispatch the same request again.
struct RetrySignal {
  std::string reason;
};

// Failure that may be retried if the retry policy of the request allows it.
struct RetryCandidate {
  std::string reason;
  RequestError error;
};

using FailureCategory = std::variant<RequestError, RetryCandidate>;

using FailureDecision = std::variant<RequestError, RetrySignal>;

// Maps a failed attempt to either a terminal error or a retryable one, without any side effect.
// Calling it twice with the same arguments yields the same result.
[[nodiscard]] FailureCategory CategorizeFailure(const Request &request, const FailureContext &context);

// Decides the fate of a failed attempt.
// May update the retry state of the request (retry policy, markers).
class FailureClassifier {
 public:
  FailureClassifier() noexcept = default;

  FailureClassifier(const FailureClassifier &) = delete;
  FailureClassifier(FailureClassifier &&) = delete;
  FailureClassifier &operator=(const FailureClassifier &) = delete;
  FailureClassifier &operator=(FailureClassifier &&) = delete;

  virtual ~FailureClassifier() = default;

  [[nodiscard]] virtual FailureDecision classify(Request &request, const FailureContext &context) = 0;
};

// Categorizes the failure with CategorizeFailure, then lets the retry policy of the request decide whether a retry
// candidate is attempted again.
class DefaultFailureClassifier final : public FailureClassifier {
 public:
  [[nodiscard]] FailureDecision classify(Request &request, const FailureContext &context) override;
};

}  // namespace courier
