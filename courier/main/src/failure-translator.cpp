#include "courier/failure-translator.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "courier/async-transport.hpp"
#include "courier/http-status-code.hpp"
#include "courier/log.hpp"
#include "courier/network-response.hpp"
#include "courier/request-error.hpp"

namespace courier {

FailureCategory CategorizeFailure(const Request &request, const FailureContext &context) {
  const TransportFailure &failure = context.failure;
  switch (failure.kind) {
    case TransportFailureKind::Timeout:
      return RetryCandidate{"socket", RequestError(ErrorKind::Timeout, failure.message, std::nullopt,
                                                   context.networkTime)};
    case TransportFailureKind::MalformedUrl:
      return RequestError(ErrorKind::BadUrl, fmt::format("{}: {}", request.url(), failure.message), std::nullopt,
                          context.networkTime);
    default:
      break;
  }

  if (!context.response) {
    RequestError error(ErrorKind::NoConnection, failure.message, std::nullopt, context.networkTime);
    if (request.shouldRetryConnectionErrors()) {
      return RetryCandidate{"connection", std::move(error)};
    }
    return error;
  }

  const ReceivedResponse &response = *context.response;
  if (!response.body) {
    return RetryCandidate{"network", RequestError(ErrorKind::Network, failure.message, std::nullopt,
                                                  context.networkTime)};
  }

  NetworkResponse networkResponse(response.statusCode, *response.body, false, context.networkTime,
                                  response.headers);
  const http::StatusCode statusCode = response.statusCode;
  if (statusCode == http::StatusCodeUnauthorized || statusCode == http::StatusCodeForbidden) {
    return RetryCandidate{"auth", RequestError(ErrorKind::AuthFailure, {}, std::move(networkResponse),
                                               context.networkTime)};
  }
  if (http::IsClientError(statusCode)) {
    // Don't retry other client errors.
    return RequestError(ErrorKind::Client, {}, std::move(networkResponse), context.networkTime);
  }
  if (http::IsServerError(statusCode) && request.shouldRetryServerErrors()) {
    return RetryCandidate{"server", RequestError(ErrorKind::Server, {}, std::move(networkResponse),
                                                 context.networkTime)};
  }
  // 3xx, or 5xx that should not be retried
  return RequestError(ErrorKind::Server, {}, std::move(networkResponse), context.networkTime);
}

FailureDecision DefaultFailureClassifier::classify(Request &request, const FailureContext &context) {
  if (context.response) {
    log::error("Unexpected response code {} for {}", context.response->statusCode, request.url());
  }

  FailureCategory category = CategorizeFailure(request, context);
  if (auto *error = std::get_if<RequestError>(&category)) {
    return std::move(*error);
  }

  auto &candidate = std::get<RetryCandidate>(category);
  const auto oldTimeout = request.timeout();
  if (!request.retryPolicy().retry(candidate.error)) {
    request.addMarker(fmt::format("{}-timeout-giveup [timeout={}]", candidate.reason, oldTimeout.count()));
    return std::move(candidate.error);
  }
  request.addMarker(fmt::format("{}-retry [timeout={}]", candidate.reason, oldTimeout.count()));
  return RetrySignal{std::move(candidate.reason)};
}

}  // namespace courier
