#include "courier/async-network.hpp"

#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "courier/async-transport.hpp"
#include "courier/byte-array-pool.hpp"
#include "courier/byte-buffer.hpp"
#include "courier/cache-headers.hpp"
#include "courier/exception.hpp"
#include "courier/executor.hpp"
#include "courier/failure-translator.hpp"
#include "courier/http-header.hpp"
#include "courier/http-status-code.hpp"
#include "courier/invalid_argument_exception.hpp"
#include "courier/log.hpp"
#include "courier/network-config.hpp"
#include "courier/network-response.hpp"
#include "courier/request-error.hpp"
#include "courier/response-classifier.hpp"
#include "courier/stream-materializer.hpp"
#include "courier/timedef.hpp"
#include "courier/transport-response.hpp"

namespace courier {

namespace {

std::chrono::milliseconds ElapsedSince(SteadyTimePoint start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
}

std::vector<http::Header> CopyHeaders(const TransportResponse &response) {
  const auto headers = response.headers();
  return {headers.begin(), headers.end()};
}

// State of a logical request across all its attempts.
class RequestCall : public std::enable_shared_from_this<RequestCall> {
 public:
  RequestCall(std::shared_ptr<Request> request, OnRequestComplete onComplete, const NetworkConfig &config,
              std::shared_ptr<AsyncTransport> transport, std::shared_ptr<BufferPool> pool,
              std::weak_ptr<Executor> blockingExecutor, std::shared_ptr<FailureClassifier> failureClassifier)
      : _config(config),
        _request(std::move(request)),
        _onComplete(std::move(onComplete)),
        _transport(std::move(transport)),
        _pool(std::move(pool)),
        _blockingExecutor(std::move(blockingExecutor)),
        _failureClassifier(std::move(failureClassifier)) {}

  // Requests a new attempt.
  // The thread bringing the number of pending attempts from 0 runs them in a loop, any other one only registers its
  // attempt. This way, a transport resolving attempts synchronously does not grow the stack with each retry.
  void dispatch() {
    if (_nbPendingAttempts.fetch_add(1, std::memory_order_acq_rel) != 0) {
      return;
    }
    do {
      runAttempt();
    } while (_nbPendingAttempts.fetch_sub(1, std::memory_order_acq_rel) != 1);
  }

 private:
  void runAttempt() {
    const SteadyTimePoint start = SteadyClock::now();
    auto attemptResolved = std::make_shared<std::atomic<bool>>(false);
    TransportCallback callback = [self = shared_from_this(), start, attemptResolved](TransportResult result) {
      if (attemptResolved->exchange(true, std::memory_order_acq_rel)) {
        log::error("[{}] Transport resolved the same attempt twice, ignoring", self->_request->identity());
        return;
      }
      self->onTransportResult(std::move(result), start);
    };
    try {
      _transport->executeRequest(_request, CacheHeaders(_request->cacheEntry()), std::move(callback));
    } catch (const std::exception &ex) {
      if (attemptResolved->exchange(true, std::memory_order_acq_rel)) {
        // raised while handling the outcome of the attempt (by the caller's continuation for instance)
        throw;
      }
      onFailure(FailureContext{TransportFailure{TransportFailureKind::Io, ex.what()}, std::nullopt,
                               ElapsedSince(start)});
    }
  }

  void onTransportResult(TransportResult result, SteadyTimePoint start) {
    std::visit(
        [this, start](auto &outcome) {
          using T = std::decay_t<decltype(outcome)>;
          if constexpr (std::is_same_v<T, TransportResponse>) {
            onResponse(std::move(outcome), start);
          } else if constexpr (std::is_same_v<T, AuthFailure>) {
            fail(RequestError(ErrorKind::AuthFailure, outcome.message, std::nullopt, ElapsedSince(start)));
          } else {
            onFailure(FailureContext{std::move(outcome), std::nullopt, ElapsedSince(start)});
          }
        },
        result);
  }

  void onResponse(TransportResponse response, SteadyTimePoint start) {
    if (response.statusCode() == http::StatusCodeNotModified) {
      // any pending body stream is closed with the response
      succeed(NotModifiedResponse(response.headers(), _request->cacheEntry(), ElapsedSince(start)));
      return;
    }
    if (response.hasContentBytes()) {
      onBodyReceived(response.statusCode(), CopyHeaders(response), response.takeContentBytes(), start);
      return;
    }
    if (!response.hasContent()) {
      onBodyReceived(response.statusCode(), CopyHeaders(response), ByteBuffer{}, start);
      return;
    }

    // Reading the stream may block: never do it on the transport thread.
    auto pendingResponse = std::make_shared<TransportResponse>(std::move(response));
    try {
      const auto blockingExecutor = _blockingExecutor.lock();
      if (!blockingExecutor) {
        throw exception("Blocking executor has been destroyed");
      }
      blockingExecutor->submit(
          [self = shared_from_this(), pendingResponse, start] { self->copyBody(*pendingResponse, start); });
    } catch (const std::exception &ex) {
      log::error("[{}] Unable to schedule body copy: {}", _request->identity(), ex.what());
      onFailure(FailureContext{TransportFailure{TransportFailureKind::Io, ex.what()},
                               ReceivedResponse{pendingResponse->statusCode(), CopyHeaders(*pendingResponse), {}},
                               ElapsedSince(start)});
    }
  }

  void copyBody(TransportResponse &response, SteadyTimePoint start) {
    const auto stream = response.releaseContent();
    ByteBuffer body;
    try {
      body = MaterializeStream(*stream, response.contentLength(), *_pool, _config.defaultBodyBufferSize);
    } catch (const std::exception &ex) {
      onFailure(FailureContext{TransportFailure{TransportFailureKind::Io, ex.what()},
                               ReceivedResponse{response.statusCode(), CopyHeaders(response), {}},
                               ElapsedSince(start)});
      return;
    }
    onBodyReceived(response.statusCode(), CopyHeaders(response), std::move(body), start);
  }

  void onBodyReceived(http::StatusCode statusCode, std::vector<http::Header> headers, ByteBuffer body,
                      SteadyTimePoint start) {
    ResponseOutcome outcome =
        ClassifyResponse(*_request, statusCode, std::move(headers), std::move(body), ElapsedSince(start), _config);
    if (auto *networkResponse = std::get_if<NetworkResponse>(&outcome)) {
      succeed(std::move(*networkResponse));
    } else {
      onFailure(std::get<FailureContext>(outcome));
    }
  }

  void onFailure(const FailureContext &context) {
    log::debug("[{}] Attempt failed ({}): {}", _request->identity(), TransportFailureKindToString(context.failure.kind),
               context.failure.message);
    std::optional<FailureDecision> decision;
    try {
      decision.emplace(_failureClassifier->classify(*_request, context));
    } catch (const std::exception &ex) {
      log::error("[{}] Failure classification error: {}", _request->identity(), ex.what());
      fail(RequestError(ErrorKind::Network, fmt::format("failure classification error: {}", ex.what()), std::nullopt,
                        context.networkTime));
      return;
    }
    if (auto *error = std::get_if<RequestError>(&*decision)) {
      fail(std::move(*error));
      return;
    }
    log::debug("[{}] Retrying ({})", _request->identity(), std::get<RetrySignal>(*decision).reason);
    dispatch();
  }

  void succeed(NetworkResponse response) {
    if (markCompleted()) {
      _onComplete.onSuccess(std::move(response));
    }
  }

  void fail(RequestError error) {
    if (markCompleted()) {
      _onComplete.onError(std::move(error));
    }
  }

  bool markCompleted() {
    if (_completed.exchange(true, std::memory_order_acq_rel)) {
      log::error("[{}] Request already completed, dropping new outcome", _request->identity());
      return false;
    }
    return true;
  }

  NetworkConfig _config;
  std::shared_ptr<Request> _request;
  OnRequestComplete _onComplete;
  std::shared_ptr<AsyncTransport> _transport;
  std::shared_ptr<BufferPool> _pool;
  // not owned: a copy task must never hold the last reference to the executor running it
  std::weak_ptr<Executor> _blockingExecutor;
  std::shared_ptr<FailureClassifier> _failureClassifier;
  std::atomic<uint32_t> _nbPendingAttempts{0};
  std::atomic<bool> _completed{false};
};

}  // namespace

AsyncNetwork::AsyncNetwork(std::shared_ptr<AsyncTransport> transport, NetworkConfig config,
                           std::shared_ptr<BufferPool> pool)
    : _config(std::move(config)),
      _transport(std::move(transport)),
      _pool(std::move(pool)),
      _failureClassifier(std::make_shared<DefaultFailureClassifier>()) {
  _config.validate();
  if (!_transport) {
    throw invalid_argument("AsyncNetwork needs a transport");
  }
  if (!_pool) {
    _pool = std::make_shared<ByteArrayPool>(_config.bufferPoolSizeLimit);
  }
}

void AsyncNetwork::setBlockingExecutor(std::shared_ptr<Executor> blockingExecutor) {
  _blockingExecutor = std::move(blockingExecutor);
}

void AsyncNetwork::setFailureClassifier(std::shared_ptr<FailureClassifier> failureClassifier) {
  if (failureClassifier) {
    _failureClassifier = std::move(failureClassifier);
  } else {
    _failureClassifier = std::make_shared<DefaultFailureClassifier>();
  }
}

void AsyncNetwork::performRequest(std::shared_ptr<Request> request, OnRequestComplete onComplete) {
  if (!_blockingExecutor) {
    throw exception("AsyncNetwork blocking executor must be set before performing requests");
  }
  if (!request) {
    throw invalid_argument("Cannot perform a null request");
  }
  auto call = std::make_shared<RequestCall>(std::move(request), std::move(onComplete), _config, _transport, _pool,
                                            _blockingExecutor, _failureClassifier);
  call->dispatch();
}

}  // namespace courier
