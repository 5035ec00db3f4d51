#pragma once

#include <functional>
#include <memory>

#include "courier/async-transport.hpp"
#include "courier/byte-array-pool.hpp"
#include "courier/executor.hpp"
#include "courier/failure-translator.hpp"
#include "courier/network-config.hpp"
#include "courier/network-response.hpp"
#include "courier/request-error.hpp"
#include "courier/request.hpp"

namespace courier {

// Continuation of a logical request. Exactly one of the two callbacks is invoked, exactly once, whatever the number
// of attempts. They may be invoked from any thread: the one of the transport, or the one of the blocking executor.
struct OnRequestComplete {
  std::function<void(NetworkResponse)> onSuccess;
  std::function<void(RequestError)> onError;
};

// Asynchronous request execution on top of an AsyncTransport.
//
// Each attempt of a request is dispatched to the transport, then its outcome is turned into a NetworkResponse:
//  - a 304 Not Modified answer is served from the cache entry of the request, without reading any body
//  - an already available body is used as is
//  - a streamed body is copied on the blocking executor, in buffers leased from the buffer pool
// Failed attempts are translated by the FailureClassifier into either a terminal RequestError or a new attempt.
// Attempts of a request are strictly sequential, and re-dispatch is iterative: a transport calling back
// synchronously does not grow the call stack with each retry.
//
// Basic usage:
//   AsyncNetwork network(std::make_shared<MyTransport>());
//   network.setBlockingExecutor(std::make_shared<ThreadPool>());
//   network.performRequest(std::make_shared<Request>("https://example.com"),
//                          {[](NetworkResponse resp) { ... }, [](RequestError err) { ... }});
//
// Thread-safety: configure the network before performing requests. performRequest may then be called concurrently.
class AsyncNetwork {
 public:
  // Creates a network sending its requests through given transport.
  // If pool is nullptr, a ByteArrayPool bounded by config.bufferPoolSizeLimit is created.
  // Throws invalid_argument if config is invalid.
  explicit AsyncNetwork(std::shared_ptr<AsyncTransport> transport, NetworkConfig config = {},
                        std::shared_ptr<BufferPool> pool = nullptr);

  // Sets the executor on which streamed bodies are copied. Mandatory before the first call to performRequest.
  // In-flight requests do not extend its lifetime: once the network and the executor are destroyed, pending body
  // copies fail like transport I/O errors.
  void setBlockingExecutor(std::shared_ptr<Executor> blockingExecutor);

  // Replaces the failure classifier. A null classifier resets it to a DefaultFailureClassifier.
  void setFailureClassifier(std::shared_ptr<FailureClassifier> failureClassifier);

  // Starts the execution of given request. Never blocks.
  // Throws courier::exception if no blocking executor has been set, in which case onComplete is never invoked.
  void performRequest(std::shared_ptr<Request> request, OnRequestComplete onComplete);

  [[nodiscard]] const NetworkConfig &config() const noexcept { return _config; }

  [[nodiscard]] BufferPool &bufferPool() noexcept { return *_pool; }

 private:
  NetworkConfig _config;
  std::shared_ptr<AsyncTransport> _transport;
  std::shared_ptr<BufferPool> _pool;
  std::shared_ptr<Executor> _blockingExecutor;
  std::shared_ptr<FailureClassifier> _failureClassifier;
};

}  // namespace courier
