#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "courier/async-transport.hpp"
#include "courier/http-header.hpp"
#include "courier/http-status-code.hpp"
#include "courier/request.hpp"

namespace courier::test {

// AsyncTransport replaying a script: each executeRequest call consumes the next step, in order.
// Once the script is exhausted, attempts fail with an I/O failure.
//
// By default the callback is invoked synchronously, before executeRequest returns. In deferred mode, attempts are
// kept pending until the test resolves them with resolveNext(), possibly from another thread.
class ScriptedTransport final : public AsyncTransport {
 public:
  using Step = std::function<TransportResult(const Request &)>;

  ScriptedTransport &then(Step step);

  // Repeats given step nbTimes.
  ScriptedTransport &thenRepeat(std::size_t nbTimes, const Step &step);

  // Responds with an already available body.
  ScriptedTransport &thenRespond(http::StatusCode statusCode, std::string_view body,
                                 std::vector<http::Header> headers = {});

  // Responds without any body.
  ScriptedTransport &thenRespondEmpty(http::StatusCode statusCode, std::vector<http::Header> headers = {});

  ScriptedTransport &thenFail(TransportFailureKind kind, std::string message = "scripted failure");

  ScriptedTransport &thenAuthFail(std::string message = "scripted auth failure");

  void setDeferred(bool deferred = true);

  // Resolves the oldest pending attempt with the next step. Returns false if no attempt is pending.
  bool resolveNext();

  void executeRequest(const std::shared_ptr<Request> &request, std::vector<http::Header> extraHeaders,
                      TransportCallback callback) override;

  [[nodiscard]] std::size_t nbCalls() const;

  [[nodiscard]] std::size_t nbPendingAttempts() const;

  // Maximum number of executeRequest calls observed on the same call stack.
  [[nodiscard]] std::size_t maxNestedCalls() const;

  // Extra headers received by each call, in call order.
  [[nodiscard]] std::vector<std::vector<http::Header>> receivedExtraHeaders() const;

  // Request timeout observed by each call, in call order.
  [[nodiscard]] std::vector<std::chrono::milliseconds> receivedTimeouts() const;

 private:
  struct PendingAttempt {
    std::shared_ptr<Request> request;
    TransportCallback callback;
  };

  Step nextStep();

  mutable std::mutex _mutex;
  std::deque<Step> _steps;
  std::deque<PendingAttempt> _pendingAttempts;
  std::vector<std::vector<http::Header>> _receivedExtraHeaders;
  std::vector<std::chrono::milliseconds> _receivedTimeouts;
  std::size_t _nbNestedCalls{0};
  std::size_t _maxNestedCalls{0};
  bool _deferred{false};
};

}  // namespace courier::test
