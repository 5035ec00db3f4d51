#include "courier/scripted-transport.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "courier/byte-buffer.hpp"
#include "courier/transport-response.hpp"

namespace courier::test {

ScriptedTransport &ScriptedTransport::then(Step step) {
  std::scoped_lock lock(_mutex);
  _steps.push_back(std::move(step));
  return *this;
}

ScriptedTransport &ScriptedTransport::thenRepeat(std::size_t nbTimes, const Step &step) {
  std::scoped_lock lock(_mutex);
  _steps.insert(_steps.end(), nbTimes, step);
  return *this;
}

ScriptedTransport &ScriptedTransport::thenRespond(http::StatusCode statusCode, std::string_view body,
                                                  std::vector<http::Header> headers) {
  return then([statusCode, body = std::string(body), headers = std::move(headers)](const Request &) {
    return TransportResult(TransportResponse(statusCode, headers, ToByteBuffer(body)));
  });
}

ScriptedTransport &ScriptedTransport::thenRespondEmpty(http::StatusCode statusCode,
                                                       std::vector<http::Header> headers) {
  return then([statusCode, headers = std::move(headers)](const Request &) {
    return TransportResult(TransportResponse(statusCode, headers));
  });
}

ScriptedTransport &ScriptedTransport::thenFail(TransportFailureKind kind, std::string message) {
  return then([kind, message = std::move(message)](const Request &) {
    return TransportResult(TransportFailure{kind, message});
  });
}

ScriptedTransport &ScriptedTransport::thenAuthFail(std::string message) {
  return then([message = std::move(message)](const Request &) { return TransportResult(AuthFailure{message}); });
}

void ScriptedTransport::setDeferred(bool deferred) {
  std::scoped_lock lock(_mutex);
  _deferred = deferred;
}

ScriptedTransport::Step ScriptedTransport::nextStep() {
  std::scoped_lock lock(_mutex);
  if (_steps.empty()) {
    return [](const Request &) {
      return TransportResult(TransportFailure{TransportFailureKind::Io, "no scripted step left"});
    };
  }
  Step step = std::move(_steps.front());
  _steps.pop_front();
  return step;
}

bool ScriptedTransport::resolveNext() {
  PendingAttempt attempt;
  {
    std::scoped_lock lock(_mutex);
    if (_pendingAttempts.empty()) {
      return false;
    }
    attempt = std::move(_pendingAttempts.front());
    _pendingAttempts.pop_front();
  }
  attempt.callback(nextStep()(*attempt.request));
  return true;
}

void ScriptedTransport::executeRequest(const std::shared_ptr<Request> &request,
                                       std::vector<http::Header> extraHeaders, TransportCallback callback) {
  {
    std::scoped_lock lock(_mutex);
    _receivedExtraHeaders.push_back(std::move(extraHeaders));
    _receivedTimeouts.push_back(request->timeout());
    if (_deferred) {
      _pendingAttempts.push_back(PendingAttempt{request, std::move(callback)});
      return;
    }
    ++_nbNestedCalls;
    _maxNestedCalls = std::max(_maxNestedCalls, _nbNestedCalls);
  }

  callback(nextStep()(*request));

  std::scoped_lock lock(_mutex);
  --_nbNestedCalls;
}

std::size_t ScriptedTransport::nbCalls() const {
  std::scoped_lock lock(_mutex);
  return _receivedTimeouts.size();
}

std::size_t ScriptedTransport::nbPendingAttempts() const {
  std::scoped_lock lock(_mutex);
  return _pendingAttempts.size();
}

std::size_t ScriptedTransport::maxNestedCalls() const {
  std::scoped_lock lock(_mutex);
  return _maxNestedCalls;
}

std::vector<std::vector<http::Header>> ScriptedTransport::receivedExtraHeaders() const {
  std::scoped_lock lock(_mutex);
  return _receivedExtraHeaders;
}

std::vector<std::chrono::milliseconds> ScriptedTransport::receivedTimeouts() const {
  std::scoped_lock lock(_mutex);
  return _receivedTimeouts;
}

}  // namespace courier::test
