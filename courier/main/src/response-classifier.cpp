#include "courier/response-classifier.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cstddef>
#include <utility>
#include <vector>

#include "courier/async-transport.hpp"
#include "courier/failure-translator.hpp"
#include "courier/log.hpp"

namespace courier {

void LogSlowRequest(const Request &request, std::chrono::milliseconds lifetime, std::size_t nbBytes,
                    http::StatusCode statusCode, const NetworkConfig &config) {
  if (config.logAllRequests || lifetime > config.slowRequestThreshold) {
    log::info("HTTP response for request=<{}> [lifetime={} ms], [size={}], [rc={}], [retryCount={}]",
              request.identity(), lifetime.count(), nbBytes, statusCode, request.retryPolicy().currentRetryCount());
  }
}

ResponseOutcome ClassifyResponse(const Request &request, http::StatusCode statusCode,
                                 std::vector<http::Header> headers, ByteBuffer body,
                                 std::chrono::milliseconds networkTime, const NetworkConfig &config) {
  LogSlowRequest(request, networkTime, body.size(), statusCode, config);

  if (!http::IsSuccess(statusCode)) {
    return FailureContext{TransportFailure{TransportFailureKind::Io, fmt::format("unexpected status {}", statusCode)},
                          ReceivedResponse{statusCode, std::move(headers), std::move(body)}, networkTime};
  }
  return NetworkResponse(statusCode, std::move(body), false, networkTime, std::move(headers));
}

}  // namespace courier
