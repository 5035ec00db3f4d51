#pragma once

#include <chrono>
#include <cstddef>
#include <variant>
#include <vector>

#include "courier/byte-buffer.hpp"
#include "courier/failure-translator.hpp"
#include "courier/http-header.hpp"
#include "courier/http-status-code.hpp"
#include "courier/network-config.hpp"
#include "courier/network-response.hpp"
#include "courier/request.hpp"

namespace courier {

// Logs the attempt if it lasted longer than the configured threshold, or if all requests should be logged.
void LogSlowRequest(const Request &request, std::chrono::milliseconds lifetime, std::size_t nbBytes,
                    http::StatusCode statusCode, const NetworkConfig &config);

// Either the response to deliver, or the failure to translate.
using ResponseOutcome = std::variant<NetworkResponse, FailureContext>;

// Classifies a fully received response.
// A status code in [200, 299] is a success. Any other status code is reported as an I/O failure carrying the received
// response, so that it follows the same translation as transport failures.
[[nodiscard]] ResponseOutcome ClassifyResponse(const Request &request, http::StatusCode statusCode,
                                               std::vector<http::Header> headers, ByteBuffer body,
                                               std::chrono::milliseconds networkTime, const NetworkConfig &config);

}  // namespace courier
