#pragma once

#include <chrono>
#include <span>
#include <utility>
#include <vector>

#include "courier/byte-buffer.hpp"
#include "courier/http-header.hpp"
#include "courier/http-status-code.hpp"

namespace courier {

// Finalized response of a network exchange, delivered to the caller.
// Immutable once built.
class NetworkResponse {
 public:
  NetworkResponse(http::StatusCode statusCode, ByteBuffer data, bool notModified, std::chrono::milliseconds networkTime,
                  std::vector<http::Header> headers) noexcept
      : _headers(std::move(headers)),
        _data(std::move(data)),
        _networkTime(networkTime),
        _statusCode(statusCode),
        _notModified(notModified) {}

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  // Body bytes. Never absent: a response without content has an empty buffer.
  [[nodiscard]] const ByteBuffer &data() const noexcept { return _data; }

  // True when the server answered 304 Not Modified: data() then holds the cached body, if any.
  [[nodiscard]] bool notModified() const noexcept { return _notModified; }

  // Duration of the network exchange of the attempt that produced this response.
  [[nodiscard]] std::chrono::milliseconds networkTime() const noexcept { return _networkTime; }

  // Response headers in reception order. Duplicated names are kept.
  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  bool operator==(const NetworkResponse &) const noexcept = default;

 private:
  std::vector<http::Header> _headers;
  ByteBuffer _data;
  std::chrono::milliseconds _networkTime;
  http::StatusCode _statusCode;
  bool _notModified;
};

}  // namespace courier
