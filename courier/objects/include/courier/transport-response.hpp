#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "courier/byte-buffer.hpp"
#include "courier/http-header.hpp"
#include "courier/http-status-code.hpp"
#include "courier/input-stream.hpp"

namespace courier {

// Raw outcome of one successful transport exchange.
// The body may be already available (content bytes), pending in an open stream, or absent.
// Destroying a response still owning its stream closes it.
class TransportResponse {
 public:
  static constexpr int64_t kUnknownContentLength = -1;

  // Response without body.
  TransportResponse(http::StatusCode statusCode, std::vector<http::Header> headers);

  // Response whose body has already been read by the transport.
  TransportResponse(http::StatusCode statusCode, std::vector<http::Header> headers, ByteBuffer contentBytes);

  // Response whose body remains to be read from given stream.
  // contentLength is the declared length of the body, or a negative value if unknown.
  TransportResponse(http::StatusCode statusCode, std::vector<http::Header> headers,
                    std::unique_ptr<InputStream> content, int64_t contentLength = kUnknownContentLength);

  TransportResponse(const TransportResponse &) = delete;
  TransportResponse(TransportResponse &&) noexcept = default;
  TransportResponse &operator=(const TransportResponse &) = delete;
  TransportResponse &operator=(TransportResponse &&) noexcept;

  ~TransportResponse();

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  // Response headers in reception order, duplicates kept.
  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  [[nodiscard]] bool hasContentBytes() const noexcept { return _contentBytes.has_value(); }

  [[nodiscard]] bool hasContent() const noexcept { return _content != nullptr; }

  // Moves out the already available body. Precondition: hasContentBytes().
  [[nodiscard]] ByteBuffer takeContentBytes() noexcept;

  // Gives the ownership of the body stream to the caller, who becomes responsible for closing it.
  [[nodiscard]] std::unique_ptr<InputStream> releaseContent() noexcept { return std::move(_content); }

  // Declared body length, negative if unknown.
  [[nodiscard]] int64_t contentLength() const noexcept { return _contentLength; }

 private:
  std::vector<http::Header> _headers;
  std::optional<ByteBuffer> _contentBytes;
  std::unique_ptr<InputStream> _content;
  int64_t _contentLength{kUnknownContentLength};
  http::StatusCode _statusCode;
};

}  // namespace courier
