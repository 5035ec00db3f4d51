#include "courier/transport-response.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <utility>
#include <vector>

#include "courier/input-stream.hpp"
#include "courier/log.hpp"

namespace courier {

void CloseQuietly(InputStream &stream) noexcept {
  try {
    stream.close();
  } catch (const std::exception &ex) {
    log::debug("Error occurred when closing response stream: {}", ex.what());
  }
}

TransportResponse::TransportResponse(http::StatusCode statusCode, std::vector<http::Header> headers)
    : _headers(std::move(headers)), _statusCode(statusCode) {}

TransportResponse::TransportResponse(http::StatusCode statusCode, std::vector<http::Header> headers,
                                     ByteBuffer contentBytes)
    : _headers(std::move(headers)),
      _contentBytes(std::move(contentBytes)),
      _contentLength(static_cast<int64_t>(_contentBytes->size())),
      _statusCode(statusCode) {}

TransportResponse::TransportResponse(http::StatusCode statusCode, std::vector<http::Header> headers,
                                     std::unique_ptr<InputStream> content, int64_t contentLength)
    : _headers(std::move(headers)), _content(std::move(content)), _contentLength(contentLength), _statusCode(statusCode) {}

TransportResponse &TransportResponse::operator=(TransportResponse &&rhs) noexcept {
  if (this != &rhs) {
    if (_content) {
      CloseQuietly(*_content);
    }
    _headers = std::move(rhs._headers);
    _contentBytes = std::move(rhs._contentBytes);
    _content = std::move(rhs._content);
    _contentLength = rhs._contentLength;
    _statusCode = rhs._statusCode;
  }
  return *this;
}

TransportResponse::~TransportResponse() {
  if (_content) {
    CloseQuietly(*_content);
  }
}

ByteBuffer TransportResponse::takeContentBytes() noexcept {
  ByteBuffer ret = std::move(*_contentBytes);
  _contentBytes.reset();
  return ret;
}

}  // namespace courier
