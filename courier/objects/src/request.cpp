#include "courier/request.hpp"

#include <spdlog/fmt/fmt.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "courier/invalid_argument_exception.hpp"
#include "courier/log.hpp"
#include "courier/retry-policy.hpp"

namespace courier {

Request::Request(std::string url, std::string_view method)
    : _url(std::move(url)), _method(method), _retryPolicy(std::make_unique<DefaultRetryPolicy>()) {
  if (_url.empty()) {
    throw invalid_argument("Request url should not be empty");
  }
  if (_method.empty()) {
    throw invalid_argument("Request method should not be empty");
  }
}

std::string Request::identity() const { return fmt::format("{} {}", _method, _url); }

Request &Request::addHeader(std::string_view name, std::string_view value) {
  _headers.emplace_back(name, value);
  return *this;
}

Request &Request::setBody(std::string body) {
  _body = std::move(body);
  return *this;
}

Request &Request::setCacheEntry(std::optional<CacheEntry> cacheEntry) {
  _cacheEntry = std::move(cacheEntry);
  return *this;
}

Request &Request::setRetryPolicy(std::unique_ptr<RetryPolicy> retryPolicy) {
  if (retryPolicy) {
    _retryPolicy = std::move(retryPolicy);
  } else {
    _retryPolicy = std::make_unique<DefaultRetryPolicy>();
  }
  return *this;
}

Request &Request::setShouldRetryServerErrors(bool on) noexcept {
  _shouldRetryServerErrors = on;
  return *this;
}

Request &Request::setShouldRetryConnectionErrors(bool on) noexcept {
  _shouldRetryConnectionErrors = on;
  return *this;
}

void Request::addMarker(std::string marker) {
  log::debug("[{}] {}", identity(), marker);
  std::scoped_lock lock(_markersMutex);
  _markers.push_back(std::move(marker));
}

std::vector<std::string> Request::markers() const {
  std::scoped_lock lock(_markersMutex);
  return _markers;
}

}  // namespace courier
