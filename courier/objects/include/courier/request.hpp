#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "courier/cache-entry.hpp"
#include "courier/http-header.hpp"
#include "courier/retry-policy.hpp"

namespace courier {

// Logical unit of work sent through an AsyncNetwork.
// Configure it before dispatching it: once handed to performRequest, only its retry policy and markers are mutated
// (by the network itself).
class Request {
 public:
  explicit Request(std::string url, std::string_view method = "GET");

  [[nodiscard]] std::string_view url() const noexcept { return _url; }

  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  // Identity of the request used in logs.
  [[nodiscard]] std::string identity() const;

  [[nodiscard]] const std::vector<http::Header> &headers() const noexcept { return _headers; }

  Request &addHeader(std::string_view name, std::string_view value);

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  Request &setBody(std::string body);

  // Cache entry to revalidate, or nullptr if the request has no cached counterpart.
  [[nodiscard]] const CacheEntry *cacheEntry() const noexcept { return _cacheEntry ? &*_cacheEntry : nullptr; }

  Request &setCacheEntry(std::optional<CacheEntry> cacheEntry);

  [[nodiscard]] RetryPolicy &retryPolicy() noexcept { return *_retryPolicy; }
  [[nodiscard]] const RetryPolicy &retryPolicy() const noexcept { return *_retryPolicy; }

  // Replaces the retry policy. A null policy resets it to a DefaultRetryPolicy.
  Request &setRetryPolicy(std::unique_ptr<RetryPolicy> retryPolicy);

  // Timeout to apply to the current attempt, as decided by the retry policy.
  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return _retryPolicy->currentTimeout(); }

  // Whether 5xx answers should be retried. Default: false.
  [[nodiscard]] bool shouldRetryServerErrors() const noexcept { return _shouldRetryServerErrors; }

  Request &setShouldRetryServerErrors(bool on = true) noexcept;

  // Whether connection establishment failures should be retried. Default: false.
  [[nodiscard]] bool shouldRetryConnectionErrors() const noexcept { return _shouldRetryConnectionErrors; }

  Request &setShouldRetryConnectionErrors(bool on = true) noexcept;

  // Records a debug event in the life of this request (retries, give ups...). Thread-safe.
  void addMarker(std::string marker);

  // Returns a copy of the recorded markers, in order. Thread-safe.
  [[nodiscard]] std::vector<std::string> markers() const;

 private:
  std::string _url;
  std::string _method;
  std::string _body;
  std::vector<http::Header> _headers;
  std::optional<CacheEntry> _cacheEntry;
  std::unique_ptr<RetryPolicy> _retryPolicy;
  mutable std::mutex _markersMutex;
  std::vector<std::string> _markers;
  bool _shouldRetryServerErrors{false};
  bool _shouldRetryConnectionErrors{false};
};

}  // namespace courier
