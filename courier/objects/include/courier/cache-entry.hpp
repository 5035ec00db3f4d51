#pragma once

#include <string>
#include <vector>

#include "courier/byte-buffer.hpp"
#include "courier/http-header.hpp"
#include "courier/timedef.hpp"

namespace courier {

// Data of a previously cached response, used to revalidate it with the server.
// Freshness policy (ttl computation) is the responsibility of the cache layer owning the entry.
struct CacheEntry {
  // Returns true if the entry has at least one validator the server can use for revalidation.
  [[nodiscard]] bool hasValidators() const noexcept { return !etag.empty() || lastModified != SysTimePoint{}; }

  // Cached body, returned as-is on 304 Not Modified.
  ByteBuffer data;

  // ETag of the cached response, empty if none.
  std::string etag;

  // Last-Modified date as reported by the server. Epoch means unknown.
  SysTimePoint lastModified;

  // Headers of the cached response, in order.
  std::vector<http::Header> responseHeaders;
};

}  // namespace courier
