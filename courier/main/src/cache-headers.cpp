#include "courier/cache-headers.hpp"

#include <span>
#include <vector>

#include "courier/cache-entry.hpp"
#include "courier/http-constants.hpp"
#include "courier/http-header.hpp"
#include "courier/timedef.hpp"
#include "courier/timestring.hpp"

namespace courier {

std::vector<http::Header> CacheHeaders(const CacheEntry *entry) {
  std::vector<http::Header> headers;
  if (entry == nullptr) {
    return headers;
  }
  if (!entry->etag.empty()) {
    headers.emplace_back(http::IfNoneMatch, entry->etag);
  }
  if (entry->lastModified != SysTimePoint{}) {
    headers.emplace_back(http::IfModifiedSince, TimeToStringRFC7231(entry->lastModified));
  }
  return headers;
}

std::vector<http::Header> CombineHeaders(std::span<const http::Header> responseHeaders, const CacheEntry &entry) {
  std::vector<http::Header> combined(responseHeaders.begin(), responseHeaders.end());
  combined.reserve(responseHeaders.size() + entry.responseHeaders.size());
  for (const http::Header &cachedHeader : entry.responseHeaders) {
    if (!http::FindHeaderValue(responseHeaders, cachedHeader.name())) {
      combined.push_back(cachedHeader);
    }
  }
  return combined;
}

}  // namespace courier
