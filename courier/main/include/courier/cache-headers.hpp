#pragma once

#include <span>
#include <vector>

#include "courier/cache-entry.hpp"
#include "courier/http-header.hpp"

namespace courier {

// Returns the conditional headers allowing the server to revalidate given cache entry:
//  - If-None-Match with the entry etag, if any
//  - If-Modified-Since with the entry last modified date, if known
// Returns an empty list if entry is nullptr.
std::vector<http::Header> CacheHeaders(const CacheEntry *entry);

// Merges the headers of a 304 response with the headers of the revalidated cache entry.
// Response headers come first and take precedence. Cached headers whose name (case-insensitive) does not appear in the
// response are appended, in their cached order.
std::vector<http::Header> CombineHeaders(std::span<const http::Header> responseHeaders, const CacheEntry &entry);

}  // namespace courier
