#include "courier/request.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "courier/cache-entry.hpp"
#include "courier/invalid_argument_exception.hpp"
#include "courier/retry-policy.hpp"

namespace courier {

using namespace std::chrono_literals;

TEST(RequestTest, Defaults) {
  Request request("https://example.com/items");
  EXPECT_EQ(request.url(), "https://example.com/items");
  EXPECT_EQ(request.method(), "GET");
  EXPECT_EQ(request.identity(), "GET https://example.com/items");
  EXPECT_EQ(request.cacheEntry(), nullptr);
  EXPECT_FALSE(request.shouldRetryServerErrors());
  EXPECT_FALSE(request.shouldRetryConnectionErrors());
  EXPECT_EQ(request.timeout(), DefaultRetryPolicy::kDefaultTimeout);
}

TEST(RequestTest, EmptyUrlIsInvalid) { EXPECT_THROW(Request(""), invalid_argument); }

TEST(RequestTest, Setters) {
  Request request("https://example.com/items", "POST");
  CacheEntry entry;
  entry.etag = "\"v1\"";
  request.addHeader("Accept", "application/json")
      .setBody("{}")
      .setCacheEntry(entry)
      .setShouldRetryServerErrors()
      .setShouldRetryConnectionErrors()
      .setRetryPolicy(std::make_unique<DefaultRetryPolicy>(100ms, 5, 0.0F));

  EXPECT_EQ(request.method(), "POST");
  EXPECT_EQ(request.body(), "{}");
  ASSERT_EQ(request.headers().size(), 1U);
  EXPECT_EQ(request.headers()[0].name(), "Accept");
  ASSERT_NE(request.cacheEntry(), nullptr);
  EXPECT_EQ(request.cacheEntry()->etag, "\"v1\"");
  EXPECT_TRUE(request.shouldRetryServerErrors());
  EXPECT_TRUE(request.shouldRetryConnectionErrors());
  EXPECT_EQ(request.timeout(), 100ms);

  request.setRetryPolicy(nullptr);
  EXPECT_EQ(request.timeout(), DefaultRetryPolicy::kDefaultTimeout);
}

TEST(RequestTest, MarkersFromSeveralThreads) {
  Request request("https://example.com");
  std::vector<std::thread> threads;
  for (int threadPos = 0; threadPos < 4; ++threadPos) {
    threads.emplace_back([&request] {
      for (int markerPos = 0; markerPos < 50; ++markerPos) {
        request.addMarker("marker");
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  EXPECT_EQ(request.markers().size(), 200U);
}

}  // namespace courier
