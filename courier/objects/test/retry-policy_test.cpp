#include "courier/retry-policy.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "courier/invalid_argument_exception.hpp"
#include "courier/request-error.hpp"

namespace courier {

using namespace std::chrono_literals;

TEST(DefaultRetryPolicyTest, Defaults) {
  DefaultRetryPolicy policy;
  EXPECT_EQ(policy.currentTimeout(), 2500ms);
  EXPECT_EQ(policy.currentRetryCount(), 0U);
  EXPECT_EQ(policy.maxRetries(), 1U);
  EXPECT_TRUE(policy.hasAttemptRemaining());
}

TEST(DefaultRetryPolicyTest, OneRetryThenGiveUp) {
  DefaultRetryPolicy policy;
  const RequestError error(ErrorKind::Timeout);

  EXPECT_TRUE(policy.retry(error));
  EXPECT_EQ(policy.currentRetryCount(), 1U);
  EXPECT_EQ(policy.currentTimeout(), 5000ms);  // doubled with the default multiplier of 1

  EXPECT_FALSE(policy.retry(error));
  EXPECT_EQ(policy.currentRetryCount(), 2U);
}

TEST(DefaultRetryPolicyTest, BackoffMultiplier) {
  DefaultRetryPolicy policy(1000ms, 3, 0.5F);
  const RequestError error(ErrorKind::Server);

  EXPECT_TRUE(policy.retry(error));
  EXPECT_EQ(policy.currentTimeout(), 1500ms);
  EXPECT_TRUE(policy.retry(error));
  EXPECT_EQ(policy.currentTimeout(), 2250ms);
  EXPECT_TRUE(policy.retry(error));
  EXPECT_FALSE(policy.retry(error));
}

TEST(DefaultRetryPolicyTest, NoRetry) {
  DefaultRetryPolicy policy(100ms, 0, 1.0F);
  EXPECT_FALSE(policy.retry(RequestError(ErrorKind::Network)));
}

TEST(DefaultRetryPolicyTest, InvalidArguments) {
  EXPECT_THROW(DefaultRetryPolicy(-1ms, 1, 1.0F), invalid_argument);
  EXPECT_THROW(DefaultRetryPolicy(10ms, 1, -0.5F), invalid_argument);
}

}  // namespace courier
