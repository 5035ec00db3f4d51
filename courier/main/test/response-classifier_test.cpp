#include "courier/response-classifier.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "courier/async-transport.hpp"
#include "courier/byte-buffer.hpp"
#include "courier/failure-translator.hpp"
#include "courier/http-header.hpp"
#include "courier/log.hpp"
#include "courier/network-config.hpp"
#include "courier/network-response.hpp"
#include "courier/request.hpp"

namespace courier {

using namespace std::chrono_literals;

class ResponseClassifierTest : public ::testing::Test {
 protected:
  Request request{"https://example.com/items"};
  NetworkConfig config;
};

TEST_F(ResponseClassifierTest, SuccessStatusCodes) {
  for (http::StatusCode statusCode : {200, 201, 204, 299}) {
    const ResponseOutcome outcome =
        ClassifyResponse(request, statusCode, {{"ETag", "\"v1\""}}, ToByteBuffer("ok"), 5ms, config);
    const auto *response = std::get_if<NetworkResponse>(&outcome);
    ASSERT_NE(response, nullptr) << statusCode;
    EXPECT_EQ(response->statusCode(), statusCode);
    EXPECT_EQ(AsStringView(response->data()), "ok");
    EXPECT_FALSE(response->notModified());
    EXPECT_EQ(response->networkTime(), 5ms);
    ASSERT_EQ(response->headers().size(), 1U);
  }
}

TEST_F(ResponseClassifierTest, OtherStatusCodesAreFailuresCarryingTheResponse) {
  for (http::StatusCode statusCode : {100, 199, 300, 302, 404, 500, 503}) {
    const ResponseOutcome outcome =
        ClassifyResponse(request, statusCode, {{"Retry-After", "1"}}, ToByteBuffer("err"), 7ms, config);
    const auto *context = std::get_if<FailureContext>(&outcome);
    ASSERT_NE(context, nullptr) << statusCode;
    EXPECT_EQ(context->failure.kind, TransportFailureKind::Io);
    EXPECT_EQ(context->networkTime, 7ms);
    ASSERT_TRUE(context->response.has_value());
    EXPECT_EQ(context->response->statusCode, statusCode);
    ASSERT_TRUE(context->response->body.has_value());
    EXPECT_EQ(AsStringView(*context->response->body), "err");
    ASSERT_EQ(context->response->headers.size(), 1U);
  }
}

class SlowRequestLogTest : public ResponseClassifierTest {
 protected:
  void SetUp() override {
    _previousLogger = log::default_logger();
    auto logger = std::make_shared<log::logger>("slow-request-test",
                                                std::make_shared<log::sinks::ostream_sink_mt>(_logs));
    logger->set_level(log::level::info);
    log::set_default_logger(std::move(logger));
  }

  void TearDown() override { log::set_default_logger(_previousLogger); }

  [[nodiscard]] std::string logs() const { return _logs.str(); }

 private:
  std::ostringstream _logs;
  std::shared_ptr<log::logger> _previousLogger;
};

TEST_F(SlowRequestLogTest, FastRequestIsNotLogged) {
  LogSlowRequest(request, 10ms, 2, 200, config);
  EXPECT_TRUE(logs().empty());
}

TEST_F(SlowRequestLogTest, SlowRequestIsLogged) {
  LogSlowRequest(request, 3001ms, 42, 200, config);
  const std::string output = logs();
  EXPECT_NE(output.find("GET https://example.com/items"), std::string::npos);
  EXPECT_NE(output.find("[lifetime=3001 ms]"), std::string::npos);
  EXPECT_NE(output.find("[size=42]"), std::string::npos);
  EXPECT_NE(output.find("[rc=200]"), std::string::npos);
  EXPECT_NE(output.find("[retryCount=0]"), std::string::npos);
}

TEST_F(SlowRequestLogTest, ThresholdIsExclusive) {
  LogSlowRequest(request, config.slowRequestThreshold, 0, 200, config);
  EXPECT_TRUE(logs().empty());
}

TEST_F(SlowRequestLogTest, LogAllRequests) {
  config.withLogAllRequests();
  LogSlowRequest(request, 0ms, 0, 204, config);
  EXPECT_NE(logs().find("[rc=204]"), std::string::npos);
}

TEST_F(SlowRequestLogTest, ClassifyResponseLogsFailuresToo) {
  config.withSlowRequestThreshold(0ms);
  (void)ClassifyResponse(request, 500, {}, ToByteBuffer("err"), 1ms, config);
  EXPECT_NE(logs().find("[rc=500]"), std::string::npos);
}

}  // namespace courier
