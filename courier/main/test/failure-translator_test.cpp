#include "courier/failure-translator.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "courier/async-transport.hpp"
#include "courier/byte-buffer.hpp"
#include "courier/http-header.hpp"
#include "courier/request-error.hpp"
#include "courier/request.hpp"
#include "courier/retry-policy.hpp"

namespace courier {

using namespace std::chrono_literals;

namespace {

FailureContext NoResponse(TransportFailureKind kind) { return FailureContext{TransportFailure{kind, "boom"}, {}, 4ms}; }

FailureContext WithResponse(http::StatusCode statusCode, std::optional<ByteBuffer> body) {
  return FailureContext{TransportFailure{TransportFailureKind::Io, "unexpected status"},
                        ReceivedResponse{statusCode, {{"X-Trace", "42"}}, std::move(body)}, 9ms};
}

const RequestError &ExpectTerminal(const FailureCategory &category) {
  EXPECT_TRUE(std::holds_alternative<RequestError>(category));
  return std::get<RequestError>(category);
}

const RetryCandidate &ExpectCandidate(const FailureCategory &category) {
  EXPECT_TRUE(std::holds_alternative<RetryCandidate>(category));
  return std::get<RetryCandidate>(category);
}

}  // namespace

class CategorizeFailureTest : public ::testing::Test {
 protected:
  Request request{"https://example.com/items"};
};

TEST_F(CategorizeFailureTest, TimeoutIsSocketCandidate) {
  const FailureCategory category = CategorizeFailure(request, NoResponse(TransportFailureKind::Timeout));
  const RetryCandidate &candidate = ExpectCandidate(category);
  EXPECT_EQ(candidate.reason, "socket");
  EXPECT_EQ(candidate.error.kind(), ErrorKind::Timeout);
  EXPECT_EQ(candidate.error.networkTime(), 4ms);
}

TEST_F(CategorizeFailureTest, MalformedUrlIsTerminal) {
  const FailureCategory category = CategorizeFailure(request, NoResponse(TransportFailureKind::MalformedUrl));
  EXPECT_EQ(ExpectTerminal(category).kind(), ErrorKind::BadUrl);
}

TEST_F(CategorizeFailureTest, NoResponseIsTerminalNoConnectionByDefault) {
  for (auto kind : {TransportFailureKind::ConnectionFailed, TransportFailureKind::Io}) {
    const FailureCategory category = CategorizeFailure(request, NoResponse(kind));
    EXPECT_EQ(ExpectTerminal(category).kind(), ErrorKind::NoConnection);
  }
}

TEST_F(CategorizeFailureTest, NoResponseIsConnectionCandidateWhenAllowed) {
  request.setShouldRetryConnectionErrors();
  const FailureCategory category = CategorizeFailure(request, NoResponse(TransportFailureKind::ConnectionFailed));
  const RetryCandidate &candidate = ExpectCandidate(category);
  EXPECT_EQ(candidate.reason, "connection");
  EXPECT_EQ(candidate.error.kind(), ErrorKind::NoConnection);
}

TEST_F(CategorizeFailureTest, AuthStatusCodesAreCandidates) {
  for (http::StatusCode statusCode : {401, 403}) {
    const FailureCategory category = CategorizeFailure(request, WithResponse(statusCode, ToByteBuffer("denied")));
    const RetryCandidate &candidate = ExpectCandidate(category);
    EXPECT_EQ(candidate.reason, "auth");
    EXPECT_EQ(candidate.error.kind(), ErrorKind::AuthFailure);
    EXPECT_EQ(candidate.error.statusCode(), statusCode);
  }
}

TEST_F(CategorizeFailureTest, OtherClientErrorsAreTerminal) {
  const FailureCategory category = CategorizeFailure(request, WithResponse(404, ToByteBuffer("missing")));
  const RequestError &error = ExpectTerminal(category);
  EXPECT_EQ(error.kind(), ErrorKind::Client);
  ASSERT_TRUE(error.response().has_value());
  EXPECT_EQ(AsStringView(error.response()->data()), "missing");
  EXPECT_FALSE(error.response()->notModified());
  EXPECT_EQ(error.response()->networkTime(), 9ms);
  ASSERT_EQ(error.response()->headers().size(), 1U);
  EXPECT_EQ(error.response()->headers()[0].name(), "X-Trace");
}

TEST_F(CategorizeFailureTest, ServerErrorsAreTerminalByDefault) {
  const FailureCategory category = CategorizeFailure(request, WithResponse(500, ToByteBuffer("err")));
  const RequestError &error = ExpectTerminal(category);
  EXPECT_EQ(error.kind(), ErrorKind::Server);
  EXPECT_EQ(error.statusCode(), 500);
}

TEST_F(CategorizeFailureTest, ServerErrorsAreCandidatesWhenAllowed) {
  request.setShouldRetryServerErrors();
  const FailureCategory category = CategorizeFailure(request, WithResponse(503, ToByteBuffer("busy")));
  const RetryCandidate &candidate = ExpectCandidate(category);
  EXPECT_EQ(candidate.reason, "server");
  EXPECT_EQ(candidate.error.kind(), ErrorKind::Server);
}

TEST_F(CategorizeFailureTest, RedirectIsTerminalServerError) {
  request.setShouldRetryServerErrors();
  const FailureCategory category = CategorizeFailure(request, WithResponse(302, ByteBuffer{}));
  EXPECT_EQ(ExpectTerminal(category).kind(), ErrorKind::Server);
}

TEST_F(CategorizeFailureTest, ResponseWithoutBodyIsNetworkCandidate) {
  const FailureCategory category = CategorizeFailure(request, WithResponse(200, std::nullopt));
  const RetryCandidate &candidate = ExpectCandidate(category);
  EXPECT_EQ(candidate.reason, "network");
  EXPECT_EQ(candidate.error.kind(), ErrorKind::Network);
  EXPECT_FALSE(candidate.error.response().has_value());
}

TEST_F(CategorizeFailureTest, IsIdempotent) {
  request.setShouldRetryServerErrors();
  const std::vector<FailureContext> contexts{NoResponse(TransportFailureKind::Timeout),
                                             NoResponse(TransportFailureKind::ConnectionFailed),
                                             WithResponse(401, ToByteBuffer("a")), WithResponse(404, ToByteBuffer("b")),
                                             WithResponse(500, ToByteBuffer("c")), WithResponse(200, std::nullopt)};
  for (const FailureContext &context : contexts) {
    const FailureCategory first = CategorizeFailure(request, context);
    const FailureCategory second = CategorizeFailure(request, context);
    ASSERT_EQ(first.index(), second.index());
    const RequestError &firstError =
        std::holds_alternative<RequestError>(first) ? std::get<RequestError>(first) : std::get<RetryCandidate>(first).error;
    const RequestError &secondError = std::holds_alternative<RequestError>(second)
                                          ? std::get<RequestError>(second)
                                          : std::get<RetryCandidate>(second).error;
    EXPECT_EQ(firstError.kind(), secondError.kind());
    EXPECT_STREQ(firstError.what(), secondError.what());
    EXPECT_EQ(firstError.response(), secondError.response());
  }
  // categorizing does not consume retries
  EXPECT_EQ(request.retryPolicy().currentRetryCount(), 0U);
  EXPECT_TRUE(request.markers().empty());
}

TEST(DefaultFailureClassifierTest, RetriesWhileThePolicyAllows) {
  Request request("https://example.com/items");
  DefaultFailureClassifier classifier;
  const FailureContext context = NoResponse(TransportFailureKind::Timeout);

  const FailureDecision first = classifier.classify(request, context);
  ASSERT_TRUE(std::holds_alternative<RetrySignal>(first));
  EXPECT_EQ(std::get<RetrySignal>(first).reason, "socket");
  EXPECT_EQ(request.retryPolicy().currentRetryCount(), 1U);

  const FailureDecision second = classifier.classify(request, context);
  ASSERT_TRUE(std::holds_alternative<RequestError>(second));
  EXPECT_EQ(std::get<RequestError>(second).kind(), ErrorKind::Timeout);

  EXPECT_EQ(request.markers(),
            (std::vector<std::string>{"socket-retry [timeout=2500]", "socket-timeout-giveup [timeout=5000]"}));
}

TEST(DefaultFailureClassifierTest, TerminalErrorsDoNotConsumeRetries) {
  Request request("https://example.com/items");
  DefaultFailureClassifier classifier;

  const FailureDecision decision = classifier.classify(request, WithResponse(404, ToByteBuffer("missing")));

  ASSERT_TRUE(std::holds_alternative<RequestError>(decision));
  EXPECT_EQ(std::get<RequestError>(decision).kind(), ErrorKind::Client);
  EXPECT_EQ(request.retryPolicy().currentRetryCount(), 0U);
  EXPECT_TRUE(request.markers().empty());
}

TEST(DefaultFailureClassifierTest, CustomRetryPolicy) {
  Request request("https://example.com/items");
  request.setRetryPolicy(std::make_unique<DefaultRetryPolicy>(100ms, 3, 1.0F)).setShouldRetryServerErrors();
  DefaultFailureClassifier classifier;
  const FailureContext context = WithResponse(503, ToByteBuffer("busy"));

  for (int retryPos = 0; retryPos < 3; ++retryPos) {
    ASSERT_TRUE(std::holds_alternative<RetrySignal>(classifier.classify(request, context)));
  }
  const FailureDecision last = classifier.classify(request, context);
  ASSERT_TRUE(std::holds_alternative<RequestError>(last));
  EXPECT_EQ(std::get<RequestError>(last).statusCode(), 503);

  EXPECT_EQ(request.markers(),
            (std::vector<std::string>{"server-retry [timeout=100]", "server-retry [timeout=200]",
                                      "server-retry [timeout=400]", "server-timeout-giveup [timeout=800]"}));
}

TEST(TransportFailureKindTest, ToString) {
  EXPECT_EQ(TransportFailureKindToString(TransportFailureKind::Timeout), "timeout");
  EXPECT_EQ(TransportFailureKindToString(TransportFailureKind::ConnectionFailed), "connection failed");
  EXPECT_EQ(TransportFailureKindToString(TransportFailureKind::Io), "io");
  EXPECT_EQ(TransportFailureKindToString(TransportFailureKind::MalformedUrl), "malformed url");
}

}  // namespace courier
