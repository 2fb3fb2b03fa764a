/// @file test_rate_limiter.cpp
/// Unit tests for rate_limiter.hpp: header bookkeeping and delay computation.

#include "rate_limiter.hpp"
#include "fake_requestor.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <vector>

using namespace apicore;

// ---------------------------------------------------------------------------
// Helper: a limiter on a hand-driven clock that records its sleeps
// ---------------------------------------------------------------------------

class RateLimiterTest : public ::testing::Test {
protected:
    double              now = 1000.0;
    std::vector<double> sleeps;

    RateLimiter limiter{
        [this](std::chrono::duration<double> d) { sleeps.push_back(d.count()); },
        [this] { return now; }};

    static Headers rateHeaders(const std::string& remaining,
                               const std::string& used,
                               const std::string& reset) {
        return {{"x-ratelimit-remaining", remaining},
                {"x-ratelimit-used", used},
                {"x-ratelimit-reset", reset}};
    }
};

// ============================================================================
// Construction and defaults
// ============================================================================

TEST_F(RateLimiterTest, FreshLimiterKnowsNothing) {
    EXPECT_FALSE(limiter.remaining().has_value());
    EXPECT_FALSE(limiter.used().has_value());
    EXPECT_FALSE(limiter.nextRequestTimestamp().has_value());
    EXPECT_DOUBLE_EQ(limiter.totalSleepSeconds(), 0.0);
}

TEST_F(RateLimiterTest, FreshLimiterDoesNotSleep) {
    limiter.delay();
    EXPECT_TRUE(sleeps.empty());
}

// ============================================================================
// update
// ============================================================================

TEST_F(RateLimiterTest, UpdateRecordsBudget) {
    limiter.update(rateHeaders("100", "500", "60"));

    EXPECT_DOUBLE_EQ(*limiter.remaining(), 100.0);
    EXPECT_EQ(*limiter.used(), 500);
    EXPECT_DOUBLE_EQ(*limiter.resetTimestamp(), 1060.0);
    // One client: 60 s spread over 100 requests.
    EXPECT_DOUBLE_EQ(*limiter.nextRequestTimestamp(), 1000.6);
}

TEST_F(RateLimiterTest, NextRequestNeverLaterThanReset) {
    limiter.update(rateHeaders("0.5", "599", "10"));
    EXPECT_DOUBLE_EQ(*limiter.nextRequestTimestamp(), 1010.0);
}

TEST_F(RateLimiterTest, ExhaustedBudgetWaitsForReset) {
    limiter.update(rateHeaders("0", "600", "42"));
    EXPECT_DOUBLE_EQ(*limiter.nextRequestTimestamp(), 1042.0);
}

TEST_F(RateLimiterTest, LargerDropEstimatesMoreClients) {
    limiter.update(rateHeaders("100", "500", "60"));
    now = 1001.0;
    limiter.update(rateHeaders("97", "503", "59"));

    // Budget dropped by 3: three clients share 59 s over 97 requests.
    EXPECT_DOUBLE_EQ(*limiter.nextRequestTimestamp(), 1001.0 + 3.0 * 59.0 / 97.0);
}

TEST_F(RateLimiterTest, MissingHeadersDecrementKnownBudget) {
    limiter.update(rateHeaders("100", "500", "60"));
    limiter.update(Headers());

    EXPECT_DOUBLE_EQ(*limiter.remaining(), 99.0);
    EXPECT_EQ(*limiter.used(), 501);
}

TEST_F(RateLimiterTest, MissingHeadersWithUnknownBudgetAreIgnored) {
    limiter.update(Headers());
    EXPECT_FALSE(limiter.remaining().has_value());
}

TEST_F(RateLimiterTest, MalformedHeadersLeaveStateUntouched) {
    limiter.update(rateHeaders("100", "500", "60"));
    limiter.update(rateHeaders("lots", "501", "59"));

    EXPECT_DOUBLE_EQ(*limiter.remaining(), 100.0);
    EXPECT_EQ(*limiter.used(), 500);
}

TEST_F(RateLimiterTest, IncompleteHeadersLeaveStateUntouched) {
    limiter.update({{"x-ratelimit-remaining", "10"}});
    EXPECT_FALSE(limiter.remaining().has_value());
}

// ============================================================================
// delay
// ============================================================================

TEST_F(RateLimiterTest, DelaySleepsUntilNextRequest) {
    limiter.update(rateHeaders("100", "500", "60"));
    limiter.delay();

    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_NEAR(sleeps[0], 0.6, 1e-9);
    EXPECT_NEAR(limiter.totalSleepSeconds(), 0.6, 1e-9);
}

TEST_F(RateLimiterTest, DelayDoesNothingOnceTimestampPassed) {
    limiter.update(rateHeaders("100", "500", "60"));
    now = 1001.0;
    limiter.delay();
    EXPECT_TRUE(sleeps.empty());
}

// ============================================================================
// call
// ============================================================================

TEST_F(RateLimiterTest, CallPassesHeadersAndRecordsResponse) {
    fakes::FakeRequestor requestor;
    requestor.respond(200, "{}", rateHeaders("50", "550", "30"));

    PreparedRequest request;
    request.method = "GET";
    request.url    = "https://oauth.example.com/api/v1/me";

    HttpResponse response = limiter.call(
        requestor, [] { return Headers{{"Authorization", "bearer abc"}}; }, request);

    EXPECT_EQ(response.status, 200u);
    ASSERT_EQ(requestor.calls().size(), 1u);
    EXPECT_EQ(requestor.calls()[0].headers.at("authorization"), "bearer abc");
    EXPECT_DOUBLE_EQ(*limiter.remaining(), 50.0);
}

TEST_F(RateLimiterTest, CallPropagatesTransportFailureWithoutUpdating) {
    fakes::FakeRequestor requestor;
    requestor.fail(TransportFault::ConnectionError);

    PreparedRequest request;
    request.method = "GET";
    request.url    = "https://oauth.example.com/api/v1/me";

    EXPECT_THROW(limiter.call(requestor, [] { return Headers(); }, request), RequestException);
    EXPECT_FALSE(limiter.remaining().has_value());
}
