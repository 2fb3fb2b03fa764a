/// @file test_errors.cpp
/// Unit tests for errors.hpp: messages and fields derived from responses.

#include "errors.hpp"

#include <gtest/gtest.h>
#include <boost/asio/error.hpp>
#include <string>

using namespace apicore;

static HttpResponse makeResponse(unsigned int status,
                                 const std::string& body = "",
                                 Headers headers = Headers()) {
    HttpResponse r;
    r.status  = status;
    r.body    = body;
    r.headers = std::move(headers);
    r.url     = "https://oauth.reddit.com/api/v1/me?raw_json=1";
    return r;
}

// ============================================================================
// ResponseException
// ============================================================================

TEST(ResponseException, MessageNamesStatus) {
    NotFound e(makeResponse(404));
    EXPECT_STREQ(e.what(), "received 404 HTTP response");
    EXPECT_EQ(e.status(), 404u);
    EXPECT_EQ(e.response().url, "https://oauth.reddit.com/api/v1/me?raw_json=1");
}

TEST(ResponseException, HierarchyIsCatchableAsApiException) {
    try {
        throw ServerError(makeResponse(503));
    } catch (const ApiException& e) {
        EXPECT_STREQ(e.what(), "received 503 HTTP response");
    }
}

// ============================================================================
// Redirect
// ============================================================================

TEST(Redirect, PathComesFromLocationWithoutJsonSuffix) {
    Redirect e(makeResponse(302, "", {{"Location", "https://oauth.reddit.com/r/cpp.json?x=1"}}));
    EXPECT_EQ(e.path(), "/r/cpp");
    EXPECT_STREQ(e.what(), "Redirect to /r/cpp");
}

TEST(Redirect, LoginRedirectExplainsReadOnlyApplications) {
    Redirect e(makeResponse(302, "", {{"location", "https://www.reddit.com/login/"}}));
    EXPECT_EQ(e.path(), "/login/");
    EXPECT_NE(std::string(e.what()).find("read-only OAuth 2.0 application"),
              std::string::npos);
}

TEST(Redirect, MissingLocationGivesEmptyPath) {
    Redirect e(makeResponse(301));
    EXPECT_EQ(e.path(), "");
}

// ============================================================================
// SpecialError
// ============================================================================

TEST(SpecialError, ParsesStructuredBody) {
    SpecialError e(makeResponse(
        415, R"({"message":"Unsupported Media Type","reason":"bad_type","special_errors":["a"]})"));
    EXPECT_EQ(e.message(), "Unsupported Media Type");
    EXPECT_EQ(e.reason(), "bad_type");
    ASSERT_EQ(e.specialErrors().size(), 1u);
    EXPECT_EQ(e.specialErrors()[0], "a");
    EXPECT_STREQ(e.what(), "Special error 'Unsupported Media Type'");
}

TEST(SpecialError, NonJsonBodyLeavesFieldsEmpty) {
    SpecialError e(makeResponse(415, "<html>"));
    EXPECT_EQ(e.message(), "");
    EXPECT_EQ(e.reason(), "");
    EXPECT_TRUE(e.specialErrors().empty());
}

// ============================================================================
// TooManyRequests
// ============================================================================

TEST(TooManyRequests, RetryAfterIsParsedAndMentioned) {
    TooManyRequests e(makeResponse(429, "slow down", {{"Retry-After", "30"}}));
    ASSERT_TRUE(e.retryAfter().has_value());
    EXPECT_DOUBLE_EQ(*e.retryAfter(), 30.0);
    EXPECT_EQ(e.message(), "slow down");
    EXPECT_NE(std::string(e.what()).find("Please wait at least 30 seconds"),
              std::string::npos);
}

TEST(TooManyRequests, HttpDateRetryAfterIsIgnored) {
    TooManyRequests e(makeResponse(429, "", {{"retry-after", "Wed, 21 Oct 2015 07:28:00 GMT"}}));
    EXPECT_FALSE(e.retryAfter().has_value());
    EXPECT_STREQ(e.what(), "received 429 HTTP response");
}

// ============================================================================
// Authorization errors
// ============================================================================

TEST(AuthorizationError, WwwAuthenticateSelectsClass) {
    EXPECT_THROW(throwAuthorizationError(makeResponse(
                     401, "", {{"www-authenticate", "Bearer realm=\"reddit\", error=\"invalid_token\""}})),
                 InvalidToken);
    EXPECT_THROW(throwAuthorizationError(makeResponse(
                     403, "", {{"www-authenticate", "Bearer realm=\"reddit\", error=\"insufficient_scope\""}})),
                 InsufficientScope);
}

TEST(AuthorizationError, FallsBackOnStatus) {
    EXPECT_THROW(throwAuthorizationError(makeResponse(403)), Forbidden);
    EXPECT_THROW(throwAuthorizationError(makeResponse(401)), InvalidToken);
}

TEST(AuthorizationError, FamilySharesBase) {
    EXPECT_THROW(throwAuthorizationError(makeResponse(403)), AuthorizationError);
}

// ============================================================================
// RequestException
// ============================================================================

TEST(RequestException, KeepsOriginalErrorAndRequest) {
    boost::system::error_code ec = boost::asio::error::connection_refused;
    RequestException e(TransportFault::ConnectionError, ec, "GET", "http://h/x");

    EXPECT_EQ(e.fault(), TransportFault::ConnectionError);
    EXPECT_EQ(e.originalError(), ec);
    EXPECT_EQ(e.method(), "GET");
    EXPECT_EQ(e.url(), "http://h/x");
    EXPECT_NE(std::string(e.what()).find("ConnectionError"), std::string::npos);
}

TEST(TransportFaults, OnlyOtherIsNotTransient) {
    EXPECT_TRUE(isTransient(TransportFault::ConnectionError));
    EXPECT_TRUE(isTransient(TransportFault::ConnectTimeout));
    EXPECT_TRUE(isTransient(TransportFault::ReadTimeout));
    EXPECT_TRUE(isTransient(TransportFault::ChunkedEncoding));
    EXPECT_FALSE(isTransient(TransportFault::Other));
}

TEST(UnexpectedStatus, IsLogicError) {
    UnexpectedStatus e(408);
    EXPECT_EQ(e.status(), 408u);
    EXPECT_STREQ(e.what(), "Unexpected status code: 408");
}
