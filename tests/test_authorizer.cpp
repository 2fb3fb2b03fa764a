/// @file test_authorizer.cpp
/// Unit tests for authorizer.hpp: token validity, expiry and refresh.

#include "authorizer.hpp"
#include "errors.hpp"
#include "fake_requestor.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace apicore;
using namespace std::chrono_literals;

static std::shared_ptr<fakes::FakeRequestor> makeRequestor() {
    return std::make_shared<fakes::FakeRequestor>();
}

// ============================================================================
// BaseAuthorizer / StaticTokenAuthorizer
// ============================================================================

TEST(StaticTokenAuthorizer, NullRequestorThrows) {
    EXPECT_THROW(StaticTokenAuthorizer(nullptr, "token"), InvalidInvocation);
}

TEST(StaticTokenAuthorizer, TokenWithoutExpiryIsValid) {
    StaticTokenAuthorizer auth(makeRequestor(), "token");
    EXPECT_TRUE(auth.isValid());
    EXPECT_EQ(auth.accessToken(), "token");
    EXPECT_FALSE(auth.canRefresh());
}

TEST(StaticTokenAuthorizer, EmptyTokenIsInvalid) {
    StaticTokenAuthorizer auth(makeRequestor(), "");
    EXPECT_FALSE(auth.isValid());
}

TEST(StaticTokenAuthorizer, ExpiredTokenIsInvalid) {
    StaticTokenAuthorizer auth(makeRequestor(), "token", -1s);
    EXPECT_FALSE(auth.isValid());
}

TEST(StaticTokenAuthorizer, UnexpiredTokenIsValid) {
    StaticTokenAuthorizer auth(makeRequestor(), "token", 3600s);
    EXPECT_TRUE(auth.isValid());
}

TEST(StaticTokenAuthorizer, ClearInvalidates) {
    StaticTokenAuthorizer auth(makeRequestor(), "token");
    auth.clearAccessToken();
    EXPECT_FALSE(auth.isValid());
    EXPECT_EQ(auth.accessToken(), "");
}

TEST(StaticTokenAuthorizer, RefreshThrows) {
    StaticTokenAuthorizer auth(makeRequestor(), "token");
    EXPECT_THROW(auth.refresh(), InvalidInvocation);
}

TEST(StaticTokenAuthorizer, ExposesRequestor) {
    auto requestor = makeRequestor();
    StaticTokenAuthorizer auth(requestor, "token");
    EXPECT_EQ(&auth.requestor(), requestor.get());
}

// ============================================================================
// RefreshingAuthorizer
// ============================================================================

TEST(RefreshingAuthorizer, EmptySourceThrows) {
    EXPECT_THROW(RefreshingAuthorizer(makeRequestor(), nullptr), InvalidInvocation);
}

TEST(RefreshingAuthorizer, StartsWithoutToken) {
    RefreshingAuthorizer auth(makeRequestor(), [] { return TokenGrant{"t", 0s}; });
    EXPECT_TRUE(auth.canRefresh());
    EXPECT_FALSE(auth.isValid());
    EXPECT_EQ(auth.refreshCount(), 0);
}

TEST(RefreshingAuthorizer, RefreshStoresGrantedToken) {
    int issued = 0;
    RefreshingAuthorizer auth(makeRequestor(), [&] {
        ++issued;
        return TokenGrant{"token-" + std::to_string(issued), 3600s};
    });

    auth.refresh();
    EXPECT_TRUE(auth.isValid());
    EXPECT_EQ(auth.accessToken(), "token-1");

    auth.clearAccessToken();
    auth.refresh();
    EXPECT_EQ(auth.accessToken(), "token-2");
    EXPECT_EQ(auth.refreshCount(), 2);
}

TEST(RefreshingAuthorizer, EmptyGrantThrowsOAuthException) {
    RefreshingAuthorizer auth(makeRequestor(), [] { return TokenGrant{}; });
    EXPECT_THROW(auth.refresh(), OAuthException);
    EXPECT_FALSE(auth.isValid());
    EXPECT_EQ(auth.refreshCount(), 0);
}

TEST(RefreshingAuthorizer, RefreshIfInvalidSkipsValidToken) {
    int issued = 0;
    RefreshingAuthorizer auth(makeRequestor(), [&] {
        ++issued;
        return TokenGrant{"token-" + std::to_string(issued), 3600s};
    });

    auth.refreshIfInvalid();
    auth.refreshIfInvalid();
    EXPECT_EQ(auth.accessToken(), "token-1");
    EXPECT_EQ(auth.refreshCount(), 1);

    auth.clearAccessToken();
    auth.refreshIfInvalid();
    EXPECT_EQ(auth.accessToken(), "token-2");
}

TEST(RefreshingAuthorizer, ConcurrentRefreshIfInvalidFetchesOnce) {
    std::atomic<int> issued{0};
    auto auth = std::make_shared<RefreshingAuthorizer>(makeRequestor(), [&] {
        std::this_thread::sleep_for(50ms);
        int n = ++issued;
        return TokenGrant{"token-" + std::to_string(n), 3600s};
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([auth] { auth->refreshIfInvalid(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(issued.load(), 1);
    EXPECT_EQ(auth->refreshCount(), 1);
    EXPECT_EQ(auth->accessToken(), "token-1");
}

TEST(StaticTokenAuthorizer, RefreshIfInvalidIsNoOp) {
    StaticTokenAuthorizer auth(makeRequestor(), "");
    EXPECT_NO_THROW(auth.refreshIfInvalid());
    EXPECT_FALSE(auth.isValid());
}
