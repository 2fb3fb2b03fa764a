#pragma once

#include "requestor.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace apicore {

/// Holds the bearer token a Session sends. Thread-safe: token state is
/// guarded by an internal mutex.
class BaseAuthorizer {
public:
    /// @throws InvalidInvocation if @p requestor is null.
    explicit BaseAuthorizer(std::shared_ptr<Requestor> requestor);
    virtual ~BaseAuthorizer() = default;

    BaseAuthorizer(const BaseAuthorizer&) = delete;
    BaseAuthorizer& operator=(const BaseAuthorizer&) = delete;

    /// True while an access token is held and has not expired.
    bool isValid() const;

    std::string accessToken() const;

    /// Forget the current token; isValid() is false afterwards.
    void clearAccessToken();

    /// Whether refresh() can obtain a new token.
    virtual bool canRefresh() const { return false; }

    /// Obtain a new access token.
    /// @throws InvalidInvocation on authorizers that cannot refresh.
    virtual void refresh();

    /// Refresh only if the token is not valid and refreshing is possible.
    /// Concurrent callers that all see an invalid token obtain one new token
    /// between them.
    virtual void refreshIfInvalid();

    Requestor& requestor() const { return *mRequestor; }

protected:
    /// Store @p token; an @p expiresIn of zero means it never expires.
    void setAccessToken(const std::string& token, std::chrono::seconds expiresIn);

private:
    using Clock = std::chrono::steady_clock;

    std::shared_ptr<Requestor> mRequestor;

    mutable std::mutex               mMutex;
    std::string                      mAccessToken;
    std::optional<Clock::time_point> mExpiration;
};

/// Uses a token obtained elsewhere. Cannot refresh: once the token expires
/// or is cleared after a 401, requests fail with an authorization error.
class StaticTokenAuthorizer : public BaseAuthorizer {
public:
    /// @param expiresIn  Lifetime of @p accessToken; zero means unlimited.
    StaticTokenAuthorizer(std::shared_ptr<Requestor> requestor,
                          const std::string& accessToken,
                          std::chrono::seconds expiresIn = std::chrono::seconds(0));
};

/// Access token handed out by a TokenSource.
struct TokenGrant {
    std::string          accessToken;
    std::chrono::seconds expiresIn{0};
};

/// Obtains fresh tokens from a caller-supplied source (for instance a
/// refresh-token grant performed by the application).
class RefreshingAuthorizer : public BaseAuthorizer {
public:
    using TokenSource = std::function<TokenGrant()>;

    /// @throws InvalidInvocation if @p tokenSource is empty.
    RefreshingAuthorizer(std::shared_ptr<Requestor> requestor, TokenSource tokenSource);

    bool canRefresh() const override { return true; }

    /// Ask the token source for a new token. Concurrent callers are
    /// serialized.
    /// @throws OAuthException if the source returns an empty token.
    void refresh() override;

    void refreshIfInvalid() override;

    int refreshCount() const;

private:
    void fetchToken();      // caller holds mRefreshMutex

    TokenSource        mTokenSource;
    mutable std::mutex mRefreshMutex;
    int                mRefreshCount = 0;
};

} // namespace apicore
