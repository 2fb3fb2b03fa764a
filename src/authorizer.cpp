#include "authorizer.hpp"
#include "errors.hpp"

namespace apicore {

BaseAuthorizer::BaseAuthorizer(std::shared_ptr<Requestor> requestor)
    : mRequestor(std::move(requestor))
{
    if (!mRequestor) {
        throw InvalidInvocation("authorizer requires a requestor");
    }
}

bool BaseAuthorizer::isValid() const {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mAccessToken.empty()) {
        return false;
    }
    return !mExpiration || Clock::now() < *mExpiration;
}

std::string BaseAuthorizer::accessToken() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mAccessToken;
}

void BaseAuthorizer::clearAccessToken() {
    std::lock_guard<std::mutex> lock(mMutex);
    mAccessToken.clear();
    mExpiration.reset();
}

void BaseAuthorizer::refresh() {
    throw InvalidInvocation("this authorizer cannot refresh its access token");
}

void BaseAuthorizer::refreshIfInvalid() {
    if (!isValid() && canRefresh()) {
        refresh();
    }
}

void BaseAuthorizer::setAccessToken(const std::string& token, std::chrono::seconds expiresIn) {
    std::lock_guard<std::mutex> lock(mMutex);
    mAccessToken = token;
    if (expiresIn.count() != 0) {
        mExpiration = Clock::now() + expiresIn;
    } else {
        mExpiration.reset();
    }
}

// ---------------------------------------------------------------------------
// StaticTokenAuthorizer
// ---------------------------------------------------------------------------

StaticTokenAuthorizer::StaticTokenAuthorizer(std::shared_ptr<Requestor> requestor,
                                             const std::string& accessToken,
                                             std::chrono::seconds expiresIn)
    : BaseAuthorizer(std::move(requestor))
{
    setAccessToken(accessToken, expiresIn);
}

// ---------------------------------------------------------------------------
// RefreshingAuthorizer
// ---------------------------------------------------------------------------

RefreshingAuthorizer::RefreshingAuthorizer(std::shared_ptr<Requestor> requestor,
                                           TokenSource tokenSource)
    : BaseAuthorizer(std::move(requestor))
    , mTokenSource(std::move(tokenSource))
{
    if (!mTokenSource) {
        throw InvalidInvocation("refreshing authorizer requires a token source");
    }
}

void RefreshingAuthorizer::refresh() {
    std::lock_guard<std::mutex> lock(mRefreshMutex);
    fetchToken();
}

void RefreshingAuthorizer::refreshIfInvalid() {
    std::lock_guard<std::mutex> lock(mRefreshMutex);
    // Another thread may have refreshed while this one waited.
    if (isValid()) {
        return;
    }
    fetchToken();
}

void RefreshingAuthorizer::fetchToken() {
    TokenGrant grant = mTokenSource();
    if (grant.accessToken.empty()) {
        throw OAuthException("token source returned no access token");
    }
    setAccessToken(grant.accessToken, grant.expiresIn);
    ++mRefreshCount;
}

int RefreshingAuthorizer::refreshCount() const {
    std::lock_guard<std::mutex> lock(mRefreshMutex);
    return mRefreshCount;
}

} // namespace apicore
