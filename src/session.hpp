#pragma once

#include "authorizer.hpp"
#include "classification.hpp"
#include "config.hpp"
#include "models.hpp"
#include "rate_limiter.hpp"
#include "retry_strategy.hpp"
#include "util.hpp"

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace apicore {

struct SessionOptions {
    /// Attempts per logical request when no retryStrategy is given.
    int retries = kDefaultRetries;

    /// Initial retry state shared by every request; FiniteRetryStrategy(retries)
    /// when empty.
    std::shared_ptr<const RetryStrategy> retryStrategy;

    /// Backoff wait between attempts.
    Sleeper sleeper = sleepFor;

    /// Shared limiter; a private one is created when empty.
    std::shared_ptr<RateLimiter> rateLimiter;

    bool verbose = false;
};

/// The low-level connection to the API: runs one logical request through
/// authorization, rate limiting, retries and status classification.
///
/// Safe to call from several threads at once as long as the authorizer and
/// rate limiter are (the bundled ones are).
class Session {
public:
    /// @throws InvalidInvocation if @p authorizer is null or options are invalid.
    explicit Session(std::shared_ptr<BaseAuthorizer> authorizer,
                     SessionOptions options = SessionOptions());

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Return the JSON content of the resource at @p path, resolved against
    /// the requestor's oauthUrl().
    ///
    /// @return std::nullopt for 204 No Content, a JSON "" for an empty body,
    ///         the decoded body otherwise.
    /// @throws ResponseException subclasses for error statuses,
    ///         RequestException for transport failures that were not retried
    ///         or kept failing, BadJSON for undecodable success bodies,
    ///         InvalidInvocation when the token is invalid and cannot be
    ///         refreshed, UnexpectedStatus for statuses no rule covers.
    std::optional<nlohmann::json> request(const std::string& method,
                                          const std::string& path,
                                          const RequestOptions& options = RequestOptions());

    /// Close the underlying requestor. Destroying a Session does not do this:
    /// the requestor belongs to the authorizer, which other sessions may share.
    void close();

    BaseAuthorizer& authorizer() const { return *mAuthorizer; }
    RateLimiter& rateLimiter() const { return *mRateLimiter; }

    /// Normalized copy of @p options: raw_json=1 added to params,
    /// api_type=json added to object data (then sorted into form fields) and
    /// object json. @p options itself is left untouched.
    /// @throws InvalidInvocation for params that are not an object or data
    ///         that is neither an object, a string, nor a list of pairs.
    static PreparedRequest prepareRequest(const std::string& method,
                                          const std::string& url,
                                          const RequestOptions& options);

private:
    std::shared_ptr<BaseAuthorizer>      mAuthorizer;
    std::shared_ptr<RateLimiter>         mRateLimiter;
    std::shared_ptr<const RetryStrategy> mRetryStrategy;
    Sleeper                              mSleeper;
    bool                                 mVerbose;

    std::optional<nlohmann::json> requestWithRetries(const PreparedRequest& request);

    AttemptOutcome makeRequest(const PreparedRequest& request, const RetryStrategy& strategy);

    Headers authorizationHeader() const;

    void logRequest(const PreparedRequest& request) const;
    void logRetry(const PreparedRequest& request, const AttemptOutcome& outcome) const;

    static std::optional<nlohmann::json> decodeBody(const HttpResponse& response);
};

/// Build a Session for @p authorizer with default options.
Session makeSession(std::shared_ptr<BaseAuthorizer> authorizer);

} // namespace apicore
