#pragma once

#include "models.hpp"

#include <optional>
#include <stdexcept>
#include <string>

#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>

namespace apicore {

/// Base of every error the library reports for API or configuration problems.
class ApiException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Collaborators were wired incorrectly or a call cannot be carried out
/// as requested (bad authorizer, undescriptive user agent, ...).
class InvalidInvocation : public ApiException {
public:
    using ApiException::ApiException;
};

/// A token source failed to produce an access token.
class OAuthException : public ApiException {
public:
    using ApiException::ApiException;
};

// ---------------------------------------------------------------------------
// Transport failures
// ---------------------------------------------------------------------------

enum class TransportFault {
    ConnectionError,    // refused, reset, DNS, TLS handshake, early EOF
    ConnectTimeout,
    ReadTimeout,
    ChunkedEncoding,    // body ended mid-message
    Other
};

const char* toString(TransportFault fault);

/// True for faults worth another attempt.
bool isTransient(TransportFault fault);

/// A network-level failure; the original error is kept for classification.
class RequestException : public ApiException {
public:
    RequestException(TransportFault fault,
                     boost::system::error_code originalError,
                     const std::string& method,
                     const std::string& url);

    TransportFault fault() const { return mFault; }
    const boost::system::error_code& originalError() const { return mOriginalError; }
    const std::string& method() const { return mMethod; }
    const std::string& url() const { return mUrl; }

private:
    TransportFault            mFault;
    boost::system::error_code mOriginalError;
    std::string               mMethod;
    std::string               mUrl;
};

// ---------------------------------------------------------------------------
// Response errors
// ---------------------------------------------------------------------------

/// An HTTP response the caller has to deal with. Keeps a copy of it.
class ResponseException : public ApiException {
public:
    explicit ResponseException(const HttpResponse& response);

    const HttpResponse& response() const { return mResponse; }
    unsigned int status() const { return mResponse.status; }

protected:
    ResponseException(const HttpResponse& response, const std::string& message);

private:
    HttpResponse mResponse;
};

/// A success-class response whose body is not JSON.
class BadJSON : public ResponseException {
public:
    using ResponseException::ResponseException;
};

class BadRequest : public ResponseException {
public:
    using ResponseException::ResponseException;
};

class Conflict : public ResponseException {
public:
    using ResponseException::ResponseException;
};

class NotFound : public ResponseException {
public:
    using ResponseException::ResponseException;
};

class TooLarge : public ResponseException {
public:
    using ResponseException::ResponseException;
};

class URITooLong : public ResponseException {
public:
    using ResponseException::ResponseException;
};

class UnavailableForLegalReasons : public ResponseException {
public:
    using ResponseException::ResponseException;
};

/// 5xx and the Cloudflare 520/522 codes, once retries are used up.
class ServerError : public ResponseException {
public:
    using ResponseException::ResponseException;
};

/// 301/302. Redirects are never followed; the target path is reported.
class Redirect : public ResponseException {
public:
    explicit Redirect(const HttpResponse& response);

    /// Location path with any trailing ".json" removed.
    const std::string& path() const { return mPath; }

private:
    static std::string redirectPath(const HttpResponse& response);
    static std::string message(const std::string& path);

    std::string mPath;
};

/// 415 with a structured explanation in the body.
class SpecialError : public ResponseException {
public:
    explicit SpecialError(const HttpResponse& response);

    const std::string& message() const { return mMessage; }
    const std::string& reason() const { return mReason; }
    const nlohmann::json& specialErrors() const { return mSpecialErrors; }

private:
    std::string    mMessage;
    std::string    mReason;
    nlohmann::json mSpecialErrors = nlohmann::json::array();
};

/// 420/429.
class TooManyRequests : public ResponseException {
public:
    explicit TooManyRequests(const HttpResponse& response);

    /// Seconds from the retry-after header, when the server sent one.
    std::optional<double> retryAfter() const { return mRetryAfter; }
    /// Response body text.
    const std::string& message() const { return mMessage; }

private:
    static std::optional<double> parseRetryAfter(const HttpResponse& response);
    static std::string describe(const HttpResponse& response,
                                const std::optional<double>& retryAfter);

    std::optional<double> mRetryAfter;
    std::string           mMessage;
};

/// 401/403 family.
class AuthorizationError : public ResponseException {
public:
    using ResponseException::ResponseException;
};

class InvalidToken : public AuthorizationError {
public:
    using AuthorizationError::AuthorizationError;
};

class InsufficientScope : public AuthorizationError {
public:
    using AuthorizationError::AuthorizationError;
};

class Forbidden : public AuthorizationError {
public:
    using AuthorizationError::AuthorizationError;
};

/// Throw the authorization error matching a 401/403 response: the error
/// named in www-authenticate wins, otherwise 403 is Forbidden and 401 is
/// InvalidToken.
[[noreturn]] void throwAuthorizationError(const HttpResponse& response);

// ---------------------------------------------------------------------------
// Internal invariant violations
// ---------------------------------------------------------------------------

/// The server answered with a status the pipeline has no rule for. Signals
/// an API contract change rather than a recoverable condition.
class UnexpectedStatus : public std::logic_error {
public:
    explicit UnexpectedStatus(unsigned int status);

    unsigned int status() const { return mStatus; }

private:
    unsigned int mStatus;
};

} // namespace apicore
