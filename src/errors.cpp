#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <sstream>

namespace apicore {

// ---------------------------------------------------------------------------
// Transport failures
// ---------------------------------------------------------------------------

const char* toString(TransportFault fault) {
    switch (fault) {
        case TransportFault::ConnectionError: return "ConnectionError";
        case TransportFault::ConnectTimeout:  return "ConnectTimeout";
        case TransportFault::ReadTimeout:     return "ReadTimeout";
        case TransportFault::ChunkedEncoding: return "ChunkedEncodingError";
        case TransportFault::Other:           return "RequestError";
    }
    return "RequestError";
}

bool isTransient(TransportFault fault) {
    // A connect timeout is a connection error too.
    return fault == TransportFault::ConnectionError
        || fault == TransportFault::ConnectTimeout
        || fault == TransportFault::ReadTimeout
        || fault == TransportFault::ChunkedEncoding;
}

namespace {

std::string describeFailure(TransportFault fault,
                            const boost::system::error_code& error,
                            const std::string& method,
                            const std::string& url) {
    std::ostringstream oss;
    oss << "error with request " << method << " " << url << ": "
        << toString(fault) << "(" << error.message() << ")";
    return oss.str();
}

} // namespace

RequestException::RequestException(TransportFault fault,
                                   boost::system::error_code originalError,
                                   const std::string& method,
                                   const std::string& url)
    : ApiException(describeFailure(fault, originalError, method, url))
    , mFault(fault)
    , mOriginalError(originalError)
    , mMethod(method)
    , mUrl(url) {}

// ---------------------------------------------------------------------------
// Response errors
// ---------------------------------------------------------------------------

ResponseException::ResponseException(const HttpResponse& response)
    : ResponseException(response,
                        "received " + std::to_string(response.status) + " HTTP response") {}

ResponseException::ResponseException(const HttpResponse& response, const std::string& message)
    : ApiException(message)
    , mResponse(response) {}

Redirect::Redirect(const HttpResponse& response)
    : ResponseException(response, message(redirectPath(response)))
    , mPath(redirectPath(response)) {}

std::string Redirect::redirectPath(const HttpResponse& response) {
    auto location = response.headers.find("location");
    if (location == response.headers.end()) {
        return "";
    }
    std::string path = urlPath(location->second);
    const std::string suffix = ".json";
    if (path.size() >= suffix.size() &&
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0) {
        path.erase(path.size() - suffix.size());
    }
    return path;
}

std::string Redirect::message(const std::string& path) {
    std::string msg = "Redirect to " + path;
    if (path == "/login/") {
        msg += " (You may be trying to perform a non-read-only action via a "
               "read-only OAuth 2.0 application.)";
    }
    return msg;
}

namespace {

std::string specialErrorMessage(const nlohmann::json& body) {
    if (body.is_object() && body.contains("message") && body["message"].is_string()) {
        return body["message"].get<std::string>();
    }
    return "";
}

nlohmann::json parseBody(const HttpResponse& response) {
    return nlohmann::json::parse(response.body, nullptr, /*allow_exceptions=*/false);
}

} // namespace

SpecialError::SpecialError(const HttpResponse& response)
    : ResponseException(response,
                        "Special error '" + specialErrorMessage(parseBody(response)) + "'") {
    const auto body = parseBody(response);
    if (!body.is_object()) {
        return;
    }
    mMessage = specialErrorMessage(body);
    if (body.contains("reason") && body["reason"].is_string()) {
        mReason = body["reason"].get<std::string>();
    }
    if (body.contains("special_errors") && body["special_errors"].is_array()) {
        mSpecialErrors = body["special_errors"];
    }
}

TooManyRequests::TooManyRequests(const HttpResponse& response)
    : ResponseException(response, describe(response, parseRetryAfter(response)))
    , mRetryAfter(parseRetryAfter(response))
    , mMessage(response.body) {}

std::optional<double> TooManyRequests::parseRetryAfter(const HttpResponse& response) {
    auto header = response.headers.find("retry-after");
    if (header == response.headers.end() || header->second.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        double seconds = std::stod(header->second, &consumed);
        if (consumed != header->second.size()) {
            return std::nullopt;
        }
        return seconds;
    } catch (const std::exception&) {
        // HTTP-date form; not interpreted.
        return std::nullopt;
    }
}

std::string TooManyRequests::describe(const HttpResponse& response,
                                      const std::optional<double>& retryAfter) {
    std::ostringstream oss;
    oss << "received " << response.status << " HTTP response";
    if (retryAfter) {
        oss << ". Please wait at least " << *retryAfter
            << " seconds before re-trying this request.";
    }
    return oss.str();
}

void throwAuthorizationError(const HttpResponse& response) {
    auto header = response.headers.find("www-authenticate");
    if (header != response.headers.end()) {
        std::string value = header->second;
        value.erase(std::remove(value.begin(), value.end(), '"'), value.end());
        auto equals = value.rfind('=');
        if (equals != std::string::npos) {
            std::string error = value.substr(equals + 1);
            error.erase(0, error.find_first_not_of(" \t"));
            error.erase(error.find_last_not_of(" \t") + 1);
            if (error == "invalid_token") {
                throw InvalidToken(response);
            }
            if (error == "insufficient_scope") {
                throw InsufficientScope(response);
            }
        }
    }
    if (response.status == 403) {
        throw Forbidden(response);
    }
    throw InvalidToken(response);
}

// ---------------------------------------------------------------------------
// Internal invariant violations
// ---------------------------------------------------------------------------

UnexpectedStatus::UnexpectedStatus(unsigned int status)
    : std::logic_error("Unexpected status code: " + std::to_string(status))
    , mStatus(status) {}

} // namespace apicore
