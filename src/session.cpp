#include "session.hpp"

#include <algorithm>
#include <iostream>

namespace apicore {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Session::Session(std::shared_ptr<BaseAuthorizer> authorizer, SessionOptions options)
    : mAuthorizer(std::move(authorizer))
    , mRateLimiter(std::move(options.rateLimiter))
    , mRetryStrategy(std::move(options.retryStrategy))
    , mSleeper(std::move(options.sleeper))
    , mVerbose(options.verbose)
{
    if (!mAuthorizer) {
        throw InvalidInvocation("invalid Authorizer: null");
    }
    if (!mSleeper) {
        throw InvalidInvocation("session requires a sleeper");
    }
    if (!mRetryStrategy) {
        if (options.retries < 1) {
            throw InvalidInvocation("retries must be at least 1, got "
                                    + std::to_string(options.retries));
        }
        mRetryStrategy = std::make_shared<FiniteRetryStrategy>(options.retries);
    }
    if (!mRateLimiter) {
        mRateLimiter = std::make_shared<RateLimiter>(mSleeper, RateLimiter::wallClockSeconds,
                                                     mVerbose);
    }
}

Session makeSession(std::shared_ptr<BaseAuthorizer> authorizer) {
    return Session(std::move(authorizer));
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

std::optional<nlohmann::json> Session::request(const std::string& method,
                                               const std::string& path,
                                               const RequestOptions& options) {
    const std::string url = resolveUrl(mAuthorizer->requestor().oauthUrl(), path);
    const PreparedRequest prepared = prepareRequest(method, url, options);
    return requestWithRetries(prepared);
}

void Session::close() {
    mAuthorizer->requestor().close();
}

PreparedRequest Session::prepareRequest(const std::string& method,
                                        const std::string& url,
                                        const RequestOptions& options) {
    PreparedRequest prepared;
    prepared.method  = method;
    prepared.url     = url;
    prepared.files   = options.files;
    prepared.timeout = options.timeout;

    prepared.params = options.params.is_null() ? nlohmann::json::object() : options.params;
    if (!prepared.params.is_object()) {
        throw InvalidInvocation("params must be a JSON object");
    }
    prepared.params["raw_json"] = 1;

    if (options.data) {
        const nlohmann::json& data = *options.data;
        if (data.is_object()) {
            nlohmann::json copy = data;
            copy["api_type"] = "json";

            FormFields fields;
            for (const auto& item : copy.items()) {
                fields.emplace_back(item.key(), item.value());
            }
            std::stable_sort(fields.begin(), fields.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
            prepared.data = std::move(fields);
        } else if (data.is_string()) {
            prepared.rawData = data.get<std::string>();
        } else if (data.is_array()) {
            // Pre-built [key, value] pairs are sent as given.
            FormFields fields;
            for (const auto& pair : data) {
                if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string()) {
                    throw InvalidInvocation("data pairs must be [key, value] arrays");
                }
                fields.emplace_back(pair[0].get<std::string>(), pair[1]);
            }
            prepared.data = std::move(fields);
        } else {
            throw InvalidInvocation("data must be an object, a string or a list of pairs");
        }
    }

    if (options.json) {
        prepared.json = *options.json;
        if (prepared.json->is_object()) {
            (*prepared.json)["api_type"] = "json";
        }
    }
    return prepared;
}

// ---------------------------------------------------------------------------
// Private: retry loop
// ---------------------------------------------------------------------------

std::optional<nlohmann::json> Session::requestWithRetries(const PreparedRequest& request) {
    std::shared_ptr<const RetryStrategy> strategy = mRetryStrategy;

    for (bool firstAttempt = true;; firstAttempt = false) {
        if (!firstAttempt) {
            strategy->sleep(mSleeper, mVerbose);
        }
        logRequest(request);

        const AttemptOutcome outcome = makeRequest(request, *strategy);

        if (outcome.response && outcome.response->status == 401) {
            mAuthorizer->clearAccessToken();
        }

        switch (classifyOutcome(outcome, strategy->shouldRetryOnFailure(),
                                mAuthorizer->canRefresh())) {
            case ResponseClassification::RetryableTransportError:
            case ResponseClassification::RetryableStatus:
            case ResponseClassification::AuthExpired:
                logRetry(request, outcome);
                strategy = strategy->consumeAvailableRetry();
                break;
            case ResponseClassification::TerminalStatus:
                throwStatusException(*outcome.response);
            case ResponseClassification::NoContent:
                return std::nullopt;
            case ResponseClassification::Success:
                return decodeBody(*outcome.response);
        }
    }
}

AttemptOutcome Session::makeRequest(const PreparedRequest& request,
                                    const RetryStrategy& strategy) {
    AttemptOutcome outcome;
    try {
        outcome.response = mRateLimiter->call(
            mAuthorizer->requestor(),
            [this] { return authorizationHeader(); },
            request);

        if (mVerbose) {
            auto length = outcome.response->headers.find("content-length");
            std::cerr << "[Session] Response: " << outcome.response->status << " ("
                      << (length == outcome.response->headers.end() ? "?" : length->second)
                      << " bytes)\n";
        }
    } catch (const RequestException& e) {
        if (!strategy.shouldRetryOnFailure() || !isTransient(e.fault())) {
            throw;
        }
        outcome.failure = e;
    }
    return outcome;
}

Headers Session::authorizationHeader() const {
    mAuthorizer->refreshIfInvalid();
    const std::string token = mAuthorizer->accessToken();
    if (token.empty() || !mAuthorizer->isValid()) {
        throw InvalidInvocation("access token is invalid and cannot be refreshed");
    }

    Headers headers;
    headers["Authorization"] = "bearer " + token;
    return headers;
}

std::optional<nlohmann::json> Session::decodeBody(const HttpResponse& response) {
    auto length = response.headers.find("content-length");
    if (length != response.headers.end() && length->second == "0") {
        return nlohmann::json("");
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error&) {
        throw BadJSON(response);
    }
}

// ---------------------------------------------------------------------------
// Private: logging
// ---------------------------------------------------------------------------

void Session::logRequest(const PreparedRequest& request) const {
    if (!mVerbose) {
        return;
    }
    nlohmann::json data = nullptr;
    if (request.data) {
        data = nlohmann::json::array();
        for (const auto& [key, value] : *request.data) {
            data.push_back({key, value});
        }
    } else if (request.rawData) {
        data = *request.rawData;
    }
    std::cerr << "[Session] Fetching: " << request.method << " " << request.url << "\n"
              << "[Session] Data: " << data.dump() << "\n"
              << "[Session] Params: " << request.params.dump() << "\n";
}

void Session::logRetry(const PreparedRequest& request, const AttemptOutcome& outcome) const {
    std::string status;
    if (outcome.failure) {
        status = std::string(toString(outcome.failure->fault())) + "("
               + outcome.failure->originalError().message() + ")";
    } else {
        status = std::to_string(outcome.response->status);
    }
    std::cerr << "[Retry] Retrying due to " << status << " status: "
              << request.method << " " << request.url << "\n";
}

} // namespace apicore
