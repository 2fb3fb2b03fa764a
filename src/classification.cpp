#include "classification.hpp"

#include <unordered_map>
#include <unordered_set>

namespace apicore {

namespace {

using StatusThrower = void (*)(const HttpResponse&);

template <class Error>
[[noreturn]] void throwAs(const HttpResponse& response) {
    throw Error(response);
}

const std::unordered_map<unsigned int, StatusThrower>& statusExceptions() {
    static const std::unordered_map<unsigned int, StatusThrower> table = {
        {301, &throwAs<Redirect>},
        {302, &throwAs<Redirect>},
        {400, &throwAs<BadRequest>},
        {401, &throwAuthorizationError},
        {403, &throwAuthorizationError},
        {404, &throwAs<NotFound>},
        {409, &throwAs<Conflict>},
        {413, &throwAs<TooLarge>},
        {414, &throwAs<URITooLong>},
        {415, &throwAs<SpecialError>},
        {420, &throwAs<TooManyRequests>},
        {429, &throwAs<TooManyRequests>},
        {451, &throwAs<UnavailableForLegalReasons>},
        {500, &throwAs<ServerError>},
        {502, &throwAs<ServerError>},
        {503, &throwAs<ServerError>},
        {504, &throwAs<ServerError>},
        {520, &throwAs<ServerError>},
        {522, &throwAs<ServerError>},
    };
    return table;
}

const std::unordered_set<unsigned int> kRetryStatuses = {500, 502, 503, 504, 408, 520, 522};
const std::unordered_set<unsigned int> kSuccessStatuses = {200, 201, 202};

constexpr unsigned int kNoContent    = 204;
constexpr unsigned int kUnauthorized = 401;

} // namespace

const char* toString(ResponseClassification classification) {
    switch (classification) {
        case ResponseClassification::Success:                 return "Success";
        case ResponseClassification::NoContent:               return "NoContent";
        case ResponseClassification::AuthExpired:             return "AuthExpired";
        case ResponseClassification::RetryableStatus:         return "RetryableStatus";
        case ResponseClassification::RetryableTransportError: return "RetryableTransportError";
        case ResponseClassification::TerminalStatus:          return "TerminalStatus";
    }
    return "Unknown";
}

bool isRetryableStatus(unsigned int status) {
    return kRetryStatuses.count(status) > 0;
}

bool isSuccessStatus(unsigned int status) {
    return kSuccessStatuses.count(status) > 0;
}

bool hasStatusException(unsigned int status) {
    return statusExceptions().count(status) > 0;
}

void throwStatusException(const HttpResponse& response) {
    statusExceptions().at(response.status)(response);
    // Every table entry throws.
    throw UnexpectedStatus(response.status);
}

ResponseClassification classifyOutcome(const AttemptOutcome& outcome,
                                       bool retryAllowed,
                                       bool canRefresh) {
    if (!outcome.response) {
        return ResponseClassification::RetryableTransportError;
    }

    const unsigned int status = outcome.response->status;

    if (retryAllowed) {
        if (status == kUnauthorized && canRefresh) {
            return ResponseClassification::AuthExpired;
        }
        if (isRetryableStatus(status)) {
            return ResponseClassification::RetryableStatus;
        }
    }

    if (hasStatusException(status)) {
        return ResponseClassification::TerminalStatus;
    }
    if (status == kNoContent) {
        return ResponseClassification::NoContent;
    }
    if (!isSuccessStatus(status)) {
        throw UnexpectedStatus(status);
    }
    return ResponseClassification::Success;
}

} // namespace apicore
