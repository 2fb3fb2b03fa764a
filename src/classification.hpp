#pragma once

#include "errors.hpp"
#include "models.hpp"

#include <optional>

namespace apicore {

/// What one attempt amounts to, computed fresh from its outcome.
enum class ResponseClassification {
    Success,
    NoContent,
    AuthExpired,
    RetryableStatus,
    RetryableTransportError,
    TerminalStatus
};

const char* toString(ResponseClassification classification);

/// Result of one attempt: a response or a captured transient transport
/// failure, never both.
struct AttemptOutcome {
    std::optional<HttpResponse>     response;
    std::optional<RequestException> failure;
};

/// 500, 502, 503, 504, 408 and Cloudflare's 520/522.
bool isRetryableStatus(unsigned int status);

/// 200, 201, 202.
bool isSuccessStatus(unsigned int status);

/// True if @p status has an entry in the status-to-error table.
bool hasStatusException(unsigned int status);

/// Throw the error the table maps @p response's status to.
/// Precondition: hasStatusException(response.status).
[[noreturn]] void throwStatusException(const HttpResponse& response);

/// Classify @p outcome. @p retryAllowed is the retry strategy's verdict,
/// @p canRefresh whether the authorizer can renew its token.
/// A captured failure is always transient (non-transient ones are rethrown
/// before an outcome is built).
/// @throws UnexpectedStatus for a status no rule covers.
ResponseClassification classifyOutcome(const AttemptOutcome& outcome,
                                       bool retryAllowed,
                                       bool canRefresh);

} // namespace apicore
