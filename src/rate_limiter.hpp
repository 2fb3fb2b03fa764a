#pragma once

#include "models.hpp"
#include "requestor.hpp"
#include "util.hpp"

#include <functional>
#include <mutex>
#include <optional>

namespace apicore {

/// Observes the server's x-ratelimit-* headers and sleeps before a call
/// when the remaining budget has to be spread over the reset window.
///
/// Shared by every Session using the same credentials; all bookkeeping is
/// guarded by an internal mutex and the network call runs outside it.
class RateLimiter {
public:
    /// Seconds since the epoch.
    using Clock          = std::function<double()>;
    using HeaderCallback = std::function<Headers()>;

    explicit RateLimiter(Sleeper sleeper = sleepFor,
                         Clock clock = wallClockSeconds,
                         bool verbose = false);

    /// Wait if needed, fetch headers from @p headerCallback, perform the call
    /// on @p requestor and record the rate-limit headers of the response.
    HttpResponse call(Requestor& requestor,
                      const HeaderCallback& headerCallback,
                      const PreparedRequest& request);

    /// Sleep until the next request may be sent.
    void delay();

    /// Update the budget from a response's headers.
    void update(const Headers& responseHeaders);

    // ---- accessors ----
    std::optional<double> remaining() const;
    std::optional<int>    used() const;
    std::optional<double> nextRequestTimestamp() const;
    std::optional<double> resetTimestamp() const;
    double                totalSleepSeconds() const;

    static double wallClockSeconds();

private:
    Sleeper mSleeper;
    Clock   mClock;
    bool    mVerbose;

    mutable std::mutex    mMutex;
    std::optional<double> mRemaining;
    std::optional<int>    mUsed;
    std::optional<double> mNextRequestTimestamp;
    std::optional<double> mResetTimestamp;
    double                mTotalSleep = 0.0;
};

} // namespace apicore
