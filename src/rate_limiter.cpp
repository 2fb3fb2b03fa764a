#include "rate_limiter.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace apicore {

RateLimiter::RateLimiter(Sleeper sleeper, Clock clock, bool verbose)
    : mSleeper(std::move(sleeper))
    , mClock(std::move(clock))
    , mVerbose(verbose) {}

double RateLimiter::wallClockSeconds() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

HttpResponse RateLimiter::call(Requestor& requestor,
                               const HeaderCallback& headerCallback,
                               const PreparedRequest& request) {
    delay();
    const Headers headers = headerCallback();
    HttpResponse response = requestor.request(request, headers);
    update(response.headers);
    return response;
}

void RateLimiter::delay() {
    double sleepSeconds = 0.0;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (!mNextRequestTimestamp) return;
        sleepSeconds = *mNextRequestTimestamp - mClock();
        if (sleepSeconds <= 0.0) return;
        mTotalSleep += sleepSeconds;
    }

    std::cerr << "[RateLimiter] Sleeping: " << sleepSeconds
              << " seconds prior to call\n";
    mSleeper(std::chrono::duration<double>(sleepSeconds));
}

void RateLimiter::update(const Headers& responseHeaders) {
    std::lock_guard<std::mutex> lock(mMutex);

    auto remainingHeader = responseHeaders.find("x-ratelimit-remaining");
    if (remainingHeader == responseHeaders.end()) {
        if (mRemaining) {
            *mRemaining -= 1;
            *mUsed += 1;
        }
        return;
    }

    double secondsToReset = 0.0;
    double remaining      = 0.0;
    int    used           = 0;
    try {
        auto reset = responseHeaders.find("x-ratelimit-reset");
        auto usedHeader = responseHeaders.find("x-ratelimit-used");
        if (reset == responseHeaders.end() || usedHeader == responseHeaders.end()) {
            throw std::invalid_argument("incomplete x-ratelimit headers");
        }
        secondsToReset = std::stoi(reset->second);
        remaining      = std::stod(remainingHeader->second);
        used           = std::stoi(usedHeader->second);
    } catch (const std::exception& e) {
        std::cerr << "[RateLimiter] Warning: failed to parse rate-limit headers: "
                  << e.what() << "\n";
        return;
    }

    const double now = mClock();
    const std::optional<double> previousRemaining = mRemaining;

    mRemaining      = remaining;
    mUsed           = used;
    mResetTimestamp = now + secondsToReset;

    if (remaining <= 0) {
        mNextRequestTimestamp = mResetTimestamp;
        return;
    }

    // Other clients sharing the budget show up as a larger drop than ours.
    double estimatedClients = 1.0;
    if (previousRemaining && *previousRemaining > remaining) {
        estimatedClients = *previousRemaining - remaining;
    }

    mNextRequestTimestamp = std::min(*mResetTimestamp,
                                     now + estimatedClients * secondsToReset / remaining);

    if (mVerbose) {
        std::cerr << "[RateLimiter] remaining=" << remaining << ", used=" << used
                  << ", reset in " << secondsToReset << "s\n";
    }
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

std::optional<double> RateLimiter::remaining() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mRemaining;
}

std::optional<int> RateLimiter::used() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mUsed;
}

std::optional<double> RateLimiter::nextRequestTimestamp() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mNextRequestTimestamp;
}

std::optional<double> RateLimiter::resetTimestamp() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mResetTimestamp;
}

double RateLimiter::totalSleepSeconds() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mTotalSleep;
}

} // namespace apicore
