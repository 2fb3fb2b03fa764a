#pragma once

#include "util.hpp"

#include <memory>
#include <optional>

namespace apicore {

/// Schedules the retries of one logical request: how many attempts are
/// left and how long to wait before the next one.
///
/// Instances are immutable. Consuming a retry yields a new instance and
/// leaves the receiver untouched, so one strategy can seed many requests.
class RetryStrategy {
public:
    virtual ~RetryStrategy() = default;

    /// Delay before the attempt this state governs; empty means go now.
    virtual std::optional<double> sleepSeconds() const = 0;

    /// True if a failed attempt under this state may be retried.
    virtual bool shouldRetryOnFailure() const = 0;

    /// State for the next attempt.
    virtual std::unique_ptr<RetryStrategy> consumeAvailableRetry() const = 0;

    /// Block on @p sleeper for sleepSeconds(), if any.
    void sleep(const Sleeper& sleeper, bool verbose = false) const;
};

/// Retries a request a fixed number of times. The last two attempts wait
/// [0, 2) and [2, 4) seconds respectively; earlier ones go immediately.
class FiniteRetryStrategy final : public RetryStrategy {
public:
    /// @param retries  Number of times to attempt a request.
    explicit FiniteRetryStrategy(int retries = 3);

    int remainingRetries() const { return mRetries; }

    std::optional<double> sleepSeconds() const override;
    bool shouldRetryOnFailure() const override;
    std::unique_ptr<RetryStrategy> consumeAvailableRetry() const override;

private:
    const int mRetries;
};

} // namespace apicore
