#include "retry_strategy.hpp"

#include <iomanip>
#include <iostream>

namespace apicore {

void RetryStrategy::sleep(const Sleeper& sleeper, bool verbose) const {
    const auto seconds = sleepSeconds();
    if (!seconds) {
        return;
    }
    if (verbose) {
        std::cerr << "[Retry] Sleeping: " << std::fixed << std::setprecision(2)
                  << *seconds << " seconds prior to retry\n";
    }
    sleeper(std::chrono::duration<double>(*seconds));
}

FiniteRetryStrategy::FiniteRetryStrategy(int retries)
    : mRetries(retries) {}

std::optional<double> FiniteRetryStrategy::sleepSeconds() const {
    if (mRetries != 1 && mRetries != 2) {
        return std::nullopt;
    }
    const double base = (mRetries == 2) ? 0.0 : 2.0;
    return base + randomUniform(2.0);
}

bool FiniteRetryStrategy::shouldRetryOnFailure() const {
    return mRetries > 1;
}

std::unique_ptr<RetryStrategy> FiniteRetryStrategy::consumeAvailableRetry() const {
    return std::make_unique<FiniteRetryStrategy>(mRetries - 1);
}

} // namespace apicore
