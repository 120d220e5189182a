#include "core/shared/circuit_breaker.h"
#include "core/shared/logging.h"

#include <chrono>

namespace nr {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

CircuitBreaker::CircuitBreaker(QString dependencyName, int openThreshold, int halfOpenDelayMs)
    : name(std::move(dependencyName))
    , openThreshold(openThreshold > 0 ? openThreshold : kDefaultOpenThreshold)
    , halfOpenDelayMs(halfOpenDelayMs >= 0 ? halfOpenDelayMs : kDefaultHalfOpenDelayMs)
{
}

bool CircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < openThreshold) {
        return false;
    }
    // Half-open once the delay has passed: allow one attempt.
    return steadyNowMs() - lastFailureTime.load() < halfOpenDelayMs;
}

void CircuitBreaker::recordSuccess()
{
    const int previous = consecutiveFailures.exchange(0);
    if (previous >= openThreshold) {
        LOG_INFO(nrCore, "Circuit for %s closed after successful probe", qUtf8Printable(name));
    }
}

void CircuitBreaker::recordFailure()
{
    const int failures = consecutiveFailures.fetch_add(1) + 1;
    lastFailureTime.store(steadyNowMs());
    if (failures == openThreshold) {
        LOG_WARN(nrCore, "Circuit for %s opened after %d consecutive failures",
                 qUtf8Printable(name), failures);
    }
}

} // namespace nr
