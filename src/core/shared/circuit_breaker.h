#pragma once

#include <QString>

#include <atomic>
#include <cstdint>

namespace nr {

// Consecutive-failure circuit breaker guarding a slow or remote dependency.
// Open after openThreshold consecutive failures; once halfOpenDelayMs has
// elapsed since the last failure a probe is let through again.
struct CircuitBreaker {
    static constexpr int kDefaultOpenThreshold = 5;
    static constexpr int kDefaultHalfOpenDelayMs = 30000;

    explicit CircuitBreaker(QString dependencyName = {},
                            int openThreshold = kDefaultOpenThreshold,
                            int halfOpenDelayMs = kDefaultHalfOpenDelayMs);

    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};    // steady_clock ms
    const QString name;
    const int openThreshold;
    const int halfOpenDelayMs;

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

} // namespace nr
