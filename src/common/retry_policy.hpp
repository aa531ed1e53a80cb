#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace bluemeter {

enum class Backoff {
    Fixed,
    Exponential
};

// Bounded retry for transient enumeration failures. Only EnumerationError is
// retried; anything else propagates immediately.
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryPolicy(int maxAttempts,
                std::chrono::milliseconds initialDelay,
                Backoff backoff = Backoff::Fixed,
                std::chrono::milliseconds maxDelay = std::chrono::seconds(30));

    // Two attempts, two seconds apart.
    static RetryPolicy enumerationDefault();

    int maxAttempts() const { return m_maxAttempts; }

    // Delay slept after failed attempt `attempt` (1-based).
    std::chrono::milliseconds delayForAttempt(int attempt) const;

    void setSleeper(Sleeper sleeper);

    template <typename Fn>
    auto run(const std::string &operation, Fn &&fn) const -> decltype(fn())
    {
        for (int attempt = 1;; ++attempt) {
            try {
                return fn();
            } catch (const EnumerationError &ex) {
                if (attempt >= m_maxAttempts) {
                    BMLOG_WARN(QStringLiteral("RetryPolicy"),
                               QStringLiteral("run"),
                               QStringLiteral("retries_exhausted"),
                               QStringLiteral("enumeration_failed"),
                               QStringLiteral("rethrow"),
                               logging::defaultWho(),
                               QString(),
                               nlohmann::json{{"operation", operation},
                                              {"attempts", attempt},
                                              {"error", ex.what()}});
                    throw;
                }
                const auto delay = delayForAttempt(attempt);
                BMLOG_INFO(QStringLiteral("RetryPolicy"),
                           QStringLiteral("run"),
                           QStringLiteral("retry_scheduled"),
                           QStringLiteral("enumeration_failed"),
                           QStringLiteral("sleep_then_retry"),
                           logging::defaultWho(),
                           QString(),
                           nlohmann::json{{"operation", operation},
                                          {"attempt", attempt},
                                          {"maxAttempts", m_maxAttempts},
                                          {"delayMs", delay.count()},
                                          {"error", ex.what()}});
                sleepFor(delay);
            }
        }
    }

private:
    void sleepFor(std::chrono::milliseconds delay) const;

    int m_maxAttempts;
    std::chrono::milliseconds m_initialDelay;
    Backoff m_backoff;
    std::chrono::milliseconds m_maxDelay;
    Sleeper m_sleeper;
};

} // namespace bluemeter
