#include "common/retry_policy.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace bluemeter {

RetryPolicy::RetryPolicy(int maxAttempts,
                         std::chrono::milliseconds initialDelay,
                         Backoff backoff,
                         std::chrono::milliseconds maxDelay)
    : m_maxAttempts(std::max(1, maxAttempts))
    , m_initialDelay(std::max(std::chrono::milliseconds(0), initialDelay))
    , m_backoff(backoff)
    , m_maxDelay(std::max(m_initialDelay, maxDelay))
{
}

RetryPolicy RetryPolicy::enumerationDefault()
{
    return RetryPolicy(2, std::chrono::seconds(2), Backoff::Fixed);
}

std::chrono::milliseconds RetryPolicy::delayForAttempt(int attempt) const
{
    if (m_backoff == Backoff::Fixed || attempt <= 1) {
        return m_initialDelay;
    }

    auto delay = m_initialDelay;
    for (int i = 1; i < attempt; ++i) {
        delay *= 2;
        if (delay >= m_maxDelay) {
            return m_maxDelay;
        }
    }
    return delay;
}

void RetryPolicy::setSleeper(Sleeper sleeper)
{
    m_sleeper = std::move(sleeper);
}

void RetryPolicy::sleepFor(std::chrono::milliseconds delay) const
{
    if (m_sleeper) {
        m_sleeper(delay);
        return;
    }
    std::this_thread::sleep_for(delay);
}

} // namespace bluemeter
