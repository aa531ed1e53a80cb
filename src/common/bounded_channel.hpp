#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace bluemeter {

// Multi-producer queue with a fixed capacity. Producers that must never block
// (OS callbacks) use tryPush; the single consumer drains with popFor.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity)
        : m_capacity(capacity == 0 ? 1 : capacity)
    {
    }

    BoundedChannel(const BoundedChannel &) = delete;
    BoundedChannel &operator=(const BoundedChannel &) = delete;

    // Never waits for space. Returns false when the channel is full or closed.
    bool tryPush(T value)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed || m_items.size() >= m_capacity) {
                return false;
            }
            m_items.push_back(std::move(value));
        }
        m_notEmpty.notify_one();
        return true;
    }

    // Waits up to `timeout` for space. Returns false on timeout or close.
    template <typename Rep, typename Period>
    bool pushFor(T value, std::chrono::duration<Rep, Period> timeout)
    {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            const bool ready = m_notFull.wait_for(lock, timeout, [this]() {
                return m_closed || m_items.size() < m_capacity;
            });
            if (!ready || m_closed) {
                return false;
            }
            m_items.push_back(std::move(value));
        }
        m_notEmpty.notify_one();
        return true;
    }

    // Waits up to `timeout` for an item. Empty on timeout or when closed and
    // drained.
    template <typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout)
    {
        std::optional<T> result;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_notEmpty.wait_for(lock, timeout, [this]() {
                return m_closed || !m_items.empty();
            });
            if (m_items.empty()) {
                return std::nullopt;
            }
            result.emplace(std::move(m_items.front()));
            m_items.pop_front();
        }
        m_notFull.notify_one();
        return result;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_notEmpty.notify_all();
        m_notFull.notify_all();
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    std::size_t capacity() const { return m_capacity; }

private:
    const std::size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
    std::deque<T> m_items;
    bool m_closed = false;
};

} // namespace bluemeter
