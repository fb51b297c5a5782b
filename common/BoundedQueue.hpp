#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <cstddef>

namespace lan_sweep::common
{
    // Multi-producer / multi-consumer queue with a fixed capacity.
    // Push blocks while full, Pop blocks while empty. After Close, Push is
    // refused and Pop drains what is left before returning nullopt.
    template <typename T>
    class BoundedQueue
    {
    private:
        std::queue<T> m_queue;
        std::size_t m_capacity;
        mutable std::mutex m_mutex;
        std::condition_variable m_notEmpty;
        std::condition_variable m_notFull;
        bool m_closed = false;

    public:
        explicit BoundedQueue(std::size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

        bool Push(T value)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_notFull.wait(lock, [this]
                           { return m_queue.size() < m_capacity || m_closed; });

            if (m_closed)
                return false;

            m_queue.push(std::move(value));
            m_notEmpty.notify_one();
            return true;
        }

        std::optional<T> Pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_notEmpty.wait(lock, [this]
                            { return !m_queue.empty() || m_closed; });

            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            m_notFull.notify_one();
            return value;
        }

        void Close()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
            m_notEmpty.notify_all();
            m_notFull.notify_all();
        }

        // Drops everything still queued. Returns how many items were dropped.
        std::size_t Clear()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::size_t dropped = m_queue.size();
            std::queue<T>().swap(m_queue);
            m_notFull.notify_all();
            return dropped;
        }

        bool Empty() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.empty();
        }
    };
}
