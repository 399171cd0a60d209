#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace hearth::common
{
    // Bounded mailbox of one EventBus subscriber. The bus side only offers
    // (never blocks); the consumer side waits until an item arrives or the
    // queue is closed. Items queued before Close() are still handed out.
    template <typename T>
    class SubscriberQueue
    {
    public:
        explicit SubscriberQueue(size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

        bool Offer(const T &item)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed || m_items.size() >= m_capacity)
                return false;
            m_items.push_back(item);
            m_ready.notify_one();
            return true;
        }

        std::optional<T> Pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_ready.wait(lock, [this]
                         { return !m_items.empty() || m_closed; });
            return TakeLocked();
        }

        std::optional<T> PopFor(std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_ready.wait_for(lock, timeout, [this]
                             { return !m_items.empty() || m_closed; });
            return TakeLocked();
        }

        void Close()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
            m_ready.notify_all();
        }

        bool Closed() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_closed;
        }

        size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_items.size();
        }

        size_t Capacity() const { return m_capacity; }

    private:
        std::optional<T> TakeLocked()
        {
            if (m_items.empty())
                return std::nullopt;
            std::optional<T> item(std::move(m_items.front()));
            m_items.pop_front();
            return item;
        }

        const size_t m_capacity;
        std::deque<T> m_items;
        mutable std::mutex m_mutex;
        std::condition_variable m_ready;
        bool m_closed = false;
    };
}
