#pragma once

#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "SubscriberQueue.hpp"

namespace hearth::common
{
    /*
      Best-effort fan-out. Each subscriber owns a bounded queue; a subscriber
      whose queue is full when an event is published is dropped and its
      queue shut down, so a stalled consumer never blocks a publisher.
    */
    template <typename T>
    class EventBus
    {
    public:
        using Subscription = SubscriberQueue<T>;

        explicit EventBus(std::string name = "EventBus") : m_name(std::move(name)) {}

        std::shared_ptr<Subscription> Subscribe(size_t capacity = 50)
        {
            auto sub = std::make_shared<Subscription>(capacity);
            std::lock_guard<std::mutex> lock(m_mutex);
            m_subscribers.push_back(sub);
            return sub;
        }

        void Unsubscribe(const std::shared_ptr<Subscription> &sub)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_subscribers.erase(std::remove(m_subscribers.begin(), m_subscribers.end(), sub),
                                m_subscribers.end());
            sub->Close();
        }

        // Returns the number of subscribers that accepted the event.
        size_t Publish(const T &event)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            size_t delivered = 0;

            for (auto it = m_subscribers.begin(); it != m_subscribers.end();)
            {
                if ((*it)->Offer(event))
                {
                    ++delivered;
                    ++it;
                    continue;
                }

                std::cerr << "[" << m_name << "] WARNING: dropping slow subscriber\n";
                (*it)->Close();
                it = m_subscribers.erase(it);
            }
            return delivered;
        }

        size_t SubscriberCount() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_subscribers.size();
        }

        void Shutdown()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &sub : m_subscribers)
                sub->Close();
            m_subscribers.clear();
        }

    private:
        std::string m_name;
        mutable std::mutex m_mutex;
        std::vector<std::shared_ptr<Subscription>> m_subscribers;
    };
}
