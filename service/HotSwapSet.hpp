#pragma once

#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace hearth::service
{
    struct ReloadStats
    {
        int added = 0;
        int updated = 0;
        int removed = 0;
        int kept = 0;
    };

    /*
      Keyed set of live instances that can be replaced while a worker is
      iterating over it. T needs a Setup() member that may throw; teardown
      is T's destructor, which runs once the last snapshot holding the
      instance is released.
    */
    template <typename T>
    class HotSwapSet
    {
    public:
        struct Entry
        {
            std::string fingerprint;
            std::shared_ptr<T> instance;
        };

        using Map = std::map<std::string, Entry>;

        struct Candidate
        {
            std::string key;
            std::string fingerprint;
            std::function<std::shared_ptr<T>()> build;
        };

        explicit HotSwapSet(std::string name) : m_name(std::move(name)), m_active(std::make_shared<const Map>()) {}

        // Only holds the lock long enough to copy the pointer.
        std::shared_ptr<const Map> Snapshot() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_active;
        }

        std::shared_ptr<T> Find(const std::string &key) const
        {
            auto snapshot = Snapshot();
            auto it = snapshot->find(key);
            if (it == snapshot->end())
                return nullptr;
            return it->second.instance;
        }

        size_t Size() const
        {
            return Snapshot()->size();
        }

        ReloadStats Reload(const std::vector<Candidate> &candidates)
        {
            std::lock_guard<std::mutex> reload(m_reloadMutex);

            auto current = Snapshot();
            auto next = std::make_shared<Map>();
            ReloadStats stats;

            for (const auto &candidate : candidates)
            {
                if (next->count(candidate.key))
                {
                    std::cerr << "[" << m_name << "] WARNING: duplicate key '" << candidate.key << "' ignored\n";
                    continue;
                }

                auto existing = current->find(candidate.key);
                if (existing != current->end() && existing->second.fingerprint == candidate.fingerprint)
                {
                    next->emplace(candidate.key, existing->second);
                    ++stats.kept;
                    continue;
                }

                std::shared_ptr<T> instance;
                try
                {
                    instance = candidate.build();
                    if (!instance)
                        throw std::runtime_error("builder returned nothing");
                    instance->Setup();
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[" << m_name << "] ERROR: setup of '" << candidate.key << "' failed: " << e.what() << "\n";
                    continue;
                }

                next->emplace(candidate.key, Entry{candidate.fingerprint, instance});
                if (existing != current->end())
                    ++stats.updated;
                else
                    ++stats.added;
            }

            for (const auto &pair : *current)
            {
                if (!next->count(pair.first))
                    ++stats.removed;
            }

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_active = std::move(next);
            }

            std::cout << "[" << m_name << "] Reloaded: " << stats.added << " added, " << stats.updated
                      << " updated, " << stats.removed << " removed, " << stats.kept << " kept\n";
            return stats;
        }

        void Clear()
        {
            std::lock_guard<std::mutex> reload(m_reloadMutex);
            std::lock_guard<std::mutex> lock(m_mutex);
            m_active = std::make_shared<const Map>();
        }

    private:
        std::string m_name;
        mutable std::mutex m_mutex;
        std::mutex m_reloadMutex;
        std::shared_ptr<const Map> m_active;
    };
}
