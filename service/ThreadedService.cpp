#include "ThreadedService.hpp"
#include <iostream>

namespace hearth::service
{
    ThreadedService::ThreadedService(std::string name,
                                     std::chrono::milliseconds interval,
                                     std::chrono::milliseconds faultBackoff)
        : m_name(std::move(name)), m_interval(interval), m_faultBackoff(faultBackoff), m_running(false)
    {
    }

    ThreadedService::~ThreadedService()
    {
        // Derived destructors already stopped us; this only joins a thread
        // left behind if one forgot.
        m_running = false;
        {
            std::lock_guard<std::mutex> lock(m_waitMutex);
            m_stopRequested = true;
        }
        m_waitCv.notify_all();
        if (m_thread.joinable())
            m_thread.join();
    }

    void ThreadedService::Start()
    {
        std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
        if (m_running)
            return;

        OnStart();

        {
            std::lock_guard<std::mutex> lock(m_waitMutex);
            m_stopRequested = false;
        }
        {
            std::lock_guard<std::mutex> lock(m_statsMutex);
            m_startedAt = common::Clock::now();
        }
        m_running = true;
        m_thread = std::thread(&ThreadedService::WorkerLoop, this);
        std::cout << "[Service] " << m_name << " started\n";
    }

    void ThreadedService::Stop()
    {
        std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
        if (!m_running && !m_thread.joinable())
            return;

        m_running = false;
        {
            std::lock_guard<std::mutex> lock(m_waitMutex);
            m_stopRequested = true;
        }
        m_waitCv.notify_all();

        if (m_thread.joinable())
            m_thread.join();

        OnStop();
        std::cout << "[Service] " << m_name << " stopped\n";
    }

    void ThreadedService::SetInterval(std::chrono::milliseconds interval)
    {
        std::lock_guard<std::mutex> lock(m_waitMutex);
        m_interval = interval;
    }

    std::chrono::milliseconds ThreadedService::Interval() const
    {
        std::lock_guard<std::mutex> lock(m_waitMutex);
        return m_interval;
    }

    bool ThreadedService::WaitFor(std::chrono::milliseconds duration)
    {
        std::unique_lock<std::mutex> lock(m_waitMutex);
        return !m_waitCv.wait_for(lock, duration, [this]
                                  { return m_stopRequested; });
    }

    void ThreadedService::WorkerLoop()
    {
        while (m_running)
        {
            bool faulted = false;
            try
            {
                RunCycle();

                std::lock_guard<std::mutex> lock(m_statsMutex);
                ++m_cycles;
                m_lastSuccess = common::Clock::now();
            }
            catch (const std::exception &e)
            {
                faulted = true;
                std::cerr << "[Service] ERROR: " << m_name << " cycle failed: " << e.what() << "\n";

                std::lock_guard<std::mutex> lock(m_statsMutex);
                ++m_cycles;
                ++m_faults;
                m_lastError = e.what();
            }
            catch (...)
            {
                faulted = true;
                std::cerr << "[Service] ERROR: " << m_name << " cycle failed with a non-standard exception\n";

                std::lock_guard<std::mutex> lock(m_statsMutex);
                ++m_cycles;
                ++m_faults;
                m_lastError = "unknown exception";
            }

            if (!m_running)
                break;
            if (!WaitFor(faulted ? m_faultBackoff : Interval()))
                break;
        }
    }

    ServiceHealth ThreadedService::Health() const
    {
        ServiceHealth health;
        health.name = m_name;
        health.running = m_running;

        const auto interval = Interval();
        std::lock_guard<std::mutex> lock(m_statsMutex);
        health.cycles = m_cycles;
        health.faults = m_faults;
        health.last_success = m_lastSuccess;
        health.last_error = m_lastError;

        if (health.running)
        {
            const auto now = common::Clock::now();
            const auto reference = m_lastSuccess ? *m_lastSuccess : m_startedAt;
            health.stale = (now - reference) > 2 * interval;
        }
        return health;
    }
}
