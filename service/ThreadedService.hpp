#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "../common/TimeUtil.hpp"

namespace hearth::service
{
    struct ServiceHealth
    {
        std::string name;
        bool running = false;
        uint64_t cycles = 0;
        uint64_t faults = 0;
        std::optional<common::TimePoint> last_success;
        std::string last_error;
        bool stale = false;
    };

    /*
      One long-lived worker thread running RunCycle() every interval.
      A cycle that throws is logged, counted and followed by the fault
      backoff; the worker keeps going. Both waits wake early on Stop().
      Derived classes must call Stop() from their own destructor so the
      worker never runs against a half-destroyed object.
    */
    class ThreadedService
    {
    public:
        ThreadedService(std::string name,
                        std::chrono::milliseconds interval,
                        std::chrono::milliseconds faultBackoff);
        virtual ~ThreadedService();

        ThreadedService(const ThreadedService &) = delete;
        ThreadedService &operator=(const ThreadedService &) = delete;

        // Runs OnStart() on the calling thread; if it throws the service
        // stays stopped and the exception reaches the caller.
        void Start();
        void Stop();

        bool IsRunning() const { return m_running; }
        const std::string &Name() const { return m_name; }

        ServiceHealth Health() const;

        void SetInterval(std::chrono::milliseconds interval);
        std::chrono::milliseconds Interval() const;

    protected:
        virtual void OnStart() {}
        virtual void OnStop() {}
        virtual void RunCycle() = 0;

    private:
        void WorkerLoop();
        // False when Stop() interrupted the wait.
        bool WaitFor(std::chrono::milliseconds duration);

        std::string m_name;
        std::chrono::milliseconds m_interval;
        std::chrono::milliseconds m_faultBackoff;

        std::atomic<bool> m_running;
        std::thread m_thread;
        std::mutex m_lifecycleMutex;

        mutable std::mutex m_waitMutex;
        std::condition_variable m_waitCv;
        bool m_stopRequested = false;

        mutable std::mutex m_statsMutex;
        uint64_t m_cycles = 0;
        uint64_t m_faults = 0;
        std::optional<common::TimePoint> m_lastSuccess;
        std::string m_lastError;
        common::TimePoint m_startedAt{};
    };
}
