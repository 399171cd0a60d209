#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "service/ServiceManager.hpp"
#include "service/ThreadedService.hpp"
#include "test_support.hpp"

using namespace hearth::service;
using namespace std::chrono_literals;

static bool WaitUntil(const std::function<bool()> &pred, std::chrono::milliseconds timeout = 3000ms)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

class ScriptedService : public ThreadedService
{
public:
    ScriptedService(std::string name, std::chrono::milliseconds interval, std::chrono::milliseconds backoff)
        : ThreadedService(std::move(name), interval, backoff) {}
    ~ScriptedService() override { Stop(); }

    std::atomic<int> runs{0};
    std::atomic<int> failuresLeft{0};
    std::atomic<bool> block{false};
    bool failStart = false;
    std::vector<std::string> *stopLog = nullptr;
    std::mutex *stopLogMutex = nullptr;

protected:
    void OnStart() override
    {
        if (failStart)
            throw std::runtime_error("hardware missing");
    }

    void OnStop() override
    {
        if (stopLog)
        {
            std::lock_guard<std::mutex> lock(*stopLogMutex);
            stopLog->push_back(Name());
        }
    }

    void RunCycle() override
    {
        ++runs;
        while (block)
            std::this_thread::sleep_for(2ms);
        if (failuresLeft > 0)
        {
            --failuresLeft;
            throw std::runtime_error("simulated fault");
        }
    }
};

void test_runs_cycles_until_stopped()
{
    ScriptedService svc("ticker", 10ms, 10ms);
    svc.Start();
    assert(svc.IsRunning());
    assert(WaitUntil([&]
                     { return svc.runs >= 3; }));
    svc.Stop();
    assert(!svc.IsRunning());

    int after = svc.runs;
    std::this_thread::sleep_for(50ms);
    assert(svc.runs == after);

    auto health = svc.Health();
    assert(!health.running);
    assert(health.cycles >= 3);
    assert(health.faults == 0);
    assert(health.last_success);
    std::cout << "test_runs_cycles_until_stopped passed\n";
}

void test_faults_use_backoff_and_worker_survives()
{
    // A long interval and a short backoff: retries after a fault are fast.
    ScriptedService svc("flaky", 10s, 10ms);
    svc.failuresLeft = 3;

    hearth::test::StreamCapture err(std::cerr);
    svc.Start();
    assert(WaitUntil([&]
                     { return svc.runs >= 4; }));

    auto health = svc.Health();
    assert(health.running);
    assert(health.faults == 3);
    assert(health.last_error == "simulated fault");
    assert(WaitUntil([&]
                     { return svc.Health().last_success.has_value(); }));
    svc.Stop();
    assert(err.Text().find("[Service] ERROR: flaky cycle failed: simulated fault") != std::string::npos);
    std::cout << "test_faults_use_backoff_and_worker_survives passed\n";
}

void test_stop_interrupts_long_wait()
{
    ScriptedService svc("sleepy", 60s, 60s);
    svc.Start();
    assert(WaitUntil([&]
                     { return svc.runs == 1; }));

    auto begin = std::chrono::steady_clock::now();
    svc.Stop();
    assert(std::chrono::steady_clock::now() - begin < 2s);
    std::cout << "test_stop_interrupts_long_wait passed\n";
}

void test_stuck_cycle_reports_stale()
{
    ScriptedService svc("stuck", 20ms, 20ms);
    svc.block = true;
    svc.Start();
    assert(WaitUntil([&]
                     { return svc.Health().stale; }));
    svc.block = false;
    assert(WaitUntil([&]
                     { return !svc.Health().stale; }));
    svc.Stop();
    std::cout << "test_stuck_cycle_reports_stale passed\n";
}

void test_failed_start_leaves_service_stopped()
{
    ScriptedService svc("broken", 10ms, 10ms);
    svc.failStart = true;
    bool threw = false;
    try
    {
        svc.Start();
    }
    catch (const std::runtime_error &)
    {
        threw = true;
    }
    assert(threw);
    assert(!svc.IsRunning());
    assert(svc.runs == 0);
    std::cout << "test_failed_start_leaves_service_stopped passed\n";
}

void test_manager_lifecycle()
{
    std::vector<std::string> stopped;
    std::mutex stoppedMutex;

    auto a = std::make_shared<ScriptedService>("a", 10ms, 10ms);
    auto b = std::make_shared<ScriptedService>("b", 10ms, 10ms);
    auto c = std::make_shared<ScriptedService>("c", 10ms, 10ms);
    c->failStart = true;
    for (auto *svc : {a.get(), b.get(), c.get()})
    {
        svc->stopLog = &stopped;
        svc->stopLogMutex = &stoppedMutex;
    }

    ServiceManager manager;
    assert(manager.Register(a));
    assert(manager.Register(b));
    assert(manager.Register(c));
    assert(!manager.Register(std::make_shared<ScriptedService>("a", 10ms, 10ms)));
    assert(!manager.Register(nullptr));
    assert(manager.Get("b") == b);
    assert(!manager.Get("missing"));

    hearth::test::StreamCapture err(std::cerr);
    auto failed = manager.StartAll();
    assert(failed.size() == 1 && failed[0] == "c");
    assert(a->IsRunning() && b->IsRunning() && !c->IsRunning());

    auto health = manager.HealthCheck();
    assert(health.size() == 3);
    assert(health[0].name == "a" && health[2].name == "c");
    assert(!health[2].running);

    manager.StopAll();
    assert(!a->IsRunning() && !b->IsRunning());
    assert(stopped.size() == 2);
    assert(stopped[0] == "b" && stopped[1] == "a");
    std::cout << "test_manager_lifecycle passed\n";
}

void test_interval_can_change_while_running()
{
    ScriptedService svc("retimed", 60s, 60s);
    svc.Start();
    assert(WaitUntil([&]
                     { return svc.runs == 1; }));
    svc.SetInterval(10ms);
    assert(svc.Interval() == 10ms);
    svc.Stop();
    std::cout << "test_interval_can_change_while_running passed\n";
}

int main()
{
    test_runs_cycles_until_stopped();
    test_faults_use_backoff_and_worker_survives();
    test_stop_interrupts_long_wait();
    test_stuck_cycle_reports_stale();
    test_failed_start_leaves_service_stopped();
    test_manager_lifecycle();
    test_interval_can_change_while_running();
    std::cout << "All threaded service tests passed!\n";
    return 0;
}
