#include "../common/Config.hpp"
#include "../common/Errors.hpp"
#include "../hardware/HardwareService.hpp"
#include "../presence/PresenceService.hpp"
#include "../service/ServiceManager.hpp"
#include "../store/PresenceStore.hpp"
#include <csignal>
#include <iostream>
#include <thread>

namespace
{
    volatile std::sig_atomic_t g_running = 1;
    volatile std::sig_atomic_t g_reload = 0;

    void HandleSignal(int signal)
    {
        if (signal == SIGHUP)
            g_reload = 1;
        else
            g_running = 0;
    }

    void PrintHealth(const hearth::service::ServiceManager &services)
    {
        for (const auto &h : services.HealthCheck())
        {
            std::cout << "[Health] " << h.name << ": " << (h.running ? "running" : "stopped")
                      << ", cycles=" << h.cycles << ", faults=" << h.faults
                      << (h.stale ? ", STALE" : "")
                      << (h.last_error.empty() ? "" : ", last error: " + h.last_error) << "\n";
        }
    }
}

int main(int argc, char *argv[])
{
    using namespace hearth;

    if (argc < 2)
    {
        std::cout << "Usage: ./hearthd <config.yaml>\n";
        return 1;
    }
    const std::string configPath = argv[1];

    common::AppConfig config;
    try
    {
        config = common::LoadConfig(configPath);
    }
    catch (const common::ConfigError &e)
    {
        std::cerr << "[Config] ERROR: " << e.what() << "\n";
        return 1;
    }

    auto store = std::make_shared<store::PresenceStore>(config.database);
    try
    {
        store->Initialize();
    }
    catch (const common::StoreError &e)
    {
        std::cerr << "[Store] ERROR: " << e.what() << "\n";
        return 2;
    }

    auto presenceBus = std::make_shared<presence::PresenceBus>("PresenceBus");
    auto hardwareBus = std::make_shared<hardware::HardwareBus>("HardwareBus");

    auto presenceSub = presenceBus->Subscribe();
    auto hardwareSub = hardwareBus->Subscribe();

    std::thread presenceLog([presenceSub]()
                            {
        while (auto note = presenceSub->Pop())
        {
            std::cout << "[Notify] " << common::FormatTimestamp(note->timestamp) << " " << note->device_name
                      << " " << store::ToString(note->event_type) << " (" << note->ip_address << ")\n";
        } });

    std::thread hardwareLog([hardwareSub]()
                            {
        while (auto note = hardwareSub->Pop())
        {
            std::cout << "[Notify] " << common::FormatTimestamp(note->timestamp) << " " << note->name
                      << " -> " << note->label << "\n";
        } });

    auto presenceService = std::make_shared<presence::PresenceService>(store, presenceBus, config);
    auto hardwareService = std::make_shared<hardware::HardwareService>(store, hardwareBus, config.hardware,
                                                                       config.scheduler.fault_backoff);

    service::ServiceManager services;
    services.Register(presenceService);
    services.Register(hardwareService);

    // Register signal handlers before starting the workers.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGHUP, HandleSignal);

    auto failed = services.StartAll();
    if (failed.size() == services.HealthCheck().size())
    {
        std::cerr << "[Hearth] ERROR: no service could be started\n";
        services.StopAll();
        presenceBus->Shutdown();
        hardwareBus->Shutdown();
        presenceLog.join();
        hardwareLog.join();
        return 3;
    }

    std::cout << "[Hearth] Running with " << configPath << ". SIGHUP reloads, SIGINT/SIGTERM stops.\n";

    int ticks = 0;
    while (g_running)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (g_reload)
        {
            g_reload = 0;
            try
            {
                common::AppConfig next = common::LoadConfig(configPath);
                presenceService->ReloadConfig(next);
                hardwareService->ReloadConfig(next.hardware);
                std::cout << "[Config] Reloaded " << configPath << "\n";
            }
            catch (const common::ConfigError &e)
            {
                std::cerr << "[Config] ERROR: reload rejected, keeping current settings: " << e.what() << "\n";
            }
        }

        // Every five minutes.
        if (++ticks % 1500 == 0)
            PrintHealth(services);
    }

    std::cout << "[Hearth] Shutting down\n";
    services.StopAll();
    presenceBus->Shutdown();
    hardwareBus->Shutdown();
    presenceLog.join();
    hardwareLog.join();
    PrintHealth(services);
    return 0;
}
