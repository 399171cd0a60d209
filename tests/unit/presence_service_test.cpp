#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include "common/Errors.hpp"
#include "presence/PresenceService.hpp"
#include "scanner/ScanSources.hpp"
#include "test_support.hpp"

using namespace hearth;
using namespace hearth::presence;
using hearth::store::PresenceEventType;
using hearth::test::FakeSource;
using hearth::test::Obs;

static const std::string PHONE_MAC = "A4:83:E7:11:22:33";
static const std::string RANDOM_MAC = "DA:A1:19:00:00:01";

static common::AppConfig TestConfig()
{
    common::AppConfig cfg;
    cfg.presence.interval = std::chrono::seconds(1);
    cfg.presence.miss_threshold = 3;
    cfg.scheduler.fault_backoff = std::chrono::milliseconds(50);
    return cfg;
}

// Serves fixed fake sources; an "snmp" entry becomes a real SNMP source when a target is set.
struct FakeSources
{
    std::shared_ptr<FakeSource> arp = std::make_shared<FakeSource>("arp");
    std::shared_ptr<FakeSource> mdns = std::make_shared<FakeSource>("mdns");

    SourceFactory Factory()
    {
        auto arpSource = arp;
        auto mdnsSource = mdns;
        return [arpSource, mdnsSource](const common::AppConfig &cfg)
        {
            std::vector<SourceSet::Candidate> out;
            out.push_back({"arp", "1", [arpSource]()
                           { return arpSource; }});
            if (cfg.presence.mdns.enabled)
                out.push_back({"mdns", "1", [mdnsSource]()
                               { return mdnsSource; }});
            if (cfg.snmp.Enabled())
            {
                const auto snmp = cfg.snmp;
                out.push_back({"snmp", snmp.target, [snmp]()
                               { return std::make_shared<scanner::SnmpSource>(snmp); }});
            }
            return out;
        };
    }
};

void test_arrival_and_departure_cycle()
{
    auto db = test::MakeStore("service_arrival");
    auto bus = std::make_shared<PresenceBus>("PresenceBus");
    auto sub = bus->Subscribe();
    FakeSources sources;
    PresenceService service(db, bus, TestConfig(), sources.Factory());
    service.ReloadConfig(TestConfig());
    assert(service.ActiveSourceCount() == 2);

    // First sighting creates the device and marks it home.
    sources.arp->next = {Obs(PHONE_MAC, "192.168.1.10")};
    auto first = service.RunOnce();
    assert(first.created == 1);
    assert(first.events.size() == 1);
    assert(first.events[0].event_type == PresenceEventType::Arrived);

    auto note = sub->PopFor(std::chrono::milliseconds(500));
    assert(note);
    assert(note->event_type == PresenceEventType::Arrived);
    assert(note->ip_address == "192.168.1.10");

    auto home = service.WhoIsHome();
    assert(home.size() == 1);
    assert(home[0].mac_address == PHONE_MAC);
    assert(!home[0].is_randomized_mac);

    // Two misses keep it home.
    sources.arp->next.clear();
    assert(service.RunOnce().events.empty());
    assert(service.RunOnce().events.empty());
    assert(service.WhoIsHome().size() == 1);

    // The third miss is a departure.
    auto third = service.RunOnce();
    assert(third.events.size() == 1);
    assert(third.events[0].event_type == PresenceEventType::Left);
    assert(service.WhoIsHome().empty());

    auto events = service.RecentEvents(1, 50);
    assert(events.total == 2);
    assert(events.events[0].event_type == PresenceEventType::Left);
    assert(events.events[1].event_type == PresenceEventType::Arrived);
    assert(events.events[0].timestamp >= events.events[1].timestamp);
    std::cout << "test_arrival_and_departure_cycle passed\n";
}

void test_randomized_mac_is_linked_within_ten_cycles()
{
    auto db = test::MakeStore("service_link");
    FakeSources sources;
    PresenceService service(db, nullptr, TestConfig(), sources.Factory());
    service.ReloadConfig(TestConfig());

    sources.arp->next = {Obs(PHONE_MAC, "192.168.1.10"), Obs(RANDOM_MAC, "192.168.1.23")};
    sources.mdns->next = {Obs(PHONE_MAC, "192.168.1.10", "Dans-iPhone", scanner::ObservationKind::Mdns),
                          Obs(RANDOM_MAC, "192.168.1.23", "iPhone", scanner::ObservationKind::Mdns)};

    int linked = 0;
    for (int cycle = 0; cycle < 10; ++cycle)
        linked += service.RunOnce().linked;
    assert(linked == 1);

    auto home = service.WhoIsHome();
    // The linked MAC is folded into its primary identity.
    assert(home.size() == 1);
    assert(home[0].mac_address == PHONE_MAC);

    auto detail = service.GetDeviceDetail(home[0].id);
    assert(detail);
    assert(detail->linked_devices.size() == 1);
    assert(detail->linked_devices[0].mac_address == RANDOM_MAC);
    assert(detail->linked_devices[0].link_confidence >= 0.75);
    assert(detail->linked_devices[0].is_home);

    // One arrival for the identity only.
    assert(service.RecentEvents(1, 50).total == 1);
    std::cout << "test_randomized_mac_is_linked_within_ten_cycles passed\n";
}

void test_linking_starts_tracking_the_primary()
{
    auto db = test::MakeStore("service_link_untracked");
    auto cfg = TestConfig();
    cfg.presence.track_new_devices = false;
    FakeSources sources;
    PresenceService service(db, nullptr, cfg, sources.Factory());
    service.ReloadConfig(cfg);

    sources.arp->next = {Obs(PHONE_MAC, "192.168.1.10"), Obs(RANDOM_MAC, "192.168.1.23")};
    sources.mdns->next = {Obs(PHONE_MAC, "192.168.1.10", "Dans-iPhone", scanner::ObservationKind::Mdns),
                          Obs(RANDOM_MAC, "192.168.1.23", "iPhone", scanner::ObservationKind::Mdns)};

    int linkCycle = 0;
    for (int cycle = 1; cycle <= 12 && !linkCycle; ++cycle)
    {
        auto report = service.RunOnce();
        if (report.linked)
        {
            linkCycle = cycle;
            // The primary arrives in the same cycle it gains a linked MAC.
            assert(report.events.size() == 1);
            assert(report.events[0].event_type == PresenceEventType::Arrived);
        }
        else
        {
            assert(report.events.empty());
        }
    }
    assert(linkCycle > 0);

    auto home = service.WhoIsHome();
    assert(home.size() == 1);
    assert(home[0].mac_address == PHONE_MAC);
    assert(home[0].track_presence);

    // Only the randomized MAC is seen now; the identity stays home.
    sources.arp->next = {Obs(RANDOM_MAC, "192.168.1.23")};
    sources.mdns->next = {};
    for (int cycle = 0; cycle < 5; ++cycle)
        assert(service.RunOnce().events.empty());
    assert(service.WhoIsHome().size() == 1);
    std::cout << "test_linking_starts_tracking_the_primary passed\n";
}

void test_unreachable_snmp_does_not_break_the_cycle()
{
    auto db = test::MakeStore("service_snmp");
    FakeSources sources;
    common::AppConfig cfg = TestConfig();
    cfg.snmp.target = "127.0.0.1";
    cfg.snmp.timeout = std::chrono::milliseconds(100);
    cfg.snmp.retries = 0;

    PresenceService service(db, nullptr, cfg, sources.Factory());
    service.ReloadConfig(cfg);
    assert(service.ActiveSourceCount() == 3);

    sources.arp->next = {Obs(PHONE_MAC, "192.168.1.10")};
    test::StreamCapture err(std::cerr);
    auto report = service.RunOnce();
    assert(report.source_failures == 0);
    assert(report.created == 1);
    assert(report.events.size() == 1);
    assert(err.Text().find("[Snmp] WARNING") != std::string::npos);
    std::cout << "test_unreachable_snmp_does_not_break_the_cycle passed\n";
}

void test_failing_source_is_contained()
{
    auto db = test::MakeStore("service_failing");
    FakeSources sources;
    PresenceService service(db, nullptr, TestConfig(), sources.Factory());
    service.ReloadConfig(TestConfig());

    sources.mdns->fail = true;
    sources.arp->next = {Obs(PHONE_MAC, "192.168.1.10")};

    test::StreamCapture err(std::cerr);
    auto report = service.RunOnce();
    assert(report.source_failures == 1);
    assert(report.observations == 1);
    assert(report.events.size() == 1);
    assert(err.Text().find("[Presence] WARNING: source 'mdns' failed: simulated source failure") != std::string::npos);
    std::cout << "test_failing_source_is_contained passed\n";
}

// Blocks in Scan() until released so a reload can happen mid-cycle.
class GateSource : public scanner::ObservationSource
{
public:
    std::string Name() const override { return "gate"; }
    std::vector<scanner::Observation> Scan() override
    {
        entered = true;
        while (!release)
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return {Obs(PHONE_MAC, "192.168.1.10")};
    }

    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
};

void test_reload_during_cycle_uses_consistent_snapshot()
{
    auto db = test::MakeStore("service_reload");
    auto gate = std::make_shared<GateSource>();
    auto replacement = std::make_shared<FakeSource>("replacement");
    replacement->next = {Obs(RANDOM_MAC, "192.168.1.23")};

    SourceFactory factory = [gate, replacement](const common::AppConfig &cfg)
    {
        std::vector<SourceSet::Candidate> out;
        if (cfg.presence.interface == "swapped")
            out.push_back({"replacement", "1", [replacement]()
                           { return replacement; }});
        else
            out.push_back({"gate", "1", [gate]()
                           { return gate; }});
        return out;
    };

    PresenceService service(db, nullptr, TestConfig(), factory);
    service.ReloadConfig(TestConfig());

    CycleReport inFlight;
    std::thread cycle([&]()
                      { inFlight = service.RunOnce(); });
    while (!gate->entered)
        std::this_thread::sleep_for(std::chrono::milliseconds(2));

    common::AppConfig swapped = TestConfig();
    swapped.presence.interface = "swapped";
    auto stats = service.ReloadConfig(swapped);
    assert(stats.added == 1);
    assert(stats.removed == 1);
    assert(service.ActiveSourceCount() == 1);

    gate->release = true;
    cycle.join();
    // The cycle that was running finished against the set it started with.
    assert(inFlight.observations == 1);
    assert(inFlight.created == 1);

    auto next = service.RunOnce();
    assert(next.created == 1);
    assert(replacement->scans == 1);
    assert(replacement->setups == 1);

    // Reloading the same settings keeps the live instance.
    stats = service.ReloadConfig(swapped);
    assert(stats.kept == 1);
    assert(replacement->setups == 1);
    std::cout << "test_reload_during_cycle_uses_consistent_snapshot passed\n";
}

void test_cycle_timestamps_never_go_backwards()
{
    auto db = test::MakeStore("service_monotonic");
    FakeSources sources;
    PresenceService service(db, nullptr, TestConfig(), sources.Factory());
    service.ReloadConfig(TestConfig());

    auto previous = service.RunOnce().timestamp;
    for (int i = 0; i < 5; ++i)
    {
        auto ts = service.RunOnce().timestamp;
        assert(ts >= previous);
        previous = ts;
    }
    std::cout << "test_cycle_timestamps_never_go_backwards passed\n";
}

void test_worker_runs_cycles_and_start_needs_store()
{
    auto db = test::MakeStore("service_worker");
    FakeSources sources;
    sources.arp->next = {Obs(PHONE_MAC, "192.168.1.10")};
    PresenceService service(db, nullptr, TestConfig(), sources.Factory());
    assert(service.Name() == "presence");

    service.Start();
    for (int i = 0; i < 300 && service.Health().cycles == 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    auto health = service.Health();
    assert(service.ActiveSourceCount() == 2);
    service.Stop();
    assert(health.cycles >= 1);
    assert(health.faults == 0);
    assert(service.WhoIsHome().size() == 1);

    // Stop releases the sources; the next start sets them up again.
    assert(service.ActiveSourceCount() == 0);
    const int setupsBefore = sources.arp->setups;
    service.Start();
    assert(service.ActiveSourceCount() == 2);
    assert(sources.arp->setups == setupsBefore + 1);
    service.Stop();

    common::DatabaseConfig missing;
    missing.path = "/nonexistent-dir/hearth.db";
    auto unreachable = std::make_shared<store::PresenceStore>(missing);
    PresenceService broken(unreachable, nullptr, TestConfig(), sources.Factory());
    test::StreamCapture err(std::cerr);
    bool threw = false;
    try
    {
        broken.Start();
    }
    catch (const common::StoreError &)
    {
        threw = true;
    }
    assert(threw);
    assert(!broken.IsRunning());
    std::cout << "test_worker_runs_cycles_and_start_needs_store passed\n";
}

void test_default_sources_follow_config()
{
    common::AppConfig cfg = TestConfig();
    auto sources = PresenceService::DefaultSources(cfg);
    assert(sources.size() == 2);
    assert(sources[0].key == "arp");
    assert(sources[1].key == "mdns");

    cfg.presence.mdns.enabled = false;
    cfg.snmp.target = "192.168.1.1";
    auto withSnmp = PresenceService::DefaultSources(cfg);
    assert(withSnmp.size() == 2);
    assert(withSnmp[1].key == "snmp");

    // Fingerprints move with the settings they depend on.
    common::AppConfig changed = cfg;
    changed.presence.ip_range = "192.168.1.0/24";
    auto again = PresenceService::DefaultSources(changed);
    assert(again[0].fingerprint != withSnmp[0].fingerprint);
    assert(again[1].fingerprint == withSnmp[1].fingerprint);
    std::cout << "test_default_sources_follow_config passed\n";
}

int main()
{
    test_arrival_and_departure_cycle();
    test_randomized_mac_is_linked_within_ten_cycles();
    test_linking_starts_tracking_the_primary();
    test_unreachable_snmp_does_not_break_the_cycle();
    test_failing_source_is_contained();
    test_reload_during_cycle_uses_consistent_snapshot();
    test_cycle_timestamps_never_go_backwards();
    test_worker_runs_cycles_and_start_needs_store();
    test_default_sources_follow_config();
    std::cout << "All presence service tests passed!\n";
    return 0;
}
