#include <cassert>
#include <chrono>
#include <iostream>
#include "presence/PresenceTracker.hpp"
#include "test_support.hpp"

using namespace hearth;
using namespace hearth::presence;
using hearth::store::Device;
using hearth::store::PresenceEventType;

static common::TimePoint At(int second)
{
    return common::FromMillis(1700000000000) + std::chrono::seconds(second);
}

static int64_t Insert(store::StoreSession &session, const std::string &mac, const std::string &name,
                      std::optional<int64_t> link = std::nullopt, bool tracked = true)
{
    Device d;
    d.mac_address = mac;
    d.name = name;
    d.last_ip = "192.168.1." + mac.substr(mac.size() - 2);
    d.first_seen = At(0);
    d.last_seen = At(0);
    d.linked_to_device_id = link;
    d.track_presence = tracked;
    return session.InsertDevice(d);
}

void test_arrival_and_departure_after_threshold()
{
    auto db = test::MakeStore("tracker_basic");
    auto session = db->OpenSession();
    int64_t phone = Insert(*session, "A4:83:E7:11:22:33", "Phone");
    PresenceTracker tracker(3);

    auto r1 = tracker.Update(*session, {phone}, At(1));
    assert(r1.events.size() == 1);
    assert(r1.events[0].event_type == PresenceEventType::Arrived);
    assert(r1.events[0].ip_address == "192.168.1.33");
    assert(r1.snapshot.devices.size() == 1);
    assert(session->FindDevice(phone)->is_home);

    // Still home: no repeated arrival.
    assert(tracker.Update(*session, {phone}, At(2)).events.empty());

    assert(tracker.Update(*session, {}, At(3)).events.empty());
    assert(session->FindDevice(phone)->missed_cycles == 1);
    assert(tracker.Update(*session, {}, At(4)).events.empty());
    auto r5 = tracker.Update(*session, {}, At(5));
    assert(r5.events.size() == 1);
    assert(r5.events[0].event_type == PresenceEventType::Left);
    assert(r5.events[0].timestamp == At(5));
    assert(r5.snapshot.devices.empty());

    auto device = session->FindDevice(phone);
    assert(!device->is_home);
    assert(device->missed_cycles == 3);
    // Departure keeps the time of the last real sighting.
    assert(device->last_seen == At(1));

    // Misses stay capped and produce no further events.
    assert(tracker.Update(*session, {}, At(6)).events.empty());
    assert(session->FindDevice(phone)->missed_cycles == 3);

    auto events = session->EventsForDevice(phone);
    assert(events.size() == 2);
    assert(session->RecentSnapshots(100).size() == 6);
    std::cout << "test_arrival_and_departure_after_threshold passed\n";
}

void test_sighting_resets_miss_counter()
{
    auto db = test::MakeStore("tracker_flap");
    auto session = db->OpenSession();
    int64_t laptop = Insert(*session, "A4:83:E7:11:22:44", "Laptop");
    PresenceTracker tracker(3);

    tracker.Update(*session, {laptop}, At(1));
    for (int round = 0; round < 4; ++round)
    {
        assert(tracker.Update(*session, {}, At(10 + round * 3)).events.empty());
        assert(tracker.Update(*session, {}, At(11 + round * 3)).events.empty());
        assert(tracker.Update(*session, {laptop}, At(12 + round * 3)).events.empty());
        assert(session->FindDevice(laptop)->missed_cycles == 0);
    }
    assert(session->FindDevice(laptop)->is_home);
    assert(session->EventsForDevice(laptop).size() == 1);
    std::cout << "test_sighting_resets_miss_counter passed\n";
}

void test_linked_device_keeps_primary_home()
{
    auto db = test::MakeStore("tracker_linked");
    auto session = db->OpenSession();
    int64_t primary = Insert(*session, "A4:83:E7:11:22:55", "Dans phone");
    int64_t child = Insert(*session, "DA:A1:19:00:00:66", "Dans phone (Random MAC)", primary);
    PresenceTracker tracker(2);

    // Only the randomized MAC is seen: the identity arrives once.
    auto r1 = tracker.Update(*session, {child}, At(1));
    assert(r1.events.size() == 1);
    assert(r1.events[0].device_id == primary);
    assert(r1.events[0].ip_address == "192.168.1.66");
    assert(session->FindDevice(primary)->is_home);
    assert(session->FindDevice(child)->is_home);

    // Either member keeps the identity home.
    for (int i = 2; i < 8; ++i)
    {
        auto r = tracker.Update(*session, {i % 2 ? primary : child}, At(i));
        assert(r.events.empty());
    }

    tracker.Update(*session, {}, At(8));
    auto left = tracker.Update(*session, {}, At(9));
    assert(left.events.size() == 1);
    assert(left.events[0].device_id == primary);
    assert(!session->FindDevice(child)->is_home);
    std::cout << "test_linked_device_keeps_primary_home passed\n";
}

void test_untracked_devices_are_ignored()
{
    auto db = test::MakeStore("tracker_untracked");
    auto session = db->OpenSession();
    int64_t printer = Insert(*session, "A4:83:E7:11:22:77", "Printer", std::nullopt, false);
    PresenceTracker tracker(1);

    auto r = tracker.Update(*session, {printer}, At(1));
    assert(r.events.empty());
    assert(r.snapshot.devices.empty());
    assert(!session->FindDevice(printer)->is_home);
    std::cout << "test_untracked_devices_are_ignored passed\n";
}

void test_threshold_of_one_departs_on_first_miss()
{
    auto db = test::MakeStore("tracker_threshold_one");
    auto session = db->OpenSession();
    int64_t tv = Insert(*session, "A4:83:E7:11:22:88", "TV");
    PresenceTracker tracker(0);
    assert(tracker.MissThreshold() == 1);

    tracker.Update(*session, {tv}, At(1));
    auto r = tracker.Update(*session, {}, At(2));
    assert(r.events.size() == 1);
    assert(r.events[0].event_type == PresenceEventType::Left);
    std::cout << "test_threshold_of_one_departs_on_first_miss passed\n";
}

int main()
{
    test_arrival_and_departure_after_threshold();
    test_sighting_resets_miss_counter();
    test_linked_device_keeps_primary_home();
    test_untracked_devices_are_ignored();
    test_threshold_of_one_departs_on_first_miss();
    std::cout << "All presence tracker tests passed!\n";
    return 0;
}
