#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include "common/EventBus.hpp"
#include "test_support.hpp"

using hearth::common::EventBus;

void test_fan_out_to_every_subscriber()
{
    EventBus<int> bus("TestBus");
    auto a = bus.Subscribe();
    auto b = bus.Subscribe();

    assert(bus.Publish(7) == 2);
    assert(a->Pop().value() == 7);
    assert(b->Pop().value() == 7);
    std::cout << "test_fan_out_to_every_subscriber passed\n";
}

void test_slow_subscriber_is_dropped()
{
    EventBus<int> bus("TestBus");
    auto slow = bus.Subscribe(2);
    auto fast = bus.Subscribe(10);

    hearth::test::StreamCapture err(std::cerr);
    assert(bus.Publish(1) == 2);
    assert(bus.Publish(2) == 2);
    // slow is full now; the third event drops it without blocking.
    assert(bus.Publish(3) == 1);
    assert(bus.SubscriberCount() == 1);
    assert(err.Text().find("[TestBus] WARNING: dropping slow subscriber") != std::string::npos);

    // The dropped subscriber drains what it had, then sees end of stream.
    assert(slow->Pop().value() == 1);
    assert(slow->Pop().value() == 2);
    assert(!slow->Pop());

    assert(slow->Closed());
    assert(!fast->Closed());
    assert(fast->Size() == 3);
    std::cout << "test_slow_subscriber_is_dropped passed\n";
}

void test_unsubscribe_and_shutdown_release_consumers()
{
    EventBus<std::string> bus;
    auto sub = bus.Subscribe();
    bus.Unsubscribe(sub);
    assert(bus.SubscriberCount() == 0);
    assert(bus.Publish("ignored") == 0);
    assert(!sub->Pop());

    auto waiting = bus.Subscribe();
    std::thread consumer([waiting]()
                         {
        int received = 0;
        while (waiting->Pop())
            ++received;
        assert(received == 1); });

    bus.Publish("hello");
    bus.Shutdown();
    consumer.join();
    std::cout << "test_unsubscribe_and_shutdown_release_consumers passed\n";
}

int main()
{
    test_fan_out_to_every_subscriber();
    test_slow_subscriber_is_dropped();
    test_unsubscribe_and_shutdown_release_consumers();
    std::cout << "All event bus tests passed!\n";
    return 0;
}
