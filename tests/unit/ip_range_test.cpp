#include <cassert>
#include <iostream>
#include "common/IpRange.hpp"

using namespace hearth::common;

void test_cidr_excludes_network_and_broadcast()
{
    auto range = ParseIpRange("192.168.1.77/24");
    assert(range);
    assert(FormatIPv4(range->first) == "192.168.1.1");
    assert(FormatIPv4(range->last) == "192.168.1.254");
    assert(range->Size() == 254);

    auto hosts = range->Hosts();
    assert(hosts.size() == 254);
    assert(hosts.front() == "192.168.1.1");
    assert(hosts.back() == "192.168.1.254");
    std::cout << "test_cidr_excludes_network_and_broadcast passed\n";
}

void test_small_prefixes_keep_every_address()
{
    auto p31 = ParseIpRange("10.0.0.0/31");
    assert(p31 && p31->Size() == 2);
    auto p32 = ParseIpRange("10.0.0.9/32");
    assert(p32 && p32->Size() == 1);
    assert(FormatIPv4(p32->first) == "10.0.0.9");
    std::cout << "test_small_prefixes_keep_every_address passed\n";
}

void test_explicit_range()
{
    auto range = ParseIpRange("192.168.1.10-192.168.1.20");
    assert(range);
    assert(range->Size() == 11);
    assert(range->Hosts()[3] == "192.168.1.13");

    // Reversed bounds are rejected.
    assert(!ParseIpRange("192.168.1.20-192.168.1.10"));
    std::cout << "test_explicit_range passed\n";
}

void test_full_space_does_not_overflow()
{
    auto range = ParseIpRange("0.0.0.0/0");
    assert(range);
    assert(range->Size() == 0xFFFFFFFEull);
    std::cout << "test_full_space_does_not_overflow passed\n";
}

void test_invalid_input()
{
    assert(!ParseIpRange(""));
    assert(!ParseIpRange("192.168.1.0/33"));
    assert(!ParseIpRange("192.168.1.0/abc"));
    assert(!ParseIpRange("192.168.1.0/24x"));
    assert(!ParseIpRange("300.1.1.1"));
    assert(!ParseIPv4("1.2.3"));
    assert(ParseIPv4("10.0.0.1").value() == 0x0A000001u);
    std::cout << "test_invalid_input passed\n";
}

int main()
{
    test_cidr_excludes_network_and_broadcast();
    test_small_prefixes_keep_every_address();
    test_explicit_range();
    test_full_space_does_not_overflow();
    test_invalid_input();
    std::cout << "All IP range tests passed!\n";
    return 0;
}
