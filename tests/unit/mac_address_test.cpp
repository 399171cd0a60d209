#include <cassert>
#include <iostream>
#include "common/MacAddress.hpp"

using namespace hearth::common;

void test_normalize_accepts_common_notations()
{
    assert(NormalizeMac("aa:bb:cc:dd:ee:ff").value() == "AA:BB:CC:DD:EE:FF");
    assert(NormalizeMac("AA-BB-CC-DD-EE-FF").value() == "AA:BB:CC:DD:EE:FF");
    assert(NormalizeMac("aabbccddeeff").value() == "AA:BB:CC:DD:EE:FF");
    assert(NormalizeMac("aabb.ccdd.eeff").value() == "AA:BB:CC:DD:EE:FF");
    std::cout << "test_normalize_accepts_common_notations passed\n";
}

void test_normalize_rejects_garbage()
{
    assert(!NormalizeMac(""));
    assert(!NormalizeMac("AA:BB:CC:DD:EE"));
    assert(!NormalizeMac("AA:BB:CC:DD:EE:FF:00"));
    assert(!NormalizeMac("GG:BB:CC:DD:EE:FF"));
    assert(!NormalizeMac("<incomplete>"));
    std::cout << "test_normalize_rejects_garbage passed\n";
}

void test_randomized_bit()
{
    // Second nibble 2, 6, A or E marks a locally administered address.
    assert(IsRandomizedMac("DA:A1:19:00:00:01"));
    assert(IsRandomizedMac("02:00:00:00:00:00"));
    assert(IsRandomizedMac("A6:11:22:33:44:55"));
    assert(IsRandomizedMac("FE:11:22:33:44:55"));
    assert(!IsRandomizedMac("A4:83:E7:11:22:33"));
    assert(!IsRandomizedMac("00:11:22:33:44:55"));
    assert(!IsRandomizedMac(""));
    std::cout << "test_randomized_bit passed\n";
}

void test_prefix_and_unset()
{
    assert(OuiPrefix("A4:83:E7:11:22:33") == "A4:83:E7");
    assert(IsUnsetMac("00:00:00:00:00:00"));
    assert(IsUnsetMac("FF:FF:FF:FF:FF:FF"));
    assert(!IsUnsetMac("A4:83:E7:11:22:33"));
    std::cout << "test_prefix_and_unset passed\n";
}

int main()
{
    test_normalize_accepts_common_notations();
    test_normalize_rejects_garbage();
    test_randomized_bit();
    test_prefix_and_unset();
    std::cout << "All MAC address tests passed!\n";
    return 0;
}
