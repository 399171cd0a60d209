#include <cassert>
#include <iostream>
#include <tins/tins.h>
#include <vector>
#include "scanner/MdnsBrowser.hpp"

using hearth::scanner::MdnsBrowser;

static const std::vector<std::string> TYPES = {"_airplay._tcp.local", "_googlecast._tcp.local."};

static std::vector<uint8_t> Serialize(Tins::DNS &dns)
{
    return dns.serialize();
}

void test_query_carries_one_ptr_question_per_type()
{
    auto bytes = MdnsBrowser::BuildQuery(TYPES);
    Tins::DNS dns(bytes.data(), static_cast<uint32_t>(bytes.size()));
    assert(dns.type() == Tins::DNS::QUERY);

    auto queries = dns.queries();
    assert(queries.size() == 2);
    assert(queries[0].dname() == "_airplay._tcp.local");
    assert(queries[0].query_type() == Tins::DNS::PTR);
    assert(queries[1].dname() == "_googlecast._tcp.local");
    std::cout << "test_query_carries_one_ptr_question_per_type passed\n";
}

void test_response_with_services_and_address()
{
    Tins::DNS dns;
    dns.type(Tins::DNS::RESPONSE);
    dns.add_answer(Tins::DNS::resource("_airplay._tcp.local", "Living-Room._airplay._tcp.local",
                                       Tins::DNS::PTR, Tins::DNS::INTERNET, 120));
    dns.add_answer(Tins::DNS::resource("_ipp._tcp.local", "Printer._ipp._tcp.local",
                                       Tins::DNS::PTR, Tins::DNS::INTERNET, 120));
    dns.add_additional(Tins::DNS::resource("Other-Host.local", "192.168.1.99",
                                           Tins::DNS::A, Tins::DNS::INTERNET, 120));
    dns.add_additional(Tins::DNS::resource("Living-Room.local", "192.168.1.30",
                                           Tins::DNS::A, Tins::DNS::INTERNET, 120));
    auto bytes = Serialize(dns);

    auto host = MdnsBrowser::ParseResponse(bytes.data(), bytes.size(), "192.168.1.30", TYPES);
    assert(host);
    assert(host->ip == "192.168.1.30");
    // The A record matching the sender wins over the first one.
    assert(host->hostname == "Living-Room");
    // Only queried service types are kept.
    assert(host->services.size() == 1);
    assert(host->services.count("_airplay._tcp.local") == 1);
    std::cout << "test_response_with_services_and_address passed\n";
}

void test_hostname_falls_back_to_first_address()
{
    Tins::DNS dns;
    dns.type(Tins::DNS::RESPONSE);
    dns.add_answer(Tins::DNS::resource("Kitchen-Speaker.local", "10.0.0.7", Tins::DNS::A, Tins::DNS::INTERNET, 120));
    auto bytes = Serialize(dns);

    auto host = MdnsBrowser::ParseResponse(bytes.data(), bytes.size(), "10.0.0.8", TYPES);
    assert(host);
    assert(host->hostname == "Kitchen-Speaker");
    assert(host->services.empty());
    std::cout << "test_hostname_falls_back_to_first_address passed\n";
}

void test_uninformative_or_broken_packets()
{
    Tins::DNS query;
    query.type(Tins::DNS::QUERY);
    query.add_query(Tins::DNS::query("_airplay._tcp.local", Tins::DNS::PTR, Tins::DNS::INTERNET));
    auto queryBytes = Serialize(query);
    assert(!MdnsBrowser::ParseResponse(queryBytes.data(), queryBytes.size(), "10.0.0.1", TYPES));

    Tins::DNS unrelated;
    unrelated.type(Tins::DNS::RESPONSE);
    unrelated.add_answer(Tins::DNS::resource("_ipp._tcp.local", "Printer._ipp._tcp.local",
                                             Tins::DNS::PTR, Tins::DNS::INTERNET, 120));
    auto unrelatedBytes = Serialize(unrelated);
    assert(!MdnsBrowser::ParseResponse(unrelatedBytes.data(), unrelatedBytes.size(), "10.0.0.1", TYPES));

    const uint8_t garbage[] = {0x00, 0x01, 0x84, 0x00, 0x00, 0x00, 0x00, 0x05};
    assert(!MdnsBrowser::ParseResponse(garbage, sizeof(garbage), "10.0.0.1", TYPES));
    std::cout << "test_uninformative_or_broken_packets passed\n";
}

int main()
{
    test_query_carries_one_ptr_question_per_type();
    test_response_with_services_and_address();
    test_hostname_falls_back_to_first_address();
    test_uninformative_or_broken_packets();
    std::cout << "All mDNS response tests passed!\n";
    return 0;
}
