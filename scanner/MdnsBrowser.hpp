#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hearth::scanner
{
    struct MdnsHost
    {
        std::string ip;
        std::string hostname;
        std::set<std::string> services;
    };

    class MdnsBrowser
    {
    public:
        MdnsBrowser(std::vector<std::string> serviceTypes, std::chrono::milliseconds listen);

        // Sends one PTR query per service type to 224.0.0.251:5353 and
        // collects answers until the listen window closes. Socket failures
        // log a warning and return what was gathered so far.
        std::vector<MdnsHost> Browse();

        static std::vector<uint8_t> BuildQuery(const std::vector<std::string> &serviceTypes);

        // Decodes one response datagram sent by senderIp. Services are the
        // PTR owners that match a queried type; the hostname is the A record
        // pointing at the sender (or the first A record). Nothing when the
        // packet is malformed or carries neither.
        static std::optional<MdnsHost> ParseResponse(const uint8_t *data, size_t size,
                                                     const std::string &senderIp,
                                                     const std::vector<std::string> &serviceTypes);

    private:
        std::vector<std::string> m_serviceTypes;
        std::chrono::milliseconds m_listen;
    };
}
