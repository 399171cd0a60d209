#include "MdnsBrowser.hpp"
#include <tins/tins.h>
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <map>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hearth::scanner
{
    namespace
    {
        const char *MDNS_GROUP = "224.0.0.251";
        constexpr uint16_t MDNS_PORT = 5353;

        std::string Lower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        std::string StripDot(std::string name)
        {
            while (!name.empty() && name.back() == '.')
                name.pop_back();
            return name;
        }

        std::string StripLocal(const std::string &name)
        {
            std::string clean = StripDot(name);
            const std::string suffix = ".local";
            if (clean.size() > suffix.size() && Lower(clean.substr(clean.size() - suffix.size())) == suffix)
                clean.erase(clean.size() - suffix.size());
            return clean;
        }
    }

    MdnsBrowser::MdnsBrowser(std::vector<std::string> serviceTypes, std::chrono::milliseconds listen)
        : m_serviceTypes(std::move(serviceTypes)), m_listen(listen)
    {
    }

    std::vector<uint8_t> MdnsBrowser::BuildQuery(const std::vector<std::string> &serviceTypes)
    {
        Tins::DNS dns;
        dns.id(0);
        dns.type(Tins::DNS::QUERY);
        for (const auto &service : serviceTypes)
            dns.add_query(Tins::DNS::query(StripDot(service), Tins::DNS::PTR, Tins::DNS::INTERNET));
        return dns.serialize();
    }

    std::optional<MdnsHost> MdnsBrowser::ParseResponse(const uint8_t *data, size_t size,
                                                       const std::string &senderIp,
                                                       const std::vector<std::string> &serviceTypes)
    {
        std::set<std::string> wanted;
        for (const auto &service : serviceTypes)
            wanted.insert(Lower(StripDot(service)));

        try
        {
            Tins::DNS dns(data, static_cast<uint32_t>(size));
            if (dns.type() != Tins::DNS::RESPONSE)
                return std::nullopt;

            MdnsHost host;
            host.ip = senderIp;
            std::string firstA;

            auto records = dns.answers();
            auto additional = dns.additional();
            records.insert(records.end(), additional.begin(), additional.end());

            for (const auto &rr : records)
            {
                if (rr.query_type() == Tins::DNS::PTR)
                {
                    std::string owner = Lower(StripDot(rr.dname()));
                    if (wanted.count(owner))
                        host.services.insert(owner);
                }
                else if (rr.query_type() == Tins::DNS::A)
                {
                    std::string name = StripLocal(rr.dname());
                    if (firstA.empty())
                        firstA = name;
                    if (rr.data() == senderIp)
                        host.hostname = name;
                }
            }

            if (host.hostname.empty())
                host.hostname = firstA;
            if (host.hostname.empty() && host.services.empty())
                return std::nullopt;
            return host;
        }
        catch (const Tins::malformed_packet &)
        {
            return std::nullopt;
        }
    }

    std::vector<MdnsHost> MdnsBrowser::Browse()
    {
        std::map<std::string, MdnsHost> hosts;

        int sockfd = socket(AF_INET, SOCK_DGRAM, 0);
        if (sockfd < 0)
        {
            std::cerr << "[Mdns] WARNING: socket() failed: " << std::strerror(errno) << "\n";
            return {};
        }

        try
        {
            std::vector<uint8_t> query = BuildQuery(m_serviceTypes);

            sockaddr_in group;
            std::memset(&group, 0, sizeof(group));
            group.sin_family = AF_INET;
            group.sin_port = htons(MDNS_PORT);
            inet_pton(AF_INET, MDNS_GROUP, &group.sin_addr);

            unsigned char ttl = 255;
            setsockopt(sockfd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

            if (sendto(sockfd, query.data(), query.size(), 0, reinterpret_cast<const sockaddr *>(&group), sizeof(group)) < 0)
            {
                std::cerr << "[Mdns] WARNING: query send failed: " << std::strerror(errno) << "\n";
                close(sockfd);
                return {};
            }

            const auto deadline = std::chrono::steady_clock::now() + m_listen;
            std::vector<uint8_t> buffer(9000);
            while (true)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                    break;

                pollfd pfd{sockfd, POLLIN, 0};
                if (poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0)
                    break;

                sockaddr_in sender;
                socklen_t len = sizeof(sender);
                ssize_t n = recvfrom(sockfd, buffer.data(), buffer.size(), 0, reinterpret_cast<sockaddr *>(&sender), &len);
                if (n <= 0)
                    continue;

                char ipbuf[INET_ADDRSTRLEN] = {0};
                inet_ntop(AF_INET, &sender.sin_addr, ipbuf, sizeof(ipbuf));

                auto parsed = ParseResponse(buffer.data(), static_cast<size_t>(n), ipbuf, m_serviceTypes);
                if (!parsed)
                    continue;

                MdnsHost &host = hosts[parsed->ip];
                host.ip = parsed->ip;
                if (!parsed->hostname.empty())
                    host.hostname = parsed->hostname;
                host.services.insert(parsed->services.begin(), parsed->services.end());
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Mdns] WARNING: browse failed: " << e.what() << "\n";
        }
        close(sockfd);

        std::vector<MdnsHost> result;
        result.reserve(hosts.size());
        for (auto &pair : hosts)
            result.push_back(std::move(pair.second));
        return result;
    }
}
