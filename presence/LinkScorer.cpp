#include "LinkScorer.hpp"
#include <algorithm>
#include <bitset>
#include <cctype>

namespace hearth::presence
{
    namespace
    {
        const char *FAMILY_TOKENS[] = {"iphone", "ipad", "watch", "macbook", "android", "galaxy", "pixel"};

        constexpr size_t MIN_COMMON_PREFIX = 3;

        struct ServiceVendor
        {
            const char *service;
            const char *vendor;
        };

        const ServiceVendor SERVICE_VENDORS[] = {
            {"_apple-mobdev2._tcp", "Apple"},
            {"_companion-link._tcp", "Apple"},
            {"_airplay._tcp", "Apple"},
            {"_raop._tcp", "Apple"},
            {"_sleep-proxy._udp", "Apple"},
            {"_googlecast._tcp", "Google"},
            {"_googlezone._tcp", "Google"},
            {"_amzn-wplay._tcp", "Amazon"},
        };

        std::string StripLocal(const std::string &service)
        {
            const std::string suffix = ".local";
            std::string s = service;
            if (s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0)
                s.erase(s.size() - suffix.size());
            while (!s.empty() && s.back() == '.')
                s.pop_back();
            return s;
        }

        bool IsFamilyToken(const std::string &pattern)
        {
            for (const char *token : FAMILY_TOKENS)
            {
                if (pattern == token)
                    return true;
            }
            return false;
        }
    }

    std::string HostnamePattern(const std::string &hostname)
    {
        std::string lower;
        lower.reserve(hostname.size());
        for (char c : hostname)
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

        for (const char *token : FAMILY_TOKENS)
        {
            if (lower.find(token) != std::string::npos)
                return token;
        }

        std::string label = lower.substr(0, lower.find('.'));
        std::string pattern;
        for (char c : label)
        {
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '-')
                continue;
            pattern.push_back(c);
        }
        return pattern;
    }

    double HostnameSimilarity(const std::string &a, const std::string &b)
    {
        const std::string pa = HostnamePattern(a);
        const std::string pb = HostnamePattern(b);
        if (pa.empty() || pb.empty())
            return 0.0;
        if (pa == pb)
            return 1.0;
        if (IsFamilyToken(pa) || IsFamilyToken(pb))
            return 0.0;

        size_t common = 0;
        while (common < pa.size() && common < pb.size() && pa[common] == pb[common])
            ++common;
        if (common < MIN_COMMON_PREFIX)
            return 0.0;
        return static_cast<double>(common) / static_cast<double>(std::max(pa.size(), pb.size()));
    }

    std::string VendorFamily(const std::string &vendor)
    {
        std::string family;
        for (char c : vendor)
        {
            if (!std::isalnum(static_cast<unsigned char>(c)))
            {
                if (!family.empty())
                    break;
                continue;
            }
            family.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return family;
    }

    double VendorMatch(const std::string &a, const std::string &b)
    {
        const std::string fa = VendorFamily(a);
        return (!fa.empty() && fa == VendorFamily(b)) ? 1.0 : 0.0;
    }

    std::string InferVendor(const std::set<std::string> &services)
    {
        for (const auto &service : services)
        {
            const std::string type = StripLocal(service);
            for (const auto &entry : SERVICE_VENDORS)
            {
                if (type == entry.service)
                    return entry.vendor;
            }
        }
        return "";
    }

    double ServiceOverlap(const std::set<std::string> &a, const std::set<std::string> &b)
    {
        if (a.empty() || b.empty())
            return 0.0;
        size_t both = 0;
        for (const auto &s : a)
            both += b.count(s);
        const size_t either = a.size() + b.size() - both;
        return static_cast<double>(both) / static_cast<double>(either);
    }

    double TimeWindowOverlap(uint32_t a, uint32_t b)
    {
        const uint32_t mask = 0xFFFFFFu;
        std::bitset<24> both((a & b) & mask);
        std::bitset<24> either((a | b) & mask);
        if ((a & mask) == 0 || (b & mask) == 0 || either.none())
            return 0.0;
        return static_cast<double>(both.count()) / static_cast<double>(either.count());
    }

    double CoOccurrenceStrength(int count, int saturation)
    {
        if (count <= 0)
            return 0.0;
        return std::min(1.0, static_cast<double>(count) / static_cast<double>(std::max(saturation, 1)));
    }

    LinkScorer::LinkScorer(common::IdentityConfig config) : m_config(std::move(config)) {}

    LinkSignals LinkScorer::Signals(const store::Device &candidate, const store::Device &primary, int coOccurrences) const
    {
        LinkSignals signals;
        signals.hostname = HostnameSimilarity(candidate.hostname, primary.hostname);
        signals.vendor = VendorMatch(candidate.vendor, primary.vendor);
        signals.time_window = TimeWindowOverlap(candidate.connection_hours, primary.connection_hours);
        signals.cooccurrence = CoOccurrenceStrength(coOccurrences, m_config.cooccurrence_saturation);
        signals.services = ServiceOverlap(candidate.mdns_services, primary.mdns_services);
        return signals;
    }

    double LinkScorer::Score(const LinkSignals &signals) const
    {
        const auto &w = m_config.weights;
        double score = w.hostname * signals.hostname + w.vendor * signals.vendor +
                       w.time_window * signals.time_window + w.cooccurrence * signals.cooccurrence +
                       w.services * signals.services;
        return std::clamp(score, 0.0, 1.0);
    }
}
