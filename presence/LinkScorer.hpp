#pragma once

#include <cstdint>
#include <set>
#include <string>
#include "../common/Config.hpp"
#include "../store/Records.hpp"

namespace hearth::presence
{
    struct LinkSignals
    {
        double hostname = 0.0;
        double vendor = 0.0;
        double time_window = 0.0;
        double cooccurrence = 0.0;
        double services = 0.0;
    };

    // Lower-cased family token ("iphone", "pixel", ...) when one is present,
    // otherwise the first label with digits and dashes removed. Empty for an
    // empty hostname.
    std::string HostnamePattern(const std::string &hostname);

    double HostnameSimilarity(const std::string &a, const std::string &b);
    // Compares vendor families, so "Apple, Inc." matches "Apple".
    double VendorMatch(const std::string &a, const std::string &b);

    // Lower-cased first word of a vendor name.
    std::string VendorFamily(const std::string &vendor);

    // Vendor implied by vendor-specific mDNS service types; empty when the
    // services say nothing. Used for randomized MACs, whose OUI is meaningless.
    std::string InferVendor(const std::set<std::string> &services);

    double ServiceOverlap(const std::set<std::string> &a, const std::set<std::string> &b);

    // Jaccard overlap of two 24-bit hour masks; 0 when either is empty.
    double TimeWindowOverlap(uint32_t a, uint32_t b);

    double CoOccurrenceStrength(int count, int saturation);

    class LinkScorer
    {
    public:
        explicit LinkScorer(common::IdentityConfig config);

        LinkSignals Signals(const store::Device &candidate, const store::Device &primary, int coOccurrences) const;
        double Score(const LinkSignals &signals) const;

        const common::IdentityConfig &Config() const { return m_config; }

    private:
        common::IdentityConfig m_config;
    };
}
