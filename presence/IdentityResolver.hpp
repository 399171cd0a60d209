#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "LinkScorer.hpp"
#include "OuiRegistry.hpp"
#include "../common/Config.hpp"
#include "../scanner/Observation.hpp"
#include "../store/PresenceStore.hpp"

namespace hearth::presence
{
    struct ResolveResult
    {
        // Devices with a real observation this cycle.
        std::set<int64_t> observed_ids;
        size_t merged_observations = 0;
        int created = 0;
        int linked = 0;
    };

    struct LinkCandidate
    {
        int64_t device_id = 0;
        double score = 0.0;
    };

    class IdentityResolver
    {
    public:
        IdentityResolver(common::IdentityConfig identity,
                         common::PresenceConfig presence,
                         std::shared_ptr<const OuiRegistry> oui);

        // Upserts every observed MAC, links randomized MACs to their primary
        // identity and bumps co-occurrence for every observed pair. Runs
        // inside the caller's session; a StoreError leaves it to roll back.
        ResolveResult Resolve(store::StoreSession &session,
                              const std::vector<scanner::Observation> &observations,
                              common::TimePoint now);

        // Normalizes and de-duplicates by MAC. Invalid MACs and a MAC seen at
        // two different IPs (all but the first report) are dropped with a warning.
        static std::vector<scanner::Observation> MergeObservations(const std::vector<scanner::Observation> &observations);

        // Rejects links that would break the single-hop chain rule.
        static bool CanLink(const store::Device &source, const store::Device &target,
                            const std::vector<store::Device> &devices);

        // Scores every unlinked device against source, best first.
        std::vector<LinkCandidate> RankCandidates(const store::Device &source,
                                                  const std::vector<store::Device> &devices,
                                                  const std::map<std::pair<int64_t, int64_t>, int> &coCounts) const;

    private:
        store::Device NewDevice(const scanner::Observation &obs, common::TimePoint now) const;
        void ApplyObservation(store::StoreSession &session, store::Device &device,
                              const scanner::Observation &obs, common::TimePoint now) const;
        bool TryLink(store::StoreSession &session, store::Device &device, std::vector<store::Device> &devices,
                     const std::map<std::pair<int64_t, int64_t>, int> &coCounts) const;

        LinkScorer m_scorer;
        common::PresenceConfig m_presence;
        std::shared_ptr<const OuiRegistry> m_oui;
    };
}
