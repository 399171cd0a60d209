#include "IdentityResolver.hpp"
#include "../common/MacAddress.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace hearth::presence
{
    using scanner::Observation;
    using store::Device;

    namespace
    {
        constexpr double SCORE_EPSILON = 1e-9;

        std::pair<int64_t, int64_t> PairKey(int64_t a, int64_t b)
        {
            return {std::min(a, b), std::max(a, b)};
        }

        uint32_t HourBit(common::TimePoint now)
        {
            return 1u << common::HourOfDay(now);
        }
    }

    IdentityResolver::IdentityResolver(common::IdentityConfig identity,
                                       common::PresenceConfig presence,
                                       std::shared_ptr<const OuiRegistry> oui)
        : m_scorer(std::move(identity)), m_presence(std::move(presence)), m_oui(std::move(oui))
    {
    }

    std::vector<Observation> IdentityResolver::MergeObservations(const std::vector<Observation> &observations)
    {
        std::vector<Observation> merged;
        std::map<std::string, size_t> index;

        for (const auto &obs : observations)
        {
            auto mac = common::NormalizeMac(obs.mac);
            if (!mac || common::IsUnsetMac(*mac))
            {
                std::cerr << "[Resolver] WARNING: dropping observation with invalid MAC '" << obs.mac << "'\n";
                continue;
            }

            auto it = index.find(*mac);
            if (it == index.end())
            {
                Observation copy = obs;
                copy.mac = *mac;
                index[*mac] = merged.size();
                merged.push_back(std::move(copy));
                continue;
            }

            Observation &existing = merged[it->second];
            if (!obs.ip.empty() && !existing.ip.empty() && obs.ip != existing.ip)
            {
                std::cerr << "[Resolver] WARNING: MAC " << *mac << " reported at " << existing.ip << " and "
                          << obs.ip << ", keeping " << existing.ip << "\n";
                continue;
            }

            if (existing.ip.empty())
                existing.ip = obs.ip;
            if (existing.hostname.empty())
                existing.hostname = obs.hostname;
            existing.services.insert(obs.services.begin(), obs.services.end());
        }
        return merged;
    }

    bool IdentityResolver::CanLink(const Device &source, const Device &target, const std::vector<Device> &devices)
    {
        if (source.id == target.id)
        {
            std::cerr << "[Resolver] WARNING: refusing to link " << source.mac_address << " to itself\n";
            return false;
        }
        if (source.linked_to_device_id)
        {
            std::cerr << "[Resolver] WARNING: " << source.mac_address << " is already linked\n";
            return false;
        }
        if (target.linked_to_device_id)
        {
            std::cerr << "[Resolver] WARNING: refusing to link " << source.mac_address << " to "
                      << target.mac_address << ", which is itself linked\n";
            return false;
        }
        for (const auto &d : devices)
        {
            if (d.linked_to_device_id && *d.linked_to_device_id == source.id)
            {
                std::cerr << "[Resolver] WARNING: refusing to link " << source.mac_address
                          << ", other devices are linked to it\n";
                return false;
            }
        }
        return true;
    }

    std::vector<LinkCandidate> IdentityResolver::RankCandidates(const Device &source,
                                                                const std::vector<Device> &devices,
                                                                const std::map<std::pair<int64_t, int64_t>, int> &coCounts) const
    {
        std::vector<LinkCandidate> ranked;
        for (const auto &candidate : devices)
        {
            if (candidate.id == source.id || candidate.linked_to_device_id)
                continue;

            int count = 0;
            auto it = coCounts.find(PairKey(source.id, candidate.id));
            if (it != coCounts.end())
                count = it->second;

            double score = m_scorer.Score(m_scorer.Signals(source, candidate, count));
            ranked.push_back({candidate.id, score});
        }

        std::sort(ranked.begin(), ranked.end(), [](const LinkCandidate &a, const LinkCandidate &b)
                  {
                      if (a.score != b.score)
                          return a.score > b.score;
                      return a.device_id < b.device_id; });
        return ranked;
    }

    Device IdentityResolver::NewDevice(const Observation &obs, common::TimePoint now) const
    {
        Device d;
        d.mac_address = obs.mac;
        d.hostname = obs.hostname;
        d.name = obs.hostname.empty() ? "Unknown (" + obs.mac.substr(obs.mac.size() - 5) + ")"
                                      : obs.hostname + " (Auto)";
        d.is_randomized_mac = common::IsRandomizedMac(obs.mac);
        if (d.is_randomized_mac)
            d.vendor = InferVendor(obs.services);
        else if (m_oui)
            d.vendor = m_oui->Lookup(obs.mac);
        d.last_ip = obs.ip;
        d.is_home = false;
        d.track_presence = m_presence.track_new_devices;
        d.first_seen = now;
        d.last_seen = now;
        d.connection_hours = HourBit(now);
        if (!obs.ip.empty())
            d.ip_history.push_back({obs.ip, now});
        d.mdns_services = obs.services;
        return d;
    }

    void IdentityResolver::ApplyObservation(store::StoreSession &session, Device &device,
                                            const Observation &obs, common::TimePoint now) const
    {
        if (!obs.ip.empty() && obs.ip != device.last_ip)
        {
            store::IpHistoryEntry entry{obs.ip, now};
            session.AppendIpHistory(device.id, entry, m_presence.ip_history_limit);
            device.ip_history.push_back(entry);
            while (device.ip_history.size() > m_presence.ip_history_limit)
                device.ip_history.erase(device.ip_history.begin());
            device.last_ip = obs.ip;
        }

        if (!obs.hostname.empty())
            device.hostname = obs.hostname;

        device.last_seen = std::max(device.last_seen, now);
        device.connection_hours |= HourBit(now);
        device.is_randomized_mac = common::IsRandomizedMac(device.mac_address);

        for (const auto &service : obs.services)
        {
            if (device.mdns_services.insert(service).second)
                session.AddService(device.id, service);
        }

        if (device.vendor.empty())
        {
            if (device.is_randomized_mac)
                device.vendor = InferVendor(device.mdns_services);
            else if (m_oui)
                device.vendor = m_oui->Lookup(device.mac_address);
        }

        session.UpdateDevice(device);
    }

    bool IdentityResolver::TryLink(store::StoreSession &session, Device &device, std::vector<Device> &devices,
                                   const std::map<std::pair<int64_t, int64_t>, int> &coCounts) const
    {
        if (!device.is_randomized_mac || device.linked_to_device_id)
            return false;

        auto ranked = RankCandidates(device, devices, coCounts);
        if (ranked.empty())
            return false;

        const auto &cfg = m_scorer.Config();
        const LinkCandidate &best = ranked.front();
        const double second = ranked.size() > 1 ? ranked[1].score : 0.0;
        if (best.score + SCORE_EPSILON < cfg.link_threshold)
            return false;
        if (best.score - second + SCORE_EPSILON < cfg.link_margin)
            return false;

        auto target = std::find_if(devices.begin(), devices.end(), [&](const Device &d)
                                   { return d.id == best.device_id; });
        if (target == devices.end() || !CanLink(device, *target, devices))
            return false;

        device.linked_to_device_id = target->id;
        device.link_confidence = best.score;
        device.name = target->name + " (Random MAC)";
        device.track_presence = true;
        device.is_home = target->is_home;
        device.missed_cycles = 0;
        session.UpdateDevice(device);

        // Presence is reported through the primary, so a link makes it tracked.
        if (!target->track_presence)
        {
            target->track_presence = true;
            session.UpdateDevice(*target);
            std::cout << "[Resolver] Tracking " << target->name << ", it now has a linked MAC\n";
        }

        std::cout << "[Resolver] Linked " << device.mac_address << " -> " << target->name << " ("
                  << std::fixed << std::setprecision(2) << best.score << ")\n";
        return true;
    }

    ResolveResult IdentityResolver::Resolve(store::StoreSession &session,
                                            const std::vector<Observation> &observations,
                                            common::TimePoint now)
    {
        ResolveResult result;
        auto merged = MergeObservations(observations);
        result.merged_observations = merged.size();
        if (merged.empty())
            return result;

        std::vector<Device> devices = session.LoadDevices();
        std::map<std::string, size_t> byMac;
        for (size_t i = 0; i < devices.size(); ++i)
            byMac[devices[i].mac_address] = i;

        std::vector<size_t> observed;
        observed.reserve(merged.size());

        for (const auto &obs : merged)
        {
            auto it = byMac.find(obs.mac);
            size_t idx;
            if (it == byMac.end())
            {
                Device d = NewDevice(obs, now);
                session.InsertDevice(d);
                idx = devices.size();
                devices.push_back(std::move(d));
                byMac[obs.mac] = idx;
                ++result.created;
                std::cout << "[Resolver] New device " << devices[idx].mac_address << " (" << devices[idx].name << ")\n";
            }
            else
            {
                idx = it->second;
                ApplyObservation(session, devices[idx], obs, now);
            }
            observed.push_back(idx);
            result.observed_ids.insert(devices[idx].id);
        }

        std::map<std::pair<int64_t, int64_t>, int> coCounts;
        for (const auto &assoc : session.LoadAssociations())
            coCounts[PairKey(assoc.device1_id, assoc.device2_id)] = assoc.co_occurrence_count;

        for (size_t idx : observed)
        {
            if (TryLink(session, devices[idx], devices, coCounts))
                ++result.linked;
        }

        std::vector<int64_t> ids(result.observed_ids.begin(), result.observed_ids.end());
        for (size_t i = 0; i < ids.size(); ++i)
        {
            for (size_t j = i + 1; j < ids.size(); ++j)
                session.RecordCoOccurrence(ids[i], ids[j], now, m_scorer.Config().cooccurrence_saturation);
        }
        return result;
    }
}
