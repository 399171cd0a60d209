#pragma once

#include <set>
#include <vector>
#include "../store/PresenceStore.hpp"

namespace hearth::presence
{
    struct TrackResult
    {
        std::vector<store::PresenceEvent> events;
        store::NetworkSnapshot snapshot;
    };

    /*
      Home/Away state per identity (unlinked, tracked device). An identity is
      seen when it or any device linked to it was observed. Away -> Home on
      the first sighting, Home -> Away after missThreshold consecutive
      cycles without one. Linked devices mirror their primary.
    */
    class PresenceTracker
    {
    public:
        explicit PresenceTracker(int missThreshold);

        TrackResult Update(store::StoreSession &session, const std::set<int64_t> &observedIds, common::TimePoint now);

        int MissThreshold() const { return m_missThreshold; }

    private:
        int m_missThreshold;
    };
}
