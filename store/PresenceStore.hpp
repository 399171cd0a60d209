#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "Records.hpp"
#include "../common/Config.hpp"

namespace hearth::store
{
    /*
      One SQLite connection plus one transaction, scoped to a single cycle
      or query. Destroying a session that was not committed rolls it back.
      Every failure throws common::StoreError.
    */
    class StoreSession
    {
    public:
        ~StoreSession();

        StoreSession(const StoreSession &) = delete;
        StoreSession &operator=(const StoreSession &) = delete;

        std::vector<Device> LoadDevices();
        std::optional<Device> FindDevice(int64_t id);
        std::optional<Device> FindDeviceByMac(const std::string &mac);

        // Assigns device.id.
        int64_t InsertDevice(Device &device);
        void UpdateDevice(const Device &device);
        void AppendIpHistory(int64_t device_id, const IpHistoryEntry &entry, size_t limit);
        void AddService(int64_t device_id, const std::string &service);

        std::vector<DeviceAssociation> LoadAssociations();
        std::vector<DeviceAssociation> AssociationsFor(int64_t device_id);

        // Upserts the unordered pair and bumps its count.
        DeviceAssociation RecordCoOccurrence(int64_t a, int64_t b, TimePoint when, int saturation);

        int64_t InsertPresenceEvent(PresenceEvent &event);
        int64_t InsertSnapshot(NetworkSnapshot &snapshot);
        int64_t InsertHardwareEvent(HardwareEventRecord &record);

        std::vector<Device> HomeDevices();
        EventPage RecentEvents(int page, int per_page);
        std::vector<PresenceEvent> EventsForDevice(int64_t device_id);
        std::optional<DeviceDetail> LoadDeviceDetail(int64_t device_id);
        std::vector<NetworkSnapshot> RecentSnapshots(int limit);
        std::vector<HardwareEventRecord> RecentHardwareEvents(int limit);

        void Commit();

    private:
        friend class PresenceStore;
        StoreSession(sqlite3 *db, bool write);

        void Exec(const char *sql);
        void LoadDeviceCollections(Device &device);

        sqlite3 *db_;
        bool committed_;
    };

    class PresenceStore
    {
    public:
        explicit PresenceStore(common::DatabaseConfig config);

        PresenceStore(const PresenceStore &) = delete;
        PresenceStore &operator=(const PresenceStore &) = delete;

        // Creates the schema. Retries up to connect_attempts times, then
        // throws common::StoreError.
        void Initialize();

        std::unique_ptr<StoreSession> OpenSession(bool write = true);

        bool Ping();

        std::vector<Device> WhoIsHome();
        EventPage RecentEvents(int page, int per_page);
        std::optional<DeviceDetail> GetDeviceDetail(int64_t device_id);

        const std::string &Path() const { return config_.path; }

    private:
        sqlite3 *Connect();
        void CreateSchema();

        common::DatabaseConfig config_;
    };
}
