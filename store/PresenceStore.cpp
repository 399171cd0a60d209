#include "PresenceStore.hpp"
#include "../common/Errors.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace hearth::store
{
    using common::FromMillis;
    using common::StoreError;
    using common::ToMillis;

    namespace
    {
        class Statement
        {
        public:
            Statement(sqlite3 *db, const char *sql) : db_(db), stmt_(nullptr)
            {
                if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK)
                    throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db) + " [" + sql + "]");
            }

            ~Statement()
            {
                sqlite3_finalize(stmt_);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            Statement &BindInt(int idx, int64_t value)
            {
                Check(sqlite3_bind_int64(stmt_, idx, value));
                return *this;
            }

            Statement &BindReal(int idx, double value)
            {
                Check(sqlite3_bind_double(stmt_, idx, value));
                return *this;
            }

            Statement &BindText(int idx, const std::string &value)
            {
                Check(sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT));
                return *this;
            }

            Statement &BindNull(int idx)
            {
                Check(sqlite3_bind_null(stmt_, idx));
                return *this;
            }

            // True while rows are available.
            bool Step()
            {
                int rc = sqlite3_step(stmt_);
                if (rc == SQLITE_ROW)
                    return true;
                if (rc == SQLITE_DONE)
                    return false;
                throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
            }

            void Run()
            {
                while (Step())
                {
                }
            }

            int64_t Int(int col) const { return sqlite3_column_int64(stmt_, col); }
            double Real(int col) const { return sqlite3_column_double(stmt_, col); }
            bool IsNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

            std::string Text(int col) const
            {
                const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt_, col));
                return text ? text : "";
            }

        private:
            void Check(int rc)
            {
                if (rc != SQLITE_OK)
                    throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
            }

            sqlite3 *db_;
            sqlite3_stmt *stmt_;
        };

        const char *DEVICE_COLUMNS =
            "id, mac_address, name, owner, last_ip, hostname, vendor, is_home, is_randomized_mac, "
            "track_presence, first_seen_ms, last_seen_ms, linked_to_device_id, link_confidence, "
            "missed_cycles, connection_hours";

        Device ReadDevice(const Statement &stmt)
        {
            Device d;
            d.id = stmt.Int(0);
            d.mac_address = stmt.Text(1);
            d.name = stmt.Text(2);
            d.owner = stmt.Text(3);
            d.last_ip = stmt.Text(4);
            d.hostname = stmt.Text(5);
            d.vendor = stmt.Text(6);
            d.is_home = stmt.Int(7) != 0;
            d.is_randomized_mac = stmt.Int(8) != 0;
            d.track_presence = stmt.Int(9) != 0;
            d.first_seen = FromMillis(stmt.Int(10));
            d.last_seen = FromMillis(stmt.Int(11));
            if (!stmt.IsNull(12))
                d.linked_to_device_id = stmt.Int(12);
            d.link_confidence = stmt.Real(13);
            d.missed_cycles = static_cast<int>(stmt.Int(14));
            d.connection_hours = static_cast<uint32_t>(stmt.Int(15));
            return d;
        }

        DeviceAssociation ReadAssociation(const Statement &stmt)
        {
            DeviceAssociation a;
            a.id = stmt.Int(0);
            a.device1_id = stmt.Int(1);
            a.device2_id = stmt.Int(2);
            a.association_type = stmt.Text(3);
            a.confidence = stmt.Real(4);
            a.co_occurrence_count = static_cast<int>(stmt.Int(5));
            a.last_seen_together = FromMillis(stmt.Int(6));
            return a;
        }

        PresenceEvent ReadEvent(const Statement &stmt)
        {
            PresenceEvent e;
            e.id = stmt.Int(0);
            e.device_id = stmt.Int(1);
            e.device_name = stmt.Text(2);
            e.event_type = ParseEventType(stmt.Text(3)).value_or(PresenceEventType::Arrived);
            e.timestamp = FromMillis(stmt.Int(4));
            e.ip_address = stmt.Text(5);
            e.hostname = stmt.Text(6);
            return e;
        }

        const char *SCHEMA =
            "CREATE TABLE IF NOT EXISTS devices ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "mac_address TEXT UNIQUE NOT NULL, "
            "name TEXT NOT NULL DEFAULT 'Unknown Device', "
            "owner TEXT, "
            "last_ip TEXT, "
            "hostname TEXT, "
            "vendor TEXT, "
            "is_home INTEGER NOT NULL DEFAULT 0, "
            "is_randomized_mac INTEGER NOT NULL DEFAULT 0, "
            "track_presence INTEGER NOT NULL DEFAULT 1, "
            "first_seen_ms INTEGER NOT NULL, "
            "last_seen_ms INTEGER NOT NULL, "
            "linked_to_device_id INTEGER, "
            "link_confidence REAL NOT NULL DEFAULT 0, "
            "missed_cycles INTEGER NOT NULL DEFAULT 0, "
            "connection_hours INTEGER NOT NULL DEFAULT 0, "
            "CHECK (linked_to_device_id IS NULL OR linked_to_device_id <> id), "
            "FOREIGN KEY(linked_to_device_id) REFERENCES devices(id)"
            ");"

            "CREATE TABLE IF NOT EXISTS device_ip_history ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "device_id INTEGER NOT NULL, "
            "ip_address TEXT NOT NULL, "
            "seen_at_ms INTEGER NOT NULL, "
            "FOREIGN KEY(device_id) REFERENCES devices(id)"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_ip_history_device ON device_ip_history(device_id, id);"

            "CREATE TABLE IF NOT EXISTS device_services ("
            "device_id INTEGER NOT NULL, "
            "service TEXT NOT NULL, "
            "UNIQUE(device_id, service), "
            "FOREIGN KEY(device_id) REFERENCES devices(id)"
            ");"

            "CREATE TABLE IF NOT EXISTS presence_events ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "device_id INTEGER NOT NULL, "
            "event_type TEXT NOT NULL CHECK (event_type IN ('arrived', 'left')), "
            "timestamp_ms INTEGER NOT NULL, "
            "ip_address TEXT, "
            "hostname TEXT, "
            "FOREIGN KEY(device_id) REFERENCES devices(id)"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_presence_events_device ON presence_events(device_id, timestamp_ms);"

            "CREATE TABLE IF NOT EXISTS device_associations ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "device1_id INTEGER NOT NULL, "
            "device2_id INTEGER NOT NULL, "
            "association_type TEXT NOT NULL DEFAULT 'co_occurrence', "
            "confidence REAL NOT NULL DEFAULT 0, "
            "co_occurrence_count INTEGER NOT NULL DEFAULT 0, "
            "last_seen_together_ms INTEGER NOT NULL, "
            "UNIQUE(device1_id, device2_id), "
            "CHECK (device1_id < device2_id), "
            "FOREIGN KEY(device1_id) REFERENCES devices(id), "
            "FOREIGN KEY(device2_id) REFERENCES devices(id)"
            ");"

            "CREATE TABLE IF NOT EXISTS network_snapshots ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "timestamp_ms INTEGER NOT NULL, "
            "device_count INTEGER NOT NULL"
            ");"

            "CREATE TABLE IF NOT EXISTS snapshot_devices ("
            "snapshot_id INTEGER NOT NULL, "
            "device_id INTEGER NOT NULL, "
            "mac_address TEXT NOT NULL, "
            "ip_address TEXT, "
            "FOREIGN KEY(snapshot_id) REFERENCES network_snapshots(id)"
            ");"

            "CREATE TABLE IF NOT EXISTS hardware_events ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "hardware_id TEXT NOT NULL, "
            "value REAL NOT NULL, "
            "formatted_value TEXT, "
            "unit TEXT, "
            "timestamp_ms INTEGER NOT NULL"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_hardware_events_ts ON hardware_events(timestamp_ms);";
    }

    const char *ToString(PresenceEventType type)
    {
        return type == PresenceEventType::Arrived ? "arrived" : "left";
    }

    std::optional<PresenceEventType> ParseEventType(const std::string &text)
    {
        if (text == "arrived")
            return PresenceEventType::Arrived;
        if (text == "left")
            return PresenceEventType::Left;
        return std::nullopt;
    }

    // ---------------------------------------------------------------- session

    StoreSession::StoreSession(sqlite3 *db, bool write) : db_(db), committed_(false)
    {
        try
        {
            Exec(write ? "BEGIN IMMEDIATE;" : "BEGIN;");
        }
        catch (const StoreError &)
        {
            sqlite3_close(db_);
            throw;
        }
    }

    StoreSession::~StoreSession()
    {
        if (!committed_)
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }

    void StoreSession::Exec(const char *sql)
    {
        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::string msg = err_msg ? err_msg : sqlite3_errmsg(db_);
            sqlite3_free(err_msg);
            throw StoreError("exec failed: " + msg);
        }
    }

    void StoreSession::Commit()
    {
        if (committed_)
            return;
        Exec("COMMIT;");
        committed_ = true;
    }

    void StoreSession::LoadDeviceCollections(Device &device)
    {
        Statement history(db_, "SELECT ip_address, seen_at_ms FROM device_ip_history WHERE device_id = ? ORDER BY id ASC;");
        history.BindInt(1, device.id);
        while (history.Step())
            device.ip_history.push_back({history.Text(0), FromMillis(history.Int(1))});

        Statement services(db_, "SELECT service FROM device_services WHERE device_id = ?;");
        services.BindInt(1, device.id);
        while (services.Step())
            device.mdns_services.insert(services.Text(0));
    }

    std::vector<Device> StoreSession::LoadDevices()
    {
        std::vector<Device> devices;
        std::string sql = std::string("SELECT ") + DEVICE_COLUMNS + " FROM devices ORDER BY id ASC;";
        Statement stmt(db_, sql.c_str());
        while (stmt.Step())
            devices.push_back(ReadDevice(stmt));

        for (auto &d : devices)
            LoadDeviceCollections(d);
        return devices;
    }

    std::optional<Device> StoreSession::FindDevice(int64_t id)
    {
        std::string sql = std::string("SELECT ") + DEVICE_COLUMNS + " FROM devices WHERE id = ?;";
        Statement stmt(db_, sql.c_str());
        stmt.BindInt(1, id);
        if (!stmt.Step())
            return std::nullopt;
        Device d = ReadDevice(stmt);
        LoadDeviceCollections(d);
        return d;
    }

    std::optional<Device> StoreSession::FindDeviceByMac(const std::string &mac)
    {
        std::string sql = std::string("SELECT ") + DEVICE_COLUMNS + " FROM devices WHERE mac_address = ?;";
        Statement stmt(db_, sql.c_str());
        stmt.BindText(1, mac);
        if (!stmt.Step())
            return std::nullopt;
        Device d = ReadDevice(stmt);
        LoadDeviceCollections(d);
        return d;
    }

    int64_t StoreSession::InsertDevice(Device &device)
    {
        Statement stmt(db_,
                       "INSERT INTO devices (mac_address, name, owner, last_ip, hostname, vendor, is_home, "
                       "is_randomized_mac, track_presence, first_seen_ms, last_seen_ms, linked_to_device_id, "
                       "link_confidence, missed_cycles, connection_hours) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        stmt.BindText(1, device.mac_address)
            .BindText(2, device.name)
            .BindText(3, device.owner)
            .BindText(4, device.last_ip)
            .BindText(5, device.hostname)
            .BindText(6, device.vendor)
            .BindInt(7, device.is_home)
            .BindInt(8, device.is_randomized_mac)
            .BindInt(9, device.track_presence)
            .BindInt(10, ToMillis(device.first_seen))
            .BindInt(11, ToMillis(device.last_seen))
            .BindReal(13, device.link_confidence)
            .BindInt(14, device.missed_cycles)
            .BindInt(15, device.connection_hours);
        if (device.linked_to_device_id)
            stmt.BindInt(12, *device.linked_to_device_id);
        else
            stmt.BindNull(12);
        stmt.Run();

        device.id = sqlite3_last_insert_rowid(db_);
        for (const auto &entry : device.ip_history)
            AppendIpHistory(device.id, entry, device.ip_history.size());
        for (const auto &service : device.mdns_services)
            AddService(device.id, service);
        return device.id;
    }

    void StoreSession::UpdateDevice(const Device &device)
    {
        Statement stmt(db_,
                       "UPDATE devices SET name = ?, owner = ?, last_ip = ?, hostname = ?, vendor = ?, "
                       "is_home = ?, is_randomized_mac = ?, track_presence = ?, last_seen_ms = ?, "
                       "linked_to_device_id = ?, link_confidence = ?, missed_cycles = ?, connection_hours = ? "
                       "WHERE id = ?;");
        stmt.BindText(1, device.name)
            .BindText(2, device.owner)
            .BindText(3, device.last_ip)
            .BindText(4, device.hostname)
            .BindText(5, device.vendor)
            .BindInt(6, device.is_home)
            .BindInt(7, device.is_randomized_mac)
            .BindInt(8, device.track_presence)
            .BindInt(9, ToMillis(device.last_seen))
            .BindReal(11, device.link_confidence)
            .BindInt(12, device.missed_cycles)
            .BindInt(13, device.connection_hours)
            .BindInt(14, device.id);
        if (device.linked_to_device_id)
            stmt.BindInt(10, *device.linked_to_device_id);
        else
            stmt.BindNull(10);
        stmt.Run();

        if (sqlite3_changes(db_) != 1)
            throw StoreError("device " + std::to_string(device.id) + " does not exist");
    }

    void StoreSession::AppendIpHistory(int64_t device_id, const IpHistoryEntry &entry, size_t limit)
    {
        Statement insert(db_, "INSERT INTO device_ip_history (device_id, ip_address, seen_at_ms) VALUES (?, ?, ?);");
        insert.BindInt(1, device_id).BindText(2, entry.ip).BindInt(3, ToMillis(entry.seen_at));
        insert.Run();

        Statement prune(db_,
                        "DELETE FROM device_ip_history WHERE device_id = ?1 AND id NOT IN ("
                        "SELECT id FROM device_ip_history WHERE device_id = ?1 ORDER BY id DESC LIMIT ?2);");
        prune.BindInt(1, device_id).BindInt(2, static_cast<int64_t>(limit));
        prune.Run();
    }

    void StoreSession::AddService(int64_t device_id, const std::string &service)
    {
        Statement stmt(db_, "INSERT OR IGNORE INTO device_services (device_id, service) VALUES (?, ?);");
        stmt.BindInt(1, device_id).BindText(2, service);
        stmt.Run();
    }

    std::vector<DeviceAssociation> StoreSession::LoadAssociations()
    {
        std::vector<DeviceAssociation> out;
        Statement stmt(db_,
                       "SELECT id, device1_id, device2_id, association_type, confidence, co_occurrence_count, "
                       "last_seen_together_ms FROM device_associations;");
        while (stmt.Step())
            out.push_back(ReadAssociation(stmt));
        return out;
    }

    std::vector<DeviceAssociation> StoreSession::AssociationsFor(int64_t device_id)
    {
        std::vector<DeviceAssociation> out;
        Statement stmt(db_,
                       "SELECT id, device1_id, device2_id, association_type, confidence, co_occurrence_count, "
                       "last_seen_together_ms FROM device_associations "
                       "WHERE device1_id = ?1 OR device2_id = ?1 ORDER BY co_occurrence_count DESC;");
        stmt.BindInt(1, device_id);
        while (stmt.Step())
            out.push_back(ReadAssociation(stmt));
        return out;
    }

    DeviceAssociation StoreSession::RecordCoOccurrence(int64_t a, int64_t b, TimePoint when, int saturation)
    {
        if (a == b)
            throw StoreError("association needs two distinct devices");

        const int64_t lo = std::min(a, b);
        const int64_t hi = std::max(a, b);
        const double sat = static_cast<double>(std::max(saturation, 1));

        Statement upsert(db_,
                         "INSERT INTO device_associations (device1_id, device2_id, association_type, confidence, "
                         "co_occurrence_count, last_seen_together_ms) VALUES (?1, ?2, 'co_occurrence', MIN(1.0, 1.0 / ?4), 1, ?3) "
                         "ON CONFLICT(device1_id, device2_id) DO UPDATE SET "
                         "co_occurrence_count = co_occurrence_count + 1, "
                         "confidence = MIN(1.0, (co_occurrence_count + 1) / ?4), "
                         "last_seen_together_ms = ?3;");
        upsert.BindInt(1, lo).BindInt(2, hi).BindInt(3, ToMillis(when)).BindReal(4, sat);
        upsert.Run();

        Statement select(db_,
                         "SELECT id, device1_id, device2_id, association_type, confidence, co_occurrence_count, "
                         "last_seen_together_ms FROM device_associations WHERE device1_id = ? AND device2_id = ?;");
        select.BindInt(1, lo).BindInt(2, hi);
        if (!select.Step())
            throw StoreError("association row vanished after upsert");
        return ReadAssociation(select);
    }

    int64_t StoreSession::InsertPresenceEvent(PresenceEvent &event)
    {
        Statement stmt(db_,
                       "INSERT INTO presence_events (device_id, event_type, timestamp_ms, ip_address, hostname) "
                       "VALUES (?, ?, ?, ?, ?);");
        stmt.BindInt(1, event.device_id)
            .BindText(2, ToString(event.event_type))
            .BindInt(3, ToMillis(event.timestamp))
            .BindText(4, event.ip_address)
            .BindText(5, event.hostname);
        stmt.Run();
        event.id = sqlite3_last_insert_rowid(db_);
        return event.id;
    }

    int64_t StoreSession::InsertSnapshot(NetworkSnapshot &snapshot)
    {
        snapshot.device_count = static_cast<int>(snapshot.devices.size());

        Statement stmt(db_, "INSERT INTO network_snapshots (timestamp_ms, device_count) VALUES (?, ?);");
        stmt.BindInt(1, ToMillis(snapshot.timestamp)).BindInt(2, snapshot.device_count);
        stmt.Run();
        snapshot.id = sqlite3_last_insert_rowid(db_);

        for (const auto &entry : snapshot.devices)
        {
            Statement dev(db_, "INSERT INTO snapshot_devices (snapshot_id, device_id, mac_address, ip_address) VALUES (?, ?, ?, ?);");
            dev.BindInt(1, snapshot.id).BindInt(2, entry.device_id).BindText(3, entry.mac_address).BindText(4, entry.ip_address);
            dev.Run();
        }
        return snapshot.id;
    }

    int64_t StoreSession::InsertHardwareEvent(HardwareEventRecord &record)
    {
        Statement stmt(db_,
                       "INSERT INTO hardware_events (hardware_id, value, formatted_value, unit, timestamp_ms) "
                       "VALUES (?, ?, ?, ?, ?);");
        stmt.BindText(1, record.hardware_id)
            .BindReal(2, record.value)
            .BindText(3, record.formatted_value)
            .BindText(4, record.unit)
            .BindInt(5, ToMillis(record.timestamp));
        stmt.Run();
        record.id = sqlite3_last_insert_rowid(db_);
        return record.id;
    }

    std::vector<Device> StoreSession::HomeDevices()
    {
        std::vector<Device> devices;
        std::string sql = std::string("SELECT ") + DEVICE_COLUMNS +
                          " FROM devices WHERE is_home = 1 AND track_presence = 1 AND linked_to_device_id IS NULL "
                          "ORDER BY name ASC;";
        Statement stmt(db_, sql.c_str());
        while (stmt.Step())
            devices.push_back(ReadDevice(stmt));
        for (auto &d : devices)
            LoadDeviceCollections(d);
        return devices;
    }

    EventPage StoreSession::RecentEvents(int page, int per_page)
    {
        EventPage result;
        result.page = std::max(page, 1);
        result.per_page = std::clamp(per_page, 1, 500);

        Statement count(db_, "SELECT COUNT(*) FROM presence_events;");
        if (count.Step())
            result.total = count.Int(0);

        Statement stmt(db_,
                       "SELECT e.id, e.device_id, d.name, e.event_type, e.timestamp_ms, e.ip_address, e.hostname "
                       "FROM presence_events e JOIN devices d ON d.id = e.device_id "
                       "ORDER BY e.timestamp_ms DESC, e.id DESC LIMIT ? OFFSET ?;");
        stmt.BindInt(1, result.per_page).BindInt(2, static_cast<int64_t>(result.page - 1) * result.per_page);
        while (stmt.Step())
            result.events.push_back(ReadEvent(stmt));
        return result;
    }

    std::vector<PresenceEvent> StoreSession::EventsForDevice(int64_t device_id)
    {
        std::vector<PresenceEvent> events;
        Statement stmt(db_,
                       "SELECT e.id, e.device_id, d.name, e.event_type, e.timestamp_ms, e.ip_address, e.hostname "
                       "FROM presence_events e JOIN devices d ON d.id = e.device_id "
                       "WHERE e.device_id = ? ORDER BY e.timestamp_ms ASC, e.id ASC;");
        stmt.BindInt(1, device_id);
        while (stmt.Step())
            events.push_back(ReadEvent(stmt));
        return events;
    }

    std::optional<DeviceDetail> StoreSession::LoadDeviceDetail(int64_t device_id)
    {
        auto device = FindDevice(device_id);
        if (!device)
            return std::nullopt;

        DeviceDetail detail;
        detail.device = *device;
        if (device->linked_to_device_id)
            detail.primary = FindDevice(*device->linked_to_device_id);

        std::string sql = std::string("SELECT ") + DEVICE_COLUMNS +
                          " FROM devices WHERE linked_to_device_id = ? ORDER BY link_confidence DESC;";
        Statement linked(db_, sql.c_str());
        linked.BindInt(1, device_id);
        while (linked.Step())
            detail.linked_devices.push_back(ReadDevice(linked));

        detail.associations = AssociationsFor(device_id);
        return detail;
    }

    std::vector<NetworkSnapshot> StoreSession::RecentSnapshots(int limit)
    {
        std::vector<NetworkSnapshot> snapshots;
        Statement stmt(db_, "SELECT id, timestamp_ms, device_count FROM network_snapshots ORDER BY id DESC LIMIT ?;");
        stmt.BindInt(1, limit);
        while (stmt.Step())
        {
            NetworkSnapshot snap;
            snap.id = stmt.Int(0);
            snap.timestamp = FromMillis(stmt.Int(1));
            snap.device_count = static_cast<int>(stmt.Int(2));
            snapshots.push_back(snap);
        }

        for (auto &snap : snapshots)
        {
            Statement devs(db_, "SELECT device_id, mac_address, ip_address FROM snapshot_devices WHERE snapshot_id = ?;");
            devs.BindInt(1, snap.id);
            while (devs.Step())
                snap.devices.push_back({devs.Int(0), devs.Text(1), devs.Text(2)});
        }
        return snapshots;
    }

    std::vector<HardwareEventRecord> StoreSession::RecentHardwareEvents(int limit)
    {
        std::vector<HardwareEventRecord> records;
        Statement stmt(db_,
                       "SELECT id, hardware_id, value, formatted_value, unit, timestamp_ms FROM hardware_events "
                       "ORDER BY timestamp_ms DESC, id DESC LIMIT ?;");
        stmt.BindInt(1, limit);
        while (stmt.Step())
        {
            HardwareEventRecord r;
            r.id = stmt.Int(0);
            r.hardware_id = stmt.Text(1);
            r.value = stmt.Real(2);
            r.formatted_value = stmt.Text(3);
            r.unit = stmt.Text(4);
            r.timestamp = FromMillis(stmt.Int(5));
            records.push_back(r);
        }
        return records;
    }

    // ------------------------------------------------------------------ store

    PresenceStore::PresenceStore(common::DatabaseConfig config) : config_(std::move(config)) {}

    sqlite3 *PresenceStore::Connect()
    {
        sqlite3 *db = nullptr;
        int rc = sqlite3_open_v2(config_.path.c_str(), &db,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            sqlite3_close(db);
            throw StoreError("open " + config_.path + " failed: " + msg);
        }

        sqlite3_busy_timeout(db, 5000);
        sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, nullptr);
        return db;
    }

    void PresenceStore::CreateSchema()
    {
        sqlite3 *db = Connect();

        char *err_msg = nullptr;
        sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        if (sqlite3_exec(db, SCHEMA, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::string msg = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            sqlite3_close(db);
            throw StoreError("schema error: " + msg);
        }
        sqlite3_close(db);
    }

    void PresenceStore::Initialize()
    {
        const int attempts = std::max(config_.connect_attempts, 1);
        std::string last_error;

        for (int attempt = 1; attempt <= attempts; ++attempt)
        {
            try
            {
                CreateSchema();
                std::cout << "[Store] Database ready at " << config_.path << "\n";
                return;
            }
            catch (const StoreError &e)
            {
                last_error = e.what();
                std::cerr << "[Store] WARNING: attempt " << attempt << "/" << attempts
                          << " failed: " << last_error << "\n";
            }

            if (attempt < attempts)
                std::this_thread::sleep_for(config_.retry_delay);
        }

        throw StoreError("database unreachable after " + std::to_string(attempts) + " attempts: " + last_error);
    }

    std::unique_ptr<StoreSession> PresenceStore::OpenSession(bool write)
    {
        sqlite3 *db = Connect();
        return std::unique_ptr<StoreSession>(new StoreSession(db, write));
    }

    bool PresenceStore::Ping()
    {
        try
        {
            auto session = OpenSession(false);
            session->Commit();
            return true;
        }
        catch (const StoreError &e)
        {
            std::cerr << "[Store] ERROR: " << e.what() << "\n";
            return false;
        }
    }

    std::vector<Device> PresenceStore::WhoIsHome()
    {
        auto session = OpenSession(false);
        auto devices = session->HomeDevices();
        session->Commit();
        return devices;
    }

    EventPage PresenceStore::RecentEvents(int page, int per_page)
    {
        auto session = OpenSession(false);
        auto result = session->RecentEvents(page, per_page);
        session->Commit();
        return result;
    }

    std::optional<DeviceDetail> PresenceStore::GetDeviceDetail(int64_t device_id)
    {
        auto session = OpenSession(false);
        auto detail = session->LoadDeviceDetail(device_id);
        session->Commit();
        return detail;
    }
}
