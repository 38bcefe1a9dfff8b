#include "InventoryStore.hpp"

#include <iostream>
#include <set>
#include <utility>

namespace net_survey::engine
{
    namespace
    {
        std::string ColumnText(sqlite3_stmt *stmt, int col)
        {
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
            return text ? std::string(text) : std::string();
        }

        bool StartsWith(const std::string &s, const std::string &prefix)
        {
            return s.compare(0, prefix.size(), prefix) == 0;
        }

        DeviceRecord ReadDevice(sqlite3_stmt *stmt)
        {
            DeviceRecord d;
            d.id = sqlite3_column_int(stmt, 0);
            d.name = ColumnText(stmt, 1);
            d.ip_address = ColumnText(stmt, 2);
            d.mac_address = ColumnText(stmt, 3);
            d.hostname = ColumnText(stmt, 4);
            d.manufacturer = ColumnText(stmt, 5);
            d.device_type = ColumnText(stmt, 6);
            d.port = ColumnText(stmt, 7);
            d.discovery_method = ColumnText(stmt, 8);
            return d;
        }

        const char *DEVICE_COLUMNS =
            "id, device_name, device_ip, mac_address, hostname, manufacturer, device_type, port, discovery_method";
    }

    SqliteInventory::SqliteInventory() : db_(nullptr) {}

    SqliteInventory::~SqliteInventory()
    {
        Shutdown();
    }

    bool SqliteInventory::Exec(const char *sql)
    {
        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[Inventory] SQL error: " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool SqliteInventory::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::cerr << "[Inventory] Open failed: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS devices ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "device_name TEXT NOT NULL, "
            "device_ip TEXT, "
            "mac_address TEXT DEFAULT 'N/A', "
            "hostname TEXT DEFAULT 'Unknown', "
            "manufacturer TEXT DEFAULT 'Unknown', "
            "device_type TEXT DEFAULT '', "
            "port TEXT DEFAULT '', "
            "discovery_method TEXT DEFAULT '', "
            "first_seen DATETIME DEFAULT CURRENT_TIMESTAMP, "
            "last_seen DATETIME DEFAULT CURRENT_TIMESTAMP"
            ");"

            "CREATE INDEX IF NOT EXISTS idx_devices_ip ON devices(device_ip);"
            "CREATE INDEX IF NOT EXISTS idx_devices_mac ON devices(mac_address);"

            "CREATE TABLE IF NOT EXISTS switch_topology ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "local_switch_ip TEXT NOT NULL, "
            "local_port TEXT DEFAULT '', "
            "remote_hostname TEXT DEFAULT '', "
            "remote_ip TEXT DEFAULT '', "
            "remote_port TEXT DEFAULT '', "
            "protocol TEXT DEFAULT '', "
            "discovered_at DATETIME DEFAULT CURRENT_TIMESTAMP, "
            "UNIQUE(local_switch_ip, local_port, remote_hostname)"
            ");";

        if (!Exec(sql_tables))
            return false;

        std::cout << "[Inventory] Opened " << db_path << "\n";
        return true;
    }

    void SqliteInventory::Shutdown()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    std::optional<DeviceRecord> SqliteInventory::FindDevice(const char *column, const std::string &value)
    {
        const std::string sql = std::string("SELECT ") + DEVICE_COLUMNS + " FROM devices WHERE " + column +
                                " = ? ORDER BY id LIMIT 1;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            throw InventoryError(sqlite3_errmsg(db_));

        sqlite3_bind_text(stmt, 1, value.c_str(), -1, SQLITE_TRANSIENT);
        std::optional<DeviceRecord> result;
        if (sqlite3_step(stmt) == SQLITE_ROW)
            result = ReadDevice(stmt);
        sqlite3_finalize(stmt);
        return result;
    }

    void SqliteInventory::UpdateDevice(const DeviceRecord &existing, const EndHost &host)
    {
        DeviceRecord d = existing;
        if (!host.mac.empty() && (d.mac_address.empty() || d.mac_address == "N/A"))
            d.mac_address = host.mac;
        if (host.address && d.ip_address != *host.address)
            d.ip_address = *host.address;
        if (!host.port_name.empty())
            d.port = host.port_name;
        if (d.device_type.empty())
            d.device_type = "Network Device";
        if (d.name.empty() || StartsWith(d.name, "Device-"))
            d.name = "Device-" + d.ip_address;

        const char *sql = "UPDATE devices SET device_name = ?, device_ip = ?, mac_address = ?, device_type = ?, "
                          "port = ?, discovery_method = 'topology', last_seen = CURRENT_TIMESTAMP WHERE id = ?;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            throw InventoryError(sqlite3_errmsg(db_));

        sqlite3_bind_text(stmt, 1, d.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, d.ip_address.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, d.mac_address.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, d.device_type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, d.port.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 6, d.id);

        bool ok = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        if (!ok)
            throw InventoryError(sqlite3_errmsg(db_));
    }

    void SqliteInventory::InsertDevice(const EndHost &host)
    {
        const std::string ip = host.address.value_or("");
        const std::string name = "Device-" + ip;
        const std::string mac = host.mac.empty() ? "N/A" : host.mac;

        const char *sql = "INSERT INTO devices (device_name, device_ip, mac_address, device_type, port, discovery_method) "
                          "VALUES (?, ?, ?, 'Network Device', ?, 'topology');";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            throw InventoryError(sqlite3_errmsg(db_));

        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, ip.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, mac.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, host.port_name.c_str(), -1, SQLITE_TRANSIENT);

        bool ok = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        if (!ok)
            throw InventoryError(sqlite3_errmsg(db_));
    }

    void SqliteInventory::SaveEdges(const TopologyWalkResult &sw)
    {
        const char *sql = "INSERT OR REPLACE INTO switch_topology "
                          "(local_switch_ip, local_port, remote_hostname, remote_ip, remote_port, protocol) "
                          "VALUES (?, ?, ?, ?, ?, ?);";

        for (const auto &n : sw.neighbors)
        {
            sqlite3_stmt *stmt;
            if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
                throw InventoryError(sqlite3_errmsg(db_));

            const std::string remote_ip = n.address.value_or("");
            sqlite3_bind_text(stmt, 1, sw.switch_address.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, n.local_port.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, n.device_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 4, remote_ip.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 5, n.remote_port.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 6, n.protocol.c_str(), -1, SQLITE_TRANSIENT);

            bool ok = (sqlite3_step(stmt) == SQLITE_DONE);
            sqlite3_finalize(stmt);
            if (!ok)
                throw InventoryError(sqlite3_errmsg(db_));
        }
    }

    PersistCounts SqliteInventory::PersistTopology(const std::vector<TopologyWalkResult> &switches)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            throw InventoryError("Inventory database is not open");

        PersistCounts counts;
        std::set<std::pair<std::string, std::string>> seen;

        if (!Exec("BEGIN TRANSACTION;"))
            throw InventoryError("Could not begin transaction");

        try
        {
            for (const auto &sw : switches)
            {
                SaveEdges(sw);

                for (const auto &host : sw.end_hosts)
                {
                    const std::string ip = host.address.value_or("");
                    if (ip.empty() && host.mac.empty())
                        continue;
                    if (!seen.insert({ip, host.mac}).second)
                        continue;

                    std::optional<DeviceRecord> existing;
                    if (!ip.empty())
                        existing = FindDevice("device_ip", ip);
                    if (!existing && !host.mac.empty())
                        existing = FindDevice("mac_address", host.mac);

                    if (existing)
                    {
                        UpdateDevice(*existing, host);
                        ++counts.updated;
                    }
                    else if (!ip.empty())
                    {
                        InsertDevice(host);
                        ++counts.inserted;
                    }
                }
            }
        }
        catch (const InventoryError &)
        {
            Exec("ROLLBACK;");
            throw;
        }

        if (!Exec("COMMIT;"))
            throw InventoryError("Commit failed");

        std::cout << "[Inventory] Topology persisted: " << counts.inserted << " inserted, "
                  << counts.updated << " updated\n";
        return counts;
    }

    std::vector<DeviceRecord> SqliteInventory::GetDevices()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<DeviceRecord> devices;
        if (!db_)
            return devices;

        const std::string sql = std::string("SELECT ") + DEVICE_COLUMNS + " FROM devices ORDER BY id;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            return devices;
        while (sqlite3_step(stmt) == SQLITE_ROW)
            devices.push_back(ReadDevice(stmt));
        sqlite3_finalize(stmt);
        return devices;
    }

    std::vector<TopologyEdge> SqliteInventory::GetEdges()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<TopologyEdge> edges;
        if (!db_)
            return edges;

        const char *sql = "SELECT local_switch_ip, local_port, remote_hostname, remote_ip, remote_port, protocol "
                          "FROM switch_topology ORDER BY id;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return edges;
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            TopologyEdge e;
            e.local_switch_ip = ColumnText(stmt, 0);
            e.local_port = ColumnText(stmt, 1);
            e.remote_hostname = ColumnText(stmt, 2);
            e.remote_ip = ColumnText(stmt, 3);
            e.remote_port = ColumnText(stmt, 4);
            e.protocol = ColumnText(stmt, 5);
            edges.push_back(e);
        }
        sqlite3_finalize(stmt);
        return edges;
    }
}
