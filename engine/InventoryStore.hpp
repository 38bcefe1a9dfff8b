#pragma once

#include "Types.hpp"

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace net_survey::engine
{
    class InventoryError : public std::runtime_error
    {
    public:
        explicit InventoryError(const std::string &what) : std::runtime_error(what) {}
    };

    struct PersistCounts
    {
        int inserted = 0;
        int updated = 0;
    };

    struct DeviceRecord
    {
        int id = 0;
        std::string name;
        std::string ip_address;
        std::string mac_address;
        std::string hostname;
        std::string manufacturer;
        std::string device_type;
        std::string port;
        std::string discovery_method;
    };

    struct TopologyEdge
    {
        std::string local_switch_ip;
        std::string local_port;
        std::string remote_hostname;
        std::string remote_ip;
        std::string remote_port;
        std::string protocol;
    };

    class InventoryStore
    {
    public:
        virtual ~InventoryStore() = default;

        // Upserts walk end hosts and neighbor edges. Throws InventoryError.
        virtual PersistCounts PersistTopology(const std::vector<TopologyWalkResult> &switches) = 0;
    };

    class SqliteInventory : public InventoryStore
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;

        bool Exec(const char *sql);
        std::optional<DeviceRecord> FindDevice(const char *column, const std::string &value);
        void UpdateDevice(const DeviceRecord &existing, const EndHost &host);
        void InsertDevice(const EndHost &host);
        void SaveEdges(const TopologyWalkResult &sw);

    public:
        SqliteInventory();
        ~SqliteInventory() override;

        SqliteInventory(const SqliteInventory &) = delete;
        SqliteInventory &operator=(const SqliteInventory &) = delete;

        // ":memory:" is accepted.
        bool Initialize(const std::string &db_path);
        void Shutdown();

        PersistCounts PersistTopology(const std::vector<TopologyWalkResult> &switches) override;

        std::vector<DeviceRecord> GetDevices();
        std::vector<TopologyEdge> GetEdges();
    };
}
