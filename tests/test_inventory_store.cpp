#include <gtest/gtest.h>
#include "../engine/InventoryStore.hpp"

#include <sqlite3.h>

#include <cstdio>

namespace net_survey::engine {

namespace {

EndHost Host(const std::string &mac, std::optional<std::string> ip, const std::string &port = "Gi0/7") {
    EndHost h;
    h.mac = mac;
    h.address = std::move(ip);
    h.port_name = port;
    return h;
}

TopologyWalkResult Switch(const std::string &address, std::vector<EndHost> hosts) {
    TopologyWalkResult sw;
    sw.switch_address = address;
    sw.end_hosts = std::move(hosts);
    return sw;
}

}

class SqliteInventoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "net_survey_inventory_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".db";
        RemoveFiles();
        ASSERT_TRUE(inventory.Initialize(path));
    }

    void TearDown() override {
        inventory.Shutdown();
        RemoveFiles();
    }

    // Inserts a row the way an earlier discovery run would have left it.
    void Seed(const std::string &ip, const std::string &mac, const std::string &type) {
        sqlite3 *db = nullptr;
        ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
        const std::string sql = "INSERT INTO devices (device_name, device_ip, mac_address, device_type, "
                                "discovery_method) VALUES ('Device-" + ip + "', '" + ip + "', '" + mac +
                                "', '" + type + "', 'sweep');";
        EXPECT_EQ(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
        sqlite3_close(db);
    }

    void RemoveFiles() {
        for (const char *suffix : {"", "-wal", "-shm"})
            std::remove((path + suffix).c_str());
    }

    std::string path;
    SqliteInventory inventory;
};

TEST_F(SqliteInventoryTest, NewHostsWithAddressesAreInserted) {
    auto counts = inventory.PersistTopology({Switch("10.0.0.1", {Host("00:11:22:33:44:55", std::string("10.0.0.77"))})});
    EXPECT_EQ(counts.inserted, 1);
    EXPECT_EQ(counts.updated, 0);

    auto devices = inventory.GetDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].name, "Device-10.0.0.77");
    EXPECT_EQ(devices[0].ip_address, "10.0.0.77");
    EXPECT_EQ(devices[0].mac_address, "00:11:22:33:44:55");
    EXPECT_EQ(devices[0].device_type, "Network Device");
    EXPECT_EQ(devices[0].port, "Gi0/7");
    EXPECT_EQ(devices[0].discovery_method, "topology");
    EXPECT_EQ(devices[0].hostname, "Unknown");
}

TEST_F(SqliteInventoryTest, MacOnlyNewcomersAreSkipped) {
    auto counts = inventory.PersistTopology({Switch("10.0.0.1", {Host("00:11:22:33:44:55", std::nullopt)})});
    EXPECT_EQ(counts.inserted, 0);
    EXPECT_EQ(counts.updated, 0);
    EXPECT_TRUE(inventory.GetDevices().empty());
}

TEST_F(SqliteInventoryTest, ExistingDeviceMatchedByIpIsUpdated) {
    Seed("10.0.0.77", "N/A", "");

    auto counts = inventory.PersistTopology({Switch("10.0.0.1", {Host("00:11:22:33:44:55", std::string("10.0.0.77"))})});
    EXPECT_EQ(counts.inserted, 0);
    EXPECT_EQ(counts.updated, 1);

    auto devices = inventory.GetDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].mac_address, "00:11:22:33:44:55");
    EXPECT_EQ(devices[0].device_type, "Network Device");
    EXPECT_EQ(devices[0].discovery_method, "topology");
}

TEST_F(SqliteInventoryTest, ExistingDeviceMatchedByMacTakesTheNewAddress) {
    Seed("10.0.0.50", "AA:BB:CC:DD:EE:FF", "Printer");

    auto counts = inventory.PersistTopology({Switch("10.0.0.1", {Host("AA:BB:CC:DD:EE:FF", std::string("10.0.0.51"))})});
    EXPECT_EQ(counts.updated, 1);

    auto devices = inventory.GetDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].ip_address, "10.0.0.51");
    EXPECT_EQ(devices[0].name, "Device-10.0.0.51");
    EXPECT_EQ(devices[0].device_type, "Printer");
}

TEST_F(SqliteInventoryTest, MacOnlyHostUpdatesAKnownDevice) {
    Seed("10.0.0.50", "AA:BB:CC:DD:EE:FF", "Printer");

    auto counts = inventory.PersistTopology({Switch("10.0.0.1", {Host("AA:BB:CC:DD:EE:FF", std::nullopt, "Gi0/3")})});
    EXPECT_EQ(counts.updated, 1);
    auto devices = inventory.GetDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].ip_address, "10.0.0.50");
    EXPECT_EQ(devices[0].port, "Gi0/3");
}

TEST_F(SqliteInventoryTest, HostsSeenOnSeveralSwitchesAreCountedOnce) {
    auto host = Host("00:11:22:33:44:55", std::string("10.0.0.77"));
    auto counts = inventory.PersistTopology({Switch("10.0.0.1", {host}), Switch("10.0.0.2", {host})});
    EXPECT_EQ(counts.inserted, 1);
    EXPECT_EQ(counts.updated, 0);
    EXPECT_EQ(inventory.GetDevices().size(), 1u);
}

TEST_F(SqliteInventoryTest, RepeatedWalksUpdateInsteadOfDuplicating) {
    std::vector<TopologyWalkResult> walk = {Switch("10.0.0.1", {Host("00:11:22:33:44:55", std::string("10.0.0.77"))})};
    inventory.PersistTopology(walk);
    auto second = inventory.PersistTopology(walk);
    EXPECT_EQ(second.inserted, 0);
    EXPECT_EQ(second.updated, 1);
    EXPECT_EQ(inventory.GetDevices().size(), 1u);
}

TEST_F(SqliteInventoryTest, NeighborEdgesAreUpserted) {
    TopologyWalkResult sw = Switch("10.0.0.1", {});
    Neighbor n;
    n.device_id = "dist-a";
    n.address = "10.0.0.2";
    n.local_port = "Gi0/1";
    n.remote_port = "Gi0/24";
    n.protocol = "CDP";
    sw.neighbors.push_back(n);

    inventory.PersistTopology({sw});
    sw.neighbors[0].remote_port = "Gi0/23";
    inventory.PersistTopology({sw});

    auto edges = inventory.GetEdges();
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].local_switch_ip, "10.0.0.1");
    EXPECT_EQ(edges[0].remote_hostname, "dist-a");
    EXPECT_EQ(edges[0].remote_ip, "10.0.0.2");
    EXPECT_EQ(edges[0].remote_port, "Gi0/23");
    EXPECT_EQ(edges[0].protocol, "CDP");
}

TEST(SqliteInventoryClosedTest, PersistingWithoutADatabaseThrows) {
    SqliteInventory inventory;
    EXPECT_THROW(inventory.PersistTopology({}), InventoryError);
    EXPECT_TRUE(inventory.GetDevices().empty());
    EXPECT_TRUE(inventory.GetEdges().empty());
}

TEST(SqliteInventoryClosedTest, UnopenablePathFails) {
    SqliteInventory inventory;
    EXPECT_FALSE(inventory.Initialize("/nonexistent-dir/inventory.db"));
}

}
