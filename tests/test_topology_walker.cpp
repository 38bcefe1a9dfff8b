#include <gtest/gtest.h>
#include "../engine/TopologyWalker.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace net_survey::engine {

namespace {

Oid Join(const Oid &prefix, const Oid &suffix) {
    Oid out = prefix;
    out.insert(out.end(), suffix.begin(), suffix.end());
    return out;
}

SnmpValue Text(const std::string &s) {
    SnmpValue v;
    v.type = ber::OctetString;
    v.bytes = s;
    return v;
}

SnmpValue Number(int64_t n) {
    SnmpValue v;
    v.type = ber::Integer;
    v.number = n;
    return v;
}

SnmpValue Raw(std::initializer_list<uint8_t> bytes) {
    SnmpValue v;
    v.type = ber::OctetString;
    v.bytes.assign(bytes.begin(), bytes.end());
    return v;
}

// Dotted quad as four OID-style parts.
Oid IpParts(const std::string &ip) {
    return ParseOid(ip);
}

// In-memory agents keyed by address. Walks of roots listed in `failing`
// throw the way a timed-out agent would.
class ScriptedSession : public SnmpSession {
public:
    std::vector<VarBind> Walk(const std::string &host, const Oid &root) override {
        ++walks[host];
        if (failing.count({host, root}))
            throw SnmpError("Timeout waiting for " + host);
        std::vector<VarBind> rows;
        auto &table = agents[host];
        for (auto it = table.upper_bound(root); it != table.end() && OidStartsWith(it->first, root); ++it)
            rows.push_back({it->first, it->second});
        return rows;
    }

    std::optional<SnmpValue> Get(const std::string &host, const Oid &oid) override {
        auto &table = agents[host];
        auto it = table.find(oid);
        if (it == table.end())
            return std::nullopt;
        return it->second;
    }

    void Set(const std::string &host, const Oid &oid, const SnmpValue &value) { agents[host][oid] = value; }

    void CdpNeighbor(const std::string &host, int if_index, int dev_index, const std::string &name,
                     const std::string &ip, uint8_t caps) {
        Oid idx{static_cast<uint32_t>(if_index), static_cast<uint32_t>(dev_index)};
        Set(host, Join(mib::CDP_DEVICE_ID, idx), Text(name));
        Oid p = IpParts(ip);
        Set(host, Join(mib::CDP_ADDRESS, idx),
            Raw({static_cast<uint8_t>(p[0]), static_cast<uint8_t>(p[1]), static_cast<uint8_t>(p[2]),
                 static_cast<uint8_t>(p[3])}));
        Set(host, Join(mib::CDP_DEVICE_PORT, idx), Text("Gi0/24"));
        Set(host, Join(mib::CDP_CAPABILITIES, idx), Raw({0, 0, 0, caps}));
    }

    void LldpNeighbor(const std::string &host, int local_port, const std::string &name, const std::string &ip,
                      bool bridge) {
        Oid idx{0, static_cast<uint32_t>(local_port), 1};
        Set(host, Join(mib::LLDP_REM_SYS_NAME, idx), Text(name));
        Set(host, Join(mib::LLDP_REM_PORT_ID, idx), Text("ge-0/0/1"));
        Set(host, Join(mib::LLDP_REM_CAP_ENABLED, idx), Raw({static_cast<uint8_t>(bridge ? 0x20 : 0x80), 0}));
        Oid p = IpParts(ip);
        Set(host, Join(mib::LLDP_REM_MAN_ADDR, Join(idx, {1, 4, p[0], p[1], p[2], p[3]})), Number(2));
    }

    void Interface(const std::string &host, int if_index, const std::string &name) {
        Set(host, Join(mib::IF_NAME, {static_cast<uint32_t>(if_index)}), Text(name));
    }

    void LearnedMac(const std::string &host, const Oid &mac, int bridge_port, int if_index, int status = 3) {
        Set(host, Join(mib::FDB_ADDRESS, mac), Raw({}));
        Set(host, Join(mib::FDB_PORT, mac), Number(bridge_port));
        Set(host, Join(mib::FDB_STATUS, mac), Number(status));
        Set(host, Join(mib::BASE_PORT_IFINDEX, {static_cast<uint32_t>(bridge_port)}), Number(if_index));
    }

    void Arp(const std::string &host, int if_index, const std::string &ip, std::initializer_list<uint8_t> mac) {
        Oid p = IpParts(ip);
        Set(host, Join(mib::IP_NET_TO_MEDIA_PHYS, {static_cast<uint32_t>(if_index), p[0], p[1], p[2], p[3]}),
            Raw(mac));
    }

    std::map<std::string, std::map<Oid, SnmpValue>> agents;
    std::set<std::pair<std::string, Oid>> failing;
    std::map<std::string, int> walks;
};

}

class TopologyWalkerTest : public ::testing::Test {
protected:
    // Three switches that all see each other over CDP.
    void BuildMesh() {
        session.Set("10.0.0.1", mib::SYS_NAME, Text("core"));
        session.CdpNeighbor("10.0.0.1", 1, 1, "dist-a", "10.0.0.2", 0x08);
        session.CdpNeighbor("10.0.0.1", 2, 1, "dist-b", "10.0.0.3", 0x08);

        session.Set("10.0.0.2", mib::SYS_NAME, Text("dist-a"));
        session.CdpNeighbor("10.0.0.2", 1, 1, "core", "10.0.0.1", 0x08);
        session.CdpNeighbor("10.0.0.2", 2, 1, "dist-b", "10.0.0.3", 0x08);

        session.Set("10.0.0.3", mib::SYS_NAME, Text("dist-b"));
        session.CdpNeighbor("10.0.0.3", 1, 1, "core", "10.0.0.1", 0x08);
        session.CdpNeighbor("10.0.0.3", 2, 1, "dist-a", "10.0.0.2", 0x08);
    }

    ScriptedSession session;
};

TEST_F(TopologyWalkerTest, CyclicMeshVisitsEachSwitchOnce) {
    BuildMesh();
    TopologyWalker walker(session);

    std::vector<std::size_t> visited_counts;
    auto switches = walker.Discover("10.0.0.1", 3, 50, [&](const WalkProgress &p, const TopologyWalkResult &) {
        visited_counts.push_back(p.visited);
    });

    ASSERT_EQ(switches.size(), 3u);
    std::set<std::string> addresses;
    for (const auto &s : switches)
        addresses.insert(s.switch_address);
    EXPECT_EQ(addresses.size(), 3u);

    EXPECT_EQ(switches[0].switch_address, "10.0.0.1");
    EXPECT_EQ(switches[0].depth, 0);
    EXPECT_EQ(switches[0].sys_name, "core");
    EXPECT_EQ(switches[1].depth, 1);
    EXPECT_EQ(switches[2].depth, 1);
    EXPECT_EQ(visited_counts, (std::vector<std::size_t>{1, 2, 3}));
}

TEST_F(TopologyWalkerTest, DepthZeroInspectsOnlyTheSeed) {
    BuildMesh();
    TopologyWalker walker(session);

    auto switches = walker.Discover("10.0.0.1", 0, 50);
    ASSERT_EQ(switches.size(), 1u);
    EXPECT_EQ(switches[0].neighbors.size(), 2u);
    EXPECT_EQ(session.walks.count("10.0.0.2"), 0u);
}

TEST_F(TopologyWalkerTest, MaxSwitchesBoundsTheWalk) {
    BuildMesh();
    TopologyWalker walker(session);

    EXPECT_EQ(walker.Discover("10.0.0.1", 3, 2).size(), 2u);
}

TEST_F(TopologyWalkerTest, InvalidSeedYieldsNothing) {
    TopologyWalker walker(session);
    EXPECT_TRUE(walker.Discover("core-switch", 3, 50).empty());
    EXPECT_TRUE(session.walks.empty());
}

TEST_F(TopologyWalkerTest, NonSwitchNeighborsAreNotFollowed) {
    session.CdpNeighbor("10.0.0.1", 1, 1, "phone-1", "10.0.0.50", 0x80);
    TopologyWalker walker(session);

    auto switches = walker.Discover("10.0.0.1", 3, 50);
    ASSERT_EQ(switches.size(), 1u);
    ASSERT_EQ(switches[0].neighbors.size(), 1u);
    EXPECT_FALSE(switches[0].neighbors[0].is_switch);
}

TEST_F(TopologyWalkerTest, CdpIsPreferredOverLldp) {
    session.CdpNeighbor("10.0.0.1", 1, 1, "dist-a", "10.0.0.2", 0x08);
    session.LldpNeighbor("10.0.0.1", 5, "juniper-1", "10.0.0.9", true);
    TopologyWalker walker(session);

    auto result = walker.InspectSwitch("10.0.0.1");
    ASSERT_EQ(result.neighbors.size(), 1u);
    EXPECT_EQ(result.neighbors[0].protocol, "CDP");
    EXPECT_EQ(result.neighbors[0].device_id, "dist-a");
    EXPECT_EQ(result.neighbors[0].address, std::optional<std::string>("10.0.0.2"));
    EXPECT_EQ(result.neighbors[0].remote_port, "Gi0/24");
}

TEST_F(TopologyWalkerTest, LldpIsUsedWithoutCdp) {
    session.Interface("10.0.0.1", 5, "Gi1/0/5");
    session.LldpNeighbor("10.0.0.1", 5, "juniper-1", "10.0.0.9", true);
    TopologyWalker walker(session);

    auto result = walker.InspectSwitch("10.0.0.1");
    ASSERT_EQ(result.neighbors.size(), 1u);
    const auto &n = result.neighbors[0];
    EXPECT_EQ(n.protocol, "LLDP");
    EXPECT_EQ(n.device_id, "juniper-1");
    EXPECT_EQ(n.address, std::optional<std::string>("10.0.0.9"));
    EXPECT_EQ(n.local_port, "Gi1/0/5");
    EXPECT_TRUE(n.is_switch);
}

TEST_F(TopologyWalkerTest, EndHostsExcludeUplinksAndUnlearnedEntries) {
    session.Interface("10.0.0.1", 1, "Gi0/1");
    session.Interface("10.0.0.1", 7, "Gi0/7");
    session.CdpNeighbor("10.0.0.1", 1, 1, "dist-a", "10.0.0.2", 0x08);

    session.LearnedMac("10.0.0.1", {0, 17, 34, 51, 68, 85}, 7, 7);
    session.LearnedMac("10.0.0.1", {0, 26, 43, 60, 77, 94}, 1, 1);
    session.LearnedMac("10.0.0.1", {0, 1, 2, 3, 4, 5}, 8, 8, 4);
    session.Arp("10.0.0.1", 7, "10.0.0.77", {0x00, 0x11, 0x22, 0x33, 0x44, 0x55});
    TopologyWalker walker(session);

    auto result = walker.InspectSwitch("10.0.0.1");
    ASSERT_EQ(result.end_hosts.size(), 1u);
    const auto &host = result.end_hosts[0];
    EXPECT_EQ(host.mac, "00:11:22:33:44:55");
    EXPECT_EQ(host.if_index, std::optional<int>(7));
    EXPECT_EQ(host.port_name, "Gi0/7");
    EXPECT_EQ(host.address, std::optional<std::string>("10.0.0.77"));
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(TopologyWalkerTest, QueryFailuresAreRecordedNotThrown) {
    session.failing.insert({"10.0.0.1", mib::CDP_DEVICE_ID});
    session.failing.insert({"10.0.0.1", mib::FDB_ADDRESS});
    session.LldpNeighbor("10.0.0.1", 3, "juniper-1", "10.0.0.9", true);
    TopologyWalker walker(session);

    TopologyWalkResult result;
    ASSERT_NO_THROW(result = walker.InspectSwitch("10.0.0.1"));
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].rfind("CDP error", 0), 0u);
    EXPECT_EQ(result.errors[1].rfind("FDB error", 0), 0u);
    ASSERT_EQ(result.neighbors.size(), 1u);
    EXPECT_EQ(result.neighbors[0].protocol, "LLDP");
    EXPECT_TRUE(result.end_hosts.empty());
}

TEST_F(TopologyWalkerTest, ClassifiesFromSystemDescription) {
    session.Set("10.0.0.1", mib::SYS_NAME, Text("access-sw3"));
    session.Set("10.0.0.1", mib::SYS_DESCR, Text("Cisco Catalyst 2960-X, version 15.2"));
    DeviceClassifier classifier;
    TopologyWalker walker(session, &classifier);

    auto result = walker.InspectSwitch("10.0.0.1");
    ASSERT_TRUE(result.classification.has_value());
    EXPECT_EQ(result.classification->type, DeviceType::Switch);
}

TEST(TopologyHelpersTest, MacFromOidSuffixUsesTheLastSixParts) {
    EXPECT_EQ(MacFromOidSuffix({0, 26, 43, 60, 77, 94}), "00:1A:2B:3C:4D:5E");
    EXPECT_EQ(MacFromOidSuffix({9, 0, 26, 43, 60, 77, 94}), "00:1A:2B:3C:4D:5E");
    EXPECT_EQ(MacFromOidSuffix({1, 2, 3}), "");
    EXPECT_EQ(MacFromOidSuffix({0, 1, 2, 3, 4, 300}), "");
}

TEST(TopologyHelpersTest, UplinksAreSwitchFacingInterfaces) {
    Neighbor sw;
    sw.is_switch = true;
    sw.local_if_index = 4;
    Neighbor phone;
    phone.local_if_index = 9;
    Neighbor unknown_port;
    unknown_port.is_switch = true;

    EXPECT_EQ(UplinkInterfaces({sw, phone, unknown_port}), (std::set<int>{4}));
}

}
