#include <gtest/gtest.h>
#include "../engine/HostProber.hpp"
#include "../engine/NameResolver.hpp"
#include "../engine/Socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <sstream>

namespace net_survey::engine {

namespace {

void AppendLabel(std::vector<uint8_t> &out, const std::string &label) {
    out.push_back(static_cast<uint8_t>(label.size()));
    out.insert(out.end(), label.begin(), label.end());
}

std::vector<uint8_t> NetbiosReply(const std::vector<std::pair<std::string, bool>> &names) {
    std::vector<uint8_t> reply = {0x12, 0x34, 0x84, 0x00, 0, 0, 0, 1, 0, 0, 0, 0};
    reply.push_back(0x20);
    reply.push_back('C');
    reply.push_back('K');
    for (int i = 0; i < 30; ++i)
        reply.push_back('A');
    reply.push_back(0x00);
    // type NBSTAT, class IN, ttl, rdlength (unchecked)
    std::vector<uint8_t> fixed = {0x00, 0x21, 0x00, 0x01, 0, 0, 0, 0, 0x00, 0x41};
    reply.insert(reply.end(), fixed.begin(), fixed.end());

    reply.push_back(static_cast<uint8_t>(names.size()));
    for (const auto &entry : names) {
        std::string padded = entry.first;
        padded.resize(15, ' ');
        reply.insert(reply.end(), padded.begin(), padded.end());
        reply.push_back(0x00);
        reply.push_back(entry.second ? 0x84 : 0x04);
        reply.push_back(0x00);
    }
    return reply;
}

}

TEST(ArpTableTest, SkipsHeaderAndIncompleteEntries) {
    std::istringstream in(
        "IP address       HW type     Flags       HW address            Mask     Device\n"
        "192.168.1.1      0x1         0x2         aa:bb:cc:00:11:22     *        eth0\n"
        "192.168.1.9      0x1         0x0         00:00:00:00:00:00     *        eth0\n"
        "192.168.1.20     0x1         0x2         3c:d9:2b:01:02:03     *        wlan0\n");

    auto entries = ParseArpTable(in);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].ip, "192.168.1.1");
    EXPECT_EQ(entries[0].mac, "AA:BB:CC:00:11:22");
    EXPECT_EQ(entries[1].device, "wlan0");
}

TEST(ArpTableTest, MissingTableYieldsNoMac) {
    EXPECT_FALSE(LookupArpMac("192.168.1.1", "/nonexistent/arp").has_value());
}

TEST(NetbiosTest, StatusQueryEncodesWildcardName) {
    auto query = BuildNetbiosStatusQuery(0xBEEF);
    ASSERT_EQ(query.size(), 12u + 34u + 4u);
    EXPECT_EQ(query[0], 0xBE);
    EXPECT_EQ(query[1], 0xEF);
    EXPECT_EQ(query[12], 0x20);
    EXPECT_EQ(query[13], 'C');
    EXPECT_EQ(query[14], 'K');
    EXPECT_EQ(query[query.size() - 3], 0x21);
}

TEST(NetbiosTest, FirstUniqueNameWins) {
    auto reply = NetbiosReply({{"WORKGROUP", true}, {"FILESRV01", false}, {"OTHER", false}});
    EXPECT_EQ(ParseNetbiosStatusResponse(reply), std::optional<std::string>("FILESRV01"));
}

TEST(NetbiosTest, GroupOnlyOrTruncatedRepliesHaveNoName) {
    EXPECT_FALSE(ParseNetbiosStatusResponse(NetbiosReply({{"WORKGROUP", true}})).has_value());

    auto reply = NetbiosReply({{"FILESRV01", false}});
    reply.resize(reply.size() - 5);
    EXPECT_FALSE(ParseNetbiosStatusResponse(reply).has_value());
    EXPECT_FALSE(ParseNetbiosStatusResponse({0x00, 0x01}).has_value());
}

TEST(MdnsTest, ReverseNames) {
    EXPECT_EQ(ReverseArpaName("192.168.1.20"), "20.1.168.192.in-addr.arpa");

    auto query = BuildMdnsReverseQuery("10.0.0.7", 7);
    std::vector<uint8_t> expected_name;
    for (const char *label : {"7", "0", "0", "10", "in-addr", "arpa"})
        AppendLabel(expected_name, label);
    expected_name.push_back(0);
    ASSERT_GE(query.size(), 12u + expected_name.size());
    EXPECT_TRUE(std::equal(expected_name.begin(), expected_name.end(), query.begin() + 12));
}

TEST(MdnsTest, PtrAnswerStripsLocalSuffix) {
    std::vector<uint8_t> reply = {0, 0, 0x84, 0x00, 0, 1, 0, 1, 0, 0, 0, 0};
    for (const char *label : {"20", "1", "168", "192", "in-addr", "arpa"})
        AppendLabel(reply, label);
    reply.push_back(0);
    reply.insert(reply.end(), {0x00, 0x0C, 0x00, 0x01});

    std::vector<uint8_t> rdata;
    AppendLabel(rdata, "printer-3f");
    AppendLabel(rdata, "local");
    rdata.push_back(0);

    reply.insert(reply.end(), {0xC0, 0x0C, 0x00, 0x0C, 0x00, 0x01, 0, 0, 0x0E, 0x10, 0x00,
                               static_cast<uint8_t>(rdata.size())});
    reply.insert(reply.end(), rdata.begin(), rdata.end());

    EXPECT_EQ(ParseMdnsPtrResponse(reply), std::optional<std::string>("printer-3f"));
}

TEST(MdnsTest, RepliesWithoutAnswersHaveNoName) {
    std::vector<uint8_t> reply = {0, 0, 0x84, 0x00, 0, 0, 0, 0, 0, 0, 0, 0};
    EXPECT_FALSE(ParseMdnsPtrResponse(reply).has_value());
    EXPECT_FALSE(ParseMdnsPtrResponse({0x00}).has_value());
}

TEST(HttpResponseTest, SplitsStatusAndBody) {
    auto r = ParseHttpResponse("HTTP/1.0 200 OK\r\nContent-Type: application/json\r\n\r\n{\"a\":1}");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->status, 200);
    EXPECT_EQ(r->body, "{\"a\":1}");

    EXPECT_FALSE(ParseHttpResponse("SSH-2.0-OpenSSH_9.6\r\n").has_value());
    EXPECT_FALSE(ParseHttpResponse("HTTP/1.1 abc\r\n\r\n").has_value());
}

TEST(AgentIdentityTest, ReadsKnownFields) {
    auto id = ParseAgentIdentity(
        R"({"hostname":"ws-17","mac_address":"AA:BB:CC:DD:EE:FF","agent_version":"2.1.0","os":"linux","extra":5})");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->hostname, "ws-17");
    EXPECT_EQ(id->mac, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(id->agent_version, "2.1.0");
    EXPECT_EQ(id->os, "linux");
}

TEST(AgentIdentityTest, RejectsNonObjects) {
    EXPECT_FALSE(ParseAgentIdentity("not json").has_value());
    EXPECT_FALSE(ParseAgentIdentity("[1,2,3]").has_value());

    auto partial = ParseAgentIdentity(R"({"hostname":42})");
    ASSERT_TRUE(partial.has_value());
    EXPECT_EQ(partial->hostname, "");
}

TEST(ServiceNameTest, KnownAndUnknownPorts) {
    EXPECT_EQ(ServiceName(22), "SSH");
    EXPECT_EQ(ServiceName(9100), "JetDirect");
    EXPECT_EQ(ServiceName(5002), "Management Agent");
    EXPECT_EQ(ServiceName(4444), "Unknown");
    EXPECT_EQ(DefaultPorts().size(), 20u);
}

TEST(TcpProbeTest, FindsListeningLoopbackPort) {
    int listener = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listener, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(bind(listener, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(listen(listener, 4), 0);
    socklen_t len = sizeof(addr);
    getsockname(listener, reinterpret_cast<sockaddr *>(&addr), &len);
    uint16_t open_port = ntohs(addr.sin_port);

    int closed = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in closed_addr{};
    closed_addr.sin_family = AF_INET;
    closed_addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    bind(closed, reinterpret_cast<sockaddr *>(&closed_addr), sizeof(closed_addr));
    len = sizeof(closed_addr);
    getsockname(closed, reinterpret_cast<sockaddr *>(&closed_addr), &len);
    uint16_t closed_port = ntohs(closed_addr.sin_port);
    close(closed);

    auto open = ProbeTcpPorts("127.0.0.1", {open_port, closed_port}, 500);
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0], open_port);
    EXPECT_TRUE(IsTcpPortOpen("127.0.0.1", open_port, 500));

    close(listener);
}

}
