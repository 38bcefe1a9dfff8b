#include <gtest/gtest.h>
#include "../engine/SnmpClient.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <map>
#include <mutex>
#include <thread>

namespace net_survey::engine {

namespace {

// Answers GET and GET-NEXT from a fixed table on 127.0.0.1.
class FakeAgent {
public:
    explicit FakeAgent(std::map<Oid, SnmpValue> table, bool silent = false)
        : m_table(std::move(table)), m_silent(silent) {
        m_fd = socket(AF_INET, SOCK_DGRAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(m_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        getsockname(m_fd, reinterpret_cast<sockaddr *>(&addr), &len);
        m_port = ntohs(addr.sin_port);
        m_thread = std::thread([this] { Serve(); });
    }

    ~FakeAgent() {
        m_running = false;
        m_thread.join();
        close(m_fd);
    }

    uint16_t Port() const { return m_port; }
    int Requests() const { return m_requests.load(); }
    std::string LastCommunity() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_community;
    }

private:
    void Serve() {
        while (m_running) {
            pollfd pfd{m_fd, POLLIN, 0};
            if (poll(&pfd, 1, 20) <= 0)
                continue;

            uint8_t buf[1500];
            sockaddr_in peer{};
            socklen_t peer_len = sizeof(peer);
            ssize_t n = recvfrom(m_fd, buf, sizeof(buf), 0, reinterpret_cast<sockaddr *>(&peer), &peer_len);
            if (n <= 0)
                continue;
            ++m_requests;
            if (m_silent)
                continue;

            SnmpMessage request = DecodeMessage(std::vector<uint8_t>(buf, buf + n));
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_last_community = request.community;
            }

            SnmpMessage response;
            response.version = request.version;
            response.community = request.community;
            response.request_id = request.request_id;
            response.pdu_type = ber::GetResponse;

            const Oid &asked = request.varbinds.at(0).oid;
            VarBind vb{asked, SnmpValue{}};
            if (request.pdu_type == ber::GetRequest) {
                auto it = m_table.find(asked);
                if (it != m_table.end())
                    vb.value = it->second;
                else
                    vb.value.type = ber::NoSuchInstance;
            } else {
                auto it = m_table.upper_bound(asked);
                if (it != m_table.end()) {
                    vb.oid = it->first;
                    vb.value = it->second;
                } else {
                    vb.value.type = ber::EndOfMibView;
                }
            }
            response.varbinds.push_back(vb);

            auto out = EncodeMessage(response);
            sendto(m_fd, out.data(), out.size(), 0, reinterpret_cast<sockaddr *>(&peer), peer_len);
        }
    }

    std::map<Oid, SnmpValue> m_table;
    bool m_silent;
    int m_fd = -1;
    uint16_t m_port = 0;
    std::atomic<bool> m_running{true};
    std::atomic<int> m_requests{0};
    std::mutex m_mutex;
    std::string m_last_community;
    std::thread m_thread;
};

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

SnmpCredentials Credentials(uint16_t port, int timeout_ms = 500, int retries = 1) {
    SnmpCredentials c;
    c.community = "lab";
    c.port = port;
    c.timeout_ms = timeout_ms;
    c.retries = retries;
    return c;
}

}

class SnmpClientTest : public ::testing::Test {
protected:
    std::map<Oid, SnmpValue> Table() {
        return {
            {ParseOid("1.3.6.1.2.1.1.5.0"), Text("core-sw1")},
            {ParseOid("1.3.6.1.2.1.2.2.1.2.1"), Text("Gi0/1")},
            {ParseOid("1.3.6.1.2.1.2.2.1.2.2"), Text("Gi0/2")},
            {ParseOid("1.3.6.1.2.1.2.2.1.2.10"), Text("Gi0/10")},
            {ParseOid("1.3.6.1.2.1.2.2.1.3.1"), Number(6)},
        };
    }
};

TEST_F(SnmpClientTest, GetReturnsValue) {
    FakeAgent agent(Table());
    SnmpClient client(Credentials(agent.Port()));

    auto value = client.Get("127.0.0.1", ParseOid("1.3.6.1.2.1.1.5.0"));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->AsString(), "core-sw1");
    EXPECT_EQ(agent.LastCommunity(), "lab");
}

TEST_F(SnmpClientTest, GetOfMissingObjectIsEmpty) {
    FakeAgent agent(Table());
    SnmpClient client(Credentials(agent.Port()));

    EXPECT_FALSE(client.Get("127.0.0.1", ParseOid("1.3.6.1.2.1.1.6.0")).has_value());
}

TEST_F(SnmpClientTest, WalkStopsAtEndOfSubtree) {
    FakeAgent agent(Table());
    SnmpClient client(Credentials(agent.Port()));

    auto rows = client.Walk("127.0.0.1", ParseOid("1.3.6.1.2.1.2.2.1.2"));
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].value.AsString(), "Gi0/1");
    EXPECT_EQ(rows[1].value.AsString(), "Gi0/2");
    EXPECT_EQ(rows[2].value.AsString(), "Gi0/10");
    EXPECT_EQ(OidToString(rows[2].oid), "1.3.6.1.2.1.2.2.1.2.10");
}

TEST_F(SnmpClientTest, WalkPastTheLastObjectIsEmpty) {
    FakeAgent agent(Table());
    SnmpClient client(Credentials(agent.Port()));

    EXPECT_TRUE(client.Walk("127.0.0.1", ParseOid("1.3.6.1.4.1")).empty());
}

TEST_F(SnmpClientTest, SilentAgentTimesOutAfterRetries) {
    FakeAgent agent({}, true);
    SnmpClient client(Credentials(agent.Port(), 100, 1));

    EXPECT_THROW(client.Get("127.0.0.1", ParseOid("1.3.6.1.2.1.1.5.0")), SnmpError);
    EXPECT_EQ(agent.Requests(), 2);
}

TEST(SnmpClientConstructionTest, RejectsUnsupportedVersions) {
    SnmpCredentials c;
    c.version = "3";
    EXPECT_THROW(SnmpClient client(c), SnmpError);
}

}
