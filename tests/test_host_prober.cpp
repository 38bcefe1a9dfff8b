#include <gtest/gtest.h>
#include "../engine/HostProber.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <deque>
#include <stdexcept>
#include <thread>

namespace net_survey::engine {

namespace {

// Answers echoes from a fixed script instead of the network.
class ScriptedProber : public NetworkHostProber {
public:
    explicit ScriptedProber(ProberOptions options) : NetworkHostProber(std::move(options), nullptr) {}

    std::deque<std::optional<double>> replies;
    std::string fail_with;
    int echoes = 0;

protected:
    std::optional<double> Echo(const std::string &, int) override {
        ++echoes;
        if (!fail_with.empty())
            throw std::runtime_error(fail_with);
        if (replies.empty())
            return std::nullopt;
        auto reply = replies.front();
        replies.pop_front();
        return reply;
    }
};

// TCP listener on 127.0.0.1. With a response set, every request is answered
// with it; otherwise connections are accepted and closed.
class LoopbackServer {
public:
    explicit LoopbackServer(std::string response = "") : m_response(std::move(response)) {
        m_fd = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        bind(m_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        listen(m_fd, 8);
        socklen_t len = sizeof(addr);
        getsockname(m_fd, reinterpret_cast<sockaddr *>(&addr), &len);
        m_port = ntohs(addr.sin_port);
        m_thread = std::thread([this] { Serve(); });
    }

    ~LoopbackServer() {
        m_running = false;
        m_thread.join();
        close(m_fd);
    }

    uint16_t Port() const { return m_port; }

private:
    void Serve() {
        while (m_running) {
            pollfd pfd{m_fd, POLLIN, 0};
            if (poll(&pfd, 1, 20) <= 0)
                continue;
            int client = accept(m_fd, nullptr, nullptr);
            if (client < 0)
                continue;
            Answer(client);
            close(client);
        }
    }

    void Answer(int client) {
        std::string request;
        char buffer[1024];
        while (request.find("\r\n\r\n") == std::string::npos) {
            pollfd pfd{client, POLLIN, 0};
            if (poll(&pfd, 1, 500) <= 0)
                return;
            ssize_t n = recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0)
                return;
            request.append(buffer, static_cast<size_t>(n));
        }
        if (!m_response.empty())
            send(client, m_response.data(), m_response.size(), MSG_NOSIGNAL);
    }

    std::string m_response;
    int m_fd = -1;
    uint16_t m_port = 0;
    std::atomic<bool> m_running{true};
    std::thread m_thread;
};

uint16_t ClosedPort() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
    close(fd);
    return ntohs(addr.sin_port);
}

std::string IdentityResponse() {
    const std::string body = R"({"hostname":"lab-agent","mac_address":"AA:BB:CC:00:11:22",)"
                             R"("agent_version":"1.4.0","os":"Linux"})";
    return "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: " +
           std::to_string(body.size()) + "\r\n\r\n" + body;
}

}

class HostProberTest : public ::testing::Test {
protected:
    ProberOptions Options() {
        ProberOptions o;
        o.probe_timeout_ms = 500;
        o.probe_count = 4;
        o.port_timeout_ms = 300;
        o.name_timeout_ms = 50;
        o.arp_path = "/nonexistent/arp";
        o.agent_port = ClosedPort();
        o.ports = {ClosedPort()};
        return o;
    }
};

TEST_F(HostProberTest, LatencyIsTheMeanOfAnsweredEchoes) {
    ScriptedProber prober(Options());
    prober.replies = {10.0, std::nullopt, 20.0, std::nullopt};

    LivenessResult result = prober.Probe("10.0.0.5", 500, 4);
    EXPECT_EQ(result.liveness, Liveness::Online);
    EXPECT_EQ(result.latency_ms, std::optional<double>(15.0));
    EXPECT_DOUBLE_EQ(result.packet_loss, 50.0);
    EXPECT_EQ(prober.echoes, 4);
}

TEST_F(HostProberTest, OneAnswerInFourIsSeventyFivePercentLoss) {
    ScriptedProber prober(Options());
    prober.replies = {std::nullopt, std::nullopt, std::nullopt, 7.126};

    LivenessResult result = prober.Probe("10.0.0.5", 500, 4);
    EXPECT_EQ(result.liveness, Liveness::Online);
    ASSERT_TRUE(result.latency_ms.has_value());
    EXPECT_DOUBLE_EQ(*result.latency_ms, 7.13);
    EXPECT_DOUBLE_EQ(result.packet_loss, 75.0);
}

TEST_F(HostProberTest, UnansweredHostIsOffline) {
    ScriptedProber prober(Options());

    LivenessResult result = prober.Probe("10.0.0.5", 500, 4);
    EXPECT_EQ(result.liveness, Liveness::Offline);
    EXPECT_FALSE(result.latency_ms.has_value());
    EXPECT_DOUBLE_EQ(result.packet_loss, 100.0);
}

TEST_F(HostProberTest, NonPositiveCountSendsNothing) {
    ScriptedProber prober(Options());
    prober.replies = {1.0};

    for (int count : {0, -3}) {
        LivenessResult result = prober.Probe("10.0.0.5", 500, count);
        EXPECT_EQ(result.liveness, Liveness::Offline);
        EXPECT_DOUBLE_EQ(result.packet_loss, 100.0);
    }
    EXPECT_EQ(prober.echoes, 0);
}

TEST_F(HostProberTest, OfflineHostsAreNotInspectedFurther) {
    LoopbackServer plain;
    ProberOptions o = Options();
    o.ports = {plain.Port()};
    ScriptedProber prober(o);

    DiscoveredDevice d = prober.ScanHost("127.0.0.1");
    EXPECT_EQ(d.address, "127.0.0.1");
    EXPECT_EQ(d.liveness, Liveness::Offline);
    EXPECT_FALSE(d.mac.has_value());
    EXPECT_TRUE(d.open_ports.empty());
    EXPECT_FALSE(d.agent.has_value());
}

TEST_F(HostProberTest, AgentIdentityOverridesNameAndMacAndSkipsPortScan) {
    LoopbackServer agent(IdentityResponse());
    LoopbackServer plain;
    ProberOptions o = Options();
    o.agent_port = agent.Port();
    o.ports = {plain.Port()};
    ScriptedProber prober(o);
    prober.replies = {0.5, 0.5, 0.5, 0.5};

    DiscoveredDevice d = prober.ScanHost("127.0.0.1");
    EXPECT_EQ(d.liveness, Liveness::Online);
    ASSERT_TRUE(d.agent.has_value());
    EXPECT_EQ(d.agent->agent_version, "1.4.0");
    EXPECT_EQ(d.agent->os, "Linux");
    EXPECT_EQ(d.hostname, "lab-agent");
    EXPECT_EQ(d.mac, std::optional<std::string>("AA:BB:CC:00:11:22"));
    EXPECT_TRUE(d.open_ports.empty());
}

TEST_F(HostProberTest, HostsWithoutAgentGetAPortScan) {
    LoopbackServer plain;
    ProberOptions o = Options();
    const uint16_t closed = ClosedPort();
    o.ports = {closed, plain.Port()};
    ScriptedProber prober(o);
    prober.replies = {0.5, 0.5, 0.5, 0.5};

    DiscoveredDevice d = prober.ScanHost("127.0.0.1");
    EXPECT_EQ(d.liveness, Liveness::Online);
    EXPECT_FALSE(d.agent.has_value());
    ASSERT_EQ(d.open_ports.size(), 1u);
    EXPECT_EQ(d.open_ports[0].port, plain.Port());
    EXPECT_TRUE(d.open_ports[0].open);
    EXPECT_EQ(d.vendor, "Unknown");
}

TEST_F(HostProberTest, EchoFailureBecomesAnErrorRecord) {
    ScriptedProber prober(Options());
    prober.fail_with = "interface went away";

    DiscoveredDevice d = prober.ScanHost("10.0.0.9");
    EXPECT_EQ(d.address, "10.0.0.9");
    EXPECT_EQ(d.liveness, Liveness::Error);
    EXPECT_EQ(d.error, "interface went away");
    EXPECT_FALSE(d.latency_ms.has_value());
}

}
