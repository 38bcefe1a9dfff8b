#include "HostProber.hpp"
#include "Socket.hpp"

#include <tins/tins.h>
#include <nlohmann/json.hpp>
#include <spawn.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <numeric>

extern char **environ;

namespace net_survey::engine
{
    std::atomic<bool> NetworkHostProber::s_use_system_ping{false};
    std::atomic<uint16_t> NetworkHostProber::s_icmp_id{1};

    namespace
    {
        double RoundTo2(double value)
        {
            return std::round(value * 100.0) / 100.0;
        }
    }

    const std::vector<uint16_t> &DefaultPorts()
    {
        static const std::vector<uint16_t> ports = {21, 22, 23, 25, 53, 80, 110, 139, 443, 445,
                                                    515, 554, 631, 993, 995, 3306, 3389, 8080, 8443, 9100};
        return ports;
    }

    std::string ServiceName(uint16_t port)
    {
        static const std::map<uint16_t, std::string> services = {
            {21, "FTP"}, {22, "SSH"}, {23, "Telnet"}, {25, "SMTP"}, {53, "DNS"},
            {80, "HTTP"}, {110, "POP3"}, {139, "NetBIOS"}, {443, "HTTPS"}, {445, "SMB"},
            {515, "LPD"}, {554, "RTSP"}, {631, "IPP"}, {993, "IMAPS"}, {995, "POP3S"},
            {3306, "MySQL"}, {3389, "RDP"}, {5002, "Management Agent"}, {8080, "HTTP-Alt"},
            {8443, "HTTPS-Alt"}, {9100, "JetDirect"}};

        auto it = services.find(port);
        return it == services.end() ? "Unknown" : it->second;
    }

    std::optional<AgentIdentity> ParseAgentIdentity(const std::string &body)
    {
        auto doc = nlohmann::json::parse(body, nullptr, false);
        if (doc.is_discarded() || !doc.is_object())
            return std::nullopt;

        auto field = [&doc](const char *key)
        {
            auto it = doc.find(key);
            return (it != doc.end() && it->is_string()) ? it->get<std::string>() : std::string();
        };

        AgentIdentity identity;
        identity.hostname = field("hostname");
        identity.mac = field("mac_address");
        identity.agent_version = field("agent_version");
        identity.os = field("os");
        return identity;
    }

    NetworkHostProber::NetworkHostProber(ProberOptions options, std::shared_ptr<VendorLookup> vendors)
        : m_options(std::move(options)), m_vendors(std::move(vendors)), m_resolver(m_options.name_timeout_ms)
    {
        if (m_options.ports.empty())
            m_options.ports = DefaultPorts();
    }

    std::optional<double> NetworkHostProber::IcmpEcho(const std::string &address, int timeout_ms)
    {
        Tins::PacketSender sender(Tins::NetworkInterface(), timeout_ms / 1000, (timeout_ms % 1000) * 1000);

        Tins::IP ip = Tins::IP(address) / Tins::ICMP();
        Tins::ICMP &icmp = ip.rfind_pdu<Tins::ICMP>();
        icmp.type(Tins::ICMP::ECHO_REQUEST);
        icmp.id(s_icmp_id.fetch_add(1));
        icmp.sequence(1);

        auto start = std::chrono::steady_clock::now();
        std::unique_ptr<Tins::PDU> reply(sender.send_recv(ip));
        auto end = std::chrono::steady_clock::now();

        if (!reply)
            return std::nullopt;

        const Tins::ICMP *answer = reply->find_pdu<Tins::ICMP>();
        if (!answer || answer->type() != Tins::ICMP::ECHO_REPLY)
            return std::nullopt;

        std::chrono::duration<double, std::milli> elapsed = end - start;
        return elapsed.count();
    }

    std::optional<double> NetworkHostProber::SystemPing(const std::string &address, int timeout_ms)
    {
        const std::string wait = std::to_string(std::max(1, (timeout_ms + 999) / 1000));
        const char *argv[] = {"ping", "-c", "1", "-W", wait.c_str(), address.c_str(), nullptr};

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

        auto start = std::chrono::steady_clock::now();
        pid_t pid = 0;
        int rc = posix_spawnp(&pid, "ping", &actions, nullptr, const_cast<char *const *>(argv), environ);
        posix_spawn_file_actions_destroy(&actions);
        if (rc != 0)
            return std::nullopt;

        int status = 0;
        if (waitpid(pid, &status, 0) < 0)
            return std::nullopt;
        auto end = std::chrono::steady_clock::now();

        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
            return std::nullopt;

        // Includes process start-up; only good as a liveness signal.
        std::chrono::duration<double, std::milli> elapsed = end - start;
        return std::max(1.0, elapsed.count());
    }

    std::optional<double> NetworkHostProber::Echo(const std::string &address, int timeout_ms)
    {
        if (!s_use_system_ping)
        {
            try
            {
                return IcmpEcho(address, timeout_ms);
            }
            catch (const Tins::socket_open_error &e)
            {
                if (!s_use_system_ping.exchange(true))
                    std::cerr << "[Prober] Raw ICMP unavailable (" << e.what() << "), falling back to system ping\n";
            }
        }
        return SystemPing(address, timeout_ms);
    }

    LivenessResult NetworkHostProber::Probe(const std::string &address, int timeout_ms, int count)
    {
        LivenessResult result;
        if (count <= 0)
            return result;

        std::vector<double> latencies;
        for (int i = 0; i < count; ++i)
        {
            if (std::optional<double> rtt = Echo(address, timeout_ms))
                latencies.push_back(*rtt);
        }

        result.packet_loss = static_cast<double>(count - static_cast<int>(latencies.size())) / count * 100.0;
        if (!latencies.empty())
        {
            result.liveness = Liveness::Online;
            result.latency_ms = RoundTo2(std::accumulate(latencies.begin(), latencies.end(), 0.0) / latencies.size());
        }
        return result;
    }

    HostIdentity NetworkHostProber::ResolveIdentity(const std::string &address)
    {
        HostIdentity identity;
        identity.mac = LookupArpMac(address, m_options.arp_path);
        identity.hostname = m_resolver.ResolveHostname(address);
        if (identity.mac && m_vendors)
            identity.vendor = m_vendors->Vendor(*identity.mac);
        return identity;
    }

    std::vector<PortResult> NetworkHostProber::ProbePorts(const std::string &address, const std::vector<uint16_t> &ports)
    {
        std::vector<uint16_t> open = ProbeTcpPorts(address, ports, m_options.port_timeout_ms);
        std::sort(open.begin(), open.end());

        std::vector<PortResult> results;
        for (uint16_t port : open)
            results.push_back({port, true, ServiceName(port)});
        return results;
    }

    std::optional<AgentIdentity> NetworkHostProber::DetectManagementAgent(const std::string &address)
    {
        if (!IsTcpPortOpen(address, m_options.agent_port, m_options.port_timeout_ms))
            return std::nullopt;

        auto response = HttpGet(address, m_options.agent_port, "/api/identity", m_options.probe_timeout_ms);
        if (!response || response->status != 200)
            return std::nullopt;

        return ParseAgentIdentity(response->body);
    }

    DiscoveredDevice NetworkHostProber::ScanHost(const std::string &address)
    {
        DiscoveredDevice device;
        device.address = address;

        try
        {
            LivenessResult liveness = Probe(address, m_options.probe_timeout_ms, m_options.probe_count);
            device.liveness = liveness.liveness;
            device.latency_ms = liveness.latency_ms;
            device.packet_loss = liveness.packet_loss;

            if (device.liveness != Liveness::Online)
                return device;

            HostIdentity identity = ResolveIdentity(address);
            device.hostname = identity.hostname;
            device.mac = identity.mac;
            device.vendor = identity.vendor;

            if (auto agent = DetectManagementAgent(address))
            {
                if (!agent->hostname.empty())
                    device.hostname = agent->hostname;
                if (!agent->mac.empty())
                    device.mac = agent->mac;
                device.agent = std::move(agent);
            }
            else
            {
                device.open_ports = ProbePorts(address, m_options.ports);
            }
        }
        catch (const std::exception &e)
        {
            DiscoveredDevice failed;
            failed.address = address;
            failed.liveness = Liveness::Error;
            failed.error = e.what();
            return failed;
        }

        return device;
    }
}
