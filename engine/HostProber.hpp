#pragma once

#include "Types.hpp"
#include "NameResolver.hpp"
#include "VendorLookup.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace net_survey::engine
{
    struct ProberOptions
    {
        int probe_timeout_ms = 2000;
        int probe_count = 4;
        int port_timeout_ms = 1000;
        int name_timeout_ms = 500;
        uint16_t agent_port = 5002;
        std::vector<uint16_t> ports;
        std::string arp_path = "/proc/net/arp";
    };

    struct LivenessResult
    {
        Liveness liveness = Liveness::Offline;
        std::optional<double> latency_ms;
        double packet_loss = 100.0;
    };

    struct HostIdentity
    {
        std::optional<std::string> mac;
        std::string hostname = "Unknown";
        std::string vendor = "Unknown";
    };

    // Seam between the sweep and the network.
    class HostProber
    {
    public:
        virtual ~HostProber() = default;
        virtual DiscoveredDevice ScanHost(const std::string &address) = 0;
    };

    class NetworkHostProber : public HostProber
    {
    public:
        NetworkHostProber(ProberOptions options, std::shared_ptr<VendorLookup> vendors);

        // Online if any of `count` echo probes is answered within timeout_ms.
        LivenessResult Probe(const std::string &address, int timeout_ms, int count);
        HostIdentity ResolveIdentity(const std::string &address);
        std::vector<PortResult> ProbePorts(const std::string &address, const std::vector<uint16_t> &ports);
        std::optional<AgentIdentity> DetectManagementAgent(const std::string &address);

        DiscoveredDevice ScanHost(const std::string &address) override;

        static bool UsingSystemPing() { return s_use_system_ping; }

    protected:
        // One echo round trip in milliseconds, or nullopt when unanswered.
        virtual std::optional<double> Echo(const std::string &address, int timeout_ms);

    private:
        std::optional<double> IcmpEcho(const std::string &address, int timeout_ms);
        std::optional<double> SystemPing(const std::string &address, int timeout_ms);

        ProberOptions m_options;
        std::shared_ptr<VendorLookup> m_vendors;
        NameResolver m_resolver;

        static std::atomic<bool> s_use_system_ping;
        static std::atomic<uint16_t> s_icmp_id;
    };

    std::string ServiceName(uint16_t port);

    // Reads the agent identity document. Fields: hostname, mac_address,
    // agent_version, os.
    std::optional<AgentIdentity> ParseAgentIdentity(const std::string &body);

    const std::vector<uint16_t> &DefaultPorts();
}
