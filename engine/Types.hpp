#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace net_survey::engine
{
    enum class Liveness
    {
        Online,
        Offline,
        Error
    };

    enum class DeviceType
    {
        Firewall,
        Router,
        Switch,
        AccessPoint,
        Server,
        Workstation,
        Printer,
        CameraIoT,
        Mobile,
        Unknown
    };

    enum class Confidence
    {
        High,
        Medium,
        Low
    };

    enum class ScanStatus
    {
        Scanning,
        Completed,
        Stopped,
        Error
    };

    enum class WalkStatus
    {
        Running,
        Completed,
        Error
    };

    const char *ToString(Liveness liveness);
    const char *ToString(DeviceType type);
    const char *ToString(Confidence confidence);
    const char *ToString(ScanStatus status);
    const char *ToString(WalkStatus status);

    struct PortResult
    {
        uint16_t port = 0;
        bool open = false;
        std::string service;
    };

    struct Evidence
    {
        std::string source;
        std::string value;
    };

    struct ClassificationSignals
    {
        std::string address;
        std::string mac;
        std::string hostname;
        std::string vendor;
        std::vector<uint16_t> open_ports;
        std::optional<std::string> banner;
    };

    struct ClassificationResult
    {
        DeviceType type = DeviceType::Unknown;
        int score = 0;
        Confidence confidence = Confidence::Low;
        std::vector<Evidence> evidence;
        std::vector<std::pair<DeviceType, int>> runner_ups;
    };

    struct AgentIdentity
    {
        std::string hostname;
        std::string mac;
        std::string agent_version;
        std::string os;
    };

    struct DiscoveredDevice
    {
        std::string address;
        Liveness liveness = Liveness::Offline;
        std::optional<double> latency_ms;
        double packet_loss = 100.0;
        std::string hostname = "Unknown";
        std::optional<std::string> mac;
        std::string vendor = "Unknown";
        std::vector<PortResult> open_ports;
        std::optional<ClassificationResult> classification;
        std::optional<AgentIdentity> agent;
        std::string error;
    };

    struct SnmpCredentials
    {
        std::string community = "public";
        std::string version = "2c";
        uint16_t port = 161;
        int timeout_ms = 2000;
        int retries = 1;
    };

    struct Neighbor
    {
        std::string device_id;
        std::optional<std::string> address;
        std::optional<int> local_if_index;
        std::string local_port;
        std::string remote_port;
        std::string platform;
        std::optional<uint32_t> capabilities;
        bool is_switch = false;
        std::string protocol;
    };

    struct EndHost
    {
        std::string mac;
        std::optional<std::string> address;
        std::optional<int> bridge_port;
        std::optional<int> if_index;
        std::string port_name;
    };

    struct TopologyWalkResult
    {
        std::string switch_address;
        int depth = 0;
        std::string sys_name;
        std::string sys_descr;
        std::optional<ClassificationResult> classification;
        std::vector<Neighbor> neighbors;
        std::vector<EndHost> end_hosts;
        std::vector<std::string> errors;
    };

    struct WalkOptions
    {
        int max_depth = 3;
        int max_switches = 50;
        SnmpCredentials credentials;
        bool persist = true;
    };
}
