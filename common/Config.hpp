#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace net_survey::common
{
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
    };

    struct EngineConfig
    {
        uint16_t port = 9443;
        std::string cert = "certs/server.crt";
        std::string key = "certs/server.key";
        std::string database = "net_survey.db";
        std::string oui_file = "/usr/share/ieee-data/oui.txt";

        uint32_t hard_cap = 4096;
        uint32_t max_hosts = 254;
        uint32_t concurrency = 80;
        uint32_t batch_size = 40;
        int probe_timeout_ms = 2000;
        int probe_count = 4;
        int port_timeout_ms = 1000;
        bool allow_public = false;
        uint16_t agent_port = 5002;
        std::vector<uint16_t> ports;
        int notify_threshold = 25;

        int walk_max_depth = 3;
        int walk_max_switches = 50;
        std::string snmp_community = "public";
        std::string snmp_version = "2c";
        uint16_t snmp_port = 161;
        int snmp_timeout_ms = 2000;
        int snmp_retries = 1;

        bool show_help = false;
        std::string usage;
    };

    // Command line first, then the optional --config file for anything the
    // command line left unset. Throws ConfigError.
    EngineConfig LoadConfig(int argc, const char *const argv[]);

    void ValidateConfig(const EngineConfig &config);
}
