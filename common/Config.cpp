#include "Config.hpp"

#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

namespace po = boost::program_options;

namespace net_survey::common
{
    namespace
    {
        const std::vector<int> DEFAULT_PORTS = {21, 22, 23, 25, 53, 80, 110, 139, 443, 445,
                                                515, 554, 631, 993, 995, 3306, 3389, 8080, 8443, 9100};

        uint16_t ToPort(int value, const std::string &option)
        {
            if (value < 1 || value > 65535)
                throw ConfigError(option + " must be in 1..65535, got " + std::to_string(value));
            return static_cast<uint16_t>(value);
        }

        uint32_t ToPositive(int value, const std::string &option)
        {
            if (value <= 0)
                throw ConfigError(option + " must be positive, got " + std::to_string(value));
            return static_cast<uint32_t>(value);
        }
    }

    EngineConfig LoadConfig(int argc, const char *const argv[])
    {
        EngineConfig config;

        int port = 0;
        int hard_cap = 0;
        int max_hosts = 0;
        int concurrency = 0;
        int batch_size = 0;
        int agent_port = 0;
        int snmp_port = 0;
        std::vector<int> ports;
        std::string config_file;

        po::options_description generic("General");
        generic.add_options()
            ("help,h", "Show this help")
            ("config,c", po::value<std::string>(&config_file), "INI-style configuration file");

        po::options_description server("Server");
        server.add_options()
            ("port,p", po::value<int>(&port)->default_value(config.port), "Control channel TCP port")
            ("cert", po::value<std::string>(&config.cert)->default_value(config.cert), "TLS certificate")
            ("key", po::value<std::string>(&config.key)->default_value(config.key), "TLS private key")
            ("database", po::value<std::string>(&config.database)->default_value(config.database), "Inventory database")
            ("oui-file", po::value<std::string>(&config.oui_file)->default_value(config.oui_file), "IEEE or nmap OUI table");

        po::options_description sweep("Sweep");
        sweep.add_options()
            ("hard-cap", po::value<int>(&hard_cap)->default_value(static_cast<int>(config.hard_cap)), "Largest range a sweep accepts")
            ("max-hosts", po::value<int>(&max_hosts)->default_value(static_cast<int>(config.max_hosts)), "Hosts scanned per sweep")
            ("concurrency", po::value<int>(&concurrency)->default_value(static_cast<int>(config.concurrency)), "Probes in flight")
            ("batch-size", po::value<int>(&batch_size)->default_value(static_cast<int>(config.batch_size)), "Hosts per batch")
            ("probe-timeout-ms", po::value<int>(&config.probe_timeout_ms)->default_value(config.probe_timeout_ms), "Echo timeout")
            ("probe-count", po::value<int>(&config.probe_count)->default_value(config.probe_count), "Echo requests per host")
            ("port-timeout-ms", po::value<int>(&config.port_timeout_ms)->default_value(config.port_timeout_ms), "TCP connect timeout")
            ("allow-public", po::bool_switch(&config.allow_public), "Permit sweeps of non-private ranges")
            ("agent-port", po::value<int>(&agent_port)->default_value(config.agent_port), "Management agent HTTP port")
            ("ports", po::value<std::vector<int>>(&ports)->multitoken()->default_value(DEFAULT_PORTS, "21 22 23 ... 9100"), "TCP ports probed on live hosts")
            ("notify-threshold", po::value<int>(&config.notify_threshold)->default_value(config.notify_threshold), "Classification score that raises an event");

        po::options_description walk("Topology");
        walk.add_options()
            ("walk-max-depth", po::value<int>(&config.walk_max_depth)->default_value(config.walk_max_depth), "Default BFS depth")
            ("walk-max-switches", po::value<int>(&config.walk_max_switches)->default_value(config.walk_max_switches), "Default switch budget")
            ("snmp-community", po::value<std::string>(&config.snmp_community)->default_value(config.snmp_community), "Read community")
            ("snmp-version", po::value<std::string>(&config.snmp_version)->default_value(config.snmp_version), "1 or 2c")
            ("snmp-port", po::value<int>(&snmp_port)->default_value(config.snmp_port), "Agent UDP port")
            ("snmp-timeout-ms", po::value<int>(&config.snmp_timeout_ms)->default_value(config.snmp_timeout_ms), "Per-request timeout")
            ("snmp-retries", po::value<int>(&config.snmp_retries)->default_value(config.snmp_retries), "Retries per request");

        po::options_description all("net_survey_server options");
        all.add(generic).add(server).add(sweep).add(walk);

        po::options_description file_options;
        file_options.add(server).add(sweep).add(walk);

        po::variables_map vm;
        try
        {
            po::store(po::parse_command_line(argc, argv, all), vm);

            if (vm.count("config"))
            {
                const std::string path = vm["config"].as<std::string>();
                std::ifstream in(path);
                if (!in)
                    throw ConfigError("Cannot open config file: " + path);
                po::store(po::parse_config_file(in, file_options), vm);
                std::cout << "[Config] Loaded " << path << "\n";
            }

            po::notify(vm);
        }
        catch (const po::error &e)
        {
            throw ConfigError(e.what());
        }

        std::ostringstream usage;
        usage << all;
        config.usage = usage.str();
        config.show_help = vm.count("help") > 0;

        config.port = ToPort(port, "port");
        config.agent_port = ToPort(agent_port, "agent-port");
        config.snmp_port = ToPort(snmp_port, "snmp-port");
        config.hard_cap = ToPositive(hard_cap, "hard-cap");
        config.max_hosts = ToPositive(max_hosts, "max-hosts");
        config.concurrency = ToPositive(concurrency, "concurrency");
        config.batch_size = ToPositive(batch_size, "batch-size");

        config.ports.clear();
        for (int p : ports)
            config.ports.push_back(ToPort(p, "ports"));

        ValidateConfig(config);
        return config;
    }

    void ValidateConfig(const EngineConfig &config)
    {
        if (config.hard_cap == 0 || config.max_hosts == 0 || config.concurrency == 0 || config.batch_size == 0)
            throw ConfigError("Caps and counts must be positive");
        if (config.max_hosts > config.hard_cap)
            throw ConfigError("max-hosts (" + std::to_string(config.max_hosts) + ") exceeds hard-cap (" +
                              std::to_string(config.hard_cap) + ")");
        if (config.probe_timeout_ms <= 0 || config.port_timeout_ms <= 0 || config.snmp_timeout_ms <= 0)
            throw ConfigError("Timeouts must be positive");
        if (config.probe_count <= 0)
            throw ConfigError("probe-count must be positive");
        if (config.snmp_retries < 0)
            throw ConfigError("snmp-retries must not be negative");
        if (config.walk_max_depth < 0 || config.walk_max_switches <= 0)
            throw ConfigError("Walk limits must be positive");
        if (config.snmp_version != "1" && config.snmp_version != "2c")
            throw ConfigError("snmp-version must be 1 or 2c, got " + config.snmp_version);
        if (config.ports.empty())
            throw ConfigError("At least one port must be probed");
        for (uint16_t p : config.ports)
        {
            if (p == 0)
                throw ConfigError("ports must be in 1..65535");
        }
    }
}
