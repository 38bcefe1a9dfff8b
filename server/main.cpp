#include "NetworkCore.hpp"
#include "Worker.hpp"
#include "../common/Config.hpp"
#include "../engine/DiscoveryService.hpp"
#include "../engine/EventSink.hpp"
#include "../engine/HostProber.hpp"
#include "../engine/InventoryStore.hpp"
#include "../engine/VendorLookup.hpp"

#include <csignal>
#include <iostream>
#include <memory>

namespace
{
    net_survey::server::NetworkCore *g_server = nullptr;

    void HandleSignal(int)
    {
        if (g_server)
            g_server->Stop();
    }
}

int main(int argc, char *argv[])
{
    using namespace net_survey;

    common::EngineConfig config;
    try
    {
        config = common::LoadConfig(argc, argv);
    }
    catch (const common::ConfigError &e)
    {
        std::cerr << "[Config] " << e.what() << '\n';
        return 2;
    }

    if (config.show_help)
    {
        std::cout << config.usage << '\n';
        return 0;
    }

    try
    {
        auto oui = std::make_shared<engine::FileOuiDatabase>();
        if (!oui->LoadFile(config.oui_file))
            std::cerr << "[Prober] Vendor lookups disabled: no OUI table at " << config.oui_file << '\n';
        auto vendors = std::make_shared<engine::VendorLookup>(oui);

        engine::ProberOptions prober_options;
        prober_options.probe_timeout_ms = config.probe_timeout_ms;
        prober_options.probe_count = config.probe_count;
        prober_options.port_timeout_ms = config.port_timeout_ms;
        prober_options.agent_port = config.agent_port;
        prober_options.ports = config.ports;
        engine::NetworkHostProber prober(prober_options, vendors);

        engine::SweepOptions sweep_options;
        sweep_options.policy.hard_cap = config.hard_cap;
        sweep_options.policy.max_hosts = config.max_hosts;
        sweep_options.policy.private_only = !config.allow_public;
        sweep_options.batch_size = config.batch_size;
        sweep_options.concurrency = config.concurrency;
        sweep_options.notify_threshold = config.notify_threshold;

        engine::WalkOptions walk_defaults;
        walk_defaults.max_depth = config.walk_max_depth;
        walk_defaults.max_switches = config.walk_max_switches;
        walk_defaults.credentials.community = config.snmp_community;
        walk_defaults.credentials.version = config.snmp_version;
        walk_defaults.credentials.port = config.snmp_port;
        walk_defaults.credentials.timeout_ms = config.snmp_timeout_ms;
        walk_defaults.credentials.retries = config.snmp_retries;

        engine::SqliteInventory inventory;
        if (!inventory.Initialize(config.database))
        {
            std::cerr << "Fatal: could not open inventory database " << config.database << '\n';
            return 1;
        }
        std::cout << "[Inventory] " << inventory.GetDevices().size() << " devices and "
                  << inventory.GetEdges().size() << " topology links on record\n";

        engine::LogEventSink events;
        engine::DiscoveryService service(prober, sweep_options, &inventory, &events);

        server::NetworkCore core(config.port, config.cert, config.key);
        server::Worker worker(service, walk_defaults);
        core.SetWorker(&worker);
        worker.SetNetworkCore(&core);

        core.Init();
        g_server = &core;
        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);

        worker.Start();
        core.Run();

        g_server = nullptr;
        worker.Stop();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Server Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
