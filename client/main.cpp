#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <boost/program_options.hpp>

#include "ClientNetwork.hpp"
#include "../common/Messages.hpp"
#include "../common/protocol.hpp"
#include "../engine/JsonView.hpp"

namespace po = boost::program_options;
namespace messages = net_survey::common::messages;
using net_survey::client::ClientNetwork;
using net_survey::client::NetworkResponse;
using net_survey::protocol::MessageType;

namespace
{
    struct CtlOptions
    {
        std::string host = "127.0.0.1";
        int port = 9443;
        std::string owner;
        bool json = false;
        int interval_ms = 1000;
    };

    // Prints the server's error text when the reply is not `expected`.
    bool Expect(const std::optional<NetworkResponse> &resp, MessageType expected)
    {
        if (!resp)
        {
            std::cerr << "[Client] No response from server.\n";
            return false;
        }
        if (resp->type == MessageType::ErrorResp)
        {
            std::string message;
            if (!messages::DecodeText(resp->data, message))
                message = "malformed error response";
            std::cerr << "Error: " << message << "\n";
            return false;
        }
        if (resp->type != expected)
        {
            std::cerr << "[Client] Unexpected response type " << static_cast<int>(resp->type) << "\n";
            return false;
        }
        return true;
    }

    void PrintDevice(const net_survey::engine::DiscoveredDevice &d)
    {
        std::cout << std::left << std::setw(16) << d.address << std::setw(20) << d.mac.value_or("-")
                  << std::setw(24) << d.hostname << std::setw(20) << d.vendor;
        if (d.classification)
            std::cout << net_survey::engine::ToString(d.classification->type) << " ("
                      << d.classification->score << ")";
        std::cout << "\n";

        if (!d.open_ports.empty())
        {
            std::cout << "    ports:";
            for (const auto &p : d.open_ports)
                std::cout << " " << p.port << "/" << p.service;
            std::cout << "\n";
        }
    }

    void PrintSwitch(const net_survey::engine::TopologyWalkResult &sw)
    {
        std::cout << "Switch " << sw.switch_address << " (depth " << sw.depth << ")";
        if (!sw.sys_name.empty())
            std::cout << " " << sw.sys_name;
        std::cout << "\n";

        for (const auto &n : sw.neighbors)
        {
            std::cout << "  " << n.protocol << " " << n.local_port << " -> " << n.device_id << " "
                      << n.address.value_or("-") << " " << n.remote_port << (n.is_switch ? " [switch]" : "") << "\n";
        }
        for (const auto &h : sw.end_hosts)
            std::cout << "  host " << h.mac << " " << h.address.value_or("-") << " on " << h.port_name << "\n";
        for (const auto &e : sw.errors)
            std::cout << "  ! " << e << "\n";
    }

    int RunSweep(ClientNetwork &net, const CtlOptions &opts, const std::string &range)
    {
        auto resp = net.Request(MessageType::SweepStartReq, messages::EncodeSweepStart({range, opts.owner}));
        if (!Expect(resp, MessageType::SweepStartResp))
            return 1;

        std::string job_id;
        if (!messages::DecodeText(resp->data, job_id))
            return 1;
        std::cout << "Sweep " << job_id << " started on " << range << "\n";

        nlohmann::json devices = nlohmann::json::array();
        while (true)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(opts.interval_ms));

            auto poll = net.Request(MessageType::SweepPollReq, messages::EncodeText(job_id));
            if (!Expect(poll, MessageType::SweepPollResp))
                return 1;

            net_survey::engine::ScanJobStatus status;
            if (!messages::DecodeSweepStatus(poll->data, status))
            {
                std::cerr << "[Client] Malformed poll response.\n";
                return 1;
            }

            for (const auto &d : status.new_devices)
            {
                if (opts.json)
                    devices.push_back(net_survey::engine::ToJson(d));
                else
                    PrintDevice(d);
            }

            if (!opts.json)
                std::cerr << "\r" << status.scanned << "/" << status.total << " (" << status.progress << "%) - "
                          << status.found << " online" << std::flush;

            if (status.status != net_survey::engine::ScanStatus::Scanning)
            {
                if (!opts.json)
                    std::cerr << "\n";
                std::cout << "Sweep " << net_survey::engine::ToString(status.status) << "\n";
                if (status.error)
                    std::cerr << "Error: " << *status.error << "\n";
                break;
            }
        }

        if (opts.json)
            std::cout << devices.dump(2) << "\n";
        return 0;
    }

    int RunResults(ClientNetwork &net, const CtlOptions &opts, const std::string &job_id)
    {
        auto resp = net.Request(MessageType::SweepResultsReq, messages::EncodeText(job_id));
        if (!Expect(resp, MessageType::SweepResultsResp))
            return 1;

        std::vector<net_survey::engine::DiscoveredDevice> devices;
        if (!messages::DecodeDevices(resp->data, devices))
            return 1;

        if (opts.json)
        {
            nlohmann::json out = nlohmann::json::array();
            for (const auto &d : devices)
                out.push_back(net_survey::engine::ToJson(d));
            std::cout << out.dump(2) << "\n";
        }
        else
        {
            for (const auto &d : devices)
                PrintDevice(d);
        }
        return 0;
    }

    int RunStop(ClientNetwork &net, const std::string &job_id)
    {
        auto resp = net.Request(MessageType::SweepStopReq, messages::EncodeText(job_id));
        if (!Expect(resp, MessageType::SweepStopResp))
            return 1;

        bool ok = false;
        if (!messages::DecodeFlag(resp->data, ok) || !ok)
        {
            std::cerr << "Unknown sweep job: " << job_id << "\n";
            return 1;
        }
        std::cout << "Stop requested for " << job_id << "\n";
        return 0;
    }

    int RunActive(ClientNetwork &net, const CtlOptions &opts)
    {
        auto sweep = net.Request(MessageType::SweepActiveReq, messages::EncodeText(opts.owner));
        if (!Expect(sweep, MessageType::SweepActiveResp))
            return 1;
        auto walk = net.Request(MessageType::TopologyActiveReq, messages::EncodeText(opts.owner));
        if (!Expect(walk, MessageType::TopologyActiveResp))
            return 1;

        std::optional<std::string> sweep_id;
        std::optional<std::string> walk_id;
        if (!messages::DecodeOptionalText(sweep->data, sweep_id) || !messages::DecodeOptionalText(walk->data, walk_id))
            return 1;

        std::cout << "Active sweep: " << sweep_id.value_or("none") << "\n";
        std::cout << "Active walk:  " << walk_id.value_or("none") << "\n";
        return 0;
    }

    int RunWalk(ClientNetwork &net, const CtlOptions &opts, const std::string &seed,
                const net_survey::engine::WalkOptions &walk)
    {
        messages::TopologyStartRequest req{seed, walk, opts.owner};
        auto resp = net.Request(MessageType::TopologyStartReq, messages::EncodeTopologyStart(req));
        if (!Expect(resp, MessageType::TopologyStartResp))
            return 1;

        std::string job_id;
        if (!messages::DecodeText(resp->data, job_id))
            return 1;
        std::cout << "Topology walk " << job_id << " started from " << seed << "\n";

        while (true)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(opts.interval_ms));

            auto poll = net.Request(MessageType::TopologyPollReq, messages::EncodeText(job_id));
            if (!Expect(poll, MessageType::TopologyPollResp))
                return 1;

            net_survey::engine::TopologyJobStatus status;
            if (!messages::DecodeTopologyStatus(poll->data, status))
            {
                std::cerr << "[Client] Malformed poll response.\n";
                return 1;
            }

            if (status.status == net_survey::engine::WalkStatus::Running)
            {
                if (!opts.json)
                    std::cerr << "\r" << status.switch_count << " switches, " << status.device_count
                              << " hosts, last " << status.last_switch << std::flush;
                continue;
            }

            if (!opts.json)
                std::cerr << "\n";

            if (opts.json)
            {
                nlohmann::json out = nlohmann::json::array();
                for (const auto &sw : status.switches)
                    out.push_back(net_survey::engine::ToJson(sw));
                std::cout << out.dump(2) << "\n";
            }
            else
            {
                for (const auto &sw : status.switches)
                    PrintSwitch(sw);
                if (status.persisted)
                    std::cout << "Inventory: " << status.persisted->inserted << " inserted, "
                              << status.persisted->updated << " updated\n";
            }

            if (status.error)
            {
                std::cerr << "Error: " << *status.error << "\n";
                return 1;
            }
            return 0;
        }
    }

    int RunClassify(ClientNetwork &net, const CtlOptions &opts, const net_survey::engine::ClassificationSignals &signals)
    {
        auto resp = net.Request(MessageType::ClassifyReq, messages::EncodeSignals(signals));
        if (!Expect(resp, MessageType::ClassifyResp))
            return 1;

        net_survey::engine::ClassificationResult result;
        if (!messages::DecodeClassification(resp->data, result))
            return 1;

        if (opts.json)
        {
            std::cout << net_survey::engine::ToJson(result).dump(2) << "\n";
            return 0;
        }

        std::cout << net_survey::engine::ToString(result.type) << " score " << result.score << " ("
                  << net_survey::engine::ToString(result.confidence) << ")\n";
        for (const auto &e : result.evidence)
            std::cout << "  " << e.source << ": " << e.value << "\n";
        for (const auto &r : result.runner_ups)
            std::cout << "  runner-up " << net_survey::engine::ToString(r.first) << " " << r.second << "\n";
        return 0;
    }
}

int main(int argc, char *argv[])
{
    CtlOptions opts;
    std::string command;
    std::string target;

    net_survey::engine::WalkOptions walk;
    walk.max_depth = -1;
    walk.max_switches = 0;
    walk.credentials.community.clear();
    bool no_persist = false;

    net_survey::engine::ClassificationSignals signals;
    std::vector<int> ports;
    std::string banner;

    const char *user = std::getenv("USER");
    opts.owner = user ? user : "net_survey_ctl";

    po::options_description general("net_survey_ctl <command> [target] [options]\n\n"
                                    "Commands: sweep <range> | results <job> | stop <job> | active |\n"
                                    "          walk <seed> | classify\n\nGeneral");
    general.add_options()
        ("help,h", "Show this help")
        ("host", po::value<std::string>(&opts.host)->default_value(opts.host), "Server address")
        ("port,p", po::value<int>(&opts.port)->default_value(opts.port), "Server port")
        ("owner", po::value<std::string>(&opts.owner)->default_value(opts.owner), "Job owner")
        ("json", po::bool_switch(&opts.json), "Print JSON")
        ("interval-ms", po::value<int>(&opts.interval_ms)->default_value(opts.interval_ms), "Poll interval");

    po::options_description walk_opts("Topology walk");
    walk_opts.add_options()
        ("depth", po::value<int>(&walk.max_depth), "Maximum BFS depth")
        ("max-switches", po::value<int>(&walk.max_switches), "Switch budget")
        ("community", po::value<std::string>(&walk.credentials.community), "SNMP read community")
        ("snmp-version", po::value<std::string>(&walk.credentials.version)->default_value("2c"), "1 or 2c")
        ("no-persist", po::bool_switch(&no_persist), "Do not write results to the inventory");

    po::options_description classify_opts("Classify");
    classify_opts.add_options()
        ("vendor", po::value<std::string>(&signals.vendor), "Vendor string")
        ("hostname", po::value<std::string>(&signals.hostname), "Host name")
        ("mac", po::value<std::string>(&signals.mac), "MAC address")
        ("ports", po::value<std::vector<int>>(&ports)->multitoken(), "Open TCP ports")
        ("banner", po::value<std::string>(&banner), "SNMP sysDescr or service banner");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(&command))
        ("target", po::value<std::string>(&target));

    po::options_description all;
    all.add(general).add(walk_opts).add(classify_opts).add(hidden);

    po::options_description visible;
    visible.add(general).add(walk_opts).add(classify_opts);

    po::positional_options_description pos;
    pos.add("command", 1).add("target", 1);

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(all).positional(pos).run(), vm);
        po::notify(vm);
    }
    catch (const po::error &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (vm.count("help") || command.empty())
    {
        std::cout << visible << "\n";
        return command.empty() && !vm.count("help") ? 2 : 0;
    }

    const bool needs_target = command == "sweep" || command == "results" || command == "stop" || command == "walk";
    if (needs_target && target.empty())
    {
        std::cerr << "Error: '" << command << "' needs a target\n";
        return 2;
    }

    for (int p : ports)
    {
        if (p < 1 || p > 65535)
        {
            std::cerr << "Error: port out of range: " << p << "\n";
            return 2;
        }
        signals.open_ports.push_back(static_cast<uint16_t>(p));
    }
    if (vm.count("banner"))
        signals.banner = banner;
    walk.persist = !no_persist;

    try
    {
        ClientNetwork net(opts.host, opts.port);
        if (!net.Connect())
            return 1;

        if (command == "sweep")
            return RunSweep(net, opts, target);
        if (command == "results")
            return RunResults(net, opts, target);
        if (command == "stop")
            return RunStop(net, target);
        if (command == "active")
            return RunActive(net, opts);
        if (command == "walk")
            return RunWalk(net, opts, target, walk);
        if (command == "classify")
            return RunClassify(net, opts, signals);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Error: unknown command '" << command << "'\n";
    return 2;
}
