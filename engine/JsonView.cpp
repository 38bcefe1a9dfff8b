#include "JsonView.hpp"

namespace net_survey::engine
{
    namespace
    {
        template <typename T>
        nlohmann::json OrNull(const std::optional<T> &value)
        {
            return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
        }
    }

    nlohmann::json ToJson(const ClassificationResult &result)
    {
        nlohmann::json evidence = nlohmann::json::array();
        for (const auto &e : result.evidence)
            evidence.push_back({{"source", e.source}, {"value", e.value}});

        nlohmann::json runner_ups = nlohmann::json::array();
        for (const auto &r : result.runner_ups)
            runner_ups.push_back({{"type", ToString(r.first)}, {"score", r.second}});

        return {{"device_type", ToString(result.type)},
                {"score", result.score},
                {"confidence", ToString(result.confidence)},
                {"evidence", evidence},
                {"runner_ups", runner_ups}};
    }

    nlohmann::json ToJson(const DiscoveredDevice &device)
    {
        nlohmann::json ports = nlohmann::json::array();
        for (const auto &p : device.open_ports)
            ports.push_back({{"port", p.port}, {"status", p.open ? "open" : "closed"}, {"service", p.service}});

        nlohmann::json out = {{"ip", device.address},
                              {"status", ToString(device.liveness)},
                              {"latency", OrNull(device.latency_ms)},
                              {"packet_loss", device.packet_loss},
                              {"hostname", device.hostname},
                              {"mac", OrNull(device.mac)},
                              {"manufacturer", device.vendor},
                              {"open_ports", ports}};

        if (device.classification)
            out["classification"] = ToJson(*device.classification);

        if (device.agent)
        {
            out["is_agent"] = true;
            out["agent_version"] = device.agent->agent_version;
            out["os"] = device.agent->os;
        }

        if (!device.error.empty())
            out["error"] = device.error;

        return out;
    }

    nlohmann::json ToJson(const TopologyWalkResult &result)
    {
        nlohmann::json neighbors = nlohmann::json::array();
        for (const auto &n : result.neighbors)
        {
            neighbors.push_back({{"device_id", n.device_id},
                                 {"ip", OrNull(n.address)},
                                 {"local_port", n.local_port},
                                 {"remote_port", n.remote_port},
                                 {"platform", n.platform},
                                 {"capabilities", OrNull(n.capabilities)},
                                 {"is_switch", n.is_switch},
                                 {"protocol", n.protocol}});
        }

        nlohmann::json hosts = nlohmann::json::array();
        for (const auto &h : result.end_hosts)
        {
            hosts.push_back({{"mac", h.mac},
                             {"ip", OrNull(h.address)},
                             {"bridge_port", OrNull(h.bridge_port)},
                             {"if_index", OrNull(h.if_index)},
                             {"port_name", h.port_name}});
        }

        nlohmann::json out = {{"switch_ip", result.switch_address},
                              {"depth", result.depth},
                              {"sys_name", result.sys_name},
                              {"sys_descr", result.sys_descr},
                              {"neighbors", neighbors},
                              {"end_hosts", hosts},
                              {"errors", result.errors}};
        if (result.classification)
            out["classification"] = ToJson(*result.classification);
        return out;
    }
}
