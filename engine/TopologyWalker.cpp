#include "TopologyWalker.hpp"
#include "Ipv4Range.hpp"

#include <deque>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace net_survey::engine
{
    namespace
    {
        using RowIndex = std::pair<int, int>;

        std::string IpFromTrailingBytes(const std::string &bytes)
        {
            if (bytes.size() < 4)
                return "";
            std::string out;
            for (size_t i = bytes.size() - 4; i < bytes.size(); ++i)
            {
                if (!out.empty())
                    out += '.';
                out += std::to_string(static_cast<unsigned char>(bytes[i]));
            }
            return out;
        }

        int ToInt(const SnmpValue &value)
        {
            return static_cast<int>(value.number);
        }
    }

    std::string MacFromOidSuffix(const Oid &suffix)
    {
        if (suffix.size() < 6)
            return "";

        std::stringstream ss;
        for (size_t i = suffix.size() - 6; i < suffix.size(); ++i)
        {
            if (suffix[i] > 255)
                return "";
            if (i != suffix.size() - 6)
                ss << ":";
            ss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << suffix[i];
        }
        return ss.str();
    }

    std::set<int> UplinkInterfaces(const std::vector<Neighbor> &neighbors)
    {
        std::set<int> uplinks;
        for (const auto &n : neighbors)
        {
            if (n.is_switch && n.local_if_index)
                uplinks.insert(*n.local_if_index);
        }
        return uplinks;
    }

    std::string TopologyWalker::InterfaceNames::Lookup(int if_index) const
    {
        auto it = if_name.find(if_index);
        if (it != if_name.end() && !it->second.empty())
            return it->second;
        auto d = if_descr.find(if_index);
        return d != if_descr.end() ? d->second : std::string();
    }

    TopologyWalker::TopologyWalker(SnmpSession &session, const DeviceClassifier *classifier)
        : m_session(session), m_classifier(classifier)
    {
    }

    TopologyWalker::InterfaceNames TopologyWalker::ReadInterfaceNames(const std::string &address,
                                                                      std::vector<std::string> &errors)
    {
        InterfaceNames names;

        try
        {
            for (const auto &row : m_session.Walk(address, mib::IF_NAME))
            {
                Oid suffix = OidSuffix(row.oid, mib::IF_NAME);
                if (!suffix.empty())
                    names.if_name[static_cast<int>(suffix[0])] = row.value.AsString();
            }
        }
        catch (const SnmpError &e)
        {
            errors.push_back(std::string("ifName error: ") + e.what());
        }

        try
        {
            for (const auto &row : m_session.Walk(address, mib::IF_DESCR))
            {
                Oid suffix = OidSuffix(row.oid, mib::IF_DESCR);
                if (!suffix.empty())
                    names.if_descr[static_cast<int>(suffix[0])] = row.value.AsString();
            }
        }
        catch (const SnmpError &e)
        {
            errors.push_back(std::string("ifDescr error: ") + e.what());
        }

        return names;
    }

    void TopologyWalker::ReadSystem(const std::string &address, TopologyWalkResult &result)
    {
        try
        {
            if (auto name = m_session.Get(address, mib::SYS_NAME))
                result.sys_name = name->AsString();
            if (auto descr = m_session.Get(address, mib::SYS_DESCR))
                result.sys_descr = descr->AsString();
        }
        catch (const SnmpError &e)
        {
            result.errors.push_back(std::string("System error: ") + e.what());
        }
    }

    std::vector<Neighbor> TopologyWalker::ReadCdpNeighbors(const std::string &address, const InterfaceNames &names)
    {
        std::map<RowIndex, Neighbor> entries;

        auto walk = [&](const Oid &column, const std::function<void(Neighbor &, const SnmpValue &)> &apply)
        {
            for (const auto &row : m_session.Walk(address, column))
            {
                Oid suffix = OidSuffix(row.oid, column);
                if (suffix.size() < 2)
                    continue;
                RowIndex idx{static_cast<int>(suffix[suffix.size() - 2]), static_cast<int>(suffix.back())};
                apply(entries[idx], row.value);
            }
        };

        walk(mib::CDP_DEVICE_ID, [](Neighbor &n, const SnmpValue &v)
             { n.device_id = v.AsString(); });
        walk(mib::CDP_ADDRESS, [](Neighbor &n, const SnmpValue &v)
             {
                 std::string ip = IpFromTrailingBytes(v.bytes);
                 if (!ip.empty())
                     n.address = ip; });
        walk(mib::CDP_DEVICE_PORT, [](Neighbor &n, const SnmpValue &v)
             { n.remote_port = v.AsString(); });
        walk(mib::CDP_PLATFORM, [](Neighbor &n, const SnmpValue &v)
             { n.platform = v.AsString(); });
        walk(mib::CDP_CAPABILITIES, [](Neighbor &n, const SnmpValue &v)
             { n.capabilities = v.AsBits(); });

        std::vector<Neighbor> neighbors;
        for (auto &entry : entries)
        {
            Neighbor &n = entry.second;
            uint32_t caps = n.capabilities.value_or(0);
            n.capabilities = caps;
            n.is_switch = (caps & mib::CDP_CAP_SWITCH) || (caps & mib::CDP_CAP_TRANSPARENT_BRIDGE);
            n.local_if_index = entry.first.first;
            n.local_port = names.Lookup(entry.first.first);
            n.protocol = "CDP";
            neighbors.push_back(std::move(n));
        }
        return neighbors;
    }

    std::vector<Neighbor> TopologyWalker::ReadLldpNeighbors(const std::string &address, const InterfaceNames &names)
    {
        std::map<RowIndex, Neighbor> entries;

        auto walk = [&](const Oid &column, const std::function<void(Neighbor &, const SnmpValue &)> &apply)
        {
            for (const auto &row : m_session.Walk(address, column))
            {
                Oid suffix = OidSuffix(row.oid, column);
                if (suffix.size() < 3)
                    continue;
                RowIndex idx{static_cast<int>(suffix[1]), static_cast<int>(suffix[2])};
                apply(entries[idx], row.value);
            }
        };

        walk(mib::LLDP_REM_SYS_NAME, [](Neighbor &n, const SnmpValue &v)
             { n.device_id = v.AsString(); });
        walk(mib::LLDP_REM_PORT_ID, [](Neighbor &n, const SnmpValue &v)
             { n.remote_port = v.AsString(); });
        walk(mib::LLDP_REM_SYS_DESC, [](Neighbor &n, const SnmpValue &v)
             { n.platform = v.AsString(); });
        walk(mib::LLDP_REM_CAP_ENABLED, [](Neighbor &n, const SnmpValue &v)
             {
                 n.capabilities = v.AsBits();
                 n.is_switch = !v.bytes.empty() && (static_cast<unsigned char>(v.bytes[0]) & mib::LLDP_CAP_BRIDGE); });

        // timeMark.localPort.remIndex.addrSubtype.addrLen.a.b.c.d
        for (const auto &row : m_session.Walk(address, mib::LLDP_REM_MAN_ADDR))
        {
            Oid suffix = OidSuffix(row.oid, mib::LLDP_REM_MAN_ADDR);
            if (suffix.size() != 9 || suffix[3] != 1 || suffix[4] != 4)
                continue;

            bool valid = true;
            std::string ip;
            for (size_t i = 5; i < 9; ++i)
            {
                if (suffix[i] > 255)
                    valid = false;
                if (!ip.empty())
                    ip += '.';
                ip += std::to_string(suffix[i]);
            }
            if (!valid)
                continue;

            Neighbor &n = entries[RowIndex{static_cast<int>(suffix[1]), static_cast<int>(suffix[2])}];
            if (!n.address)
                n.address = ip;
        }

        std::vector<Neighbor> neighbors;
        for (auto &entry : entries)
        {
            Neighbor &n = entry.second;
            n.local_if_index = entry.first.first;
            n.local_port = names.Lookup(entry.first.first);
            n.protocol = "LLDP";
            neighbors.push_back(std::move(n));
        }
        return neighbors;
    }

    std::vector<EndHost> TopologyWalker::ReadEndHosts(const std::string &address, const InterfaceNames &names,
                                                      const std::set<int> &uplinks, std::vector<std::string> &errors)
    {
        struct FdbEntry
        {
            std::optional<int> bridge_port;
            std::optional<int> status;
        };

        std::vector<std::string> order;
        std::map<std::string, FdbEntry> fdb;

        try
        {
            for (const auto &row : m_session.Walk(address, mib::FDB_ADDRESS))
            {
                std::string mac = MacFromOidSuffix(OidSuffix(row.oid, mib::FDB_ADDRESS));
                if (mac.empty())
                    mac = row.value.AsMac();
                if (mac.empty())
                    continue;
                if (fdb.emplace(mac, FdbEntry{}).second)
                    order.push_back(mac);
            }
        }
        catch (const SnmpError &e)
        {
            errors.push_back(std::string("FDB error: ") + e.what());
            return {};
        }

        try
        {
            for (const auto &row : m_session.Walk(address, mib::FDB_PORT))
            {
                auto it = fdb.find(MacFromOidSuffix(OidSuffix(row.oid, mib::FDB_PORT)));
                if (it != fdb.end() && row.value.IsNumeric())
                    it->second.bridge_port = ToInt(row.value);
            }
        }
        catch (const SnmpError &e)
        {
            errors.push_back(std::string("FDB port error: ") + e.what());
        }

        try
        {
            for (const auto &row : m_session.Walk(address, mib::FDB_STATUS))
            {
                auto it = fdb.find(MacFromOidSuffix(OidSuffix(row.oid, mib::FDB_STATUS)));
                if (it != fdb.end() && row.value.IsNumeric())
                    it->second.status = ToInt(row.value);
            }
        }
        catch (const SnmpError &e)
        {
            errors.push_back(std::string("FDB status error: ") + e.what());
        }

        std::map<int, int> bridge_to_if;
        try
        {
            for (const auto &row : m_session.Walk(address, mib::BASE_PORT_IFINDEX))
            {
                Oid suffix = OidSuffix(row.oid, mib::BASE_PORT_IFINDEX);
                if (!suffix.empty() && row.value.IsNumeric())
                    bridge_to_if[static_cast<int>(suffix[0])] = ToInt(row.value);
            }
        }
        catch (const SnmpError &e)
        {
            errors.push_back(std::string("Bridge port map error: ") + e.what());
        }

        std::map<std::string, std::string> mac_to_ip;
        try
        {
            for (const auto &row : m_session.Walk(address, mib::IP_NET_TO_MEDIA_PHYS))
            {
                Oid suffix = OidSuffix(row.oid, mib::IP_NET_TO_MEDIA_PHYS);
                if (suffix.size() < 5)
                    continue;

                std::string ip = std::to_string(suffix[1]) + "." + std::to_string(suffix[2]) + "." +
                                 std::to_string(suffix[3]) + "." + std::to_string(suffix[4]);
                if (ip == "0.0.0.0" || !IsValidIpv4(ip))
                    continue;

                std::string mac = row.value.AsMac();
                if (!mac.empty())
                    mac_to_ip.emplace(mac, ip);
            }
        }
        catch (const SnmpError &e)
        {
            errors.push_back(std::string("ARP error: ") + e.what());
        }

        std::vector<EndHost> hosts;
        for (const auto &mac : order)
        {
            const FdbEntry &entry = fdb[mac];
            if (entry.status && *entry.status != mib::FDB_STATUS_LEARNED)
                continue;

            EndHost host;
            host.mac = mac;
            host.bridge_port = entry.bridge_port;
            if (entry.bridge_port)
            {
                auto it = bridge_to_if.find(*entry.bridge_port);
                if (it != bridge_to_if.end())
                    host.if_index = it->second;
            }

            if (host.if_index && uplinks.count(*host.if_index))
                continue;

            if (host.if_index)
                host.port_name = names.Lookup(*host.if_index);

            auto ip = mac_to_ip.find(mac);
            if (ip != mac_to_ip.end())
                host.address = ip->second;

            hosts.push_back(std::move(host));
        }
        return hosts;
    }

    TopologyWalkResult TopologyWalker::InspectSwitch(const std::string &address, int depth)
    {
        TopologyWalkResult result;
        result.switch_address = address;
        result.depth = depth;

        ReadSystem(address, result);
        InterfaceNames names = ReadInterfaceNames(address, result.errors);

        try
        {
            result.neighbors = ReadCdpNeighbors(address, names);
        }
        catch (const SnmpError &e)
        {
            result.errors.push_back(std::string("CDP error: ") + e.what());
        }

        if (result.neighbors.empty())
        {
            try
            {
                result.neighbors = ReadLldpNeighbors(address, names);
            }
            catch (const SnmpError &e)
            {
                result.errors.push_back(std::string("LLDP error: ") + e.what());
            }
        }

        result.end_hosts = ReadEndHosts(address, names, UplinkInterfaces(result.neighbors), result.errors);

        if (m_classifier)
        {
            ClassificationSignals signals;
            signals.address = address;
            signals.hostname = result.sys_name;
            if (!result.sys_descr.empty())
                signals.banner = result.sys_descr;
            result.classification = m_classifier->Classify(signals);
        }

        for (const auto &err : result.errors)
            std::cerr << "[Topology] " << address << ": " << err << "\n";

        return result;
    }

    std::vector<TopologyWalkResult> TopologyWalker::Discover(const std::string &seed, int max_depth, int max_switches,
                                                             const SwitchCallback &on_switch)
    {
        std::vector<TopologyWalkResult> switches;
        std::set<std::string> visited;
        std::deque<std::pair<std::string, int>> queue;
        queue.emplace_back(seed, 0);

        while (!queue.empty() && static_cast<int>(visited.size()) < max_switches)
        {
            auto [address, depth] = queue.front();
            queue.pop_front();

            if (visited.count(address) || !IsValidIpv4(address))
                continue;
            visited.insert(address);

            std::cout << "[Topology] Inspecting " << address << " (depth " << depth << ")\n";
            TopologyWalkResult result = InspectSwitch(address, depth);

            if (depth < max_depth)
            {
                for (const auto &n : result.neighbors)
                {
                    if (n.is_switch && n.address && !visited.count(*n.address))
                        queue.emplace_back(*n.address, depth + 1);
                }
            }

            switches.push_back(std::move(result));
            if (on_switch)
                on_switch(WalkProgress{visited.size(), address, depth, queue.size()}, switches.back());
        }

        std::cout << "[Topology] Walk from " << seed << " visited " << switches.size() << " switches\n";
        return switches;
    }
}
