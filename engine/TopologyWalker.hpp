#pragma once

#include "Ber.hpp"
#include "DeviceClassifier.hpp"
#include "SnmpClient.hpp"
#include "Types.hpp"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace net_survey::engine
{
    namespace mib
    {
        inline const Oid SYS_DESCR = {1, 3, 6, 1, 2, 1, 1, 1, 0};
        inline const Oid SYS_NAME = {1, 3, 6, 1, 2, 1, 1, 5, 0};

        // CISCO-CDP-MIB cdpCacheTable, indexed by ifIndex.deviceIndex
        inline const Oid CDP_ADDRESS = {1, 3, 6, 1, 4, 1, 9, 9, 23, 1, 2, 1, 1, 4};
        inline const Oid CDP_DEVICE_ID = {1, 3, 6, 1, 4, 1, 9, 9, 23, 1, 2, 1, 1, 6};
        inline const Oid CDP_DEVICE_PORT = {1, 3, 6, 1, 4, 1, 9, 9, 23, 1, 2, 1, 1, 7};
        inline const Oid CDP_PLATFORM = {1, 3, 6, 1, 4, 1, 9, 9, 23, 1, 2, 1, 1, 8};
        inline const Oid CDP_CAPABILITIES = {1, 3, 6, 1, 4, 1, 9, 9, 23, 1, 2, 1, 1, 9};

        // LLDP-MIB lldpRemTable, indexed by timeMark.localPortNum.remIndex
        inline const Oid LLDP_REM_PORT_ID = {1, 0, 8802, 1, 1, 2, 1, 4, 1, 1, 7};
        inline const Oid LLDP_REM_SYS_NAME = {1, 0, 8802, 1, 1, 2, 1, 4, 1, 1, 9};
        inline const Oid LLDP_REM_SYS_DESC = {1, 0, 8802, 1, 1, 2, 1, 4, 1, 1, 10};
        inline const Oid LLDP_REM_CAP_ENABLED = {1, 0, 8802, 1, 1, 2, 1, 4, 1, 1, 12};
        // lldpRemManAddrIfSubtype; the address itself is in the index.
        inline const Oid LLDP_REM_MAN_ADDR = {1, 0, 8802, 1, 1, 2, 1, 4, 2, 1, 4};

        // BRIDGE-MIB
        inline const Oid FDB_ADDRESS = {1, 3, 6, 1, 2, 1, 17, 4, 3, 1, 1};
        inline const Oid FDB_PORT = {1, 3, 6, 1, 2, 1, 17, 4, 3, 1, 2};
        inline const Oid FDB_STATUS = {1, 3, 6, 1, 2, 1, 17, 4, 3, 1, 3};
        inline const Oid BASE_PORT_IFINDEX = {1, 3, 6, 1, 2, 1, 17, 1, 4, 1, 2};

        inline const Oid IF_NAME = {1, 3, 6, 1, 2, 1, 31, 1, 1, 1, 1};
        inline const Oid IF_DESCR = {1, 3, 6, 1, 2, 1, 2, 2, 1, 2};
        inline const Oid IP_NET_TO_MEDIA_PHYS = {1, 3, 6, 1, 2, 1, 4, 22, 1, 2};

        constexpr uint32_t CDP_CAP_TRANSPARENT_BRIDGE = 0x02;
        constexpr uint32_t CDP_CAP_SWITCH = 0x08;
        constexpr uint8_t LLDP_CAP_BRIDGE = 0x20;
        constexpr int FDB_STATUS_LEARNED = 3;
    }

    struct WalkProgress
    {
        std::size_t visited = 0;
        std::string address;
        int depth = 0;
        std::size_t queued = 0;
    };

    using SwitchCallback = std::function<void(const WalkProgress &, const TopologyWalkResult &)>;

    // Breadth-first switch discovery over SNMP. Switches are visited one at a
    // time; every visited address appears in the output exactly once.
    class TopologyWalker
    {
    public:
        explicit TopologyWalker(SnmpSession &session, const DeviceClassifier *classifier = nullptr);

        std::vector<TopologyWalkResult> Discover(const std::string &seed, int max_depth, int max_switches,
                                                 const SwitchCallback &on_switch = nullptr);

        // Never throws for SNMP failures; they land in result.errors.
        TopologyWalkResult InspectSwitch(const std::string &address, int depth = 0);

    private:
        struct InterfaceNames
        {
            std::map<int, std::string> if_name;
            std::map<int, std::string> if_descr;

            std::string Lookup(int if_index) const;
        };

        InterfaceNames ReadInterfaceNames(const std::string &address, std::vector<std::string> &errors);
        void ReadSystem(const std::string &address, TopologyWalkResult &result);
        std::vector<Neighbor> ReadCdpNeighbors(const std::string &address, const InterfaceNames &names);
        std::vector<Neighbor> ReadLldpNeighbors(const std::string &address, const InterfaceNames &names);
        std::vector<EndHost> ReadEndHosts(const std::string &address, const InterfaceNames &names,
                                          const std::set<int> &uplinks, std::vector<std::string> &errors);

        SnmpSession &m_session;
        const DeviceClassifier *m_classifier;
    };

    // Local ifIndexes facing neighbors that advertise themselves as switches.
    std::set<int> UplinkInterfaces(const std::vector<Neighbor> &neighbors);

    std::string MacFromOidSuffix(const Oid &suffix);
}
