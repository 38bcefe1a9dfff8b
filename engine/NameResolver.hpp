#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace net_survey::engine
{
    struct ArpEntry
    {
        std::string ip;
        std::string mac;
        std::string device;
    };

    // Parses the kernel neighbour table format of /proc/net/arp. Incomplete
    // entries (all-zero MAC) are skipped. MACs come back upper-case.
    std::vector<ArpEntry> ParseArpTable(std::istream &in);
    std::optional<std::string> LookupArpMac(const std::string &ip, const std::string &path = "/proc/net/arp");

    // NetBIOS node status request for the wildcard name "*".
    std::vector<uint8_t> BuildNetbiosStatusQuery(uint16_t txn_id);
    // First unique (non-group) printable name in a node status response.
    std::optional<std::string> ParseNetbiosStatusResponse(const std::vector<uint8_t> &response);

    std::string ReverseArpaName(const std::string &ip);
    std::vector<uint8_t> BuildMdnsReverseQuery(const std::string &ip, uint16_t txn_id);
    // Target of the first PTR answer, with a trailing ".local" removed.
    std::optional<std::string> ParseMdnsPtrResponse(const std::vector<uint8_t> &response);

    class NameResolver
    {
    public:
        explicit NameResolver(int timeout_ms = 500) : m_timeout_ms(timeout_ms) {}

        // Reverse DNS, then NetBIOS, then unicast mDNS. "Unknown" if all fail.
        std::string ResolveHostname(const std::string &ip) const;

        std::optional<std::string> ReverseDns(const std::string &ip) const;
        std::optional<std::string> QueryNetbios(const std::string &ip) const;
        std::optional<std::string> QueryMdns(const std::string &ip) const;

    private:
        int m_timeout_ms;
    };
}
