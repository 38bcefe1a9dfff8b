#include "Ipv4Range.hpp"

#include <tins/tins.h>
#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace net_survey::engine
{
    namespace
    {
        // Tins::IPv4Address converts to and from big-endian integers.
        uint32_t ToHostOrder(const Tins::IPv4Address &ip)
        {
            return ntohl(static_cast<uint32_t>(ip));
        }

        Tins::IPv4Address FromHostOrder(uint32_t value)
        {
            return Tins::IPv4Address(htonl(value));
        }

        uint32_t MaskFromPrefix(int prefix)
        {
            if (prefix <= 0)
                return 0;
            return 0xFFFFFFFFu << (32 - prefix);
        }

        std::string Trim(const std::string &s)
        {
            auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
            auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
            return begin < end ? std::string(begin, end) : std::string();
        }

        uint32_t ParseAddress(const std::string &text)
        {
            if (!IsValidIpv4(text))
                throw RangeError("Invalid IPv4 address: '" + text + "'");
            return ToHostOrder(Tins::IPv4Address(text));
        }

        int ParsePrefix(const std::string &text)
        {
            if (text.empty())
                throw RangeError("Missing prefix length");

            if (text.find('.') != std::string::npos)
            {
                uint32_t mask = ParseAddress(text);
                uint32_t inverted = ~mask;
                if ((inverted & (inverted + 1)) != 0)
                    throw RangeError("Non-contiguous netmask: " + text);
                int prefix = 0;
                while (prefix < 32 && (mask & (0x80000000u >> prefix)))
                    ++prefix;
                return prefix;
            }

            if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); }) || text.size() > 2)
                throw RangeError("Invalid prefix length: " + text);

            int prefix = std::stoi(text);
            if (prefix > 32)
                throw RangeError("Prefix length out of range: " + text);
            return prefix;
        }
    }

    bool IsValidIpv4(const std::string &address)
    {
        in_addr parsed{};
        return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
    }

    Ipv4Network::Ipv4Network(uint32_t network, int prefix)
        : m_network(network & MaskFromPrefix(prefix)), m_mask(MaskFromPrefix(prefix)), m_prefix(prefix)
    {
    }

    Ipv4Network Ipv4Network::Parse(const std::string &text)
    {
        const std::string trimmed = Trim(text);
        if (trimmed.empty())
            throw RangeError("Empty range");

        auto slash = trimmed.find('/');
        if (slash == std::string::npos)
            return Ipv4Network(ParseAddress(trimmed), 32);

        uint32_t address = ParseAddress(trimmed.substr(0, slash));
        int prefix = ParsePrefix(trimmed.substr(slash + 1));
        return Ipv4Network(address, prefix);
    }

    uint64_t Ipv4Network::HostCount() const
    {
        uint64_t size = 1ull << (32 - m_prefix);
        if (m_prefix >= 31)
            return size;
        return size - 2;
    }

    uint32_t Ipv4Network::FirstHost() const
    {
        return m_prefix >= 31 ? m_network : m_network + 1;
    }

    bool Ipv4Network::Contains(const std::string &address) const
    {
        if (!IsValidIpv4(address))
            return false;
        return (ToHostOrder(Tins::IPv4Address(address)) & m_mask) == m_network;
    }

    bool Ipv4Network::IsPrivate() const
    {
        uint32_t last = m_network | ~m_mask;
        return FromHostOrder(m_network).is_private() && FromHostOrder(last).is_private();
    }

    std::vector<std::string> Ipv4Network::Hosts(uint32_t limit) const
    {
        std::vector<std::string> hosts;
        uint64_t count = std::min<uint64_t>(HostCount(), limit);
        hosts.reserve(static_cast<size_t>(count));

        uint32_t current = FirstHost();
        for (uint64_t i = 0; i < count; ++i)
        {
            hosts.push_back(FromHostOrder(current).to_string());
            ++current;
        }
        return hosts;
    }

    std::string Ipv4Network::ToString() const
    {
        std::ostringstream ss;
        ss << FromHostOrder(m_network).to_string() << "/" << m_prefix;
        return ss.str();
    }

    std::vector<std::string> ExpandSweepRange(const std::string &range, const RangePolicy &policy)
    {
        Ipv4Network network = Ipv4Network::Parse(range);

        if (network.HostCount() > policy.hard_cap)
        {
            throw RangeError("Range " + network.ToString() + " has " + std::to_string(network.HostCount()) +
                             " hosts, above the hard cap of " + std::to_string(policy.hard_cap));
        }

        if (policy.private_only && !network.IsPrivate())
            throw RangeError("Range " + network.ToString() + " is not a private network");

        return network.Hosts(std::min(policy.max_hosts, policy.hard_cap));
    }
}
