#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace net_survey::engine
{
    // Raised synchronously for ranges a sweep refuses to start on.
    class RangeError : public std::runtime_error
    {
    public:
        explicit RangeError(const std::string &what) : std::runtime_error(what) {}
    };

    struct RangePolicy
    {
        uint32_t hard_cap = 4096;
        uint32_t max_hosts = 254;
        bool private_only = true;
    };

    class Ipv4Network
    {
    public:
        // Accepts "a.b.c.d/len", "a.b.c.d/mask" or a bare address (/32).
        // Host bits are masked off, like a non-strict network parse.
        static Ipv4Network Parse(const std::string &text);

        uint32_t NetworkValue() const { return m_network; }
        uint32_t MaskValue() const { return m_mask; }
        int PrefixLength() const { return m_prefix; }

        // Usable hosts: everything but network/broadcast for prefixes up
        // to /30, both addresses of a /31, the single address of a /32.
        uint64_t HostCount() const;
        uint32_t FirstHost() const;

        bool Contains(const std::string &address) const;
        bool IsPrivate() const;

        // At most `limit` hosts in ascending order.
        std::vector<std::string> Hosts(uint32_t limit) const;

        std::string ToString() const;

    private:
        Ipv4Network(uint32_t network, int prefix);

        uint32_t m_network;
        uint32_t m_mask;
        int m_prefix;
    };

    // Validates a sweep request against the policy and returns the bounded
    // host list. Throws RangeError.
    std::vector<std::string> ExpandSweepRange(const std::string &range, const RangePolicy &policy);

    bool IsValidIpv4(const std::string &address);
}
