#include "NameResolver.hpp"
#include "Socket.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>

namespace net_survey::engine
{
    namespace
    {
        constexpr uint16_t NETBIOS_PORT = 137;
        constexpr uint16_t MDNS_PORT = 5353;
        constexpr uint16_t DNS_TYPE_PTR = 12;
        constexpr uint16_t NETBIOS_TYPE_NBSTAT = 0x21;

        uint16_t RandomTxnId()
        {
            static thread_local std::mt19937 rng{std::random_device{}()};
            std::uniform_int_distribution<uint16_t> dist(1, 0xFFFF);
            return dist(rng);
        }

        void AppendU16(std::vector<uint8_t> &out, uint16_t value)
        {
            out.push_back(static_cast<uint8_t>(value >> 8));
            out.push_back(static_cast<uint8_t>(value & 0xFF));
        }

        bool ReadU16(const std::vector<uint8_t> &in, size_t offset, uint16_t &out)
        {
            if (offset + 2 > in.size())
                return false;
            out = static_cast<uint16_t>((in[offset] << 8) | in[offset + 1]);
            return true;
        }

        void AppendQueryHeader(std::vector<uint8_t> &out, uint16_t txn_id)
        {
            AppendU16(out, txn_id);
            AppendU16(out, 0x0000); // flags
            AppendU16(out, 1);      // questions
            AppendU16(out, 0);
            AppendU16(out, 0);
            AppendU16(out, 0);
        }

        // Advances past an encoded domain name, compression pointers included.
        bool SkipName(const std::vector<uint8_t> &in, size_t &offset)
        {
            while (offset < in.size())
            {
                uint8_t len = in[offset];
                if (len == 0)
                {
                    offset += 1;
                    return true;
                }
                if ((len & 0xC0) == 0xC0)
                {
                    if (offset + 2 > in.size())
                        return false;
                    offset += 2;
                    return true;
                }
                offset += 1 + len;
            }
            return false;
        }

        bool ReadName(const std::vector<uint8_t> &in, size_t offset, std::string &out)
        {
            out.clear();
            int jumps = 0;
            while (offset < in.size())
            {
                uint8_t len = in[offset];
                if (len == 0)
                    return true;
                if ((len & 0xC0) == 0xC0)
                {
                    if (offset + 2 > in.size() || ++jumps > 16)
                        return false;
                    offset = static_cast<size_t>(((len & 0x3F) << 8) | in[offset + 1]);
                    continue;
                }
                if (offset + 1 + len > in.size())
                    return false;
                if (!out.empty())
                    out += '.';
                out.append(reinterpret_cast<const char *>(in.data() + offset + 1), len);
                offset += 1 + len;
            }
            return false;
        }

        bool EndsWith(const std::string &s, const std::string &suffix)
        {
            return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        std::string ToUpper(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }
    }

    std::vector<ArpEntry> ParseArpTable(std::istream &in)
    {
        std::vector<ArpEntry> results;
        std::string line;
        std::getline(in, line);
        while (std::getline(in, line))
        {
            std::stringstream ss(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            if (!(ss >> ip >> hw_type >> flags >> mac >> mask >> dev))
                continue;

            if (mac == "00:00:00:00:00:00")
                continue;

            results.push_back({ip, ToUpper(mac), dev});
        }
        return results;
    }

    std::optional<std::string> LookupArpMac(const std::string &ip, const std::string &path)
    {
        std::ifstream arpFile(path);
        if (!arpFile.is_open())
            return std::nullopt;

        for (const auto &entry : ParseArpTable(arpFile))
        {
            if (entry.ip == ip)
                return entry.mac;
        }
        return std::nullopt;
    }

    std::vector<uint8_t> BuildNetbiosStatusQuery(uint16_t txn_id)
    {
        std::vector<uint8_t> packet;
        AppendQueryHeader(packet, txn_id);

        // "*" padded with NULs, first-level encoded: 'C','K' then 15 x "AA".
        packet.push_back(0x20);
        packet.push_back('C');
        packet.push_back('K');
        for (int i = 0; i < 30; ++i)
            packet.push_back('A');
        packet.push_back(0x00);

        AppendU16(packet, NETBIOS_TYPE_NBSTAT);
        AppendU16(packet, 0x0001);
        return packet;
    }

    std::optional<std::string> ParseNetbiosStatusResponse(const std::vector<uint8_t> &response)
    {
        size_t offset = 12;
        if (!SkipName(response, offset))
            return std::nullopt;

        // type, class, ttl, rdlength
        offset += 10;
        if (offset >= response.size())
            return std::nullopt;

        uint8_t num_names = response[offset++];
        for (uint8_t i = 0; i < num_names; ++i)
        {
            if (offset + 18 > response.size())
                break;

            std::string name(reinterpret_cast<const char *>(response.data() + offset), 15);
            bool group = (response[offset + 16] & 0x80) != 0;
            offset += 18;

            auto end = name.find_last_not_of(std::string(" \0", 2));
            name = end == std::string::npos ? std::string() : name.substr(0, end + 1);

            if (group || name.empty())
                continue;

            bool printable = std::all_of(name.begin(), name.end(), [](unsigned char c)
                                         { return std::isalnum(c) || c == '-' || c == '_'; });
            if (printable)
                return name;
        }
        return std::nullopt;
    }

    std::string ReverseArpaName(const std::string &ip)
    {
        std::vector<std::string> parts;
        std::stringstream ss(ip);
        std::string part;
        while (std::getline(ss, part, '.'))
            parts.push_back(part);

        std::string name;
        for (auto it = parts.rbegin(); it != parts.rend(); ++it)
            name += *it + ".";
        return name + "in-addr.arpa";
    }

    std::vector<uint8_t> BuildMdnsReverseQuery(const std::string &ip, uint16_t txn_id)
    {
        std::vector<uint8_t> packet;
        AppendQueryHeader(packet, txn_id);

        std::stringstream ss(ReverseArpaName(ip));
        std::string label;
        while (std::getline(ss, label, '.'))
        {
            packet.push_back(static_cast<uint8_t>(label.size()));
            packet.insert(packet.end(), label.begin(), label.end());
        }
        packet.push_back(0x00);

        AppendU16(packet, DNS_TYPE_PTR);
        AppendU16(packet, 0x0001);
        return packet;
    }

    std::optional<std::string> ParseMdnsPtrResponse(const std::vector<uint8_t> &response)
    {
        uint16_t qdcount = 0, ancount = 0;
        if (!ReadU16(response, 4, qdcount) || !ReadU16(response, 6, ancount))
            return std::nullopt;

        size_t offset = 12;
        for (uint16_t i = 0; i < qdcount; ++i)
        {
            if (!SkipName(response, offset))
                return std::nullopt;
            offset += 4;
        }

        for (uint16_t i = 0; i < ancount; ++i)
        {
            if (!SkipName(response, offset))
                return std::nullopt;

            uint16_t type = 0, rdlength = 0;
            if (!ReadU16(response, offset, type) || !ReadU16(response, offset + 8, rdlength))
                return std::nullopt;
            offset += 10;
            if (offset + rdlength > response.size())
                return std::nullopt;

            if (type == DNS_TYPE_PTR)
            {
                std::string target;
                if (!ReadName(response, offset, target) || target.empty())
                    return std::nullopt;
                if (EndsWith(target, ".local"))
                    target.resize(target.size() - 6);
                return target;
            }
            offset += rdlength;
        }
        return std::nullopt;
    }

    std::optional<std::string> NameResolver::ReverseDns(const std::string &ip) const
    {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return std::nullopt;

        char host[NI_MAXHOST];
        int rc = getnameinfo(reinterpret_cast<sockaddr *>(&addr), sizeof(addr), host, sizeof(host), nullptr, 0, NI_NAMEREQD);
        if (rc != 0)
            return std::nullopt;
        return std::string(host);
    }

    std::optional<std::string> NameResolver::QueryNetbios(const std::string &ip) const
    {
        try
        {
            UdpSocket sock;
            auto reply = sock.Exchange(ip, NETBIOS_PORT, BuildNetbiosStatusQuery(RandomTxnId()), m_timeout_ms);
            if (!reply)
                return std::nullopt;
            return ParseNetbiosStatusResponse(*reply);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Prober] NetBIOS query to " << ip << " failed: " << e.what() << "\n";
            return std::nullopt;
        }
    }

    std::optional<std::string> NameResolver::QueryMdns(const std::string &ip) const
    {
        try
        {
            UdpSocket sock;
            auto reply = sock.Exchange(ip, MDNS_PORT, BuildMdnsReverseQuery(ip, RandomTxnId()), m_timeout_ms);
            if (!reply)
                return std::nullopt;
            return ParseMdnsPtrResponse(*reply);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Prober] mDNS query to " << ip << " failed: " << e.what() << "\n";
            return std::nullopt;
        }
    }

    std::string NameResolver::ResolveHostname(const std::string &ip) const
    {
        if (auto name = ReverseDns(ip))
            return *name;
        if (auto name = QueryNetbios(ip))
            return *name;
        if (auto name = QueryMdns(ip))
            return *name;
        return "Unknown";
    }
}
