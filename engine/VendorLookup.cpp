#include "VendorLookup.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace net_survey::engine
{
    namespace
    {
        std::string Trim(const std::string &s)
        {
            size_t a = s.find_first_not_of(" \t\r\n");
            if (a == std::string::npos)
                return "";
            size_t b = s.find_last_not_of(" \t\r\n");
            return s.substr(a, b - a + 1);
        }

        bool IsHex(const std::string &s)
        {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c); });
        }

        std::string ToUpper(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }
    }

    std::optional<std::string> OuiPrefix(const std::string &mac)
    {
        std::string hex;
        for (unsigned char c : mac)
        {
            if (std::isxdigit(c))
                hex += static_cast<char>(std::toupper(c));
            else if (c != ':' && c != '-' && c != '.')
                return std::nullopt;
            if (hex.size() == 6)
                return hex;
        }
        return std::nullopt;
    }

    bool FileOuiDatabase::LoadFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            std::cerr << "[Prober] OUI database not found at " << path << ", vendors will be Unknown\n";
            return false;
        }

        size_t count = Load(file);
        std::cout << "[Prober] Loaded " << count << " OUI entries from " << path << "\n";
        return true;
    }

    size_t FileOuiDatabase::Load(std::istream &in)
    {
        size_t loaded = 0;
        std::string line;
        while (std::getline(in, line))
        {
            if (line.empty() || line[0] == '#' || line.find("(base 16)") != std::string::npos)
                continue;

            // IEEE: "00-00-0C   (hex)\t\tCISCO SYSTEMS, INC."
            auto hex_tag = line.find("(hex)");
            if (hex_tag != std::string::npos)
            {
                std::string prefix = Trim(line.substr(0, hex_tag));
                prefix.erase(std::remove(prefix.begin(), prefix.end(), '-'), prefix.end());
                std::string name = Trim(line.substr(hex_tag + 5));
                if (prefix.size() == 6 && IsHex(prefix) && !name.empty())
                {
                    m_entries[ToUpper(prefix)] = name;
                    ++loaded;
                }
                continue;
            }

            // nmap: "00000C Cisco Systems"
            if (line.size() > 7 && (line[6] == ' ' || line[6] == '\t'))
            {
                std::string prefix = line.substr(0, 6);
                std::string name = Trim(line.substr(7));
                if (IsHex(prefix) && !name.empty())
                {
                    m_entries[ToUpper(prefix)] = name;
                    ++loaded;
                }
            }
        }
        return loaded;
    }

    std::optional<std::string> FileOuiDatabase::Lookup(const std::string &prefix) const
    {
        auto it = m_entries.find(prefix);
        if (it == m_entries.end())
            return std::nullopt;
        return it->second;
    }

    VendorLookup::VendorLookup(std::shared_ptr<const OuiDatabase> database)
        : m_database(std::move(database))
    {
    }

    std::string VendorLookup::Vendor(const std::string &mac)
    {
        auto prefix = OuiPrefix(mac);
        if (!prefix)
            return "Unknown";

        std::lock_guard<std::mutex> lock(m_mutex);
        auto cached = m_cache.find(*prefix);
        if (cached != m_cache.end())
            return cached->second;

        std::string vendor = "Unknown";
        if (m_database)
        {
            if (auto name = m_database->Lookup(*prefix))
                vendor = *name;
        }
        m_cache.emplace(*prefix, vendor);
        return vendor;
    }

    size_t VendorLookup::CacheSize() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_cache.size();
    }
}
