#pragma once

#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace net_survey::engine
{
    // Source of OUI (first three MAC octets) to organisation names.
    class OuiDatabase
    {
    public:
        virtual ~OuiDatabase() = default;
        // `prefix` is six upper-case hex digits, e.g. "00000C".
        virtual std::optional<std::string> Lookup(const std::string &prefix) const = 0;
    };

    // Loads the IEEE oui.txt listing ("00-00-0C   (hex)\t\tCisco Systems, Inc")
    // or nmap-mac-prefixes ("00000C Cisco Systems"). Unrecognised lines are ignored.
    class FileOuiDatabase : public OuiDatabase
    {
    public:
        FileOuiDatabase() = default;

        bool LoadFile(const std::string &path);
        size_t Load(std::istream &in);

        std::optional<std::string> Lookup(const std::string &prefix) const override;
        size_t Size() const { return m_entries.size(); }

    private:
        std::unordered_map<std::string, std::string> m_entries;
    };

    // Upper-case hex OUI of a MAC in any of the usual notations, or
    // std::nullopt if there are not six hex digits to take.
    std::optional<std::string> OuiPrefix(const std::string &mac);

    // Per-prefix memo over an OuiDatabase. The database is consulted at most
    // once for each prefix, misses included.
    class VendorLookup
    {
    public:
        explicit VendorLookup(std::shared_ptr<const OuiDatabase> database);

        std::string Vendor(const std::string &mac);

        size_t CacheSize() const;

    private:
        std::shared_ptr<const OuiDatabase> m_database;
        mutable std::mutex m_mutex;
        std::unordered_map<std::string, std::string> m_cache;
    };
}
