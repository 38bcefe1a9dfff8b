#include "DeviceClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace net_survey::engine
{
    namespace
    {
        struct PatternRule
        {
            DeviceType type;
            std::vector<std::string> patterns;
        };

        struct CompiledRule
        {
            DeviceType type;
            std::vector<std::pair<std::string, std::regex>> patterns;
        };

        struct PortRule
        {
            std::vector<uint16_t> ports;
            DeviceType type;
            int weight;
            const char *reason;
        };

        const std::vector<PatternRule> BANNER_PATTERNS = {
            {DeviceType::Firewall, {"cisco.*asa", "palo alto", "fortinet", "fortigate",
                                    "pfsense", "opnsense", "checkpoint", "sonicwall"}},
            {DeviceType::Router, {"cisco.*ios", "juniper.*junos", "mikrotik.*routeros", "router"}},
            {DeviceType::Switch, {"cisco.*catalyst", "cisco.*nexus", "hp.*switch", "aruba.*switch",
                                  "juniper.*ex", "procurve", "switch"}},
            {DeviceType::AccessPoint, {"ubiquiti", "unifi", "cisco.*aironet", "aruba.*ap",
                                       "access point", "lap11", "lap12"}},
            {DeviceType::Server, {"linux.*server", "ubuntu.*server", "centos", "windows.*server",
                                  "esxi", "proxmox", "synology", "nas"}},
            {DeviceType::Printer, {"printer", "laserjet", "inkjet", "canon", "epson", "xerox"}},
        };

        // First entry contained in the vendor string wins.
        const std::vector<std::pair<std::string, DeviceType>> VENDOR_TABLE = {
            {"palo alto", DeviceType::Firewall},
            {"fortinet", DeviceType::Firewall},
            {"sonicwall", DeviceType::Firewall},
            {"cisco", DeviceType::Switch},
            {"juniper", DeviceType::Router},
            {"mikrotik", DeviceType::Router},
            {"ubiquiti", DeviceType::AccessPoint},
            {"ruckus", DeviceType::AccessPoint},
            {"aruba", DeviceType::AccessPoint},
            {"hewlett-packard", DeviceType::Printer},
            {"hp", DeviceType::Printer},
            {"canon", DeviceType::Printer},
            {"epson", DeviceType::Printer},
            {"brother", DeviceType::Printer},
            {"xerox", DeviceType::Printer},
            {"hikvision", DeviceType::CameraIoT},
            {"dahua", DeviceType::CameraIoT},
            {"axis", DeviceType::CameraIoT},
            {"apple", DeviceType::Mobile},
            {"samsung", DeviceType::Mobile},
            {"dell", DeviceType::Workstation},
            {"lenovo", DeviceType::Workstation},
            {"synology", DeviceType::Server},
            {"qnap", DeviceType::Server},
            {"vmware", DeviceType::Server},
        };

        const std::vector<PortRule> PORT_RULES = {
            {{3306, 5432, 27017, 6379, 1433}, DeviceType::Server, WEIGHT_PORT, "Open database ports"},
            {{9100, 631, 515}, DeviceType::Printer, WEIGHT_PORT, "Open printing ports"},
            {{554}, DeviceType::CameraIoT, WEIGHT_PORT, "RTSP port 554 open"},
            {{445}, DeviceType::Workstation, 10, "SMB port 445 open"},
            {{445}, DeviceType::Server, 5, "SMB port 445 open"},
            {{179, 520}, DeviceType::Router, WEIGHT_PORT, "Routing protocol ports open"},
        };

        const std::vector<PatternRule> HOSTNAME_PATTERNS = {
            {DeviceType::Firewall, {"^(fw|firewall|asa|palo|fortinet)[-_]?"}},
            {DeviceType::Router, {"^(router|rtr|gw|gateway)[-_]?"}},
            {DeviceType::Switch, {"^(switch|sw|core|dist|access)[-_]?"}},
            {DeviceType::AccessPoint, {"^(ap|wifi|wlan)[-_]?"}},
            {DeviceType::Server, {"^(server|srv|db|web|app|mail|esx|vcenter)[-_]?"}},
            {DeviceType::Workstation, {"^(pc|ws|desktop|laptop)[-_]?"}},
            {DeviceType::Printer, {"^(printer|print|hp|canon|epson)[-_]?"}},
            {DeviceType::CameraIoT, {"^(cam|camera|ipc|dvr|nvr)[-_]?"}},
            {DeviceType::Mobile, {"^(iphone|ipad|android|galaxy)"}},
        };

        std::vector<CompiledRule> Compile(const std::vector<PatternRule> &rules)
        {
            std::vector<CompiledRule> compiled;
            compiled.reserve(rules.size());
            for (const auto &rule : rules)
            {
                CompiledRule c{rule.type, {}};
                for (const auto &p : rule.patterns)
                    c.patterns.emplace_back(p, std::regex(p, std::regex::ECMAScript | std::regex::optimize));
                compiled.push_back(std::move(c));
            }
            return compiled;
        }

        const std::vector<CompiledRule> &BannerRules()
        {
            static const std::vector<CompiledRule> rules = Compile(BANNER_PATTERNS);
            return rules;
        }

        const std::vector<CompiledRule> &HostnameRules()
        {
            static const std::vector<CompiledRule> rules = Compile(HOSTNAME_PATTERNS);
            return rules;
        }

        std::string ToLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        class ScoreBoard
        {
        public:
            void Add(DeviceType type, int weight, const char *source, const std::string &value)
            {
                m_scores[type] += weight;
                m_evidence[type].push_back({source, value});
            }

            bool Empty() const { return m_scores.empty(); }
            int Score(DeviceType type) const
            {
                auto it = m_scores.find(type);
                return it == m_scores.end() ? 0 : it->second;
            }

            std::vector<std::pair<DeviceType, int>> Ranked() const
            {
                std::vector<std::pair<DeviceType, int>> ranked(m_scores.begin(), m_scores.end());
                std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b)
                          {
                              if (a.second != b.second)
                                  return a.second > b.second;
                              return static_cast<int>(a.first) < static_cast<int>(b.first);
                          });
                return ranked;
            }

            const std::vector<Evidence> &EvidenceFor(DeviceType type) { return m_evidence[type]; }

        private:
            std::map<DeviceType, int> m_scores;
            std::map<DeviceType, std::vector<Evidence>> m_evidence;
        };

        void ScorePatterns(const std::vector<CompiledRule> &rules, const std::string &text,
                           int weight, const char *source, ScoreBoard &board)
        {
            for (const auto &rule : rules)
            {
                for (const auto &pattern : rule.patterns)
                {
                    if (std::regex_search(text, pattern.second))
                    {
                        board.Add(rule.type, weight, source, pattern.first);
                        break;
                    }
                }
            }
        }

        std::string JoinPorts(const std::vector<uint16_t> &ports)
        {
            std::ostringstream ss;
            for (size_t i = 0; i < ports.size(); ++i)
            {
                if (i)
                    ss << ",";
                ss << ports[i];
            }
            return ss.str();
        }
    }

    ClassificationResult DeviceClassifier::Classify(const ClassificationSignals &signals) const
    {
        ScoreBoard board;

        if (signals.banner && !signals.banner->empty())
            ScorePatterns(BannerRules(), ToLower(*signals.banner), WEIGHT_BANNER, "Banner", board);

        const std::string vendor = ToLower(signals.vendor);
        if (!vendor.empty() && vendor != "unknown")
        {
            for (const auto &entry : VENDOR_TABLE)
            {
                if (vendor.find(entry.first) != std::string::npos)
                {
                    board.Add(entry.second, WEIGHT_VENDOR, "Vendor", signals.vendor);
                    break;
                }
            }
        }

        const std::set<uint16_t> ports(signals.open_ports.begin(), signals.open_ports.end());
        for (const auto &rule : PORT_RULES)
        {
            std::vector<uint16_t> hits;
            for (uint16_t p : rule.ports)
            {
                if (ports.count(p))
                    hits.push_back(p);
            }
            if (!hits.empty())
                board.Add(rule.type, rule.weight, "Ports", std::string(rule.reason) + " (" + JoinPorts(hits) + ")");
        }

        if (!signals.hostname.empty() && signals.hostname != "Unknown")
            ScorePatterns(HostnameRules(), ToLower(signals.hostname), WEIGHT_HOSTNAME, "Hostname", board);

        if (ports.empty() && board.Score(DeviceType::Mobile) >= WEIGHT_VENDOR)
            board.Add(DeviceType::Mobile, 10, "Ports", "No open ports typical for mobile");

        ClassificationResult result;
        if (board.Empty())
            return result;

        const auto ranked = board.Ranked();
        const DeviceType best = ranked.front().first;

        result.score = ranked.front().second;
        result.type = best;
        result.evidence = board.EvidenceFor(best);

        if (result.score >= THRESHOLD_HIGH)
            result.confidence = Confidence::High;
        else if (result.score >= THRESHOLD_MEDIUM)
            result.confidence = Confidence::Medium;
        else
        {
            result.confidence = Confidence::Low;
            if (result.score < SCORE_FLOOR)
                result.type = DeviceType::Unknown;
        }

        for (size_t i = 1; i < ranked.size() && i < 3; ++i)
            result.runner_ups.push_back(ranked[i]);

        return result;
    }
}
