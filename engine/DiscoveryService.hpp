#pragma once

#include "DeviceClassifier.hpp"
#include "EventSink.hpp"
#include "HostProber.hpp"
#include "InventoryStore.hpp"
#include "ScanJobManager.hpp"
#include "SweepEngine.hpp"
#include "TopologyJobManager.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace net_survey::engine
{
    // Entry point for every discovery operation the server exposes.
    class DiscoveryService
    {
    public:
        DiscoveryService(HostProber &prober, SweepOptions sweep_options, InventoryStore *inventory,
                         EventSink *events = nullptr, SnmpSessionFactory snmp_factory = nullptr);

        std::string StartSweep(const std::string &range, const std::string &owner);
        std::optional<ScanJobStatus> PollSweep(const std::string &job_id);
        std::optional<std::vector<DiscoveredDevice>> SweepResults(const std::string &job_id) const;
        bool StopSweep(const std::string &job_id);
        std::optional<std::string> ActiveSweep(const std::string &owner) const;

        std::string StartTopologyWalk(const std::string &seed, const WalkOptions &options, const std::string &owner);
        std::optional<TopologyJobStatus> PollTopologyWalk(const std::string &job_id) const;
        std::optional<std::string> ActiveTopologyWalk(const std::string &owner) const;

        ClassificationResult Classify(const ClassificationSignals &signals) const;

        ScanJobManager &Sweeps() { return m_sweeps; }
        TopologyJobManager &Walks() { return m_walks; }

    private:
        DeviceClassifier m_classifier;
        ScanJobManager m_sweeps;
        TopologyJobManager m_walks;
    };
}
