#include "DiscoveryService.hpp"

namespace net_survey::engine
{
    DiscoveryService::DiscoveryService(HostProber &prober, SweepOptions sweep_options, InventoryStore *inventory,
                                       EventSink *events, SnmpSessionFactory snmp_factory)
        : m_sweeps(prober, m_classifier, std::move(sweep_options), events),
          m_walks(m_classifier, inventory, std::move(snmp_factory))
    {
    }

    std::string DiscoveryService::StartSweep(const std::string &range, const std::string &owner)
    {
        return m_sweeps.Start(range, owner);
    }

    std::optional<ScanJobStatus> DiscoveryService::PollSweep(const std::string &job_id)
    {
        return m_sweeps.Poll(job_id);
    }

    std::optional<std::vector<DiscoveredDevice>> DiscoveryService::SweepResults(const std::string &job_id) const
    {
        return m_sweeps.Results(job_id);
    }

    bool DiscoveryService::StopSweep(const std::string &job_id)
    {
        return m_sweeps.Stop(job_id);
    }

    std::optional<std::string> DiscoveryService::ActiveSweep(const std::string &owner) const
    {
        return m_sweeps.ActiveJobFor(owner);
    }

    std::string DiscoveryService::StartTopologyWalk(const std::string &seed, const WalkOptions &options,
                                                    const std::string &owner)
    {
        return m_walks.Start(seed, options, owner);
    }

    std::optional<TopologyJobStatus> DiscoveryService::PollTopologyWalk(const std::string &job_id) const
    {
        return m_walks.Poll(job_id);
    }

    std::optional<std::string> DiscoveryService::ActiveTopologyWalk(const std::string &owner) const
    {
        return m_walks.ActiveJobFor(owner);
    }

    ClassificationResult DiscoveryService::Classify(const ClassificationSignals &signals) const
    {
        return m_classifier.Classify(signals);
    }
}
