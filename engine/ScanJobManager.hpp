#pragma once

#include "DeviceClassifier.hpp"
#include "EventSink.hpp"
#include "HostProber.hpp"
#include "SweepEngine.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace net_survey::engine
{
    struct ScanJobStatus
    {
        std::string job_id;
        std::string range;
        ScanStatus status = ScanStatus::Scanning;
        double progress = 0.0;
        uint32_t scanned = 0;
        uint32_t total = 0;
        uint32_t found = 0;
        std::vector<DiscoveredDevice> new_devices;
        std::optional<std::string> error;
    };

    // Registry of sweep jobs. Each job runs on its own thread and writes back
    // through the registry lock; callers only ever poll.
    class ScanJobManager
    {
    public:
        ScanJobManager(HostProber &prober, const DeviceClassifier &classifier, SweepOptions options,
                       EventSink *events = nullptr);
        ~ScanJobManager();

        ScanJobManager(const ScanJobManager &) = delete;
        ScanJobManager &operator=(const ScanJobManager &) = delete;

        // Throws RangeError before any job is created.
        std::string Start(const std::string &range, const std::string &owner);

        // Drains the job's new-devices buffer.
        std::optional<ScanJobStatus> Poll(const std::string &job_id);
        std::optional<std::vector<DiscoveredDevice>> Results(const std::string &job_id) const;
        bool Stop(const std::string &job_id);
        std::optional<std::string> ActiveJobFor(const std::string &owner) const;

        // Blocks until the job leaves Scanning or the timeout expires.
        bool WaitUntilDone(const std::string &job_id, std::chrono::milliseconds timeout);

        // Worker threads not yet joined. Finished jobs are reaped on the next Start.
        std::size_t LiveWorkers() const;

    private:
        struct ScanJob
        {
            std::string id;
            std::string range;
            std::string owner;
            ScanStatus status = ScanStatus::Scanning;
            uint32_t total = 0;
            uint32_t scanned = 0;
            double progress = 0.0;
            std::vector<DiscoveredDevice> devices;
            std::vector<DiscoveredDevice> new_devices;
            std::atomic<bool> stop{false};
            std::optional<std::string> error;
            std::chrono::system_clock::time_point started;
            std::thread worker;
        };

        class JobSink;

        void ReapFinished();
        void RunJob(ScanJob *job, std::vector<std::string> hosts);
        void Finish(ScanJob *job, ScanStatus status, std::optional<std::string> error);

        HostProber &m_prober;
        const DeviceClassifier &m_classifier;
        SweepOptions m_options;
        EventSink *m_events;

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::map<std::string, std::unique_ptr<ScanJob>> m_jobs;
    };

    double RoundedProgress(uint32_t scanned, uint32_t total);
}
