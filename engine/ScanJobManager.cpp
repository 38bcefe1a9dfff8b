#include "ScanJobManager.hpp"
#include "Ipv4Range.hpp"
#include "JobId.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <system_error>

namespace net_survey::engine
{
    double RoundedProgress(uint32_t scanned, uint32_t total)
    {
        if (total == 0)
            return 0.0;
        return std::round(static_cast<double>(scanned) / total * 10000.0) / 100.0;
    }

    class ScanJobManager::JobSink : public SweepSink
    {
    public:
        JobSink(ScanJobManager &manager, ScanJob *job) : m_manager(manager), m_job(job) {}

        bool StopRequested() const override { return m_job->stop.load(); }

        void SetTotal(uint32_t total) override
        {
            std::lock_guard<std::mutex> lock(m_manager.m_mutex);
            m_job->total = total;
        }

        void RecordBatch(const std::vector<DiscoveredDevice> &online, uint32_t scanned) override
        {
            std::lock_guard<std::mutex> lock(m_manager.m_mutex);
            m_job->scanned = std::max(m_job->scanned, std::min(scanned, m_job->total));
            m_job->devices.insert(m_job->devices.end(), online.begin(), online.end());
            m_job->new_devices.insert(m_job->new_devices.end(), online.begin(), online.end());
            m_job->progress = RoundedProgress(m_job->scanned, m_job->total);
        }

    private:
        ScanJobManager &m_manager;
        ScanJob *m_job;
    };

    ScanJobManager::ScanJobManager(HostProber &prober, const DeviceClassifier &classifier, SweepOptions options,
                                   EventSink *events)
        : m_prober(prober), m_classifier(classifier), m_options(std::move(options)), m_events(events)
    {
    }

    ScanJobManager::~ScanJobManager()
    {
        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &entry : m_jobs)
            {
                entry.second->stop = true;
                if (entry.second->worker.joinable())
                    workers.push_back(std::move(entry.second->worker));
            }
        }

        for (auto &t : workers)
            t.join();
    }

    void ScanJobManager::ReapFinished()
    {
        std::vector<std::thread> finished;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &entry : m_jobs)
            {
                ScanJob &job = *entry.second;
                if (job.status != ScanStatus::Scanning && job.worker.joinable())
                    finished.push_back(std::move(job.worker));
            }
        }

        // A terminal job's thread is past Finish.
        for (auto &t : finished)
            t.join();
    }

    std::size_t ScanJobManager::LiveWorkers() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<std::size_t>(std::count_if(m_jobs.begin(), m_jobs.end(), [](const auto &entry)
                                                      { return entry.second->worker.joinable(); }));
    }

    std::string ScanJobManager::Start(const std::string &range, const std::string &owner)
    {
        std::vector<std::string> hosts = ExpandSweepRange(range, m_options.policy);
        ReapFinished();

        auto job = std::make_unique<ScanJob>();
        job->id = NewJobId();
        job->range = range;
        job->owner = owner;
        job->total = static_cast<uint32_t>(hosts.size());
        job->started = std::chrono::system_clock::now();

        ScanJob *raw = job.get();
        const std::string id = job->id;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_jobs.emplace(id, std::move(job));
            try
            {
                raw->worker = std::thread(&ScanJobManager::RunJob, this, raw, std::move(hosts));
            }
            catch (const std::system_error &e)
            {
                m_jobs.erase(id);
                std::cerr << "[Jobs] Could not start sweep for " << owner << ": " << e.what() << "\n";
                throw;
            }
        }

        std::cout << "[Jobs] Sweep " << id << " started for " << owner << " on " << range << "\n";
        return id;
    }

    void ScanJobManager::RunJob(ScanJob *job, std::vector<std::string> hosts)
    {
        try
        {
            SweepEngine engine(m_prober, m_classifier, m_options, m_events);
            JobSink sink(*this, job);
            SweepReport report = engine.Run(hosts, sink);

            Finish(job, report.outcome == SweepOutcome::Stopped ? ScanStatus::Stopped : ScanStatus::Completed,
                   std::nullopt);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Jobs] Sweep " << job->id << " failed: " << e.what() << "\n";
            Finish(job, ScanStatus::Error, std::string(e.what()));
        }
    }

    void ScanJobManager::Finish(ScanJob *job, ScanStatus status, std::optional<std::string> error)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (job->status != ScanStatus::Scanning)
                return;

            job->status = status;
            job->error = std::move(error);
            if (status == ScanStatus::Completed)
            {
                job->scanned = job->total;
                job->progress = 100.0;
            }

            std::cout << "[Jobs] Sweep " << job->id << " " << ToString(status) << ": "
                      << job->scanned << "/" << job->total << " scanned, " << job->devices.size() << " found\n";
        }
        m_cv.notify_all();
    }

    std::optional<ScanJobStatus> ScanJobManager::Poll(const std::string &job_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(job_id);
        if (it == m_jobs.end())
            return std::nullopt;

        ScanJob &job = *it->second;
        ScanJobStatus status;
        status.job_id = job.id;
        status.range = job.range;
        status.status = job.status;
        status.progress = job.progress;
        status.scanned = job.scanned;
        status.total = job.total;
        status.found = static_cast<uint32_t>(job.devices.size());
        status.new_devices.swap(job.new_devices);
        status.error = job.error;
        return status;
    }

    std::optional<std::vector<DiscoveredDevice>> ScanJobManager::Results(const std::string &job_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(job_id);
        if (it == m_jobs.end())
            return std::nullopt;
        return it->second->devices;
    }

    bool ScanJobManager::Stop(const std::string &job_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(job_id);
        if (it == m_jobs.end())
            return false;

        it->second->stop = true;
        std::cout << "[Jobs] Stop requested for sweep " << job_id << "\n";
        return true;
    }

    std::optional<std::string> ScanJobManager::ActiveJobFor(const std::string &owner) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &entry : m_jobs)
        {
            if (entry.second->owner == owner && entry.second->status == ScanStatus::Scanning)
                return entry.first;
        }
        return std::nullopt;
    }

    bool ScanJobManager::WaitUntilDone(const std::string &job_id, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [&]()
                             {
            auto it = m_jobs.find(job_id);
            return it == m_jobs.end() || it->second->status != ScanStatus::Scanning; });
    }
}
