#include "TopologyJobManager.hpp"
#include "Ipv4Range.hpp"
#include "JobId.hpp"
#include "TopologyWalker.hpp"

#include <iostream>
#include <system_error>

namespace net_survey::engine
{
    TopologyJobManager::TopologyJobManager(const DeviceClassifier &classifier, InventoryStore *inventory,
                                           SnmpSessionFactory factory)
        : m_classifier(classifier), m_inventory(inventory), m_factory(std::move(factory))
    {
        if (!m_factory)
        {
            m_factory = [](const SnmpCredentials &credentials) -> std::unique_ptr<SnmpSession>
            {
                return std::make_unique<SnmpClient>(credentials);
            };
        }
    }

    TopologyJobManager::~TopologyJobManager()
    {
        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &entry : m_jobs)
            {
                if (entry.second->worker.joinable())
                    workers.push_back(std::move(entry.second->worker));
            }
        }

        for (auto &t : workers)
            t.join();
    }

    void TopologyJobManager::ReapFinished()
    {
        std::vector<std::thread> finished;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &entry : m_jobs)
            {
                WalkJob &job = *entry.second;
                if (job.state.status != WalkStatus::Running && job.worker.joinable())
                    finished.push_back(std::move(job.worker));
            }
        }

        for (auto &t : finished)
            t.join();
    }

    std::size_t TopologyJobManager::LiveWorkers() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t live = 0;
        for (const auto &entry : m_jobs)
        {
            if (entry.second->worker.joinable())
                ++live;
        }
        return live;
    }

    std::string TopologyJobManager::Start(const std::string &seed, const WalkOptions &options,
                                          const std::string &owner)
    {
        if (!IsValidIpv4(seed))
            throw RangeError("Invalid seed address: " + seed);
        if (options.max_depth < 0 || options.max_switches <= 0)
            throw RangeError("Walk limits must be positive");

        ReapFinished();

        auto job = std::make_unique<WalkJob>();
        job->state.job_id = NewJobId();
        job->state.seed = seed;
        job->state.options = options;
        job->state.started = std::chrono::system_clock::now();
        job->owner = owner;

        WalkJob *raw = job.get();
        const std::string id = job->state.job_id;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_jobs.emplace(id, std::move(job));
            try
            {
                raw->worker = std::thread(&TopologyJobManager::RunJob, this, raw);
            }
            catch (const std::system_error &e)
            {
                m_jobs.erase(id);
                std::cerr << "[Topology] Could not start walk for " << owner << ": " << e.what() << "\n";
                throw;
            }
        }

        std::cout << "[Topology] Walk " << id << " started for " << owner << " from " << seed
                  << " (depth " << options.max_depth << ", max " << options.max_switches << " switches)\n";
        return id;
    }

    void TopologyJobManager::RunJob(WalkJob *job)
    {
        WalkOptions options;
        std::string seed;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            options = job->state.options;
            seed = job->state.seed;
        }

        WalkStatus status = WalkStatus::Completed;
        std::optional<std::string> error;
        std::optional<PersistCounts> persisted;
        std::vector<TopologyWalkResult> switches;

        try
        {
            std::unique_ptr<SnmpSession> session = m_factory(options.credentials);
            TopologyWalker walker(*session, &m_classifier);

            switches = walker.Discover(seed, options.max_depth, options.max_switches,
                                       [&](const WalkProgress &progress, const TopologyWalkResult &result)
                                       {
                                           std::lock_guard<std::mutex> lock(m_mutex);
                                           job->partial.push_back(result);
                                           job->state.switch_count = static_cast<uint32_t>(progress.visited);
                                           job->state.device_count += static_cast<uint32_t>(result.end_hosts.size());
                                           job->state.last_switch = progress.address;
                                       });

            if (options.persist && m_inventory)
                persisted = m_inventory->PersistTopology(switches);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Topology] Walk " << job->state.job_id << " failed: " << e.what() << "\n";
            status = WalkStatus::Error;
            error = e.what();
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (status == WalkStatus::Completed)
                job->state.switches = std::move(switches);
            else
                job->state.switches = job->partial;
            job->partial.clear();

            job->state.switch_count = static_cast<uint32_t>(job->state.switches.size());
            uint32_t devices = 0;
            for (const auto &sw : job->state.switches)
                devices += static_cast<uint32_t>(sw.end_hosts.size());
            job->state.device_count = devices;

            job->state.persisted = persisted;
            job->state.error = error;
            job->state.status = status;
            job->state.finished = std::chrono::system_clock::now();

            std::cout << "[Topology] Walk " << job->state.job_id << " " << ToString(status) << ": "
                      << job->state.switch_count << " switches, " << job->state.device_count << " end hosts\n";
        }
        m_cv.notify_all();
    }

    std::optional<TopologyJobStatus> TopologyJobManager::Poll(const std::string &job_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(job_id);
        if (it == m_jobs.end())
            return std::nullopt;
        return it->second->state;
    }

    std::optional<std::string> TopologyJobManager::ActiveJobFor(const std::string &owner) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &entry : m_jobs)
        {
            if (entry.second->owner == owner && entry.second->state.status == WalkStatus::Running)
                return entry.first;
        }
        return std::nullopt;
    }

    bool TopologyJobManager::WaitUntilDone(const std::string &job_id, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [&]()
                             {
            auto it = m_jobs.find(job_id);
            return it == m_jobs.end() || it->second->state.status != WalkStatus::Running; });
    }
}
