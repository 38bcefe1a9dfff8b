#pragma once

#include "DeviceClassifier.hpp"
#include "InventoryStore.hpp"
#include "SnmpClient.hpp"
#include "Types.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace net_survey::engine
{
    using SnmpSessionFactory = std::function<std::unique_ptr<SnmpSession>(const SnmpCredentials &)>;

    struct TopologyJobStatus
    {
        std::string job_id;
        std::string seed;
        WalkStatus status = WalkStatus::Running;
        uint32_t switch_count = 0;
        uint32_t device_count = 0;
        std::string last_switch;
        // Populated once the walk has finished.
        std::vector<TopologyWalkResult> switches;
        std::optional<PersistCounts> persisted;
        std::optional<std::string> error;
        std::chrono::system_clock::time_point started;
        std::optional<std::chrono::system_clock::time_point> finished;
        WalkOptions options;
    };

    // Registry of topology walks, one background thread per walk.
    class TopologyJobManager
    {
    public:
        // `inventory` may be null; walks then never persist.
        TopologyJobManager(const DeviceClassifier &classifier, InventoryStore *inventory,
                           SnmpSessionFactory factory = nullptr);
        ~TopologyJobManager();

        TopologyJobManager(const TopologyJobManager &) = delete;
        TopologyJobManager &operator=(const TopologyJobManager &) = delete;

        // Throws RangeError for an invalid seed address.
        std::string Start(const std::string &seed, const WalkOptions &options, const std::string &owner);

        std::optional<TopologyJobStatus> Poll(const std::string &job_id) const;
        std::optional<std::string> ActiveJobFor(const std::string &owner) const;

        bool WaitUntilDone(const std::string &job_id, std::chrono::milliseconds timeout);

        // Worker threads not yet joined. Finished walks are reaped on the next Start.
        std::size_t LiveWorkers() const;

    private:
        struct WalkJob
        {
            TopologyJobStatus state;
            std::string owner;
            std::vector<TopologyWalkResult> partial;
            std::thread worker;
        };

        void ReapFinished();
        void RunJob(WalkJob *job);

        const DeviceClassifier &m_classifier;
        InventoryStore *m_inventory;
        SnmpSessionFactory m_factory;

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::map<std::string, std::unique_ptr<WalkJob>> m_jobs;
    };
}
