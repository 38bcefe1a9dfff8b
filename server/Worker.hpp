#pragma once

#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <string>
#include <vector>
#include <atomic>
#include "../common/protocol.hpp"
#include "../engine/DiscoveryService.hpp"

namespace net_survey::server { class NetworkCore; }

namespace net_survey::server {

    struct Job {
        int client_fd;
        net_survey::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    // Single thread that turns decoded requests into DiscoveryService calls.
    // Sweeps and walks run on their own threads, so nothing here blocks for
    // longer than a range check.
    class Worker {
    private:
        std::thread worker_thread_;
        std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::queue<Job> job_queue_;
        std::atomic<bool> running_;

        NetworkCore* network_core_;
        net_survey::engine::DiscoveryService& service_;
        net_survey::engine::WalkOptions walk_defaults_;

        void ProcessLoop();
        void Dispatch(const Job& job);
        void Respond(int client_fd, net_survey::protocol::MessageType type, const std::vector<uint8_t>& payload);
        void RespondError(int client_fd, const std::string& message);

        void HandleSweepStart(int client_fd, const std::vector<uint8_t>& payload);
        void HandleSweepPoll(int client_fd, const std::vector<uint8_t>& payload);
        void HandleSweepResults(int client_fd, const std::vector<uint8_t>& payload);
        void HandleSweepStop(int client_fd, const std::vector<uint8_t>& payload);
        void HandleSweepActive(int client_fd, const std::vector<uint8_t>& payload);
        void HandleTopologyStart(int client_fd, const std::vector<uint8_t>& payload);
        void HandleTopologyPoll(int client_fd, const std::vector<uint8_t>& payload);
        void HandleTopologyActive(int client_fd, const std::vector<uint8_t>& payload);
        void HandleClassify(int client_fd, const std::vector<uint8_t>& payload);

    public:
        Worker(net_survey::engine::DiscoveryService& service, net_survey::engine::WalkOptions walk_defaults);
        ~Worker();

        void Start();
        void Stop();

        void SetNetworkCore(NetworkCore* core) { network_core_ = core; }

        void AddJob(int client_fd, net_survey::protocol::MessageType type, std::vector<uint8_t> payload);
    };
}
