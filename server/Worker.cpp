#include "Worker.hpp"
#include "NetworkCore.hpp"
#include "../common/Messages.hpp"
#include "../engine/Ipv4Range.hpp"

#include <iostream>

namespace net_survey::server
{
    using net_survey::protocol::MessageType;
    namespace messages = net_survey::common::messages;

    Worker::Worker(net_survey::engine::DiscoveryService &service, net_survey::engine::WalkOptions walk_defaults)
        : running_(false), network_core_(nullptr), service_(service), walk_defaults_(std::move(walk_defaults))
    {
    }

    Worker::~Worker()
    {
        Stop();
    }

    void Worker::Start()
    {
        running_ = true;
        worker_thread_ = std::thread(&Worker::ProcessLoop, this);
    }

    void Worker::Stop()
    {
        if (!running_)
            return;

        running_ = false;
        queue_cv_.notify_all();

        if (worker_thread_.joinable())
        {
            worker_thread_.join();
        }
    }

    void Worker::AddJob(int client_fd, MessageType type, std::vector<uint8_t> payload)
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            job_queue_.push({client_fd, type, std::move(payload)});
        }
        queue_cv_.notify_one();
    }

    void Worker::ProcessLoop()
    {
        while (running_)
        {
            Job current_job;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                queue_cv_.wait(lock, [this]
                               { return !job_queue_.empty() || !running_; });

                if (!running_ && job_queue_.empty())
                    break;

                current_job = std::move(job_queue_.front());
                job_queue_.pop();
            }

            try
            {
                Dispatch(current_job);
            }
            catch (const net_survey::engine::RangeError &e)
            {
                RespondError(current_job.client_fd, e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Worker] Error processing job: " << e.what() << "\n";
                RespondError(current_job.client_fd, std::string("Internal error: ") + e.what());
            }
        }
    }

    void Worker::Dispatch(const Job &job)
    {
        switch (job.type)
        {
        case MessageType::SweepStartReq:
            HandleSweepStart(job.client_fd, job.payload);
            break;
        case MessageType::SweepPollReq:
            HandleSweepPoll(job.client_fd, job.payload);
            break;
        case MessageType::SweepResultsReq:
            HandleSweepResults(job.client_fd, job.payload);
            break;
        case MessageType::SweepStopReq:
            HandleSweepStop(job.client_fd, job.payload);
            break;
        case MessageType::SweepActiveReq:
            HandleSweepActive(job.client_fd, job.payload);
            break;
        case MessageType::TopologyStartReq:
            HandleTopologyStart(job.client_fd, job.payload);
            break;
        case MessageType::TopologyPollReq:
            HandleTopologyPoll(job.client_fd, job.payload);
            break;
        case MessageType::TopologyActiveReq:
            HandleTopologyActive(job.client_fd, job.payload);
            break;
        case MessageType::ClassifyReq:
            HandleClassify(job.client_fd, job.payload);
            break;
        default:
            RespondError(job.client_fd, "Unsupported message type");
            break;
        }
    }

    void Worker::Respond(int client_fd, MessageType type, const std::vector<uint8_t> &payload)
    {
        if (network_core_)
            network_core_->QueueResponse(client_fd, type, payload);
    }

    void Worker::RespondError(int client_fd, const std::string &message)
    {
        Respond(client_fd, MessageType::ErrorResp, messages::EncodeText(message));
    }

    void Worker::HandleSweepStart(int client_fd, const std::vector<uint8_t> &payload)
    {
        messages::SweepStartRequest req;
        if (!messages::DecodeSweepStart(payload, req))
        {
            RespondError(client_fd, "Invalid payload format");
            return;
        }

        std::string job_id = service_.StartSweep(req.range, req.owner);
        Respond(client_fd, MessageType::SweepStartResp, messages::EncodeText(job_id));
    }

    void Worker::HandleSweepPoll(int client_fd, const std::vector<uint8_t> &payload)
    {
        std::string job_id;
        if (!messages::DecodeText(payload, job_id))
        {
            RespondError(client_fd, "Invalid payload format");
            return;
        }

        auto status = service_.PollSweep(job_id);
        if (!status)
        {
            RespondError(client_fd, "Unknown sweep job: " + job_id);
            return;
        }
        Respond(client_fd, MessageType::SweepPollResp, messages::EncodeSweepStatus(*status));
    }

    void Worker::HandleSweepResults(int client_fd, const std::vector<uint8_t> &payload)
    {
        std::string job_id;
        if (!messages::DecodeText(payload, job_id))
        {
            RespondError(client_fd, "Invalid payload format");
            return;
        }

        auto devices = service_.SweepResults(job_id);
        if (!devices)
        {
            RespondError(client_fd, "Unknown sweep job: " + job_id);
            return;
        }
        Respond(client_fd, MessageType::SweepResultsResp, messages::EncodeDevices(*devices));
    }

    void Worker::HandleSweepStop(int client_fd, const std::vector<uint8_t> &payload)
    {
        std::string job_id;
        if (!messages::DecodeText(payload, job_id))
        {
            RespondError(client_fd, "Invalid payload format");
            return;
        }

        Respond(client_fd, MessageType::SweepStopResp, messages::EncodeFlag(service_.StopSweep(job_id)));
    }

    void Worker::HandleSweepActive(int client_fd, const std::vector<uint8_t> &payload)
    {
        std::string owner;
        if (!messages::DecodeText(payload, owner))
        {
            RespondError(client_fd, "Invalid payload format");
            return;
        }

        Respond(client_fd, MessageType::SweepActiveResp, messages::EncodeOptionalText(service_.ActiveSweep(owner)));
    }

    void Worker::HandleTopologyStart(int client_fd, const std::vector<uint8_t> &payload)
    {
        messages::TopologyStartRequest req;
        if (!messages::DecodeTopologyStart(payload, req))
        {
            RespondError(client_fd, "Invalid payload format");
            return;
        }

        // Unset fields fall back to the server's configured defaults.
        net_survey::engine::WalkOptions options = req.options;
        if (options.max_depth < 0)
            options.max_depth = walk_defaults_.max_depth;
        if (options.max_switches <= 0)
            options.max_switches = walk_defaults_.max_switches;
        if (options.credentials.community.empty())
            options.credentials = walk_defaults_.credentials;

        std::string job_id = service_.StartTopologyWalk(req.seed, options, req.owner);
        Respond(client_fd, MessageType::TopologyStartResp, messages::EncodeText(job_id));
    }

    void Worker::HandleTopologyPoll(int client_fd, const std::vector<uint8_t> &payload)
    {
        std::string job_id;
        if (!messages::DecodeText(payload, job_id))
        {
            RespondError(client_fd, "Invalid payload format");
            return;
        }

        auto status = service_.PollTopologyWalk(job_id);
        if (!status)
        {
            RespondError(client_fd, "Unknown topology job: " + job_id);
            return;
        }
        Respond(client_fd, MessageType::TopologyPollResp, messages::EncodeTopologyStatus(*status));
    }

    void Worker::HandleTopologyActive(int client_fd, const std::vector<uint8_t> &payload)
    {
        std::string owner;
        if (!messages::DecodeText(payload, owner))
        {
            RespondError(client_fd, "Invalid payload format");
            return;
        }

        Respond(client_fd, MessageType::TopologyActiveResp,
                messages::EncodeOptionalText(service_.ActiveTopologyWalk(owner)));
    }

    void Worker::HandleClassify(int client_fd, const std::vector<uint8_t> &payload)
    {
        net_survey::engine::ClassificationSignals signals;
        if (!messages::DecodeSignals(payload, signals))
        {
            RespondError(client_fd, "Invalid payload format");
            return;
        }

        Respond(client_fd, MessageType::ClassifyResp, messages::EncodeClassification(service_.Classify(signals)));
    }
}
