#pragma once

#include <atomic>
#include <map>
#include <cstdint>
#include <mutex>
#include <string>
#include <sys/epoll.h>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "../common/ByteBuffer.hpp"
#include "../common/protocol.hpp"

namespace net_survey::server
{
    class Worker;

    struct ClientContext
    {
        int socketfd = -1;
        SSL *ssl_handle = nullptr;
        net_survey::common::ByteBuffer buff;
        std::vector<uint8_t> outbox;
        bool is_handshake_complete = false;
    };

    struct PendingResponse
    {
        int client_fd;
        std::vector<uint8_t> frame;
    };

    class NetworkCore
    {
    private:
        int m_server_fd;
        int m_epoll_fd;
        int m_wake_fd;
        int m_port;
        std::string m_cert_path;
        std::string m_key_path;
        std::atomic<bool> m_running;
        std::map<int, ClientContext> registry;

        SSL_CTX *m_ssl_ctx;
        Worker *m_worker;

        // Filled by the worker thread, drained by the epoll loop.
        std::mutex m_pending_mutex;
        std::vector<PendingResponse> m_pending;

        void LogOpenSSLErrors();

        void NonBlockingMode(int fd);
        void EpollControlAdd(int fd);
        void EpollControlModify(int fd, uint32_t events);
        void EpollControlRemove(int fd);
        void DisconnectClient(int fd);

        void HandleNewConnection();
        void HandleClientData(int fd);
        void FlushPending();
        void FlushClient(int fd);

        void ProcessMessage(int fd, net_survey::protocol::MessageType type, const std::vector<uint8_t> &payload);

    public:
        NetworkCore(int port, std::string cert_path, std::string key_path);

        ~NetworkCore();

        NetworkCore(const NetworkCore &) = delete;
        NetworkCore &operator=(const NetworkCore &) = delete;

        void SetWorker(Worker *worker) { m_worker = worker; }

        void Init();
        void Run();
        // Safe from any thread, including signal handlers.
        void Stop();

        // Safe from any thread; the frame is written by the epoll loop.
        void QueueResponse(int client_fd, net_survey::protocol::MessageType type, const std::vector<uint8_t> &payload);
    };
}
