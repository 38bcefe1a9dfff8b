#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <cstring>
#include <unistd.h>
#include <stdexcept>
#include <sys/socket.h>
#include <iostream>

#include "NetworkCore.hpp"
#include "Worker.hpp"
#include "../common/Codec.hpp"
#include <netinet/in.h>

namespace net_survey::server
{
    using net_survey::protocol::MessageType;

    void NetworkCore::LogOpenSSLErrors()
    {
        unsigned long err;
        while ((err = ERR_get_error()) != 0)
        {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            std::cerr << "[Server] OpenSSL: " << buf << std::endl;
        }
    }

    void NetworkCore::NonBlockingMode(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    void NetworkCore::EpollControlAdd(int fd)
    {
        struct epoll_event event;

        std::memset(&event, 0, sizeof(event));

        event.events = EPOLLIN;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1)
        {
            throw std::runtime_error("Failed to add FD to epoll");
        }
    }

    void NetworkCore::EpollControlModify(int fd, uint32_t events)
    {
        struct epoll_event event;
        std::memset(&event, 0, sizeof(event));
        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_MOD, fd, &event) == -1)
        {
            std::cerr << "[Server] Warning: Failed to modify FD " << fd << " in epoll" << std::endl;
        }
    }

    void NetworkCore::EpollControlRemove(int fd)
    {
        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1)
        {
            std::cerr << "[Server] Warning: Failed to remove FD from epoll" << std::endl;
        }
    }

    void NetworkCore::DisconnectClient(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        EpollControlRemove(fd);
        if (it->second.ssl_handle)
        {
            SSL_shutdown(it->second.ssl_handle);
            SSL_free(it->second.ssl_handle);
        }
        close(fd);
        registry.erase(it);
        std::cout << "[Server] Client " << fd << " disconnected" << std::endl;
    }

    void NetworkCore::HandleNewConnection()
    {
        struct sockaddr clientAddress;
        socklen_t clientAddressLength = sizeof(clientAddress);
        int client_fd = accept(m_server_fd, &clientAddress, &clientAddressLength);
        if (client_fd == -1)
        {
            std::cerr << "[Server] accept failed: " << std::strerror(errno) << std::endl;
            return;
        }

        NonBlockingMode(client_fd);

        SSL *ssl_handle = SSL_new(m_ssl_ctx);
        if (!ssl_handle)
        {
            LogOpenSSLErrors();
            close(client_fd);
            return;
        }

        SSL_set_fd(ssl_handle, client_fd);
        ClientContext &ctx = registry[client_fd];
        ctx.socketfd = client_fd;
        ctx.ssl_handle = ssl_handle;

        int ret = SSL_accept(ssl_handle);

        if (ret == 1)
        {
            ctx.is_handshake_complete = true;
            std::cout << "[Server] New connection accepted, handshake complete: " << client_fd << std::endl;
            EpollControlAdd(client_fd);
        }
        else
        {
            int ssl_error = SSL_get_error(ssl_handle, ret);

            if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE)
            {
                ctx.is_handshake_complete = false;
                EpollControlAdd(client_fd);
                std::cout << "[Server] New connection accepted, handshake pending: " << client_fd << std::endl;
            }
            else
            {
                std::cerr << "[Server] Fatal SSL handshake error on " << client_fd << ". Disconnecting." << std::endl;
                LogOpenSSLErrors();
                SSL_free(ssl_handle);
                close(client_fd);
                registry.erase(client_fd);
            }
        }
    }

    void NetworkCore::HandleClientData(int fd)
    {
        auto found = registry.find(fd);
        if (found == registry.end())
            return;
        ClientContext &ctx = found->second;

        if (!ctx.is_handshake_complete)
        {
            int ret = SSL_accept(ctx.ssl_handle);

            if (ret == 1)
            {
                ctx.is_handshake_complete = true;
                std::cout << "[Server] TLS handshake complete for client " << fd << std::endl;
            }
            else
            {
                int err = SSL_get_error(ctx.ssl_handle, ret);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    return;

                std::cerr << "[Server] SSL handshake failed. Error: " << err << std::endl;
                LogOpenSSLErrors();
                DisconnectClient(fd);
                return;
            }
        }

        uint8_t temp_buffer[4096];

        while (true)
        {
            int count = SSL_read(ctx.ssl_handle, temp_buffer, sizeof(temp_buffer));

            if (count > 0)
            {
                ctx.buff.Append(temp_buffer, static_cast<size_t>(count));
            }
            else
            {
                int err = SSL_get_error(ctx.ssl_handle, count);

                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    break;

                DisconnectClient(fd);
                return;
            }
        }

        while (ctx.buff.HasHeader())
        {
            auto header = ctx.buff.PeekHeader();
            if (!ctx.buff.HasValidMagic() || ctx.buff.IsOversized(header))
            {
                std::cerr << "[Server] Malformed frame from client " << fd << ". Disconnecting." << std::endl;
                DisconnectClient(fd);
                return;
            }
            if (!ctx.buff.HasCompleteMessage(header))
                break;

            std::vector<uint8_t> payload = ctx.buff.ExtractPayload(header.payload_length);
            ctx.buff.Consume(net_survey::protocol::HEADER_SIZE + header.payload_length);

            ProcessMessage(fd, static_cast<MessageType>(header.msg_type), payload);
        }
    }

    void NetworkCore::ProcessMessage(int fd, MessageType type, const std::vector<uint8_t> &payload)
    {
        std::cout << "[Client " << fd << "] Received message type: " << static_cast<int>(type)
                  << " | Size: " << payload.size() << " bytes." << std::endl;

        switch (type)
        {
        case MessageType::HeartbeatReq:
            QueueResponse(fd, MessageType::HeartbeatResp, {});
            break;

        case MessageType::SweepStartReq:
        case MessageType::SweepPollReq:
        case MessageType::SweepResultsReq:
        case MessageType::SweepStopReq:
        case MessageType::SweepActiveReq:
        case MessageType::TopologyStartReq:
        case MessageType::TopologyPollReq:
        case MessageType::TopologyActiveReq:
        case MessageType::ClassifyReq:
            if (m_worker)
                m_worker->AddJob(fd, type, payload);
            break;

        default:
        {
            std::cout << " -> Unknown or unhandled message type." << std::endl;
            const std::string msg = "Unsupported message type";
            std::vector<uint8_t> body;
            net_survey::common::wire::append_string(body, msg);
            QueueResponse(fd, MessageType::ErrorResp, body);
            break;
        }
        }
    }

    void NetworkCore::QueueResponse(int client_fd, MessageType type, const std::vector<uint8_t> &payload)
    {
        {
            std::lock_guard<std::mutex> lock(m_pending_mutex);
            m_pending.push_back({client_fd, net_survey::protocol::Frame(type, payload)});
        }

        uint64_t one = 1;
        if (m_wake_fd != -1 && write(m_wake_fd, &one, sizeof(one)) != sizeof(one))
            std::cerr << "[Server] Warning: Failed to signal response queue" << std::endl;
    }

    void NetworkCore::FlushPending()
    {
        uint64_t counter = 0;
        while (read(m_wake_fd, &counter, sizeof(counter)) == sizeof(counter))
        {
        }

        std::vector<PendingResponse> pending;
        {
            std::lock_guard<std::mutex> lock(m_pending_mutex);
            pending.swap(m_pending);
        }

        for (auto &resp : pending)
        {
            auto it = registry.find(resp.client_fd);
            // The client may have gone while the worker was busy.
            if (it == registry.end())
                continue;
            it->second.outbox.insert(it->second.outbox.end(), resp.frame.begin(), resp.frame.end());
            FlushClient(resp.client_fd);
        }
    }

    void NetworkCore::FlushClient(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;
        ClientContext &ctx = it->second;

        while (!ctx.outbox.empty())
        {
            int written = SSL_write(ctx.ssl_handle, ctx.outbox.data(), static_cast<int>(ctx.outbox.size()));
            if (written > 0)
            {
                ctx.outbox.erase(ctx.outbox.begin(), ctx.outbox.begin() + written);
                continue;
            }

            int err = SSL_get_error(ctx.ssl_handle, written);
            if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
            {
                EpollControlModify(fd, EPOLLIN | EPOLLOUT);
                return;
            }

            std::cerr << "[Server] Write to client " << fd << " failed. Disconnecting." << std::endl;
            DisconnectClient(fd);
            return;
        }

        EpollControlModify(fd, EPOLLIN);
    }

    NetworkCore::NetworkCore(int port, std::string cert_path, std::string key_path)
        : m_server_fd(-1), m_epoll_fd(-1), m_wake_fd(-1), m_port(port), m_cert_path(std::move(cert_path)),
          m_key_path(std::move(key_path)), m_running(false), m_ssl_ctx(nullptr), m_worker(nullptr)
    {
    }

    NetworkCore::~NetworkCore()
    {
        for (auto &it : registry)
        {
            if (it.second.ssl_handle)
                SSL_free(it.second.ssl_handle);
            close(it.first);
        }
        registry.clear();

        if (m_server_fd != -1)
            close(m_server_fd);
        if (m_wake_fd != -1)
            close(m_wake_fd);
        if (m_epoll_fd != -1)
            close(m_epoll_fd);
        if (m_ssl_ctx)
            SSL_CTX_free(m_ssl_ctx);
    }

    void NetworkCore::Init()
    {
        m_ssl_ctx = SSL_CTX_new(TLS_server_method());
        if (m_ssl_ctx == nullptr)
        {
            throw std::runtime_error("Failed to create SSL context.");
        }
        SSL_CTX_set_mode(m_ssl_ctx, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

        if (SSL_CTX_use_certificate_file(m_ssl_ctx, m_cert_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load '" + m_cert_path + "'.");
        }

        if (SSL_CTX_use_PrivateKey_file(m_ssl_ctx, m_key_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load '" + m_key_path + "'.");
        }

        if (!SSL_CTX_check_private_key(m_ssl_ctx))
        {
            throw std::runtime_error("Private key does not match the certificate!");
        }

        m_server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_server_fd == -1)
        {
            throw std::runtime_error("Failed to create socket.");
        }

        int opt = 1;
        if (setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            throw std::runtime_error("Failed to set SO_REUSEADDR.");
        }

        NonBlockingMode(m_server_fd);

        struct sockaddr_in serverAddress;
        std::memset(&serverAddress, 0, sizeof(serverAddress));
        serverAddress.sin_family = AF_INET;
        serverAddress.sin_port = htons(static_cast<uint16_t>(m_port));
        serverAddress.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_server_fd, reinterpret_cast<struct sockaddr *>(&serverAddress), sizeof(serverAddress)) != 0)
        {
            throw std::runtime_error("Failed to bind server socket. Is the port taken?");
        }

        if (listen(m_server_fd, SOMAXCONN) != 0)
        {
            throw std::runtime_error("Failed to listen on server socket.");
        }

        m_epoll_fd = epoll_create1(0);
        if (m_epoll_fd == -1)
        {
            throw std::runtime_error("Failed to create epoll file descriptor.");
        }

        m_wake_fd = eventfd(0, EFD_NONBLOCK);
        if (m_wake_fd == -1)
        {
            throw std::runtime_error("Failed to create eventfd.");
        }

        EpollControlAdd(m_server_fd);
        EpollControlAdd(m_wake_fd);
    }

    void NetworkCore::Run()
    {
        m_running = true;

        std::cout << "[Server] Listening on port " << m_port << "..." << std::endl;

        struct epoll_event ev[128];
        int count = 0;
        while (m_running)
        {
            if ((count = epoll_wait(m_epoll_fd, ev, 128, -1)) == -1)
            {
                if (errno == EINTR)
                    continue;
                break;
            }

            for (int i = 0; i < count; i++)
            {
                int current_fd = ev[i].data.fd;
                if (current_fd == m_server_fd)
                    HandleNewConnection();
                else if (current_fd == m_wake_fd)
                    FlushPending();
                else if (ev[i].events & (EPOLLHUP | EPOLLERR))
                    DisconnectClient(current_fd);
                else
                {
                    if (ev[i].events & EPOLLOUT)
                        FlushClient(current_fd);
                    if (ev[i].events & EPOLLIN)
                        HandleClientData(current_fd);
                }
            }
        }

        std::cout << "[Server] Event loop stopped" << std::endl;
    }

    void NetworkCore::Stop()
    {
        m_running = false;
        uint64_t one = 1;
        if (m_wake_fd != -1)
        {
            ssize_t ignored = write(m_wake_fd, &one, sizeof(one));
            (void)ignored;
        }
    }
}
