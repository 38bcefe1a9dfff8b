#include "ClientNetwork.hpp"
#include <iostream>
#include <stdexcept>
#include <unistd.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <cstring>
#include <vector>
#include <poll.h>

namespace net_survey::client
{

    static bool wait_fd(int fd, short events, int timeout_ms)
    {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        int r = poll(&pfd, 1, timeout_ms);
        return r > 0;
    }

    static bool ssl_write_all(SSL *ssl, int fd, const uint8_t *data, size_t len, int timeout_ms)
    {
        size_t off = 0;
        while (off < len)
        {
            int n = SSL_write(ssl, data + off, static_cast<int>(len - off));
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }

            int err = SSL_get_error(ssl, n);
            if (err == SSL_ERROR_WANT_READ)
            {
                if (!wait_fd(fd, POLLIN, timeout_ms))
                    return false;
                continue;
            }
            if (err == SSL_ERROR_WANT_WRITE)
            {
                if (!wait_fd(fd, POLLOUT, timeout_ms))
                    return false;
                continue;
            }

            return false;
        }
        return true;
    }

    ClientNetwork::ClientNetwork(std::string host, int port, int timeout_ms)
        : m_host(std::move(host)), m_port(port), m_socket_fd(-1), m_timeout_ms(timeout_ms), m_ssl_ctx(nullptr),
          m_ssl_handle(nullptr)
    {
        InitSSL();
    }

    ClientNetwork::~ClientNetwork()
    {
        Disconnect();
        CleanupSSL();
    }

    bool ClientNetwork::ReadNextPacket(net_survey::protocol::Header &out_hdr, std::vector<uint8_t> &out_payload)
    {
        if (!m_ssl_handle)
            return false;

        uint8_t tmp[4096];

        while (true)
        {
            if (m_rx_buf.HasHeader())
            {
                auto hdr = m_rx_buf.PeekHeader();
                if (!m_rx_buf.HasValidMagic() || m_rx_buf.IsOversized(hdr))
                {
                    std::cerr << "[Client] Malformed frame from server.\n";
                    DisconnectLocked();
                    return false;
                }
                if (m_rx_buf.HasCompleteMessage(hdr))
                {
                    out_hdr = hdr;
                    out_payload = m_rx_buf.ExtractPayload(hdr.payload_length);
                    m_rx_buf.Consume(net_survey::protocol::HEADER_SIZE + hdr.payload_length);
                    return true;
                }
            }

            int n = SSL_read(m_ssl_handle, tmp, sizeof(tmp));
            if (n > 0)
            {
                m_rx_buf.Append(tmp, static_cast<size_t>(n));
                continue;
            }

            int err = SSL_get_error(m_ssl_handle, n);
            if (err == SSL_ERROR_ZERO_RETURN || n == 0)
            {
                std::cerr << "[Client] Server closed connection.\n";
                DisconnectLocked();
                return false;
            }
            if (err == SSL_ERROR_WANT_READ)
            {
                if (!wait_fd(m_socket_fd, POLLIN, m_timeout_ms))
                    return false;
                continue;
            }
            if (err == SSL_ERROR_WANT_WRITE)
            {
                if (!wait_fd(m_socket_fd, POLLOUT, m_timeout_ms))
                    return false;
                continue;
            }

            std::cerr << "[Client] SSL_read fatal error: " << err << "\n";
            DisconnectLocked();
            return false;
        }
    }

    void ClientNetwork::InitSSL()
    {
        m_ssl_ctx = SSL_CTX_new(TLS_client_method());
        if (!m_ssl_ctx)
        {
            ERR_print_errors_fp(stderr);
            throw std::runtime_error("Failed to create client SSL context");
        }

        SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_NONE, nullptr);
    }

    void ClientNetwork::CleanupSSL()
    {
        if (m_ssl_ctx)
        {
            SSL_CTX_free(m_ssl_ctx);
            m_ssl_ctx = nullptr;
        }
    }

    bool ClientNetwork::Connect()
    {
        std::lock_guard<std::mutex> lock(m_io_mutex);

        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo *res = nullptr;
        const std::string port = std::to_string(m_port);
        if (getaddrinfo(m_host.c_str(), port.c_str(), &hints, &res) != 0 || !res)
        {
            std::cerr << "[Client] Invalid address or host not found: " << m_host << std::endl;
            return false;
        }

        m_socket_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_socket_fd < 0)
        {
            perror("Socket creation failed");
            freeaddrinfo(res);
            return false;
        }

        int rc = connect(m_socket_fd, res->ai_addr, res->ai_addrlen);
        freeaddrinfo(res);
        if (rc < 0)
        {
            perror("Connection failed");
            DisconnectLocked();
            return false;
        }

        timeval tv{};
        tv.tv_sec = m_timeout_ms / 1000;
        tv.tv_usec = (m_timeout_ms % 1000) * 1000;
        setsockopt(m_socket_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(m_socket_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        m_ssl_handle = SSL_new(m_ssl_ctx);
        if (!m_ssl_handle)
        {
            ERR_print_errors_fp(stderr);
            DisconnectLocked();
            return false;
        }
        SSL_set_fd(m_ssl_handle, m_socket_fd);

        if (SSL_connect(m_ssl_handle) <= 0)
        {
            ERR_print_errors_fp(stderr);
            DisconnectLocked();
            return false;
        }

        std::cout << "[Client] Connected to " << m_host << ":" << m_port << " via TLS." << std::endl;
        return true;
    }

    void ClientNetwork::Disconnect()
    {
        std::lock_guard<std::mutex> lock(m_io_mutex);
        DisconnectLocked();
    }

    void ClientNetwork::DisconnectLocked()
    {
        if (m_ssl_handle)
        {
            SSL_shutdown(m_ssl_handle);
            SSL_free(m_ssl_handle);
            m_ssl_handle = nullptr;
        }
        if (m_socket_fd != -1)
        {
            close(m_socket_fd);
            m_socket_fd = -1;
        }
        m_rx_buf.Clear();
    }

    std::optional<NetworkResponse> ClientNetwork::Request(net_survey::protocol::MessageType type,
                                                          const std::vector<uint8_t> &payload)
    {
        std::lock_guard<std::mutex> lock(m_io_mutex);
        if (!m_ssl_handle)
            return std::nullopt;

        std::vector<uint8_t> frame = net_survey::protocol::Frame(type, payload);
        if (!ssl_write_all(m_ssl_handle, m_socket_fd, frame.data(), frame.size(), m_timeout_ms))
        {
            std::cerr << "[Client] Failed to send request." << std::endl;
            DisconnectLocked();
            return std::nullopt;
        }

        net_survey::protocol::Header hdr;
        std::vector<uint8_t> body;
        if (!ReadNextPacket(hdr, body))
            return std::nullopt;

        return NetworkResponse{static_cast<net_survey::protocol::MessageType>(hdr.msg_type), std::move(body)};
    }
}
