#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include "../common/protocol.hpp"
#include "../common/ByteBuffer.hpp"

namespace net_survey::client
{
    struct NetworkResponse
    {
        net_survey::protocol::MessageType type;
        std::vector<uint8_t> data;
    };

    // Blocking TLS connection to net_survey_server. One request is in flight
    // at a time; Request() sends a frame and waits for the next reply.
    class ClientNetwork
    {
    private:
        std::string m_host;
        int m_port;
        int m_socket_fd;
        int m_timeout_ms;

        std::mutex m_io_mutex;

        SSL_CTX *m_ssl_ctx;
        SSL *m_ssl_handle;

        net_survey::common::ByteBuffer m_rx_buf;

        void InitSSL();
        void CleanupSSL();
        void DisconnectLocked();
        bool ReadNextPacket(net_survey::protocol::Header &out_hdr, std::vector<uint8_t> &out_payload);

    public:
        ClientNetwork(std::string host, int port, int timeout_ms = 5000);
        ~ClientNetwork();

        ClientNetwork(const ClientNetwork &) = delete;
        ClientNetwork &operator=(const ClientNetwork &) = delete;

        bool Connect();
        void Disconnect();
        bool IsConnected() const { return m_socket_fd != -1 && m_ssl_handle != nullptr; }

        std::optional<NetworkResponse> Request(net_survey::protocol::MessageType type,
                                               const std::vector<uint8_t> &payload);
    };
}
