#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace net_survey::engine
{
    // Connected-less IPv4 UDP socket used for one request/response at a time.
    class UdpSocket
    {
    public:
        UdpSocket();
        ~UdpSocket();

        UdpSocket(const UdpSocket &) = delete;
        UdpSocket &operator=(const UdpSocket &) = delete;

        // Sends `payload` and waits up to timeout_ms for a datagram from the
        // same peer. std::nullopt on timeout or socket error.
        std::optional<std::vector<uint8_t>> Exchange(const std::string &ip, uint16_t port,
                                                     const std::vector<uint8_t> &payload, int timeout_ms);

    private:
        int m_sockfd;
    };

    // Non-blocking connects to every port at once, multiplexed on one epoll
    // set and bounded by a single deadline. Returns the ports that accepted.
    std::vector<uint16_t> ProbeTcpPorts(const std::string &ip, const std::vector<uint16_t> &ports, int timeout_ms);

    bool IsTcpPortOpen(const std::string &ip, uint16_t port, int timeout_ms);

    struct HttpResponse
    {
        int status = 0;
        std::string body;
    };

    // Minimal HTTP/1.0 GET over a plain TCP connection.
    std::optional<HttpResponse> HttpGet(const std::string &ip, uint16_t port, const std::string &path, int timeout_ms);

    // Splits a raw HTTP/1.x response into status code and body.
    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw);
}
