#include "Socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <map>
#include <stdexcept>

namespace net_survey::engine
{
    namespace
    {
        bool MakeAddress(const std::string &ip, uint16_t port, sockaddr_in &addr)
        {
            std::memset(&addr, 0, sizeof(addr));
            addr.sin_family = AF_INET;
            addr.sin_port = htons(port);
            return inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) == 1;
        }

        void SetNonBlocking(int fd)
        {
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }

        int RemainingMs(std::chrono::steady_clock::time_point deadline)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            return left.count() > 0 ? static_cast<int>(left.count()) : 0;
        }

        // Connects with a deadline, leaving the socket in blocking mode.
        int ConnectWithTimeout(const std::string &ip, uint16_t port, int timeout_ms)
        {
            sockaddr_in addr;
            if (!MakeAddress(ip, port, addr))
                return -1;

            int fd = socket(AF_INET, SOCK_STREAM, 0);
            if (fd < 0)
                return -1;

            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
            if (rc < 0 && errno != EINPROGRESS)
            {
                close(fd);
                return -1;
            }

            if (rc < 0)
            {
                pollfd pfd{fd, POLLOUT, 0};
                if (poll(&pfd, 1, timeout_ms) <= 0)
                {
                    close(fd);
                    return -1;
                }
                int err = 0;
                socklen_t len = sizeof(err);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
                if (err != 0)
                {
                    close(fd);
                    return -1;
                }
            }

            fcntl(fd, F_SETFL, flags);
            return fd;
        }
    }

    UdpSocket::UdpSocket()
    {
        m_sockfd = socket(AF_INET, SOCK_DGRAM, 0);
        if (m_sockfd < 0)
            throw std::runtime_error(std::string("UDP socket failed: ") + std::strerror(errno));
    }

    UdpSocket::~UdpSocket()
    {
        if (m_sockfd >= 0)
            close(m_sockfd);
    }

    std::optional<std::vector<uint8_t>> UdpSocket::Exchange(const std::string &ip, uint16_t port,
                                                            const std::vector<uint8_t> &payload, int timeout_ms)
    {
        sockaddr_in servaddr;
        if (!MakeAddress(ip, port, servaddr))
            return std::nullopt;

        ssize_t sent = sendto(m_sockfd, payload.data(), payload.size(), 0,
                              reinterpret_cast<const sockaddr *>(&servaddr), sizeof(servaddr));
        if (sent < 0)
            return std::nullopt;

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        std::vector<uint8_t> buffer(65535);

        while (true)
        {
            int wait_ms = RemainingMs(deadline);
            if (wait_ms <= 0)
                return std::nullopt;

            pollfd pfd{m_sockfd, POLLIN, 0};
            int ready = poll(&pfd, 1, wait_ms);
            if (ready < 0 && errno == EINTR)
                continue;
            if (ready <= 0)
                return std::nullopt;

            sockaddr_in from;
            socklen_t len = sizeof(from);
            ssize_t n = recvfrom(m_sockfd, buffer.data(), buffer.size(), 0, reinterpret_cast<sockaddr *>(&from), &len);
            if (n < 0)
                return std::nullopt;

            // Stray datagrams from other peers are dropped.
            if (from.sin_addr.s_addr != servaddr.sin_addr.s_addr)
                continue;

            buffer.resize(static_cast<size_t>(n));
            return buffer;
        }
    }

    std::vector<uint16_t> ProbeTcpPorts(const std::string &ip, const std::vector<uint16_t> &ports, int timeout_ms)
    {
        std::vector<uint16_t> open;
        if (ports.empty())
            return open;

        int ep = epoll_create1(0);
        if (ep < 0)
            return open;

        std::map<int, uint16_t> pending;

        for (uint16_t port : ports)
        {
            sockaddr_in addr;
            if (!MakeAddress(ip, port, addr))
                break;

            int fd = socket(AF_INET, SOCK_STREAM, 0);
            if (fd < 0)
                continue;
            SetNonBlocking(fd);

            int r = connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
            if (r == 0)
            {
                open.push_back(port);
                close(fd);
                continue;
            }
            if (errno != EINPROGRESS)
            {
                close(fd);
                continue;
            }

            epoll_event ev{};
            ev.events = EPOLLOUT | EPOLLERR | EPOLLHUP;
            ev.data.fd = fd;
            if (epoll_ctl(ep, EPOLL_CTL_ADD, fd, &ev) < 0)
            {
                close(fd);
                continue;
            }
            pending[fd] = port;
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        const int MAX_EVENTS = 64;
        epoll_event events[MAX_EVENTS];

        while (!pending.empty())
        {
            int remaining = RemainingMs(deadline);
            if (remaining <= 0)
                break;

            int n = epoll_wait(ep, events, MAX_EVENTS, remaining);
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                break;

            for (int i = 0; i < n; ++i)
            {
                int fd = events[i].data.fd;
                int err = 0;
                socklen_t len = sizeof(err);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);

                auto it = pending.find(fd);
                if (it != pending.end())
                {
                    if (err == 0)
                        open.push_back(it->second);
                    pending.erase(it);
                }
                epoll_ctl(ep, EPOLL_CTL_DEL, fd, nullptr);
                close(fd);
            }
        }

        for (const auto &entry : pending)
        {
            epoll_ctl(ep, EPOLL_CTL_DEL, entry.first, nullptr);
            close(entry.first);
        }
        close(ep);

        return open;
    }

    bool IsTcpPortOpen(const std::string &ip, uint16_t port, int timeout_ms)
    {
        return !ProbeTcpPorts(ip, {port}, timeout_ms).empty();
    }

    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw)
    {
        if (raw.compare(0, 5, "HTTP/") != 0)
            return std::nullopt;

        auto line_end = raw.find("\r\n");
        auto first_space = raw.find(' ');
        if (line_end == std::string::npos || first_space == std::string::npos || first_space > line_end)
            return std::nullopt;

        HttpResponse response;
        try
        {
            response.status = std::stoi(raw.substr(first_space + 1, 3));
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }

        auto body_start = raw.find("\r\n\r\n");
        if (body_start != std::string::npos)
            response.body = raw.substr(body_start + 4);
        return response;
    }

    std::optional<HttpResponse> HttpGet(const std::string &ip, uint16_t port, const std::string &path, int timeout_ms)
    {
        int fd = ConnectWithTimeout(ip, port, timeout_ms);
        if (fd < 0)
            return std::nullopt;

        timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        const std::string request = "GET " + path + " HTTP/1.0\r\n"
                                    "Host: " + ip + ":" + std::to_string(port) + "\r\n"
                                    "Accept: application/json\r\n"
                                    "Connection: close\r\n\r\n";

        if (send(fd, request.data(), request.size(), MSG_NOSIGNAL) != static_cast<ssize_t>(request.size()))
        {
            close(fd);
            return std::nullopt;
        }

        // Bodies larger than this are not an identity document.
        const size_t MAX_RESPONSE = 64 * 1024;
        std::string raw;
        char buffer[4096];
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

        while (raw.size() < MAX_RESPONSE && RemainingMs(deadline) > 0)
        {
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0)
                break;
            raw.append(buffer, static_cast<size_t>(n));
        }
        close(fd);

        return ParseHttpResponse(raw);
    }
}
