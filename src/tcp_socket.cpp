// ===================== src/tcp_socket.cpp =====================
#include "tcp_socket.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace mailhealth
{
    namespace
    {
        timeval to_timeval(std::chrono::milliseconds d)
        {
            if (d.count() < 0)
                d = std::chrono::milliseconds(0);
            timeval tv{static_cast<long>(d.count() / 1000),
                       static_cast<suseconds_t>((d.count() % 1000) * 1000)};
            return tv;
        }
    } // namespace

    TcpSocket::TcpSocket() : sockfd_(-1) {}
    TcpSocket::TcpSocket(int fd) : sockfd_(fd) {}
    TcpSocket::~TcpSocket() { closeSocket(); }

    TcpSocket::TcpSocket(TcpSocket &&other) noexcept : sockfd_(other.sockfd_)
    {
        other.sockfd_ = -1;
    }

    TcpSocket &TcpSocket::operator=(TcpSocket &&other) noexcept
    {
        if (this != &other)
        {
            closeSocket();
            sockfd_ = other.sockfd_;
            other.sockfd_ = -1;
        }
        return *this;
    }

    void TcpSocket::closeSocket()
    {
        if (sockfd_ != -1)
        {
            ::close(sockfd_);
            sockfd_ = -1;
        }
    }

    bool TcpSocket::connectTo(const ResolvedAddress &ra, std::chrono::milliseconds timeout)
    {
        closeSocket();
        sockfd_ = ::socket(ra.family, ra.socktype, ra.protocol);
        if (sockfd_ == -1)
            return false;

        int flags = ::fcntl(sockfd_, F_GETFL, 0);
        if (flags != -1)
            ::fcntl(sockfd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(sockfd_, reinterpret_cast<const sockaddr *>(&ra.addr), ra.addrlen);
        if (rc != 0 && errno == EINPROGRESS)
        {
            fd_set wfds;
            FD_ZERO(&wfds);
            FD_SET(sockfd_, &wfds);
            timeval tv = to_timeval(timeout);
            rc = ::select(sockfd_ + 1, nullptr, &wfds, nullptr, &tv);
            if (rc == 1)
            {
                int soerr = 0;
                socklen_t len = sizeof(soerr);
                if (::getsockopt(sockfd_, SOL_SOCKET, SO_ERROR, &soerr, &len) == 0 && soerr == 0)
                    rc = 0;
                else
                    rc = -1;
            }
            else
            {
                rc = -1; // timed out or select failed
            }
        }

        if (rc != 0)
        {
            closeSocket();
            return false;
        }

        if (flags != -1)
            ::fcntl(sockfd_, F_SETFL, flags);
        return true;
    }

    void TcpSocket::connectToHost(const std::string &host, int port, std::chrono::milliseconds timeout)
    {
        auto addrs = DNSResolver::resolve(host, port);
        std::string tried;
        for (const auto &ra : addrs)
        {
            if (connectTo(ra, timeout))
            {
                setIoTimeout(timeout);
                return;
            }
            tried += (tried.empty() ? "" : ", ") + ra.toString();
        }
        throw ConnectionError("connect to " + host + ":" + std::to_string(port) + " failed (tried " + tried + ")");
    }

    void TcpSocket::setIoTimeout(std::chrono::milliseconds timeout)
    {
        if (sockfd_ == -1)
            return;
        timeval tv = to_timeval(timeout);
        (void)::setsockopt(sockfd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        (void)::setsockopt(sockfd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    bool TcpSocket::sendAll(const std::string &data) const
    {
        if (sockfd_ == -1)
        {
            return false;
        }
        size_t off = 0;
        while (off < data.size())
        {
            ssize_t n = ::send(sockfd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                return false;
            off += static_cast<size_t>(n);
        }
        return true;
    }

    ssize_t TcpSocket::recvSome(char *buf, size_t len) const
    {
        if (sockfd_ == -1)
            return -1;
        ssize_t n;
        do
        {
            n = ::recv(sockfd_, buf, len, 0);
        } while (n < 0 && errno == EINTR);
        return n;
    }

    std::string TcpSocket::recvAll() const
    {
        std::string response;
        response.reserve(8192);
        char buf[4096];
        while (true)
        {
            ssize_t bytes = recvSome(buf, sizeof(buf));
            if (bytes <= 0)
                break;
            response.append(buf, static_cast<size_t>(bytes));
        }
        return response;
    }
} // namespace mailhealth
