// ===================== include/tcp_socket.hpp =====================
#pragma once
#include <chrono>
#include <string>
#include <sys/types.h>
#include "dns_resolver.hpp"

namespace mailhealth
{
    class TcpSocket
    {
        int sockfd_;

    public:
        TcpSocket();
        explicit TcpSocket(int fd); // takes ownership, e.g. an accepted client
        ~TcpSocket();

        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;
        TcpSocket(TcpSocket &&other) noexcept;
        TcpSocket &operator=(TcpSocket &&other) noexcept;

        void closeSocket();

        // Non-blocking connect bounded by timeout, then back to blocking mode.
        bool connectTo(const ResolvedAddress &ra, std::chrono::milliseconds timeout);

        // Tries every resolved address in order. Throws ConnectionError.
        void connectToHost(const std::string &host, int port, std::chrono::milliseconds timeout);

        // SO_RCVTIMEO / SO_SNDTIMEO so that a silent peer cannot block forever.
        void setIoTimeout(std::chrono::milliseconds timeout);

        bool sendAll(const std::string &data) const;
        ssize_t recvSome(char *buf, size_t len) const;
        std::string recvAll() const;
        int fd() const { return sockfd_; }
    };
} // namespace mailhealth
