// ===================== include/dns_resolver.hpp =====================
#pragma once
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

namespace mailhealth
{
    struct ResolvedAddress
    {
        int family;
        int socktype;
        int protocol;
        sockaddr_storage addr;
        socklen_t addrlen;

        std::string toString() const; // "ip:port", IPv6 in brackets
    };

    class DNSResolver
    {
    public:
        // Stream addresses for host:port in resolver order. EAI_AGAIN raises
        // TimeoutError, every other failure ConnectionError.
        static std::vector<ResolvedAddress> resolve(const std::string &host, int port);
    };
} // namespace mailhealth
