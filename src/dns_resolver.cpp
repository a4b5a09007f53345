// ===================== src/dns_resolver.cpp =====================
#include "dns_resolver.hpp"
#include "errors.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstring>

namespace mailhealth
{
    std::string ResolvedAddress::toString() const
    {
        char buf[INET6_ADDRSTRLEN] = {0};
        if (family == AF_INET)
        {
            auto *sin = reinterpret_cast<const sockaddr_in *>(&addr);
            if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)))
                return std::string();
            return std::string(buf) + ":" + std::to_string(ntohs(sin->sin_port));
        }
        if (family == AF_INET6)
        {
            auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(&addr);
            if (!inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf)))
                return std::string();
            return "[" + std::string(buf) + "]:" + std::to_string(ntohs(sin6->sin6_port));
        }
        return std::string();
    }

    std::vector<ResolvedAddress> DNSResolver::resolve(const std::string &host, int port)
    {
        std::vector<ResolvedAddress> results;

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_NUMERICSERV;
        addrinfo *res = nullptr;

        const std::string service = std::to_string(port);
        int status = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
        if (status == EAI_AGAIN)
            throw TimeoutError("temporary DNS failure resolving " + host + ": " + gai_strerror(status));
        if (status != 0)
            throw ConnectionError("cannot resolve " + host + ": " + gai_strerror(status));

        for (auto *p = res; p != nullptr; p = p->ai_next)
        {
            ResolvedAddress ra{};
            ra.family = p->ai_family;
            ra.socktype = p->ai_socktype;
            ra.protocol = p->ai_protocol;
            ra.addrlen = static_cast<socklen_t>(p->ai_addrlen);
            std::memcpy(&ra.addr, p->ai_addr, p->ai_addrlen);
            results.push_back(ra);
        }
        freeaddrinfo(res);

        if (results.empty())
            throw ConnectionError("DNS resolution returned no addresses for " + host);
        return results;
    }
} // namespace mailhealth
