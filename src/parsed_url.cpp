// ===================== src/parsed_url.cpp =====================
#include "parsed_url.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mailhealth
{
    ParsedURL::ParsedURL(const std::string &url)
    {
        scheme = "http"; // default
        path = "/";

        size_t scheme_end = url.find("://");
        size_t host_start = 0;
        if (scheme_end != std::string::npos)
        {
            scheme = url.substr(0, scheme_end);
            std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            host_start = scheme_end + 3;
        }
        if (scheme != "http" && scheme != "https")
            throw std::invalid_argument("unsupported URL scheme: " + scheme);

        size_t path_start = url.find_first_of("/?", host_start);
        std::string authority;
        if (path_start != std::string::npos)
        {
            authority = url.substr(host_start, path_start - host_start);
            path = url.substr(path_start);
            if (path[0] == '?')
                path = "/" + path;
        }
        else
        {
            authority = url.substr(host_start);
            path = "/";
        }

        size_t hash = path.find('#');
        if (hash != std::string::npos)
            path.erase(hash);

        port = isHttps() ? 443 : 80;
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos && authority.find(']', colon) == std::string::npos)
        {
            const std::string portStr = authority.substr(colon + 1);
            authority.erase(colon);
            if (portStr.empty() || portStr.size() > 5 ||
                !std::all_of(portStr.begin(), portStr.end(), [](unsigned char c)
                             { return std::isdigit(c) != 0; }))
                throw std::invalid_argument("invalid port in URL: " + url);
            port = std::stoi(portStr);
            if (port <= 0 || port > 65535)
                throw std::invalid_argument("port out of range in URL: " + url);
        }
        host = authority;
        if (host.size() > 2 && host.front() == '[' && host.back() == ']')
            host = host.substr(1, host.size() - 2);
        if (host.empty())
            throw std::invalid_argument("missing host in URL: " + url);
    }

    std::string ParsedURL::hostHeader() const
    {
        const int def = isHttps() ? 443 : 80;
        const std::string h = (host.find(':') != std::string::npos) ? "[" + host + "]" : host;
        return port == def ? h : h + ":" + std::to_string(port);
    }

    std::string ParsedURL::toGetRequestString(const std::string &userAgent) const
    {
        std::string req = std::string("GET ") + path + " HTTP/1.1\r\n" +
                          "Host: " + hostHeader() + "\r\n";
        if (!userAgent.empty())
            req += "User-Agent: " + userAgent + "\r\n";
        req += "Accept: text/html,application/xhtml+xml;q=0.9,*/*;q=0.8\r\n"
               "Connection: close\r\n\r\n";
        return req;
    }

    std::string ParsedURL::resolve(const std::string &location) const
    {
        if (location.find("://") != std::string::npos)
            return location;
        if (location.rfind("//", 0) == 0)
            return scheme + ":" + location;
        const std::string origin = scheme + "://" + hostHeader();
        if (!location.empty() && location[0] == '/')
            return origin + location;

        // relative to the current directory
        std::string base = path.substr(0, path.find('?'));
        base = base.substr(0, base.rfind('/') + 1);
        return origin + base + location;
    }
} // namespace mailhealth
