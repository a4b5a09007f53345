// ===================== include/parsed_url.hpp =====================
#pragma once
#include <string>

namespace mailhealth
{
    class ParsedURL
    {
    public:
        std::string scheme; // "http" or "https"
        std::string host;   // e.g., "www.mail-tester.com"
        int port = 0;       // explicit port, or the scheme default
        std::string path;   // path plus query, e.g., "/test-abc123?lang=en"

        // Throws std::invalid_argument for unsupported schemes or a missing host.
        explicit ParsedURL(const std::string &url);

        bool isHttps() const { return scheme == "https"; }
        std::string hostHeader() const; // host, plus ":port" when not the default
        std::string toGetRequestString(const std::string &userAgent = std::string()) const;

        // Resolves a Location header value against this URL.
        std::string resolve(const std::string &location) const;
    };
} // namespace mailhealth
