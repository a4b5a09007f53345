// ===================== include/https_fetcher.hpp =====================
#pragma once
#include <chrono>
#include <map>
#include <string>

#include "capabilities.hpp"
#include "parsed_url.hpp"

namespace mailhealth
{
    class DiagLogger;

    struct HttpResponseMessage
    {
        int status = 0;
        std::string reason;
        std::map<std::string, std::string> headers; // lower-cased names
        std::string body;                           // de-chunked

        std::string header(const std::string &name) const; // "" when absent
    };

    // Splits a complete HTTP/1.x response. Throws ProtocolError when there is
    // no status line or header terminator.
    HttpResponseMessage parse_http_response(const std::string &raw);

    // Transfer-Encoding: chunked body -> payload. Throws ProtocolError on a
    // malformed chunk size.
    std::string decode_chunked(const std::string &body);

    // GET over plain TCP or TLS, following up to kMaxRedirects redirects.
    class HttpsScoreFetcher : public ScoreFetcher
    {
    public:
        static constexpr int kMaxRedirects = 5;

        explicit HttpsScoreFetcher(std::chrono::milliseconds timeout, bool verify_tls = true,
                                   DiagLogger *log = nullptr);

        // Returns the body of the final 2xx response. Transport failures and
        // non-2xx answers throw ConnectionError. The whole fetch, redirects
        // included, is bounded by the timeout; overrunning it throws
        // TimeoutError.
        std::string fetch(const std::string &url) override;

    private:
        HttpResponseMessage getOnce(const ParsedURL &url, std::chrono::steady_clock::time_point deadline) const;

        std::chrono::milliseconds timeout_;
        bool verify_tls_;
        DiagLogger *log_;
    };
} // namespace mailhealth
