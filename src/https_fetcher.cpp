// ===================== src/https_fetcher.cpp =====================
#include "https_fetcher.hpp"
#include "diag_logger.hpp"
#include "errors.hpp"
#include "ssl_session.hpp"
#include "tcp_socket.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace mailhealth
{
    namespace
    {
        // Several result pages refuse non-browser agents.
        const char *kUserAgent =
            "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
            "Chrome/120.0 Safari/537.36";

        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string trim(const std::string &s)
        {
            size_t b = s.find_first_not_of(" \t");
            if (b == std::string::npos)
                return std::string();
            size_t e = s.find_last_not_of(" \t\r");
            return s.substr(b, e - b + 1);
        }

        std::chrono::milliseconds time_left(std::chrono::steady_clock::time_point deadline, const std::string &host)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0)
                throw TimeoutError("fetch from " + host + " ran out of time");
            return left;
        }

        // Reads until the peer closes; each recv is bounded by what is left
        // of the deadline.
        std::string read_until_close(TcpSocket &tcp, const SslSession *tls,
                                     std::chrono::steady_clock::time_point deadline, const std::string &host)
        {
            std::string response;
            response.reserve(8192);
            char buf[4096];
            for (;;)
            {
                tcp.setIoTimeout(time_left(deadline, host));
                long n = tls ? tls->recvSome(buf, sizeof(buf))
                             : static_cast<long>(tcp.recvSome(buf, sizeof(buf)));
                if (n <= 0)
                {
                    if (std::chrono::steady_clock::now() >= deadline)
                        throw TimeoutError("fetch from " + host + " ran out of time");
                    break;
                }
                response.append(buf, static_cast<size_t>(n));
            }
            return response;
        }

        bool is_redirect(int status)
        {
            return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
        }
    } // namespace

    std::string HttpResponseMessage::header(const std::string &name) const
    {
        auto it = headers.find(lower(name));
        return it == headers.end() ? std::string() : it->second;
    }

    std::string decode_chunked(const std::string &body)
    {
        std::string decoded;
        size_t pos = 0;
        while (pos < body.size())
        {
            size_t line_end = body.find("\r\n", pos);
            if (line_end == std::string::npos)
                break;
            std::string size_str = body.substr(pos, line_end - pos);
            size_t ext = size_str.find(';');
            if (ext != std::string::npos)
                size_str.erase(ext);
            size_str = trim(size_str);

            size_t chunk_size = 0;
            try
            {
                size_t used = 0;
                chunk_size = std::stoul(size_str, &used, 16);
                if (used != size_str.size())
                    throw std::invalid_argument(size_str);
            }
            catch (const std::exception &)
            {
                throw ProtocolError("malformed chunk size '" + size_str + "'");
            }
            pos = line_end + 2;
            if (chunk_size == 0)
                break;
            if (pos + chunk_size > body.size())
            {
                decoded.append(body, pos, std::string::npos); // truncated final chunk
                break;
            }
            decoded.append(body, pos, chunk_size);
            pos += chunk_size + 2; // skip CRLF
        }
        return decoded;
    }

    HttpResponseMessage parse_http_response(const std::string &raw)
    {
        size_t header_end = raw.find("\r\n\r\n");
        if (header_end == std::string::npos)
            throw ProtocolError("HTTP response without header terminator (" +
                                std::to_string(raw.size()) + " bytes)");

        HttpResponseMessage res;
        std::istringstream hs(raw.substr(0, header_end));
        std::string line;
        std::getline(hs, line);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        // HTTP/1.1 200 OK
        if (line.rfind("HTTP/", 0) != 0)
            throw ProtocolError("bad HTTP status line: " + line);
        size_t sp1 = line.find(' ');
        if (sp1 == std::string::npos || sp1 + 4 > line.size())
            throw ProtocolError("bad HTTP status line: " + line);
        const std::string code = line.substr(sp1 + 1, 3);
        if (!std::all_of(code.begin(), code.end(), [](unsigned char c)
                         { return std::isdigit(c) != 0; }))
            throw ProtocolError("bad HTTP status code: " + line);
        res.status = std::stoi(code);
        if (sp1 + 4 < line.size())
            res.reason = trim(line.substr(sp1 + 5));

        while (std::getline(hs, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            size_t colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            res.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }

        res.body = raw.substr(header_end + 4);
        if (lower(res.header("transfer-encoding")).find("chunked") != std::string::npos)
            res.body = decode_chunked(res.body);
        return res;
    }

    HttpsScoreFetcher::HttpsScoreFetcher(std::chrono::milliseconds timeout, bool verify_tls, DiagLogger *log)
        : timeout_(timeout), verify_tls_(verify_tls), log_(log) {}

    HttpResponseMessage HttpsScoreFetcher::getOnce(const ParsedURL &url,
                                                   std::chrono::steady_clock::time_point deadline) const
    {
        TcpSocket tcp;
        tcp.connectToHost(url.host, url.port, std::min(timeout_, time_left(deadline, url.host)));

        const std::string req = url.toGetRequestString(kUserAgent);
        std::string resp;
        if (url.isHttps())
        {
            tcp.setIoTimeout(time_left(deadline, url.host));
            SslSession tls(verify_tls_);
            if (!tls.handshake(tcp.fd(), url.host))
                throw ConnectionError("TLS handshake with " + url.host + " failed: " + tls.lastError());
            if (!tls.sendAll(req))
                throw ConnectionError("TLS send to " + url.host + " failed: " + tls.lastError());
            resp = read_until_close(tcp, &tls, deadline, url.host);
            tls.shutdown();
        }
        else
        {
            if (!tcp.sendAll(req))
                throw ConnectionError("send to " + url.host + " failed");
            resp = read_until_close(tcp, nullptr, deadline, url.host);
        }

        if (resp.empty())
            throw ConnectionError("empty response from " + url.host);
        return parse_http_response(resp);
    }

    std::string HttpsScoreFetcher::fetch(const std::string &url)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout_;
        std::string current = url;
        for (int hop = 0; hop <= kMaxRedirects; ++hop)
        {
            ParsedURL parsed = [&]()
            {
                try
                {
                    return ParsedURL(current);
                }
                catch (const std::invalid_argument &e)
                {
                    throw ConnectionError(std::string("cannot fetch ") + current + ": " + e.what());
                }
            }();

            if (log_ && log_->enabled(LogLevel::Debug))
                log_->debug("HTTP_GET host=" + parsed.host + " port=" + std::to_string(parsed.port) +
                            " path=" + parsed.path);
            HttpResponseMessage res = getOnce(parsed, deadline);
            if (log_ && log_->enabled(LogLevel::Debug))
                log_->debug("HTTP_RESPONSE status=" + std::to_string(res.status) +
                            " bytes=" + std::to_string(res.body.size()));

            if (res.status >= 200 && res.status < 300)
                return res.body;

            if (is_redirect(res.status))
            {
                const std::string location = res.header("location");
                if (location.empty())
                    throw ConnectionError("HTTP " + std::to_string(res.status) + " without Location from " +
                                          parsed.host);
                current = parsed.resolve(location);
                continue;
            }

            throw ConnectionError("HTTP " + std::to_string(res.status) + " " + res.reason + " from " + current);
        }
        throw ConnectionError("too many redirects fetching " + url);
    }
} // namespace mailhealth
