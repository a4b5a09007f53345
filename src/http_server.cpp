// ===================== src/http_server.cpp =====================
#include "http_server.hpp"
#include "diag_logger.hpp"
#include "errors.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mailhealth
{
    namespace
    {
        constexpr size_t kMaxRequestHeaderBytes = 16 * 1024;
        constexpr int kAcceptPollMs = 200;
    } // namespace

    bool parse_request_line(const std::string &line, HttpRequest &out)
    {
        size_t sp1 = line.find(' ');
        if (sp1 == std::string::npos || sp1 == 0)
            return false;
        size_t sp2 = line.find(' ', sp1 + 1);
        if (sp2 == std::string::npos || sp2 == sp1 + 1)
            return false;
        if (line.find(' ', sp2 + 1) != std::string::npos)
            return false;

        out.method = line.substr(0, sp1);
        out.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
        out.version = line.substr(sp2 + 1);
        if (out.version.rfind("HTTP/", 0) != 0 || out.target[0] != '/')
            return false;
        out.path = out.target.substr(0, out.target.find('?'));
        return true;
    }

    const char *reason_phrase(int status)
    {
        switch (status)
        {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 500: return "Internal Server Error";
        default: return "Unknown";
        }
    }

    std::string serialize_response(const HttpResponse &res)
    {
        std::string out = "HTTP/1.1 " + std::to_string(res.status) + " " + reason_phrase(res.status) + "\r\n";
        out += "Content-Type: " + res.content_type + "\r\n";
        out += "Content-Length: " + std::to_string(res.body.size()) + "\r\n";
        if (res.status == 405)
            out += "Allow: GET\r\n";
        out += "Connection: close\r\n\r\n";
        out += res.body;
        return out;
    }

    HttpServer::HttpServer(HttpHandler &handler, int port, DiagLogger *log,
                           std::chrono::milliseconds client_timeout)
        : handler_(handler), requested_port_(port), log_(log), client_timeout_(client_timeout) {}

    HttpServer::~HttpServer()
    {
        stop();
    }

    void HttpServer::start()
    {
        if (running_)
            return;

        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
            throw ConnectionError(std::string("socket: ") + std::strerror(errno));
        TcpSocket listener(fd);

        int opt = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(static_cast<uint16_t>(requested_port_));
        if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
            throw ConnectionError("bind to port " + std::to_string(requested_port_) + " failed: " +
                                  std::strerror(errno));
        if (::listen(fd, 16) < 0)
            throw ConnectionError(std::string("listen: ") + std::strerror(errno));

        socklen_t len = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0)
            bound_port_ = ntohs(addr.sin_port);
        else
            bound_port_ = requested_port_;

        listener_ = std::move(listener);
        running_ = true;
        thread_ = std::thread(&HttpServer::run, this);
        if (log_)
            log_->info("HTTP_LISTEN port=" + std::to_string(bound_port_));
    }

    void HttpServer::stop()
    {
        running_ = false;
        if (thread_.joinable())
            thread_.join();
        listener_.closeSocket();
    }

    void HttpServer::run()
    {
        while (running_)
        {
            pollfd pfd{};
            pfd.fd = listener_.fd();
            pfd.events = POLLIN;
            int rc = ::poll(&pfd, 1, kAcceptPollMs);
            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                if (log_)
                    log_->error(std::string("HTTP_POLL_FAILED err=") + std::strerror(errno));
                break;
            }
            if (rc == 0 || !(pfd.revents & POLLIN))
                continue;

            int cfd = ::accept(listener_.fd(), nullptr, nullptr);
            if (cfd < 0)
            {
                if (log_ && errno != EINTR && errno != EAGAIN && errno != ECONNABORTED)
                    log_->warn(std::string("HTTP_ACCEPT_FAILED err=") + std::strerror(errno));
                continue;
            }
            serve(TcpSocket(cfd));
        }
    }

    void HttpServer::serve(TcpSocket client)
    {
        using std::chrono::steady_clock;
        const steady_clock::time_point deadline = steady_clock::now() + client_timeout_;

        std::string raw;
        char buf[2048];
        bool timed_out = false;
        while (raw.find("\r\n\r\n") == std::string::npos && raw.size() <= kMaxRequestHeaderBytes)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - steady_clock::now());
            if (left.count() <= 0)
            {
                timed_out = true;
                break;
            }
            client.setIoTimeout(left);
            ssize_t n = client.recvSome(buf, sizeof(buf));
            if (n <= 0)
            {
                timed_out = steady_clock::now() >= deadline;
                break;
            }
            raw.append(buf, static_cast<size_t>(n));
        }
        if (raw.empty())
            return; // client went away

        if (timed_out)
        {
            if (log_)
                log_->debug("HTTP_CLIENT_TIMEOUT bytes=" + std::to_string(raw.size()));
            HttpResponse res;
            res.status = 408;
            res.body = "Request Timeout\n";
            client.setIoTimeout(client_timeout_);
            if (!client.sendAll(serialize_response(res)) && log_)
                log_->debug("HTTP_SEND_FAILED status=408");
            return;
        }

        HttpResponse res;
        HttpRequest req;
        const std::string first = raw.substr(0, raw.find("\r\n"));
        if (raw.find("\r\n") == std::string::npos || !parse_request_line(first, req))
        {
            res.status = 400;
            res.body = "Bad Request\n";
        }
        else
        {
            try
            {
                res = handler_.handle(req);
            }
            catch (const std::exception &e)
            {
                if (log_)
                    log_->error("HTTP_HANDLER_FAILED path=" + req.path + " detail=\"" + e.what() + "\"");
                res = HttpResponse();
                res.status = 500;
                res.body = "Internal Server Error\n";
            }
        }

        if (log_ && log_->enabled(LogLevel::Debug))
            log_->debug("HTTP_REQUEST method=" + req.method + " path=" + req.path +
                        " status=" + std::to_string(res.status));
        client.setIoTimeout(client_timeout_);
        if (!client.sendAll(serialize_response(res)) && log_)
            log_->debug("HTTP_SEND_FAILED path=" + req.path);
    }
} // namespace mailhealth
