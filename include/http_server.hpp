// ===================== include/http_server.hpp =====================
#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "tcp_socket.hpp"

namespace mailhealth
{
    class DiagLogger;

    struct HttpRequest
    {
        std::string method;
        std::string target; // as sent, query included
        std::string path;   // target without the query
        std::string version;
    };

    struct HttpResponse
    {
        int status = 200;
        std::string content_type = "text/plain; charset=utf-8";
        std::string body;
    };

    // "GET /metrics?x=1 HTTP/1.1". False for anything else.
    bool parse_request_line(const std::string &line, HttpRequest &out);

    const char *reason_phrase(int status);

    // Status line, Content-Type, Content-Length, Connection: close, body.
    std::string serialize_response(const HttpResponse &res);

    class HttpHandler
    {
    public:
        virtual ~HttpHandler() = default;
        virtual HttpResponse handle(const HttpRequest &req) = 0;
    };

    // Minimal HTTP/1.1 listener: one request per connection, answered on the
    // accept thread. A client gets `client_timeout` in total to send its
    // request head; one that is still sending then is answered 408.
    class HttpServer
    {
    public:
        static constexpr std::chrono::milliseconds kDefaultClientTimeout{5000};

        // port 0 picks an ephemeral port; see port() after start().
        HttpServer(HttpHandler &handler, int port, DiagLogger *log = nullptr,
                   std::chrono::milliseconds client_timeout = kDefaultClientTimeout);
        ~HttpServer();

        HttpServer(const HttpServer &) = delete;
        HttpServer &operator=(const HttpServer &) = delete;

        // Binds and listens before returning. Throws ConnectionError.
        void start();
        void stop();

        int port() const { return bound_port_; }
        bool running() const { return running_; }

    private:
        void run();
        void serve(TcpSocket client);

        HttpHandler &handler_;
        int requested_port_;
        int bound_port_ = 0;
        DiagLogger *log_;
        std::chrono::milliseconds client_timeout_;
        TcpSocket listener_;
        std::atomic<bool> running_{false};
        std::thread thread_;
    };
} // namespace mailhealth
