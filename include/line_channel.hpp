// ===================== include/line_channel.hpp =====================
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "ssl_session.hpp"
#include "tcp_socket.hpp"

namespace mailhealth
{
    struct ChannelEndpoint
    {
        std::string host;
        int port = 0;
        bool implicit_tls = false; // TLS from the first byte (SMTPS 465, IMAPS 993)
        bool verify_tls = true;
        std::chrono::milliseconds timeout{30000};
        // Session-wide limit; reads past it raise TimeoutError.
        std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    };

    // CRLF-framed text conversation used by the SMTP and IMAP clients.
    // Every read is bounded by the endpoint timeout and by its deadline;
    // EOF and read timeouts raise ConnectionError, a passed deadline
    // raises TimeoutError.
    class LineChannel
    {
    public:
        virtual ~LineChannel() = default;

        virtual void writeLine(const std::string &line) = 0; // appends CRLF
        virtual void writeRaw(const std::string &data) = 0;
        virtual std::string readLine() = 0;          // CRLF stripped
        virtual std::string readExact(size_t n) = 0; // IMAP literals
        virtual void startTls() = 0;                 // STARTTLS upgrade in place
        virtual bool isTls() const = 0;
    };

    using ChannelFactory = std::function<std::unique_ptr<LineChannel>(const ChannelEndpoint &)>;

    class NetLineChannel : public LineChannel
    {
    public:
        // Connects (and handshakes when implicit_tls). Throws ConnectionError.
        static std::unique_ptr<NetLineChannel> open(const ChannelEndpoint &ep);

        void writeLine(const std::string &line) override;
        void writeRaw(const std::string &data) override;
        std::string readLine() override;
        std::string readExact(size_t n) override;
        void startTls() override;
        bool isTls() const override { return tls_ != nullptr; }

    private:
        explicit NetLineChannel(const ChannelEndpoint &ep);
        std::chrono::milliseconds remaining() const;
        void fill();

        ChannelEndpoint ep_;
        TcpSocket tcp_;
        std::unique_ptr<SslSession> tls_;
        std::string buf_;
    };

    ChannelFactory default_channel_factory();
} // namespace mailhealth
