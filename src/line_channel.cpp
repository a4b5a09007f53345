// ===================== src/line_channel.cpp =====================
#include "line_channel.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace mailhealth
{
    namespace
    {
        constexpr size_t kMaxLineBytes = 64 * 1024;
    }

    NetLineChannel::NetLineChannel(const ChannelEndpoint &ep) : ep_(ep) {}

    std::unique_ptr<NetLineChannel> NetLineChannel::open(const ChannelEndpoint &ep)
    {
        std::unique_ptr<NetLineChannel> ch(new NetLineChannel(ep));
        ch->tcp_.connectToHost(ep.host, ep.port, ch->remaining());
        if (ep.implicit_tls)
            ch->startTls();
        return ch;
    }

    // Per-read timeout, shortened to what is left before the deadline.
    std::chrono::milliseconds NetLineChannel::remaining() const
    {
        using std::chrono::steady_clock;
        if (ep_.deadline == steady_clock::time_point::max())
            return ep_.timeout;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(ep_.deadline - steady_clock::now());
        if (left.count() <= 0)
            throw TimeoutError("session with " + ep_.host + " ran out of time");
        return std::min(ep_.timeout, left);
    }

    void NetLineChannel::startTls()
    {
        if (tls_)
            throw ProtocolError("TLS already active on " + ep_.host);
        // Anything buffered before the upgrade would be plaintext injection.
        if (!buf_.empty())
            throw ProtocolError("unexpected data pending before TLS handshake with " + ep_.host);

        tcp_.setIoTimeout(remaining());
        auto tls = std::make_unique<SslSession>(ep_.verify_tls);
        if (!tls->handshake(tcp_.fd(), ep_.host))
        {
            if (std::chrono::steady_clock::now() >= ep_.deadline)
                throw TimeoutError("TLS handshake with " + ep_.host + " ran out of time");
            throw ConnectionError("TLS handshake with " + ep_.host + ":" + std::to_string(ep_.port) +
                                  " failed: " + tls->lastError());
        }
        tls_ = std::move(tls);
    }

    void NetLineChannel::writeRaw(const std::string &data)
    {
        bool ok = tls_ ? tls_->sendAll(data) : tcp_.sendAll(data);
        if (!ok)
            throw ConnectionError("send to " + ep_.host + " failed");
    }

    void NetLineChannel::writeLine(const std::string &line)
    {
        writeRaw(line + "\r\n");
    }

    void NetLineChannel::fill()
    {
        tcp_.setIoTimeout(remaining());
        char tmp[4096];
        long n = tls_ ? tls_->recvSome(tmp, sizeof(tmp))
                      : static_cast<long>(tcp_.recvSome(tmp, sizeof(tmp)));
        if (n <= 0 && std::chrono::steady_clock::now() >= ep_.deadline)
            throw TimeoutError("session with " + ep_.host + " ran out of time");
        if (n == 0)
            throw ConnectionError("connection closed by " + ep_.host);
        if (n < 0)
        {
            if (!tls_ && (errno == EAGAIN || errno == EWOULDBLOCK))
                throw ConnectionError("read from " + ep_.host + " timed out");
            throw ConnectionError("read from " + ep_.host + " failed" +
                                  (tls_ ? std::string() : std::string(": ") + std::strerror(errno)));
        }
        buf_.append(tmp, static_cast<size_t>(n));
    }

    std::string NetLineChannel::readLine()
    {
        for (;;)
        {
            size_t nl = buf_.find('\n');
            if (nl != std::string::npos)
            {
                std::string line = buf_.substr(0, nl);
                buf_.erase(0, nl + 1);
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                return line;
            }
            if (buf_.size() > kMaxLineBytes)
                throw ProtocolError("line from " + ep_.host + " exceeds " + std::to_string(kMaxLineBytes) + " bytes");
            fill();
        }
    }

    std::string NetLineChannel::readExact(size_t n)
    {
        while (buf_.size() < n)
            fill();
        std::string out = buf_.substr(0, n);
        buf_.erase(0, n);
        return out;
    }

    ChannelFactory default_channel_factory()
    {
        return [](const ChannelEndpoint &ep) -> std::unique_ptr<LineChannel>
        {
            return NetLineChannel::open(ep);
        };
    }
} // namespace mailhealth
