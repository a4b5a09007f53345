// ===================== include/ssl_session.hpp =====================
#pragma once
#include <string>
#include <openssl/ssl.h>

namespace mailhealth
{
    class SslSession
    {
        SSL_CTX *ctx_;
        SSL *ssl_;
        bool verify_peer_;
        std::string last_error_;

    public:
        explicit SslSession(bool verify_peer = true);
        ~SslSession();

        SslSession(const SslSession &) = delete;
        SslSession &operator=(const SslSession &) = delete;

        // SNI + certificate chain + hostname verification when verify_peer.
        bool handshake(int sockfd, const std::string &hostname);
        bool sendAll(const std::string &data) const;
        int recvSome(char *buf, int len) const;
        void shutdown();

        const std::string &lastError() const { return last_error_; }
    };
} // namespace mailhealth
