// ===================== src/ssl_session.cpp =====================
#include "ssl_session.hpp"
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <stdexcept>

namespace mailhealth
{
    namespace
    {
        std::string drain_openssl_errors()
        {
            std::string out;
            unsigned long code;
            char buf[256];
            while ((code = ERR_get_error()) != 0)
            {
                ERR_error_string_n(code, buf, sizeof(buf));
                if (!out.empty())
                    out += "; ";
                out += buf;
            }
            return out;
        }
    } // namespace

    SslSession::SslSession(bool verify_peer) : ctx_(nullptr), ssl_(nullptr), verify_peer_(verify_peer)
    {
        // OpenSSL 1.1+ initialises itself; this keeps older builds happy.
        OPENSSL_init_ssl(0, nullptr);

        const SSL_METHOD *method = TLS_client_method();
        ctx_ = SSL_CTX_new(method);
        if (!ctx_)
            throw std::runtime_error("Failed to create SSL_CTX: " + drain_openssl_errors());

        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        if (verify_peer_)
        {
            if (SSL_CTX_set_default_verify_paths(ctx_) != 1)
            {
                SSL_CTX_free(ctx_);
                throw std::runtime_error("Failed to load default CA paths: " + drain_openssl_errors());
            }
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        }
        else
        {
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        }
    }

    SslSession::~SslSession()
    {
        shutdown();
        if (ctx_)
        {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    void SslSession::shutdown()
    {
        if (ssl_)
        {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
    }

    bool SslSession::handshake(int sockfd, const std::string &hostname)
    {
        ERR_clear_error();
        ssl_ = SSL_new(ctx_);
        if (!ssl_)
        {
            last_error_ = "SSL_new failed: " + drain_openssl_errors();
            return false;
        }
        SSL_set_fd(ssl_, sockfd);
        SSL_set_tlsext_host_name(ssl_, hostname.c_str());
        if (verify_peer_)
        {
            SSL_set_hostflags(ssl_, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
            SSL_set1_host(ssl_, hostname.c_str());
        }
        if (SSL_connect(ssl_) <= 0)
        {
            last_error_ = drain_openssl_errors();
            long vr = SSL_get_verify_result(ssl_);
            if (vr != X509_V_OK)
            {
                if (!last_error_.empty())
                    last_error_ += "; ";
                last_error_ += std::string("certificate: ") + X509_verify_cert_error_string(vr);
            }
            if (last_error_.empty())
                last_error_ = "handshake failed";
            SSL_free(ssl_);
            ssl_ = nullptr;
            return false;
        }
        return true;
    }

    bool SslSession::sendAll(const std::string &data) const
    {
        if (!ssl_)
            return false;
        size_t off = 0;
        while (off < data.size())
        {
            int n = SSL_write(ssl_, data.data() + off, static_cast<int>(data.size() - off));
            if (n <= 0)
                return false;
            off += static_cast<size_t>(n);
        }
        return true;
    }

    int SslSession::recvSome(char *buf, int len) const
    {
        if (!ssl_)
            return -1;
        return SSL_read(ssl_, buf, len);
    }
} // namespace mailhealth
