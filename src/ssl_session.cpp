// ===================== src/ssl_session.cpp =====================
#include "ssl_session.hpp"
#include <openssl/err.h>
#include <openssl/x509_vfy.h>
#include <stdexcept>

namespace cfscan
{
    namespace
    {
        std::string drain_error_queue()
        {
            std::string out;
            char buf[256];
            for (unsigned long e = ERR_get_error(); e != 0; e = ERR_get_error())
            {
                ERR_error_string_n(e, buf, sizeof(buf));
                if (!out.empty())
                    out += "; ";
                out += buf;
            }
            return out.empty() ? std::string("unknown TLS error") : out;
        }
    } // namespace

    SslSession::SslSession() : ctx_(nullptr), ssl_(nullptr)
    {
        // Idempotent and thread-safe on OpenSSL 1.1+.
        OPENSSL_init_ssl(0, nullptr);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_)
            throw std::runtime_error("Failed to create SSL_CTX: " + drain_error_queue());

        // Peers must present a chain the system trust store accepts.
        if (SSL_CTX_set_default_verify_paths(ctx_) != 1)
        {
            std::string err = drain_error_queue();
            SSL_CTX_free(ctx_);
            throw std::runtime_error("Failed to load system CA paths: " + err);
        }
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    }

    SslSession::~SslSession()
    {
        if (ssl_)
        {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ctx_)
        {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    bool SslSession::handshake(int sockfd, const std::string &hostname)
    {
        ERR_clear_error();
        ssl_ = SSL_new(ctx_);
        if (!ssl_)
        {
            last_error_ = drain_error_queue();
            return false;
        }
        SSL_set_fd(ssl_, sockfd);
        SSL_set_tlsext_host_name(ssl_, hostname.c_str());
        // certificate must also name the host we asked for
        if (SSL_set1_host(ssl_, hostname.c_str()) != 1)
        {
            last_error_ = drain_error_queue();
            return false;
        }
        if (SSL_connect(ssl_) <= 0)
        {
            last_error_ = drain_error_queue();
            long vr = SSL_get_verify_result(ssl_);
            if (vr != X509_V_OK)
                last_error_ += std::string(" (") + X509_verify_cert_error_string(vr) + ")";
            return false;
        }
        return true;
    }

    bool SslSession::sendAll(const std::string &data) const
    {
        if (!ssl_)
            return false;
        size_t sent = 0;
        while (sent < data.size())
        {
            int n = SSL_write(ssl_, data.data() + sent, static_cast<int>(data.size() - sent));
            if (n <= 0)
                return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    std::string SslSession::recvAll() const
    {
        std::string response;
        if (!ssl_)
            return response;
        response.reserve(8192);
        char buf[4096];
        while (true)
        {
            int bytes = SSL_read(ssl_, buf, sizeof(buf));
            if (bytes <= 0)
                break;
            response.append(buf, static_cast<size_t>(bytes));
        }
        return response;
    }
} // namespace cfscan
