// ===================== include/ssl_session.hpp =====================
#pragma once
#include <string>
#include <openssl/ssl.h>

namespace cfscan
{
    // TLS client over an already-connected socket. The socket stays owned by
    // the caller and must outlive the session.
    class SslSession
    {
        SSL_CTX *ctx_;
        SSL *ssl_;
        std::string last_error_;

    public:
        SslSession();
        ~SslSession();
        SslSession(const SslSession &) = delete;
        SslSession &operator=(const SslSession &) = delete;

        bool handshake(int sockfd, const std::string &hostname);
        bool sendAll(const std::string &data) const;
        std::string recvAll() const;

        // OpenSSL error queue text captured by the last failed handshake.
        const std::string &lastError() const { return last_error_; }
    };
} // namespace cfscan
