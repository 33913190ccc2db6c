#pragma once

#include <memory>
#include <string>

#include <openssl/ssl.h>

#include "postsink/net/socket.hpp"

namespace postsink::net {

    struct SslDeleter {
        void operator()(SSL* ssl) const noexcept {
            if (ssl != nullptr) SSL_free(ssl);
        }
    };

    struct SslCtxDeleter {
        void operator()(SSL_CTX* ctx) const noexcept {
            if (ctx != nullptr) SSL_CTX_free(ctx);
        }
    };

    using UniqueSsl = std::unique_ptr<SSL, SslDeleter>;
    using SharedSslCtx = std::shared_ptr<SSL_CTX>;

    // Server context with the certificate chain and private key loaded and
    // checked against each other. Failures return Tls/Crypto and log the
    // OpenSSL error queue.
    [[nodiscard]] postsink::core::Status load_server_context(const std::string& cert_path,
                                                             const std::string& key_path,
                                                             SharedSslCtx* out) noexcept;

    // Drains the OpenSSL error queue of the calling thread into the log.
    void log_ssl_errors(const char* context) noexcept;

    class TlsConnection : public Connection {
    public:
        TlsConnection(int fd, const char* remote, SharedSslCtx ctx) noexcept;
        ~TlsConnection() override;

        TlsConnection(const TlsConnection&) = delete;
        TlsConnection& operator=(const TlsConnection&) = delete;

        // Server-side handshake; Tls/Crypto on failure.
        [[nodiscard]] postsink::core::Status handshake() noexcept override;
        [[nodiscard]] postsink::core::Status read(u8* buf, u32 cap, u32* got) noexcept override;
        [[nodiscard]] postsink::core::Status write_all(const u8* data, u32 len) noexcept override;
        void shutdown() noexcept override;
        [[nodiscard]] const char* remote() const noexcept override { return remote_; }

    private:
        int fd_{-1};
        char remote_[kEndpointBytes]{};
        SharedSslCtx ctx_;
        UniqueSsl ssl_;
        bool established_{false};
        std::atomic<bool> shut_{false};
    };

    // TCP acceptor whose connections speak TLS. The handshake is left to the
    // connection's worker so a slow client never holds up accept().
    class TlsListener : public SocketListener {
    public:
        TlsListener(int fd, int wake_fd, std::string address, SharedSslCtx ctx) noexcept;

        [[nodiscard]] postsink::core::Status accept(std::unique_ptr<Connection>* out) noexcept override;

    private:
        SharedSslCtx ctx_;
    };

} // namespace postsink::net
