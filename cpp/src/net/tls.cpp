#include "postsink/net/tls.hpp"
#include "postsink/core/log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <openssl/err.h>
#include <sys/socket.h>
#include <unistd.h>

namespace postsink::net {
    using postsink::core::Status;
    using postsink::core::StatusCode;
    using postsink::core::StatusDomain;
    using postsink::core::make_status;
    using postsink::core::ok_status;
    using postsink::core::is_ok;

    namespace {
        [[nodiscard]] Status tls_error() noexcept {
            return make_status(StatusDomain::Tls, StatusCode::Crypto);
        }
    } // namespace

    void log_ssl_errors(const char* context) noexcept {
        unsigned long err = 0;
        bool any = false;
        while ((err = ERR_get_error()) != 0) {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            postsink::core::log_printf("%s: %s", context, buf);
            any = true;
        }
        if (!any) {
            postsink::core::log_printf("%s: failed", context);
        }
    }

    Status load_server_context(const std::string& cert_path, const std::string& key_path, SharedSslCtx* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Tls, StatusCode::Invalid);
        }

        SSL_CTX* raw = SSL_CTX_new(TLS_server_method());
        if (raw == nullptr) {
            log_ssl_errors("SSL_CTX_new");
            return tls_error();
        }
        SharedSslCtx ctx(raw, SslCtxDeleter{});

        if (SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION) != 1) {
            log_ssl_errors("set_min_proto_version");
            return tls_error();
        }
        SSL_CTX_set_options(ctx.get(), SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION |
                                           SSL_OP_IGNORE_UNEXPECTED_EOF);
        SSL_CTX_set_mode(ctx.get(), SSL_MODE_AUTO_RETRY);

        if (SSL_CTX_use_certificate_chain_file(ctx.get(), cert_path.c_str()) != 1) {
            log_ssl_errors(cert_path.c_str());
            return tls_error();
        }
        if (SSL_CTX_use_PrivateKey_file(ctx.get(), key_path.c_str(), SSL_FILETYPE_PEM) != 1) {
            log_ssl_errors(key_path.c_str());
            return tls_error();
        }
        if (SSL_CTX_check_private_key(ctx.get()) != 1) {
            log_ssl_errors("check_private_key");
            return tls_error();
        }

        *out = std::move(ctx);
        return ok_status();
    }

    // ====================================================================
    // TlsConnection
    // ====================================================================

    TlsConnection::TlsConnection(int fd, const char* remote, SharedSslCtx ctx) noexcept
        : fd_(fd), ctx_(std::move(ctx)) {
        std::snprintf(remote_, sizeof(remote_), "%s", remote != nullptr ? remote : "");
    }

    TlsConnection::~TlsConnection() {
        if (ssl_ && established_ && !shut_.load(std::memory_order_acquire)) {
            // Best-effort close_notify; the peer may already be gone.
            (void)SSL_shutdown(ssl_.get());
        }
        ssl_.reset();
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        ERR_clear_error();
    }

    Status TlsConnection::handshake() noexcept {
        if (ssl_) {
            return established_ ? ok_status() : tls_error();
        }
        ssl_.reset(SSL_new(ctx_.get()));
        if (!ssl_ || SSL_set_fd(ssl_.get(), fd_) != 1) {
            log_ssl_errors("SSL_new");
            return tls_error();
        }

        const int rc = SSL_accept(ssl_.get());
        if (rc != 1) {
            const int err = SSL_get_error(ssl_.get(), rc);
            char ctx_buf[96];
            std::snprintf(ctx_buf, sizeof(ctx_buf), "TLS handshake error from %s", remote_);
            if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
                postsink::core::log_printf("%s: %s", ctx_buf, errno != 0 ? std::strerror(errno) : "EOF");
            } else {
                log_ssl_errors(ctx_buf);
            }
            return tls_error();
        }
        established_ = true;
        return ok_status();
    }

    Status TlsConnection::read(u8* buf, u32 cap, u32* got) noexcept {
        if (got == nullptr || (buf == nullptr && cap > 0)) {
            return make_status(StatusDomain::Tls, StatusCode::Invalid);
        }
        *got = 0;
        if (!established_) {
            return tls_error();
        }
        if (cap == 0) {
            return ok_status();
        }

        const int n = SSL_read(ssl_.get(), buf, static_cast<int>(cap));
        if (n > 0) {
            *got = static_cast<u32>(n);
            return ok_status();
        }

        const int err = SSL_get_error(ssl_.get(), n);
        if (err == SSL_ERROR_ZERO_RETURN) {
            return ok_status();
        }
        const int sys_err = errno;
        ERR_clear_error();
        if (err == SSL_ERROR_SYSCALL) {
            if (sys_err == 0) {
                return ok_status();
            }
            return make_status(StatusDomain::Net, StatusCode::Network, static_cast<u32>(sys_err));
        }
        return make_status(StatusDomain::Tls, StatusCode::Network);
    }

    Status TlsConnection::write_all(const u8* data, u32 len) noexcept {
        if (data == nullptr && len > 0) {
            return make_status(StatusDomain::Tls, StatusCode::Invalid);
        }
        if (!established_) {
            return tls_error();
        }

        u32 done = 0;
        while (done < len) {
            const int n = SSL_write(ssl_.get(), data + done, static_cast<int>(len - done));
            if (n <= 0) {
                const int sys_err = errno;
                const int err = SSL_get_error(ssl_.get(), n);
                ERR_clear_error();
                if (err == SSL_ERROR_SYSCALL) {
                    return make_status(StatusDomain::Net, StatusCode::Network, static_cast<u32>(sys_err));
                }
                return make_status(StatusDomain::Tls, StatusCode::Network);
            }
            done += static_cast<u32>(n);
        }
        return ok_status();
    }

    void TlsConnection::shutdown() noexcept {
        shut_.store(true, std::memory_order_release);
        if (fd_ >= 0) {
            (void)::shutdown(fd_, SHUT_RDWR);
        }
    }

    // ====================================================================
    // TlsListener
    // ====================================================================

    TlsListener::TlsListener(int fd, int wake_fd, std::string address, SharedSslCtx ctx) noexcept
        : SocketListener(fd, wake_fd, std::move(address), Protocol::Http), ctx_(std::move(ctx)) {}

    Status TlsListener::accept(std::unique_ptr<Connection>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        int fd = -1;
        char remote[kEndpointBytes]{};
        Status s = accept_fd(&fd, remote, sizeof(remote));
        if (!is_ok(s)) {
            return s;
        }
        *out = std::make_unique<TlsConnection>(fd, remote, ctx_);
        return ok_status();
    }

} // namespace postsink::net
