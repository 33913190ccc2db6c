#include "postsink/net/listener.hpp"
#include "postsink/net/socket.hpp"
#include "postsink/net/tls.hpp"
#include "postsink/core/log.hpp"

#include <unistd.h>

namespace postsink::net {
    using postsink::core::Status;
    using postsink::core::StatusCode;
    using postsink::core::StatusDomain;
    using postsink::core::make_status;
    using postsink::core::ok_status;
    using postsink::core::is_ok;

    namespace {
        [[nodiscard]] Status acquire_plaintext(const ListenerConfig& cfg, std::unique_ptr<Listener>* out) noexcept {
            int fd = -1;
            Status s = open_tcp_socket(cfg.address, cfg.backlog, &fd);
            if (!is_ok(s)) {
                return s;
            }
            int wake_fd = -1;
            s = open_wake_fd(&wake_fd);
            if (!is_ok(s)) {
                close(fd);
                return s;
            }
            *out = std::make_unique<SocketListener>(fd, wake_fd, bound_address(fd), Protocol::Http);
            return ok_status();
        }

        [[nodiscard]] Status acquire_tls(const ListenerConfig& cfg, std::unique_ptr<Listener>* out) noexcept {
            // Credentials first: a bad keypair must not leave a bound port behind.
            SharedSslCtx ctx;
            Status s = load_server_context(cfg.cert_path, cfg.key_path, &ctx);
            if (!is_ok(s)) {
                return s;
            }
            postsink::core::log_printf("Loaded keypair from %s and %s", cfg.cert_path.c_str(), cfg.key_path.c_str());

            int fd = -1;
            s = open_tcp_socket(cfg.address, cfg.backlog, &fd);
            if (!is_ok(s)) {
                return s;
            }
            int wake_fd = -1;
            s = open_wake_fd(&wake_fd);
            if (!is_ok(s)) {
                close(fd);
                return s;
            }
            *out = std::make_unique<TlsListener>(fd, wake_fd, bound_address(fd), std::move(ctx));
            return ok_status();
        }

        [[nodiscard]] Status acquire_gateway(const ListenerConfig& cfg, std::unique_ptr<Listener>* out) noexcept {
            std::string path;
            Status s = resolve_socket_path(cfg.base_dir, cfg.address, &path);
            if (!is_ok(s)) {
                return s;
            }

            int fd = -1;
            s = open_unix_socket(path, cfg.backlog, &fd);
            if (!is_ok(s)) {
                return s;
            }
            int wake_fd = -1;
            s = open_wake_fd(&wake_fd);
            if (!is_ok(s)) {
                close(fd);
                unlink(path.c_str());
                return s;
            }
            *out = std::make_unique<UnixListener>(fd, wake_fd, path);
            return ok_status();
        }
    } // namespace

    const char* transport_mode_name(TransportMode mode) noexcept {
        switch (mode) {
            case TransportMode::Tls: return "tls";
            case TransportMode::Plaintext: return "plaintext";
            case TransportMode::Gateway: return "gateway";
        }
        return "unknown";
    }

    Status acquire_listener(const ListenerConfig& cfg, std::unique_ptr<Listener>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        if (cfg.address.empty()) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        switch (cfg.mode) {
            case TransportMode::Plaintext:
                return acquire_plaintext(cfg, out);
            case TransportMode::Tls:
                return acquire_tls(cfg, out);
            case TransportMode::Gateway:
                return acquire_gateway(cfg, out);
        }
        return make_status(StatusDomain::Net, StatusCode::Unsupported);
    }

} // namespace postsink::net
