#pragma once

#include <memory>
#include <string>

#include "postsink/core/errors.hpp"
#include "postsink/core/types.hpp"

namespace postsink::net {
    using u8 = postsink::core::u8;
    using u16 = postsink::core::u16;
    using u32 = postsink::core::u32;

    enum class TransportMode : u8 {
        Tls = 0,
        Plaintext = 1,
        Gateway = 2,
    };

    // Wire protocol spoken on accepted connections.
    enum class Protocol : u8 {
        Http = 0,
        FastCgi = 1,
    };

    [[nodiscard]] const char* transport_mode_name(TransportMode mode) noexcept;

    // One accepted connection. Not thread-safe except for shutdown(), which may
    // be called from any thread to unblock a pending read or write.
    class Connection {
    public:
        virtual ~Connection() = default;

        // Protocol-level setup before the first read (TLS handshake). No-op
        // for plain sockets.
        [[nodiscard]] virtual postsink::core::Status handshake() noexcept = 0;

        // *got == 0 with Ok means orderly end of stream.
        [[nodiscard]] virtual postsink::core::Status read(u8* buf, u32 cap, u32* got) noexcept = 0;

        [[nodiscard]] virtual postsink::core::Status write_all(const u8* data, u32 len) noexcept = 0;

        virtual void shutdown() noexcept = 0;

        // Peer address as "ip:port", or "@" for an unnamed Unix-domain peer.
        [[nodiscard]] virtual const char* remote() const noexcept = 0;
    };

    // A bound, listening acceptor. accept() blocks until a client connects or
    // the listener is closed; after close() it returns Net/Unavailable.
    class Listener {
    public:
        virtual ~Listener() = default;

        [[nodiscard]] virtual postsink::core::Status accept(std::unique_ptr<Connection>* out) noexcept = 0;

        // Idempotent. Wakes a blocked accept() and stops listening, so later
        // connection attempts are refused. A gateway listener also removes its
        // socket file here. The descriptor is closed on destruction.
        virtual void close() noexcept = 0;

        // Result of the cleanup done by close(): Ok before close() and for
        // TCP listeners; Net/Io with errno if the socket file could not be
        // removed.
        [[nodiscard]] virtual postsink::core::Status close_status() const noexcept = 0;

        // Bound address: "ip:port" or the absolute socket path.
        [[nodiscard]] virtual const char* address() const noexcept = 0;

        [[nodiscard]] virtual Protocol protocol() const noexcept = 0;
    };

    struct ListenerConfig {
        TransportMode mode{TransportMode::Tls};
        std::string address;    // "host:port" or socket path (gateway)
        std::string cert_path;  // tls only
        std::string key_path;   // tls only
        std::string base_dir;   // Directory a relative socket path is resolved against
        int backlog{128};
    };

    // Build the listener for cfg.mode. Every failure here is a startup error:
    // - Cli/Invalid: malformed address
    // - Tls/Crypto: certificate or key could not be loaded or do not match
    // - Net/Io (errno in aux): socket, bind or listen failed
    [[nodiscard]] postsink::core::Status acquire_listener(const ListenerConfig& cfg,
                                                          std::unique_ptr<Listener>* out) noexcept;

} // namespace postsink::net
