#pragma once

#include <atomic>
#include <string>

#include <sys/socket.h>

#include "postsink/net/listener.hpp"

namespace postsink::net {

    inline constexpr u32 kEndpointBytes = 64;

    // "ip:port" for inet peers ("[v6]:port" for IPv6), "@" for unnamed
    // Unix-domain peers. Always NUL-terminates when out_len > 0.
    void format_endpoint(const sockaddr* sa, socklen_t len, char* out, u32 out_len) noexcept;

    // Splits "host:port", "[v6]:port" or ":port". The port must be numeric.
    [[nodiscard]] postsink::core::Status split_host_port(const std::string& address,
                                                         std::string* host,
                                                         std::string* port);

    // Relative paths are joined onto base_dir (the startup working directory
    // when base_dir is empty).
    [[nodiscard]] postsink::core::Status resolve_socket_path(const std::string& base_dir,
                                                             const std::string& path,
                                                             std::string* out);

    // Bound, listening sockets. On success *fd_out is non-blocking and close-on-exec.
    [[nodiscard]] postsink::core::Status open_tcp_socket(const std::string& address, int backlog, int* fd_out) noexcept;
    [[nodiscard]] postsink::core::Status open_unix_socket(const std::string& path, int backlog, int* fd_out) noexcept;

    // Non-blocking eventfd used to wake a listener blocked in accept().
    [[nodiscard]] postsink::core::Status open_wake_fd(int* fd_out) noexcept;

    // Local address a socket is bound to, formatted like format_endpoint().
    [[nodiscard]] std::string bound_address(int fd);

    // A connected stream socket.
    class FdConnection : public Connection {
    public:
        FdConnection(int fd, const char* remote) noexcept;
        ~FdConnection() override;

        FdConnection(const FdConnection&) = delete;
        FdConnection& operator=(const FdConnection&) = delete;

        [[nodiscard]] postsink::core::Status handshake() noexcept override;
        [[nodiscard]] postsink::core::Status read(u8* buf, u32 cap, u32* got) noexcept override;
        [[nodiscard]] postsink::core::Status write_all(const u8* data, u32 len) noexcept override;
        void shutdown() noexcept override;
        [[nodiscard]] const char* remote() const noexcept override { return remote_; }

        [[nodiscard]] int fd() const noexcept { return fd_; }

    private:
        int fd_{-1};
        char remote_[kEndpointBytes]{};
    };

    // Accept loop shared by the TCP and Unix-domain variants. A blocked
    // accept() is woken through an eventfd when close() is called.
    class SocketListener : public Listener {
    public:
        SocketListener(int fd, int wake_fd, std::string address, Protocol protocol) noexcept;
        ~SocketListener() override;

        SocketListener(const SocketListener&) = delete;
        SocketListener& operator=(const SocketListener&) = delete;

        [[nodiscard]] postsink::core::Status accept(std::unique_ptr<Connection>* out) noexcept override;
        void close() noexcept override;
        [[nodiscard]] postsink::core::Status close_status() const noexcept override { return postsink::core::ok_status(); }
        [[nodiscard]] const char* address() const noexcept override { return address_.c_str(); }
        [[nodiscard]] Protocol protocol() const noexcept override { return protocol_; }

    protected:
        // Blocks until a client connects. Fills the peer endpoint string.
        [[nodiscard]] postsink::core::Status accept_fd(int* fd_out, char* remote, u32 remote_len) noexcept;

        [[nodiscard]] bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }

        int fd_{-1};
        int wake_fd_{-1};
        std::string address_;
        Protocol protocol_{Protocol::Http};
        std::atomic<bool> closed_{false};
    };

    // Gateway listener: removes its socket file when closed.
    class UnixListener : public SocketListener {
    public:
        UnixListener(int fd, int wake_fd, std::string path) noexcept;
        ~UnixListener() override;

        void close() noexcept override;
        [[nodiscard]] postsink::core::Status close_status() const noexcept override;

    private:
        std::atomic<bool> unlinked_{false};
        std::atomic<int> unlink_errno_{0};
    };

} // namespace postsink::net
