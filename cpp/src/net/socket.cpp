#include "postsink/net/socket.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace postsink::net {
    using postsink::core::Status;
    using postsink::core::StatusCode;
    using postsink::core::StatusDomain;
    using postsink::core::make_status;
    using postsink::core::ok_status;
    using postsink::core::is_ok;

    namespace {
        [[nodiscard]] Status net_error(StatusCode code, int err) noexcept {
            return make_status(StatusDomain::Net, code, static_cast<u32>(err));
        }

        [[nodiscard]] bool set_nonblocking(int fd) noexcept {
            const int flags = fcntl(fd, F_GETFL, 0);
            if (flags < 0) {
                return false;
            }
            return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
        }

        [[nodiscard]] bool port_numeric(const std::string& port) noexcept {
            if (port.empty() || port.size() > 5) {
                return false;
            }
            for (const char c : port) {
                if (c < '0' || c > '9') {
                    return false;
                }
            }
            return std::atoi(port.c_str()) <= 65535;
        }
    } // namespace

    // ====================================================================
    // Addresses
    // ====================================================================

    void format_endpoint(const sockaddr* sa, socklen_t len, char* out, u32 out_len) noexcept {
        if (out == nullptr || out_len == 0) {
            return;
        }
        out[0] = '\0';
        if (sa == nullptr) {
            return;
        }

        char host[INET6_ADDRSTRLEN]{};
        if (sa->sa_family == AF_INET && len >= static_cast<socklen_t>(sizeof(sockaddr_in))) {
            const auto* in4 = reinterpret_cast<const sockaddr_in*>(sa);
            inet_ntop(AF_INET, &in4->sin_addr, host, sizeof(host));
            std::snprintf(out, out_len, "%s:%u", host, static_cast<unsigned>(ntohs(in4->sin_port)));
        } else if (sa->sa_family == AF_INET6 && len >= static_cast<socklen_t>(sizeof(sockaddr_in6))) {
            const auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
            inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
            std::snprintf(out, out_len, "[%s]:%u", host, static_cast<unsigned>(ntohs(in6->sin6_port)));
        } else if (sa->sa_family == AF_UNIX) {
            const auto* un = reinterpret_cast<const sockaddr_un*>(sa);
            const size_t path_off = offsetof(sockaddr_un, sun_path);
            if (static_cast<size_t>(len) > path_off && un->sun_path[0] != '\0') {
                std::snprintf(out, out_len, "%.*s",
                              static_cast<int>(static_cast<size_t>(len) - path_off), un->sun_path);
            } else {
                std::snprintf(out, out_len, "@");
            }
        } else {
            std::snprintf(out, out_len, "?");
        }
    }

    Status split_host_port(const std::string& address, std::string* host, std::string* port) {
        if (host == nullptr || port == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        if (!address.empty() && address.front() == '[') {
            const size_t close = address.find(']');
            if (close == std::string::npos || close + 1 >= address.size() || address[close + 1] != ':') {
                return make_status(StatusDomain::Cli, StatusCode::Invalid);
            }
            *host = address.substr(1, close - 1);
            *port = address.substr(close + 2);
        } else {
            const size_t colon = address.rfind(':');
            if (colon == std::string::npos) {
                return make_status(StatusDomain::Cli, StatusCode::Invalid);
            }
            *host = address.substr(0, colon);
            *port = address.substr(colon + 1);
            if (host->find(':') != std::string::npos) {
                // Bare IPv6 without brackets is ambiguous.
                return make_status(StatusDomain::Cli, StatusCode::Invalid);
            }
        }

        if (!port_numeric(*port)) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        return ok_status();
    }

    Status resolve_socket_path(const std::string& base_dir, const std::string& path, std::string* out) {
        if (out == nullptr || path.empty()) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (path.front() == '/') {
            *out = path;
            return ok_status();
        }

        std::string base = base_dir;
        if (base.empty()) {
            char cwd[4096];
            if (getcwd(cwd, sizeof(cwd)) == nullptr) {
                return net_error(StatusCode::Io, errno);
            }
            base = cwd;
        }
        while (base.size() > 1 && base.back() == '/') {
            base.pop_back();
        }
        *out = base == "/" ? base + path : base + "/" + path;
        return ok_status();
    }

    // ====================================================================
    // Listening sockets
    // ====================================================================

    Status open_tcp_socket(const std::string& address, int backlog, int* fd_out) noexcept {
        if (fd_out == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        *fd_out = -1;

        std::string host;
        std::string port;
        Status s = split_host_port(address, &host, &port);
        if (!is_ok(s)) {
            return s;
        }

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

        addrinfo* res = nullptr;
        const int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &res);
        if (rc != 0) {
            return make_status(StatusDomain::Net, StatusCode::NotFound, static_cast<u32>(rc));
        }

        int last_err = EADDRNOTAVAIL;
        int fd = -1;
        for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd < 0) {
                last_err = errno;
                continue;
            }
            int one = 1;
            (void)setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
            if (ai->ai_family == AF_INET6) {
                // Dual-stack when the host is left empty.
                int v6only = host.empty() ? 0 : 1;
                (void)setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
            }
            if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, backlog) == 0) {
                break;
            }
            last_err = errno;
            ::close(fd);
            fd = -1;
        }
        freeaddrinfo(res);

        if (fd < 0) {
            return net_error(StatusCode::Io, last_err);
        }
        if (!set_nonblocking(fd)) {
            const int err = errno;
            ::close(fd);
            return net_error(StatusCode::Io, err);
        }

        *fd_out = fd;
        return ok_status();
    }

    Status open_unix_socket(const std::string& path, int backlog, int* fd_out) noexcept {
        if (fd_out == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        *fd_out = -1;

        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
            return net_error(StatusCode::Invalid, ENAMETOOLONG);
        }
        std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

        // A socket left behind by a previous run is removed; anything else at
        // the path is left alone and makes bind fail.
        struct stat st{};
        if (lstat(path.c_str(), &st) == 0 && S_ISSOCK(st.st_mode)) {
            if (unlink(path.c_str()) != 0) {
                return net_error(StatusCode::Io, errno);
            }
        }

        int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            return net_error(StatusCode::Io, errno);
        }
        if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
            const int err = errno;
            ::close(fd);
            return net_error(StatusCode::Io, err);
        }
        if (::listen(fd, backlog) != 0 || !set_nonblocking(fd)) {
            const int err = errno;
            ::close(fd);
            unlink(path.c_str());
            return net_error(StatusCode::Io, err);
        }

        *fd_out = fd;
        return ok_status();
    }

    Status open_wake_fd(int* fd_out) noexcept {
        if (fd_out == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        const int fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
        if (fd < 0) {
            *fd_out = -1;
            return net_error(StatusCode::Io, errno);
        }
        *fd_out = fd;
        return ok_status();
    }

    std::string bound_address(int fd) {
        sockaddr_storage ss{};
        socklen_t len = sizeof(ss);
        char bound[kEndpointBytes]{};
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) == 0) {
            format_endpoint(reinterpret_cast<const sockaddr*>(&ss), len, bound, sizeof(bound));
        }
        return std::string(bound);
    }

    // ====================================================================
    // FdConnection
    // ====================================================================

    FdConnection::FdConnection(int fd, const char* remote) noexcept : fd_(fd) {
        std::snprintf(remote_, sizeof(remote_), "%s", remote != nullptr ? remote : "");
    }

    FdConnection::~FdConnection() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    Status FdConnection::handshake() noexcept {
        return ok_status();
    }

    Status FdConnection::read(u8* buf, u32 cap, u32* got) noexcept {
        if (got == nullptr || (buf == nullptr && cap > 0)) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        *got = 0;
        for (;;) {
            const ssize_t n = ::recv(fd_, buf, cap, 0);
            if (n < 0) {
                if (errno == EINTR) continue;
                return net_error(StatusCode::Network, errno);
            }
            *got = static_cast<u32>(n);
            return ok_status();
        }
    }

    Status FdConnection::write_all(const u8* data, u32 len) noexcept {
        if (data == nullptr && len > 0) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        u32 done = 0;
        while (done < len) {
            const ssize_t n = ::send(fd_, data + done, len - done, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                return net_error(StatusCode::Network, errno);
            }
            done += static_cast<u32>(n);
        }
        return ok_status();
    }

    void FdConnection::shutdown() noexcept {
        if (fd_ >= 0) {
            (void)::shutdown(fd_, SHUT_RDWR);
        }
    }

    // ====================================================================
    // SocketListener
    // ====================================================================

    SocketListener::SocketListener(int fd, int wake_fd, std::string address, Protocol protocol) noexcept
        : fd_(fd), wake_fd_(wake_fd), address_(std::move(address)), protocol_(protocol) {}

    SocketListener::~SocketListener() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        if (wake_fd_ >= 0) {
            ::close(wake_fd_);
            wake_fd_ = -1;
        }
    }

    Status SocketListener::accept_fd(int* fd_out, char* remote, u32 remote_len) noexcept {
        for (;;) {
            if (closed()) {
                return make_status(StatusDomain::Net, StatusCode::Unavailable);
            }

            pollfd fds[2]{};
            fds[0].fd = fd_;
            fds[0].events = POLLIN;
            fds[1].fd = wake_fd_;
            fds[1].events = POLLIN;
            const int rc = ::poll(fds, 2, -1);
            if (rc < 0) {
                if (errno == EINTR) continue;
                return net_error(StatusCode::Io, errno);
            }
            if (fds[1].revents != 0 || closed()) {
                return make_status(StatusDomain::Net, StatusCode::Unavailable);
            }
            if (fds[0].revents == 0) {
                continue;
            }

            sockaddr_storage ss{};
            socklen_t len = sizeof(ss);
            const int fd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&ss), &len, SOCK_CLOEXEC);
            if (fd < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                return net_error(StatusCode::Io, errno);
            }
            format_endpoint(reinterpret_cast<const sockaddr*>(&ss), len, remote, remote_len);
            *fd_out = fd;
            return ok_status();
        }
    }

    Status SocketListener::accept(std::unique_ptr<Connection>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        int fd = -1;
        char remote[kEndpointBytes]{};
        Status s = accept_fd(&fd, remote, sizeof(remote));
        if (!is_ok(s)) {
            return s;
        }
        *out = std::make_unique<FdConnection>(fd, remote);
        return ok_status();
    }

    void SocketListener::close() noexcept {
        bool expected = false;
        if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return;
        }
        // Leave the listening state now so new connection attempts are
        // refused; the descriptor itself is closed on destruction.
        if (fd_ >= 0) {
            (void)::shutdown(fd_, SHUT_RDWR);
        }
        if (wake_fd_ >= 0) {
            const uint64_t one = 1;
            (void)!::write(wake_fd_, &one, sizeof(one));
        }
    }

    // ====================================================================
    // UnixListener
    // ====================================================================

    UnixListener::UnixListener(int fd, int wake_fd, std::string path) noexcept
        : SocketListener(fd, wake_fd, std::move(path), Protocol::FastCgi) {}

    UnixListener::~UnixListener() {
        UnixListener::close();
    }

    void UnixListener::close() noexcept {
        SocketListener::close();
        bool expected = false;
        if (unlinked_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            if (unlink(address_.c_str()) != 0) {
                unlink_errno_.store(errno, std::memory_order_release);
            }
        }
    }

    Status UnixListener::close_status() const noexcept {
        const int err = unlink_errno_.load(std::memory_order_acquire);
        if (err != 0) {
            return net_error(StatusCode::Io, err);
        }
        return ok_status();
    }

} // namespace postsink::net
