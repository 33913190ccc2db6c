#include "postsink/server/server.hpp"
#include "postsink/fcgi/session.hpp"
#include "postsink/http/session.hpp"
#include "postsink/core/log.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <system_error>
#include <thread>

namespace postsink::server {
    using postsink::core::Status;
    using postsink::core::StatusCode;
    using postsink::core::StatusDomain;
    using postsink::core::ok_status;
    using postsink::core::is_ok;
    using postsink::net::Connection;

    namespace {
        constexpr std::chrono::milliseconds kMinAcceptDelay{5};
        constexpr std::chrono::milliseconds kMaxAcceptDelay{1000};
    } // namespace

    bool accept_error_transient(Status s) noexcept {
        if (s.domain != StatusDomain::Net || s.code != StatusCode::Io) {
            return false;
        }
        switch (static_cast<int>(s.aux)) {
            case ECONNABORTED:
            case EMFILE:
            case ENFILE:
            case ENOBUFS:
            case ENOMEM:
            case EPROTO:
            case EPERM:
            case ENETDOWN:
            case ENETUNREACH:
            case EHOSTDOWN:
            case EHOSTUNREACH:
            case ENONET:
            case ETIMEDOUT:
                return true;
            default:
                return false;
        }
    }

    Server::~Server() {
        stop();
        wait_idle();
    }

    std::size_t Server::live_connections() const {
        std::lock_guard<std::mutex> lock(mu_);
        return live_.size();
    }

    void Server::stop() noexcept {
        if (stopping_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        listener_.close();

        std::lock_guard<std::mutex> lock(mu_);
        for (Connection* c : live_) {
            c->shutdown();
        }
    }

    void Server::wait_idle() noexcept {
        std::unique_lock<std::mutex> lock(mu_);
        idle_cv_.wait(lock, [this] { return workers_ == 0; });
    }

    void Server::serve(Connection& conn) noexcept {
        switch (listener_.protocol()) {
            case postsink::net::Protocol::Http:
                postsink::http::serve_http_connection(conn, handler_);
                return;
            case postsink::net::Protocol::FastCgi:
                postsink::fcgi::serve_fcgi_connection(conn, handler_);
                return;
        }
    }

    void Server::worker(Connection* raw) noexcept {
        std::unique_ptr<Connection> conn(raw);
        serve(*conn);
        {
            std::lock_guard<std::mutex> lock(mu_);
            live_.erase(conn.get());
        }
        conn.reset();

        // Notify under the lock: run() may return and destroy *this as soon
        // as it observes workers_ == 0.
        std::lock_guard<std::mutex> lock(mu_);
        --workers_;
        idle_cv_.notify_all();
    }

    bool Server::spawn(std::unique_ptr<Connection> conn) noexcept {
        Connection* raw = conn.get();
        {
            std::lock_guard<std::mutex> lock(mu_);
            live_.insert(raw);
            ++workers_;
            // stop() may have swept live_ before this connection was added.
            if (stopping()) {
                raw->shutdown();
            }
        }

        try {
            std::thread(&Server::worker, this, raw).detach();
            (void)conn.release();
            return true;
        } catch (const std::system_error& e) {
            postsink::core::log_printf("server: cannot start worker for %s: %s", raw->remote(), e.what());
        }

        std::lock_guard<std::mutex> lock(mu_);
        live_.erase(raw);
        --workers_;
        conn.reset();
        idle_cv_.notify_all();
        return false;
    }

    Status Server::run() noexcept {
        Status result = ok_status();
        auto delay = std::chrono::milliseconds{0};

        while (!stopping()) {
            std::unique_ptr<Connection> conn;
            Status s = listener_.accept(&conn);
            if (!is_ok(s)) {
                if (stopping() || s.code == StatusCode::Unavailable) {
                    break;
                }
                if (accept_error_transient(s)) {
                    delay = delay.count() == 0 ? kMinAcceptDelay : std::min(delay * 2, kMaxAcceptDelay);
                    char detail[128];
                    (void)postsink::core::status_describe(s, detail, sizeof(detail));
                    postsink::core::log_printf("server: accept error: %s; retrying in %lldms",
                                               detail, static_cast<long long>(delay.count()));
                    std::this_thread::sleep_for(delay);
                    continue;
                }
                postsink::core::log_status("server: accept", s);
                result = s;
                break;
            }
            delay = std::chrono::milliseconds{0};
            (void)spawn(std::move(conn));
        }

        stop();
        wait_idle();
        return result;
    }

} // namespace postsink::server
