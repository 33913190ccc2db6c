#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_set>

#include "postsink/ingest/handler.hpp"
#include "postsink/net/listener.hpp"

namespace postsink::server {

    // Accept loop. Every connection gets its own worker thread that speaks the
    // listener's protocol; the ingest handler is shared by all of them.
    class Server {
    public:
        Server(postsink::net::Listener& listener, postsink::ingest::IngestHandler& handler) noexcept
            : listener_(listener), handler_(handler) {}
        ~Server();

        Server(const Server&) = delete;
        Server& operator=(const Server&) = delete;

        // Blocks until stop() and returns Ok once every worker has finished.
        // A persistent accept failure ends the loop early with that status.
        [[nodiscard]] postsink::core::Status run() noexcept;

        // Callable from any thread, including a signal-watching one. Closes the
        // listener and shuts down open connections.
        void stop() noexcept;

        [[nodiscard]] bool stopping() const noexcept { return stopping_.load(std::memory_order_acquire); }
        [[nodiscard]] std::size_t live_connections() const;

    private:
        void serve(postsink::net::Connection& conn) noexcept;
        void worker(postsink::net::Connection* raw) noexcept;
        [[nodiscard]] bool spawn(std::unique_ptr<postsink::net::Connection> conn) noexcept;
        void wait_idle() noexcept;

        postsink::net::Listener& listener_;
        postsink::ingest::IngestHandler& handler_;

        mutable std::mutex mu_;
        std::condition_variable idle_cv_;
        std::unordered_set<postsink::net::Connection*> live_;
        std::size_t workers_{0};
        std::atomic<bool> stopping_{false};
    };

    // Accept errors worth retrying after a pause (fd exhaustion, aborted
    // handshakes) rather than ending the server.
    [[nodiscard]] bool accept_error_transient(postsink::core::Status s) noexcept;

} // namespace postsink::server
