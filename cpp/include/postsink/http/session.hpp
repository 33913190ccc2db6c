#pragma once

#include "postsink/ingest/handler.hpp"
#include "postsink/net/listener.hpp"

namespace postsink::http {

    // Unread request body discarded after a response so the connection can
    // carry the next request. Anything larger closes the connection.
    inline constexpr postsink::core::u64 kMaxDrainBytes = 256 * 1024;

    // Serves HTTP/1.x requests on conn until the peer closes, keep-alive ends
    // or a protocol error is answered. Runs the TLS handshake first.
    void serve_http_connection(postsink::net::Connection& conn, postsink::ingest::IngestHandler& handler) noexcept;

} // namespace postsink::http
