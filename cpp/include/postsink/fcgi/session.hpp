#pragma once

#include "postsink/fcgi/record.hpp"
#include "postsink/ingest/handler.hpp"
#include "postsink/net/listener.hpp"

namespace postsink::fcgi {

    // Upper bound on one request's PARAMS stream.
    inline constexpr u32 kMaxParamsBytes = 1024 * 1024;

    // Values advertised in GET_VALUES_RESULT. Requests are not multiplexed.
    inline constexpr char kMaxConnsValue[] = "1024";
    inline constexpr char kMaxReqsValue[] = "1024";
    inline constexpr char kMpxsConnsValue[] = "0";

    // Runs the FastCGI responder role on conn, one request at a time, until
    // the web server closes the connection or a request ends without
    // FCGI_KEEP_CONN.
    void serve_fcgi_connection(postsink::net::Connection& conn, postsink::ingest::IngestHandler& handler) noexcept;

    // Builds the request from its PARAMS. Fcgi/Invalid without
    // REQUEST_METHOD or with an unusable target.
    [[nodiscard]] postsink::core::Status request_from_params(const std::vector<NameValue>& params,
                                                             const char* fallback_remote,
                                                             postsink::ingest::Request* out);

} // namespace postsink::fcgi
