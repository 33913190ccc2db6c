#pragma once

#include <string>

#include "postsink/core/errors.hpp"
#include "postsink/core/types.hpp"

namespace postsink::ingest {
    using u8 = postsink::core::u8;
    using u16 = postsink::core::u16;
    using u32 = postsink::core::u32;
    using u64 = postsink::core::u64;

    // A decoded request, independent of the wire protocol it arrived on.
    struct Request {
        std::string method;
        std::string target;      // As sent: path plus query, used for logging
        std::string path;        // Decoded path component of the target
        std::string proto;       // "HTTP/1.1", "HTTP/1.0", ...
        std::string host;
        std::string user_agent;
        std::string remote;      // "ip:port" of the original client
    };

    // Pull-style request body. Implementations are protocol specific
    // (Content-Length, chunked, FastCGI stdin records).
    class BodyReader {
    public:
        virtual ~BodyReader() = default;

        // Reads up to cap bytes into buf. *got == 0 with an Ok status means the
        // body is complete. A client that goes away mid-body yields Net/Network.
        [[nodiscard]] virtual postsink::core::Status read(u8* buf, u32 cap, u32* got) noexcept = 0;
    };

    inline constexpr u32 kResponseBodyBytes = 64;

    struct Response {
        u16 status{200};
        char body[kResponseBodyBytes]{};
        u32 body_len{0};
    };

    // Sets status and a short plain-text body (truncated to fit).
    void response_set(Response* out, u16 status, const char* body) noexcept;

} // namespace postsink::ingest
