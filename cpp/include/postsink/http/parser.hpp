#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "postsink/core/buffer.hpp"
#include "postsink/core/errors.hpp"
#include "postsink/core/types.hpp"

namespace postsink::http {
    using u8 = postsink::core::u8;
    using u16 = postsink::core::u16;
    using u32 = postsink::core::u32;
    using u64 = postsink::core::u64;
    using postsink::core::BufferView;

    // Request line plus header fields, terminator included.
    inline constexpr u32 kMaxHeadBytes = 64 * 1024;
    inline constexpr u32 kMaxHeaderFields = 128;

    struct HeaderField {
        std::string name;
        std::string value;
    };

    struct RequestHead {
        std::string method;
        std::string target;
        std::string proto;          // "HTTP/1.0" or "HTTP/1.1"
        u8 minor{1};
        std::vector<HeaderField> fields;
    };

    enum class ParseResult : u8 {
        Ok = 0,
        NeedMore,
        Invalid,
        TooLarge,
    };

    // Parses a complete head from the front of 'in'. On Ok, *consumed is the
    // number of bytes up to and including the blank line. Lines may end in
    // CRLF or a bare LF.
    [[nodiscard]] ParseResult parse_request_head(BufferView in, RequestHead* out, u32* consumed);

    // First field with this name (ASCII case-insensitive), or nullptr.
    [[nodiscard]] const std::string* find_header(const RequestHead& head, std::string_view name) noexcept;

    // True when the comma-separated field value lists token.
    [[nodiscard]] bool header_has_token(std::string_view value, std::string_view token) noexcept;

    // %XX decoding. '+' is left alone. False on a malformed escape.
    [[nodiscard]] bool percent_decode(std::string_view in, std::string* out);

    // Decoded path of an origin-form ("/p?q") or absolute-form
    // ("http://host/p") target. "*" maps to itself.
    [[nodiscard]] postsink::core::Status target_path(std::string_view target, std::string* out);

    enum class BodyFraming : u8 {
        None = 0,
        Length,
        Chunked,
    };

    struct BodyPlan {
        BodyFraming framing{BodyFraming::None};
        u64 length{0};
    };

    // Chunked wins over Content-Length. Errors:
    // - Http/Invalid: malformed or conflicting Content-Length
    // - Http/Unsupported: a transfer coding other than chunked
    [[nodiscard]] postsink::core::Status body_plan(const RequestHead& head, BodyPlan* out);

    // HTTP/1.1 unless "Connection: close"; HTTP/1.0 only with "keep-alive".
    [[nodiscard]] bool wants_keep_alive(const RequestHead& head) noexcept;

    [[nodiscard]] bool expects_continue(const RequestHead& head) noexcept;

} // namespace postsink::http
