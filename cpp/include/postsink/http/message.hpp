#pragma once

#include <string>
#include <string_view>

#include "postsink/http/parser.hpp"

namespace postsink::http {

    inline constexpr char kPlainTextType[] = "text/plain; charset=utf-8";

    // Standard reason phrase, "" for codes we never send.
    [[nodiscard]] const char* status_reason(u16 status) noexcept;

    enum class ConnectionHeader : u8 {
        None = 0,
        Close,
        KeepAlive,
    };

    // Full response with a plain-text body. Error responses (status >= 400)
    // carry nosniff and get a trailing newline added to the body.
    [[nodiscard]] std::string format_response(u16 status, std::string_view body, ConnectionHeader conn);

    // Interim response sent before reading a body the client is holding back.
    inline constexpr char kContinueResponse[] = "HTTP/1.1 100 Continue\r\n\r\n";

} // namespace postsink::http
