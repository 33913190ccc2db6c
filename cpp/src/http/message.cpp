#include "postsink/http/message.hpp"

#include <cstdio>

namespace postsink::http {

    const char* status_reason(u16 status) noexcept {
        switch (status) {
            case 100: return "Continue";
            case 200: return "OK";
            case 400: return "Bad Request";
            case 405: return "Method Not Allowed";
            case 408: return "Request Timeout";
            case 411: return "Length Required";
            case 413: return "Request Entity Too Large";
            case 431: return "Request Header Fields Too Large";
            case 500: return "Internal Server Error";
            case 501: return "Not Implemented";
            case 503: return "Service Unavailable";
            case 505: return "HTTP Version Not Supported";
            default: return "";
        }
    }

    std::string format_response(u16 status, std::string_view body, ConnectionHeader conn) {
        const bool error = status >= 400;
        const std::size_t body_len = body.size() + (error ? 1 : 0);

        char line[64];
        std::snprintf(line, sizeof(line), "HTTP/1.1 %u %s\r\n", static_cast<unsigned>(status), status_reason(status));

        std::string out;
        out.reserve(160 + body_len);
        out.append(line);
        out.append("Content-Type: ").append(kPlainTextType).append("\r\n");
        if (error) {
            out.append("X-Content-Type-Options: nosniff\r\n");
        }
        out.append("Content-Length: ").append(std::to_string(body_len)).append("\r\n");
        switch (conn) {
            case ConnectionHeader::Close: out.append("Connection: close\r\n"); break;
            case ConnectionHeader::KeepAlive: out.append("Connection: keep-alive\r\n"); break;
            case ConnectionHeader::None: break;
        }
        out.append("\r\n");
        out.append(body);
        if (error) {
            out.push_back('\n');
        }
        return out;
    }

} // namespace postsink::http
