#include "postsink/http/parser.hpp"

#include <cstring>

namespace postsink::http {
    using postsink::core::Status;
    using postsink::core::StatusCode;
    using postsink::core::StatusDomain;
    using postsink::core::make_status;
    using postsink::core::ok_status;

    namespace {
        [[nodiscard]] bool is_tchar(char c) noexcept {
            if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
                return true;
            }
            return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
        }

        [[nodiscard]] bool is_token(std::string_view s) noexcept {
            if (s.empty()) {
                return false;
            }
            for (const char c : s) {
                if (!is_tchar(c)) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] char lower(char c) noexcept {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        }

        [[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (lower(a[i]) != lower(b[i])) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] std::string_view trim_ows(std::string_view s) noexcept {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
            return s;
        }

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        [[nodiscard]] bool parse_request_line(std::string_view line, RequestHead* out) {
            const std::size_t sp1 = line.find(' ');
            if (sp1 == std::string_view::npos) {
                return false;
            }
            const std::size_t sp2 = line.find(' ', sp1 + 1);
            if (sp2 == std::string_view::npos) {
                return false;
            }
            const std::string_view method = line.substr(0, sp1);
            const std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
            const std::string_view proto = line.substr(sp2 + 1);

            if (!is_token(method) || target.empty()) {
                return false;
            }
            for (const char c : target) {
                if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7f) {
                    return false;
                }
            }
            if (proto.size() != 8 || proto.substr(0, 7) != "HTTP/1." || proto[7] < '0' || proto[7] > '9') {
                return false;
            }

            out->method.assign(method);
            out->target.assign(target);
            out->proto.assign(proto);
            out->minor = static_cast<u8>(proto[7] - '0');
            return true;
        }

        [[nodiscard]] bool parse_field_line(std::string_view line, HeaderField* out) {
            const std::size_t colon = line.find(':');
            if (colon == std::string_view::npos) {
                return false;
            }
            const std::string_view name = line.substr(0, colon);
            if (!is_token(name)) {
                return false;
            }
            const std::string_view value = trim_ows(line.substr(colon + 1));
            for (const char c : value) {
                if ((static_cast<unsigned char>(c) < 0x20 && c != '\t') || c == 0x7f) {
                    return false;
                }
            }
            out->name.assign(name);
            out->value.assign(value);
            return true;
        }
    } // namespace

    ParseResult parse_request_head(BufferView in, RequestHead* out, u32* consumed) {
        if (out == nullptr || consumed == nullptr) {
            return ParseResult::Invalid;
        }
        if (in.data == nullptr || in.len == 0) {
            return ParseResult::NeedMore;
        }

        const char* base = reinterpret_cast<const char*>(in.data);
        const u32 limit = in.len < kMaxHeadBytes ? in.len : kMaxHeadBytes;

        RequestHead head;
        bool have_request_line = false;
        u32 pos = 0;
        while (pos < limit) {
            const void* lf = std::memchr(base + pos, '\n', limit - pos);
            if (lf == nullptr) {
                break;
            }
            const u32 end = static_cast<u32>(static_cast<const char*>(lf) - base);
            std::string_view line(base + pos, end - pos);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            pos = end + 1;

            if (!have_request_line) {
                if (!parse_request_line(line, &head)) {
                    return ParseResult::Invalid;
                }
                have_request_line = true;
                continue;
            }
            if (line.empty()) {
                *out = std::move(head);
                *consumed = pos;
                return ParseResult::Ok;
            }
            // Obsolete line folding.
            if (line.front() == ' ' || line.front() == '\t') {
                return ParseResult::Invalid;
            }
            if (head.fields.size() >= kMaxHeaderFields) {
                return ParseResult::TooLarge;
            }
            HeaderField field;
            if (!parse_field_line(line, &field)) {
                return ParseResult::Invalid;
            }
            head.fields.push_back(std::move(field));
        }

        return in.len >= kMaxHeadBytes ? ParseResult::TooLarge : ParseResult::NeedMore;
    }

    const std::string* find_header(const RequestHead& head, std::string_view name) noexcept {
        for (const HeaderField& f : head.fields) {
            if (iequals(f.name, name)) {
                return &f.value;
            }
        }
        return nullptr;
    }

    bool header_has_token(std::string_view value, std::string_view token) noexcept {
        while (!value.empty()) {
            const std::size_t comma = value.find(',');
            const std::string_view item = trim_ows(value.substr(0, comma));
            if (iequals(item, token)) {
                return true;
            }
            if (comma == std::string_view::npos) {
                break;
            }
            value.remove_prefix(comma + 1);
        }
        return false;
    }

    bool percent_decode(std::string_view in, std::string* out) {
        if (out == nullptr) {
            return false;
        }
        std::string decoded;
        decoded.reserve(in.size());
        for (std::size_t i = 0; i < in.size(); ++i) {
            if (in[i] != '%') {
                decoded.push_back(in[i]);
                continue;
            }
            if (i + 2 >= in.size()) {
                return false;
            }
            const int hi = hex_value(in[i + 1]);
            const int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            decoded.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        }
        *out = std::move(decoded);
        return true;
    }

    Status target_path(std::string_view target, std::string* out) {
        if (out == nullptr || target.empty()) {
            return make_status(StatusDomain::Http, StatusCode::Invalid);
        }
        if (target == "*") {
            out->assign("*");
            return ok_status();
        }

        std::string_view path = target;
        if (target.front() != '/') {
            const std::size_t scheme_end = target.find("://");
            if (scheme_end == std::string_view::npos || scheme_end == 0 ||
                !(iequals(target.substr(0, scheme_end), "http") || iequals(target.substr(0, scheme_end), "https"))) {
                return make_status(StatusDomain::Http, StatusCode::Invalid);
            }
            const std::string_view rest = target.substr(scheme_end + 3);
            const std::size_t slash = rest.find_first_of("/?#");
            path = (slash == std::string_view::npos || rest[slash] != '/') ? std::string_view("/") : rest.substr(slash);
        }

        const std::size_t cut = path.find_first_of("?#");
        if (cut != std::string_view::npos) {
            path = path.substr(0, cut);
        }
        if (!percent_decode(path, out)) {
            return make_status(StatusDomain::Http, StatusCode::Invalid);
        }
        return ok_status();
    }

    Status body_plan(const RequestHead& head, BodyPlan* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Http, StatusCode::Invalid);
        }
        *out = BodyPlan{};

        const std::string* te = find_header(head, "Transfer-Encoding");
        if (te != nullptr && head.minor >= 1) {
            if (!iequals(trim_ows(*te), "chunked")) {
                return make_status(StatusDomain::Http, StatusCode::Unsupported);
            }
            out->framing = BodyFraming::Chunked;
            return ok_status();
        }

        bool seen = false;
        u64 length = 0;
        for (const HeaderField& f : head.fields) {
            if (!iequals(f.name, "Content-Length")) {
                continue;
            }
            const std::string_view v = trim_ows(f.value);
            if (v.empty() || v.size() > 19) {
                return make_status(StatusDomain::Http, StatusCode::Invalid);
            }
            u64 n = 0;
            for (const char c : v) {
                if (c < '0' || c > '9') {
                    return make_status(StatusDomain::Http, StatusCode::Invalid);
                }
                n = n * 10 + static_cast<u64>(c - '0');
            }
            if (seen && n != length) {
                return make_status(StatusDomain::Http, StatusCode::Invalid);
            }
            seen = true;
            length = n;
        }
        if (seen) {
            out->framing = BodyFraming::Length;
            out->length = length;
        }
        return ok_status();
    }

    bool wants_keep_alive(const RequestHead& head) noexcept {
        const std::string* conn = find_header(head, "Connection");
        if (conn != nullptr && header_has_token(*conn, "close")) {
            return false;
        }
        if (head.minor >= 1) {
            return true;
        }
        return conn != nullptr && header_has_token(*conn, "keep-alive");
    }

    bool expects_continue(const RequestHead& head) noexcept {
        if (head.minor < 1) {
            return false;
        }
        const std::string* expect = find_header(head, "Expect");
        return expect != nullptr && iequals(trim_ows(*expect), "100-continue");
    }

} // namespace postsink::http
