#include "postsink/ingest/handler.hpp"
#include "postsink/core/log.hpp"

#include <cstdio>
#include <string>

namespace postsink::ingest {

using namespace postsink::core;

// Helper to quote a value for the log: printable ASCII kept, '"' and '\'
// escaped, everything else as \xNN.
static void append_quoted(std::string* out, const std::string& s) {
    static const char hex[] = "0123456789abcdef";
    out->push_back('"');
    for (const char ch : s) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c == '"' || c == '\\') {
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
        } else if (c >= 0x20 && c < 0x7f) {
            out->push_back(static_cast<char>(c));
        } else {
            out->append("\\x");
            out->push_back(hex[(c >> 4) & 0xF]);
            out->push_back(hex[c & 0xF]);
        }
    }
    out->push_back('"');
}

// "[remote method target proto Host:"h" UA:"ua"]"
static std::string request_string(const Request& req) {
    std::string rs;
    rs.reserve(64 + req.remote.size() + req.target.size() + req.host.size() + req.user_agent.size());
    rs.push_back('[');
    rs.append(req.remote);
    rs.push_back(' ');
    rs.append(req.method);
    rs.push_back(' ');
    rs.append(req.target);
    rs.push_back(' ');
    rs.append(req.proto);
    rs.append(" Host:");
    append_quoted(&rs, req.host);
    rs.append(" UA:");
    append_quoted(&rs, req.user_agent);
    rs.push_back(']');
    return rs;
}

Result IngestHandler::handle(const Request& req, BodyReader& body, Response* out) noexcept {
    Result result{};
    const std::string rs = request_string(req);

    if (req.method != kWriteMethod) {
        log_printf("%s Invalid method", rs.c_str());
        response_set(out, kStatusMethodNotAllowed, "Invalid method");
        result.outcome = Outcome::Rejected;
        return result;
    }

    storage::SpoolFile file;
    Status s = spool_.create(req.remote, req.path, &file);
    if (!is_ok(s)) {
        char detail[256];
        (void)status_describe(s, detail, sizeof(detail));
        log_printf("%s Unable to open file: %s", rs.c_str(), detail);
        response_set(out, kStatusInternalError, "open");
        result.outcome = Outcome::OpenFailed;
        return result;
    }

    // Stream outside the spool lock; the file is ours alone from here on.
    u8 chunk[kCopyChunkBytes];
    for (;;) {
        u32 got = 0;
        s = body.read(chunk, sizeof(chunk), &got);
        if (!is_ok(s)) {
            break;
        }
        if (got == 0) {
            break;
        }
        s = file.write(chunk, got);
        if (!is_ok(s)) {
            break;
        }
    }

    std::string quoted_name;
    append_quoted(&quoted_name, file.name());
    result.bytes_written = file.bytes_written();
    file.close();

    if (!is_ok(s)) {
        char detail[256];
        (void)status_describe(s, detail, sizeof(detail));
        log_printf("%s Error after writing %llu bytes to %s: %s",
                   rs.c_str(),
                   static_cast<unsigned long long>(result.bytes_written),
                   quoted_name.c_str(),
                   detail);
        response_set(out, kStatusInternalError, "write");
        result.outcome = Outcome::Failed;
        return result;
    }

    log_printf("%s Wrote %llu bytes to %s",
               rs.c_str(),
               static_cast<unsigned long long>(result.bytes_written),
               quoted_name.c_str());

    char count[24];
    std::snprintf(count, sizeof(count), "%llu", static_cast<unsigned long long>(result.bytes_written));
    response_set(out, kStatusOk, count);
    result.outcome = Outcome::Completed;
    return result;
}

} // namespace postsink::ingest
