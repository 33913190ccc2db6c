#include "postsink/core/errors.hpp"

#include <cstdio>
#include <cstring>

namespace postsink::core {

    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Io: return "Io";
            case StatusCode::Crypto: return "Crypto";
            case StatusCode::Network: return "Network";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::TooLarge: return "TooLarge";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Net: return "Net";
            case StatusDomain::Tls: return "Tls";
            case StatusDomain::Http: return "Http";
            case StatusDomain::Fcgi: return "Fcgi";
            case StatusDomain::Cli: return "Cli";
        }
        return "Unknown";
    }

    int status_describe(Status s, char* out, u32 out_len) noexcept {
        if (carries_errno(s)) {
            char err_buf[128];
            // GNU strerror_r may return a static string instead of filling err_buf.
            const char* text = strerror_r(static_cast<int>(s.aux), err_buf, sizeof(err_buf));
            return std::snprintf(out, out_len, "%s/%s: %s",
                                 status_domain_name(s.domain), status_code_name(s.code), text);
        }
        return std::snprintf(out, out_len, "%s/%s", status_domain_name(s.domain), status_code_name(s.code));
    }

} // namespace postsink::core
