#pragma once
#include <cstdint>
#include <type_traits>

namespace postsink::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Invalid,
        NotFound,
        Conflict,
        Io,
        Crypto,
        Network,
        Unsupported,
        Unavailable,
        TooLarge,
    };

    // Which layer produced the status; log lines print it next to the code.
    enum class StatusDomain : u16 {
        Core = 0,
        Storage,
        Net,
        Tls,
        Http,
        Fcgi,
        Cli,
    };

    // aux carries errno for Io/Network/Conflict codes, or an argv index for
    // Cli errors.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // True when aux holds an errno value.
    [[nodiscard]] constexpr bool carries_errno(Status s) noexcept {
        return s.aux != 0 && s.domain != StatusDomain::Cli &&
               (s.code == StatusCode::Io || s.code == StatusCode::Network || s.code == StatusCode::Conflict ||
                s.code == StatusCode::Invalid);
    }

    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;

    // Writes "<Domain>/<Code>" plus the errno text when one is attached.
    // Returns the number of characters that would have been written, like snprintf.
    int status_describe(Status s, char* out, u32 out_len) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace postsink::core
