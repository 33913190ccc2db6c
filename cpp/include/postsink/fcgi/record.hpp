#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "postsink/core/buffer.hpp"
#include "postsink/core/types.hpp"

namespace postsink::fcgi {
    using u8 = postsink::core::u8;
    using u16 = postsink::core::u16;
    using u32 = postsink::core::u32;
    using postsink::core::BufferView;
    using postsink::core::BufferMut;

    inline constexpr u8 kVersion1 = 1;
    inline constexpr u16 kNullRequestId = 0;
    inline constexpr u32 kMaxContentBytes = 65535;

    enum class RecordType : u8 {
        BeginRequest = 1,
        AbortRequest = 2,
        EndRequest = 3,
        Params = 4,
        Stdin = 5,
        Stdout = 6,
        Stderr = 7,
        Data = 8,
        GetValues = 9,
        GetValuesResult = 10,
        UnknownType = 11,
    };

    enum class Role : u16 {
        Responder = 1,
        Authorizer = 2,
        Filter = 3,
    };

    enum class ProtocolStatus : u8 {
        RequestComplete = 0,
        CantMpxConn = 1,
        Overloaded = 2,
        UnknownRole = 3,
    };

    // BeginRequest flags.
    inline constexpr u8 kKeepConn = 1;

    struct RecordHeader {
        u8 version{kVersion1};
        RecordType type{RecordType::Stdout};   // Any byte value; check before use
        u16 request_id{0};
        u16 content_len{0};
        u8 padding_len{0};
    };

    // Layout (big-endian / network order):
    // 0 version(u8), 1 type(u8), 2..3 request_id(u16), 4..5 content_len(u16),
    // 6 padding_len(u8), 7 reserved(u8).
    inline constexpr u32 kHeaderBytes = 8;

    // BeginRequest body: 0..1 role(u16), 2 flags(u8), 3..7 reserved.
    inline constexpr u32 kBeginRequestBytes = 8;

    // EndRequest body: 0..3 app_status(u32), 4 protocol_status(u8), 5..7 reserved.
    inline constexpr u32 kEndRequestBytes = 8;

    struct BeginRequest {
        Role role{Role::Responder};
        u8 flags{0};
    };

    enum class ParseResult : u8 {
        Ok = 0,
        NeedMore,
        Invalid,
    };

    // Records whose request id is zero.
    [[nodiscard]] constexpr bool is_management(const RecordHeader& h) noexcept {
        return h.request_id == kNullRequestId;
    }

    // Padding that rounds content_len up to a multiple of 8.
    [[nodiscard]] constexpr u8 padding_for(u32 content_len) noexcept {
        return static_cast<u8>((8u - (content_len % 8u)) % 8u);
    }

    // Returns bytes written (0 on failure).
    [[nodiscard]] u32 record_write_header(const RecordHeader& h, BufferMut out) noexcept;

    // Parses a header from the first bytes of 'in' (does not consume).
    // Only version 1 is accepted; the type is not checked.
    [[nodiscard]] ParseResult record_read_header(BufferView in, RecordHeader* out) noexcept;

    [[nodiscard]] ParseResult parse_begin_request(BufferView in, BeginRequest* out) noexcept;

    // Full EndRequest record, header included. Returns bytes written (0 on failure).
    [[nodiscard]] u32 write_end_request(u16 request_id, u32 app_status, ProtocolStatus status, BufferMut out) noexcept;

    // Full UnknownType management record. Returns bytes written (0 on failure).
    [[nodiscard]] u32 write_unknown_type(u8 type, BufferMut out) noexcept;

    struct NameValue {
        std::string name;
        std::string value;
    };

    // Decodes a complete name-value pair stream (Params or GetValues content).
    [[nodiscard]] ParseResult decode_name_values(BufferView in, std::vector<NameValue>* out);

    void encode_name_value(std::string_view name, std::string_view value, std::string* out);

    static_assert(std::is_trivially_copyable_v<RecordHeader>);
    static_assert(std::is_standard_layout_v<RecordHeader>);
    static_assert(std::is_trivially_copyable_v<BeginRequest>);

} // namespace postsink::fcgi
