#include "postsink/fcgi/record.hpp"

namespace postsink::fcgi {
    static void put_u16_be(u8* p, u16 v) noexcept {
        p[0] = static_cast<u8>((v >> 8) & 0xffu);
        p[1] = static_cast<u8>((v >> 0) & 0xffu);
    }

    static void put_u32_be(u8* p, u32 v) noexcept {
        p[0] = static_cast<u8>((v >> 24) & 0xffu);
        p[1] = static_cast<u8>((v >> 16) & 0xffu);
        p[2] = static_cast<u8>((v >> 8) & 0xffu);
        p[3] = static_cast<u8>((v >> 0) & 0xffu);
    }

    static u16 get_u16_be(const u8* p) noexcept {
        return static_cast<u16>((static_cast<u16>(p[0]) << 8) | static_cast<u16>(p[1]));
    }

    static u32 get_u32_be(const u8* p) noexcept {
        return (static_cast<u32>(p[0]) << 24) |
               (static_cast<u32>(p[1]) << 16) |
               (static_cast<u32>(p[2]) << 8) |
               (static_cast<u32>(p[3]) << 0);
    }

    // Name-value lengths: one byte below 128, else four bytes with the top bit set.
    static bool get_length(BufferView in, u32* pos, u32* out) noexcept {
        if (*pos >= in.len) return false;
        const u8 b0 = in.data[*pos];
        if ((b0 & 0x80u) == 0) {
            *out = b0;
            *pos += 1;
            return true;
        }
        if (in.len - *pos < 4) return false;
        *out = get_u32_be(in.data + *pos) & 0x7fffffffu;
        *pos += 4;
        return true;
    }

    static void put_length(u32 len, std::string* out) {
        if (len < 0x80u) {
            out->push_back(static_cast<char>(len));
            return;
        }
        u8 b[4];
        put_u32_be(b, len | 0x80000000u);
        out->append(reinterpret_cast<const char*>(b), sizeof(b));
    }

    u32 record_write_header(const RecordHeader& h, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kHeaderBytes) {
            return 0;
        }

        out.data[0] = h.version;
        out.data[1] = static_cast<u8>(h.type);
        put_u16_be(out.data + 2, h.request_id);
        put_u16_be(out.data + 4, h.content_len);
        out.data[6] = h.padding_len;
        out.data[7] = 0; // reserved

        return kHeaderBytes;
    }

    ParseResult record_read_header(BufferView in, RecordHeader* out) noexcept {
        if (out == nullptr) return ParseResult::Invalid;
        if (in.data == nullptr) return ParseResult::NeedMore;
        if (in.len < kHeaderBytes) return ParseResult::NeedMore;

        if (in.data[0] != kVersion1) return ParseResult::Invalid;

        RecordHeader h{};
        h.version = in.data[0];
        h.type = static_cast<RecordType>(in.data[1]);
        h.request_id = get_u16_be(in.data + 2);
        h.content_len = get_u16_be(in.data + 4);
        h.padding_len = in.data[6];

        *out = h;
        return ParseResult::Ok;
    }

    ParseResult parse_begin_request(BufferView in, BeginRequest* out) noexcept {
        if (out == nullptr) return ParseResult::Invalid;
        if (in.data == nullptr || in.len < kBeginRequestBytes) return ParseResult::Invalid;

        BeginRequest b{};
        b.role = static_cast<Role>(get_u16_be(in.data + 0));
        b.flags = in.data[2];
        *out = b;
        return ParseResult::Ok;
    }

    u32 write_end_request(u16 request_id, u32 app_status, ProtocolStatus status, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kHeaderBytes + kEndRequestBytes) {
            return 0;
        }

        RecordHeader h{};
        h.type = RecordType::EndRequest;
        h.request_id = request_id;
        h.content_len = static_cast<u16>(kEndRequestBytes);
        (void)record_write_header(h, out);

        u8* body = out.data + kHeaderBytes;
        put_u32_be(body, app_status);
        body[4] = static_cast<u8>(status);
        body[5] = 0;
        body[6] = 0;
        body[7] = 0;
        return kHeaderBytes + kEndRequestBytes;
    }

    u32 write_unknown_type(u8 type, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kHeaderBytes + 8) {
            return 0;
        }

        RecordHeader h{};
        h.type = RecordType::UnknownType;
        h.request_id = kNullRequestId;
        h.content_len = 8;
        (void)record_write_header(h, out);

        u8* body = out.data + kHeaderBytes;
        body[0] = type;
        for (u32 i = 1; i < 8; ++i) {
            body[i] = 0;
        }
        return kHeaderBytes + 8;
    }

    ParseResult decode_name_values(BufferView in, std::vector<NameValue>* out) {
        if (out == nullptr) return ParseResult::Invalid;
        out->clear();
        if (in.data == nullptr || in.len == 0) return ParseResult::Ok;

        u32 pos = 0;
        while (pos < in.len) {
            u32 name_len = 0;
            u32 value_len = 0;
            if (!get_length(in, &pos, &name_len)) return ParseResult::Invalid;
            if (!get_length(in, &pos, &value_len)) return ParseResult::Invalid;
            if (name_len > in.len - pos || value_len > in.len - pos - name_len) {
                return ParseResult::Invalid;
            }

            NameValue nv;
            nv.name.assign(reinterpret_cast<const char*>(in.data + pos), name_len);
            pos += name_len;
            nv.value.assign(reinterpret_cast<const char*>(in.data + pos), value_len);
            pos += value_len;
            out->push_back(std::move(nv));
        }
        return ParseResult::Ok;
    }

    void encode_name_value(std::string_view name, std::string_view value, std::string* out) {
        if (out == nullptr) {
            return;
        }
        put_length(static_cast<u32>(name.size()), out);
        put_length(static_cast<u32>(value.size()), out);
        out->append(name);
        out->append(value);
    }

} // namespace postsink::fcgi
