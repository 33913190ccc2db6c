#include "postsink/net/reader.hpp"

#include <algorithm>
#include <cstring>

namespace postsink::net {
    using postsink::core::Status;
    using postsink::core::StatusCode;
    using postsink::core::StatusDomain;
    using postsink::core::make_status;
    using postsink::core::ok_status;
    using postsink::core::is_ok;

    namespace {
        [[nodiscard]] Status unexpected_eof() noexcept {
            return make_status(StatusDomain::Net, StatusCode::Network);
        }
    } // namespace

    ConnReader::ConnReader(Connection& conn, u32 capacity) : conn_(conn), buf_(capacity == 0 ? 1 : capacity) {}

    void ConnReader::consume(u32 n) noexcept {
        start_ += std::min(n, end_ - start_);
        if (start_ == end_) {
            start_ = 0;
            end_ = 0;
        }
    }

    void ConnReader::compact() noexcept {
        if (start_ == 0) {
            return;
        }
        const u32 n = end_ - start_;
        if (n > 0) {
            std::memmove(buf_.data(), buf_.data() + start_, n);
        }
        start_ = 0;
        end_ = n;
    }

    Status ConnReader::fill(u32* got) noexcept {
        if (got == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        *got = 0;
        compact();
        const u32 room = static_cast<u32>(buf_.size()) - end_;
        if (room == 0) {
            return make_status(StatusDomain::Core, StatusCode::TooLarge);
        }
        u32 n = 0;
        Status s = conn_.read(buf_.data() + end_, room, &n);
        if (!is_ok(s)) {
            return s;
        }
        end_ += n;
        *got = n;
        return ok_status();
    }

    Status ConnReader::read_some(u8* buf, u32 cap, u32* got) noexcept {
        if (got == nullptr || (buf == nullptr && cap > 0)) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        *got = 0;
        if (cap == 0) {
            return ok_status();
        }
        const u32 have = end_ - start_;
        if (have > 0) {
            const u32 n = std::min(cap, have);
            std::memcpy(buf, buf_.data() + start_, n);
            consume(n);
            *got = n;
            return ok_status();
        }
        return conn_.read(buf, cap, got);
    }

    Status ConnReader::read_exact(u8* buf, u32 len) noexcept {
        u32 done = 0;
        while (done < len) {
            u32 n = 0;
            Status s = read_some(buf + done, len - done, &n);
            if (!is_ok(s)) {
                return s;
            }
            if (n == 0) {
                return unexpected_eof();
            }
            done += n;
        }
        return ok_status();
    }

    Status ConnReader::skip(u32 len) noexcept {
        u8 scratch[4096];
        while (len > 0) {
            u32 n = 0;
            Status s = read_some(scratch, std::min<u32>(len, sizeof(scratch)), &n);
            if (!is_ok(s)) {
                return s;
            }
            if (n == 0) {
                return unexpected_eof();
            }
            len -= n;
        }
        return ok_status();
    }

    Status ConnReader::read_line(std::string* line, u32 max_len) noexcept {
        if (line == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        u32 scanned = 0;
        for (;;) {
            const BufferView in = pending();
            const u8* lf = static_cast<const u8*>(std::memchr(in.data + scanned, '\n', in.len - scanned));
            if (lf != nullptr) {
                u32 len = static_cast<u32>(lf - in.data);
                const u32 used = len + 1;
                if (len > 0 && in.data[len - 1] == '\r') {
                    --len;
                }
                if (len > max_len) {
                    return make_status(StatusDomain::Core, StatusCode::TooLarge);
                }
                line->assign(reinterpret_cast<const char*>(in.data), len);
                consume(used);
                return ok_status();
            }
            scanned = in.len;
            if (scanned > max_len + 1) {
                return make_status(StatusDomain::Core, StatusCode::TooLarge);
            }

            u32 n = 0;
            Status s = fill(&n);
            if (!is_ok(s)) {
                return s;
            }
            if (n == 0) {
                return unexpected_eof();
            }
        }
    }

} // namespace postsink::net
