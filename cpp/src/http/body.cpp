#include "postsink/http/body.hpp"

#include <algorithm>
#include <string>

namespace postsink::http {
    using postsink::core::Status;
    using postsink::core::StatusCode;
    using postsink::core::StatusDomain;
    using postsink::core::make_status;
    using postsink::core::ok_status;
    using postsink::core::is_ok;

    namespace {
        [[nodiscard]] Status framing_error() noexcept {
            return make_status(StatusDomain::Http, StatusCode::Invalid);
        }

        // Hex chunk size, ignoring chunk extensions after ';'.
        [[nodiscard]] bool parse_chunk_size(const std::string& line, u64* out) noexcept {
            std::size_t end = line.find(';');
            if (end == std::string::npos) {
                end = line.size();
            }
            while (end > 0 && (line[end - 1] == ' ' || line[end - 1] == '\t')) {
                --end;
            }
            if (end == 0 || end > 16) {
                return false;
            }
            u64 n = 0;
            for (std::size_t i = 0; i < end; ++i) {
                const char c = line[i];
                u64 d = 0;
                if (c >= '0' && c <= '9') d = static_cast<u64>(c - '0');
                else if (c >= 'a' && c <= 'f') d = static_cast<u64>(c - 'a' + 10);
                else if (c >= 'A' && c <= 'F') d = static_cast<u64>(c - 'A' + 10);
                else return false;
                n = (n << 4) | d;
            }
            *out = n;
            return true;
        }
    } // namespace

    Status EmptyBodyReader::read(u8*, u32, u32* got) noexcept {
        if (got == nullptr) {
            return make_status(StatusDomain::Http, StatusCode::Invalid);
        }
        *got = 0;
        return ok_status();
    }

    Status LengthBodyReader::read(u8* buf, u32 cap, u32* got) noexcept {
        if (got == nullptr) {
            return make_status(StatusDomain::Http, StatusCode::Invalid);
        }
        *got = 0;
        if (remaining_ == 0 || cap == 0) {
            return ok_status();
        }
        const u32 want = static_cast<u32>(std::min<u64>(cap, remaining_));
        u32 n = 0;
        Status s = in_.read_some(buf, want, &n);
        if (!is_ok(s)) {
            failed_ = true;
            return s;
        }
        if (n == 0) {
            failed_ = true;
            return make_status(StatusDomain::Net, StatusCode::Network);
        }
        remaining_ -= n;
        *got = n;
        return ok_status();
    }

    // ====================================================================
    // Chunked transfer coding
    // ====================================================================

    Status ChunkedBodyReader::fail(Status s) noexcept {
        failed_ = true;
        return s;
    }

    Status ChunkedBodyReader::next_chunk() noexcept {
        std::string line;
        Status s = in_.read_line(&line, kMaxChunkLineBytes);
        if (!is_ok(s)) {
            return s.code == StatusCode::TooLarge ? framing_error() : s;
        }
        u64 size = 0;
        if (!parse_chunk_size(line, &size)) {
            return framing_error();
        }
        chunk_left_ = size;
        state_ = size == 0 ? State::Trailers : State::Data;
        return ok_status();
    }

    Status ChunkedBodyReader::read(u8* buf, u32 cap, u32* got) noexcept {
        if (got == nullptr) {
            return make_status(StatusDomain::Http, StatusCode::Invalid);
        }
        *got = 0;
        if (failed_) {
            return framing_error();
        }

        for (;;) {
            switch (state_) {
                case State::Done:
                    return ok_status();

                case State::Size: {
                    Status s = next_chunk();
                    if (!is_ok(s)) {
                        return fail(s);
                    }
                    break;
                }

                case State::Data: {
                    if (cap == 0) {
                        return ok_status();
                    }
                    const u32 want = static_cast<u32>(std::min<u64>(cap, chunk_left_));
                    u32 n = 0;
                    Status s = in_.read_some(buf, want, &n);
                    if (!is_ok(s)) {
                        return fail(s);
                    }
                    if (n == 0) {
                        return fail(make_status(StatusDomain::Net, StatusCode::Network));
                    }
                    chunk_left_ -= n;
                    if (chunk_left_ == 0) {
                        state_ = State::DataEnd;
                    }
                    *got = n;
                    return ok_status();
                }

                case State::DataEnd: {
                    std::string line;
                    Status s = in_.read_line(&line, kMaxChunkLineBytes);
                    if (!is_ok(s)) {
                        return fail(s.code == StatusCode::TooLarge ? framing_error() : s);
                    }
                    if (!line.empty()) {
                        return fail(framing_error());
                    }
                    state_ = State::Size;
                    break;
                }

                case State::Trailers: {
                    std::string line;
                    Status s = in_.read_line(&line, kMaxChunkLineBytes);
                    if (!is_ok(s)) {
                        return fail(s.code == StatusCode::TooLarge ? framing_error() : s);
                    }
                    if (line.empty()) {
                        state_ = State::Done;
                    }
                    break;
                }
            }
        }
    }

} // namespace postsink::http
