#pragma once

#include "postsink/core/types.hpp"
#include "postsink/ingest/request.hpp"
#include "postsink/net/reader.hpp"

namespace postsink::http {
    using u8 = postsink::core::u8;
    using u32 = postsink::core::u32;
    using u64 = postsink::core::u64;

    // Longest chunk-size or trailer line accepted in a chunked body.
    inline constexpr u32 kMaxChunkLineBytes = 4096;

    // Request body framed by the HTTP head. Connection errors and early end
    // of stream are Net/Network; bad chunk framing is Http/Invalid.
    class HttpBodyReader : public postsink::ingest::BodyReader {
    public:
        // True once the final byte (or the last-chunk and trailers) was read.
        [[nodiscard]] virtual bool complete() const noexcept = 0;

        // True after read() returned an error; the stream is out of sync.
        [[nodiscard]] bool failed() const noexcept { return failed_; }

    protected:
        bool failed_{false};
    };

    class EmptyBodyReader final : public HttpBodyReader {
    public:
        [[nodiscard]] postsink::core::Status read(u8* buf, u32 cap, u32* got) noexcept override;
        [[nodiscard]] bool complete() const noexcept override { return true; }
    };

    class LengthBodyReader final : public HttpBodyReader {
    public:
        LengthBodyReader(postsink::net::ConnReader& in, u64 length) noexcept : in_(in), remaining_(length) {}

        [[nodiscard]] postsink::core::Status read(u8* buf, u32 cap, u32* got) noexcept override;
        [[nodiscard]] bool complete() const noexcept override { return remaining_ == 0; }

    private:
        postsink::net::ConnReader& in_;
        u64 remaining_{0};
    };

    class ChunkedBodyReader final : public HttpBodyReader {
    public:
        explicit ChunkedBodyReader(postsink::net::ConnReader& in) noexcept : in_(in) {}

        [[nodiscard]] postsink::core::Status read(u8* buf, u32 cap, u32* got) noexcept override;
        [[nodiscard]] bool complete() const noexcept override { return state_ == State::Done; }

    private:
        enum class State : u8 {
            Size = 0,
            Data,
            DataEnd,
            Trailers,
            Done,
        };

        [[nodiscard]] postsink::core::Status next_chunk() noexcept;
        [[nodiscard]] postsink::core::Status fail(postsink::core::Status s) noexcept;

        postsink::net::ConnReader& in_;
        State state_{State::Size};
        u64 chunk_left_{0};
    };

} // namespace postsink::http
