#pragma once

#include <string>
#include <vector>

#include "postsink/core/buffer.hpp"
#include "postsink/net/listener.hpp"

namespace postsink::net {
    using postsink::core::BufferView;

    inline constexpr u32 kReaderBufferBytes = 64 * 1024;

    // Buffered reads over a Connection. Protocol parsers look at pending()
    // and consume() what they used; bodies go through read_some(), which
    // bypasses the buffer once it is empty.
    class ConnReader {
    public:
        explicit ConnReader(Connection& conn, u32 capacity = kReaderBufferBytes);

        ConnReader(const ConnReader&) = delete;
        ConnReader& operator=(const ConnReader&) = delete;

        // Buffered bytes not yet consumed.
        [[nodiscard]] BufferView pending() const noexcept {
            return BufferView{buf_.data() + start_, end_ - start_};
        }

        void consume(u32 n) noexcept;

        // Reads more bytes behind pending(). *got == 0 means end of stream.
        // Core/TooLarge when pending() already fills the whole buffer.
        [[nodiscard]] postsink::core::Status fill(u32* got) noexcept;

        // Buffered bytes first, then straight from the connection.
        [[nodiscard]] postsink::core::Status read_some(u8* buf, u32 cap, u32* got) noexcept;

        // End of stream before len bytes is Net/Network.
        [[nodiscard]] postsink::core::Status read_exact(u8* buf, u32 len) noexcept;

        // Discards exactly len bytes.
        [[nodiscard]] postsink::core::Status skip(u32 len) noexcept;

        // One LF-terminated line without its CRLF/LF. Lines longer than
        // max_len are Core/TooLarge; end of stream is Net/Network.
        [[nodiscard]] postsink::core::Status read_line(std::string* line, u32 max_len) noexcept;

        [[nodiscard]] Connection& connection() noexcept { return conn_; }

    private:
        void compact() noexcept;

        Connection& conn_;
        std::vector<u8> buf_;
        u32 start_{0};
        u32 end_{0};
    };

} // namespace postsink::net
