#pragma once

#include "postsink/ingest/request.hpp"
#include "postsink/storage/spool.hpp"

namespace postsink::ingest {

    // Terminal state of one request.
    enum class Outcome : u8 {
        Rejected = 0,    // Not the write method; nothing touched
        OpenFailed,      // Name allocation or exclusive create failed
        Failed,          // File created, body transfer failed (partial file kept)
        Completed,
    };

    inline constexpr u16 kStatusOk = 200;
    inline constexpr u16 kStatusMethodNotAllowed = 405;
    inline constexpr u16 kStatusInternalError = 500;

    inline constexpr char kWriteMethod[] = "POST";

    // Size of the copy buffer used when streaming a body to disk.
    inline constexpr u32 kCopyChunkBytes = 32 * 1024;

    struct Result {
        Outcome outcome{Outcome::Rejected};
        u64 bytes_written{0};
    };

    // Captures request bodies into the spool. Holds no per-request state, so a
    // single instance serves every connection worker concurrently.
    class IngestHandler {
    public:
        explicit IngestHandler(postsink::storage::Spool& spool) noexcept : spool_(spool) {}

        // Runs one request to completion and fills *out. Every outcome is
        // logged exactly once. Allocation failure while building the log line
        // or the destination name terminates the process.
        Result handle(const Request& req, BodyReader& body, Response* out) noexcept;

    private:
        postsink::storage::Spool& spool_;
    };

} // namespace postsink::ingest
