#pragma once

#include <mutex>
#include <string>
#include <string_view>

#include "postsink/core/errors.hpp"
#include "postsink/core/types.hpp"

namespace postsink::storage {

using u8 = postsink::core::u8;
using u32 = postsink::core::u32;
using u64 = postsink::core::u64;

// Spool configuration
struct SpoolConfig {
    const char* root{nullptr};      // Output directory, created with parents if missing
    u32 dir_mode{0700};             // Mode for directories we create
    u32 file_mode{0600};            // Mode for every captured file
};

// ========================================================================
// Captured File
// ========================================================================

// A file created by Spool::create. Owns its descriptor; closing happens on
// destruction if the caller has not done it already. Move-only.
class SpoolFile {
public:
    SpoolFile() noexcept = default;
    ~SpoolFile() noexcept;

    SpoolFile(SpoolFile&& other) noexcept;
    SpoolFile& operator=(SpoolFile&& other) noexcept;
    SpoolFile(const SpoolFile&) = delete;
    SpoolFile& operator=(const SpoolFile&) = delete;

    // Append a chunk. Short writes are retried until the whole chunk is on disk
    // or an error occurs.
    [[nodiscard]] postsink::core::Status write(const u8* data, u64 size) noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] u64 sequence() const noexcept { return seq_; }
    [[nodiscard]] u64 bytes_written() const noexcept { return written_; }

private:
    friend class Spool;

    int fd_{-1};
    std::string name_;
    u64 seq_{0};
    u64 written_{0};
};

// ========================================================================
// Output Directory
// ========================================================================

// The output directory and the lock that serializes name allocation in it.
// Every path is resolved relative to the directory handle opened by open(),
// so later changes of the process working directory do not matter.
//
// One Spool is shared by every connection worker; it is passed around by
// reference and must outlive them.
class Spool {
public:
    Spool() noexcept = default;
    ~Spool() noexcept;

    Spool(const Spool&) = delete;
    Spool& operator=(const Spool&) = delete;

    // Create (mkdir -p) and open the output directory.
    [[nodiscard]] postsink::core::Status open(const SpoolConfig& cfg) noexcept;

    void close() noexcept;

    // Allocate the lowest free destination name for (remote, path) and create
    // it with O_EXCL. The whole probe-then-create sequence runs under the
    // serialization lock; writing the body afterwards does not.
    //
    // Errors:
    // - Storage/Io with errno in aux if a probe fails for a reason other than
    //   ENOENT (e.g. ENAMETOOLONG) or the create fails.
    // - Storage/Conflict (aux=EEXIST) if another process created the name
    //   between probe and create.
    // Running out of memory while building a name terminates the process.
    [[nodiscard]] postsink::core::Status create(std::string_view remote,
                                                std::string_view path,
                                                SpoolFile* out) noexcept;

    // Whether a directory entry with this name exists. Symlinks are not followed.
    [[nodiscard]] postsink::core::Status exists(const std::string& name, bool* out) const noexcept;

    [[nodiscard]] bool is_open() const noexcept { return dir_fd_ >= 0; }
    [[nodiscard]] int dir_fd() const noexcept { return dir_fd_; }
    [[nodiscard]] const std::string& root() const noexcept { return root_; }

private:
    int dir_fd_{-1};
    u32 file_mode_{0600};
    std::string root_;
    std::mutex lock_;  // Serialization lock: probe + create only
};

} // namespace postsink::storage
