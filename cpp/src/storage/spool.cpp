#include "postsink/storage/spool.hpp"
#include "postsink/storage/naming.hpp"

#include <cstring>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

namespace postsink::storage {

using namespace postsink::core;

// ========================================================================
// Internal Helpers
// ========================================================================

// Create directory hierarchy recursively (mkdir -p)
static Status create_directories(const std::string& path, u32 mode) {
    if (path.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    if (mkdir(path.c_str(), static_cast<mode_t>(mode)) == 0) {
        return ok_status();
    }

    if (errno == EEXIST) {
        struct stat st{};
        if (stat(path.c_str(), &st) != 0) {
            return make_status(StatusDomain::Storage, StatusCode::Io, errno);
        }
        if (!S_ISDIR(st.st_mode)) {
            return make_status(StatusDomain::Storage, StatusCode::Io, ENOTDIR);
        }
        return ok_status();
    }

    if (errno == ENOENT) {
        // Parent doesn't exist, recurse
        const size_t slash = path.find_last_of('/');
        if (slash == std::string::npos || slash == 0) {
            return make_status(StatusDomain::Storage, StatusCode::Io, ENOENT);
        }
        Status s = create_directories(path.substr(0, slash), mode);
        if (!is_ok(s)) return s;

        if (mkdir(path.c_str(), static_cast<mode_t>(mode)) != 0 && errno != EEXIST) {
            return make_status(StatusDomain::Storage, StatusCode::Io, errno);
        }
        return ok_status();
    }

    return make_status(StatusDomain::Storage, StatusCode::Io, errno);
}

// ========================================================================
// SpoolFile
// ========================================================================

SpoolFile::~SpoolFile() noexcept {
    close();
}

SpoolFile::SpoolFile(SpoolFile&& other) noexcept
    : fd_(other.fd_), name_(std::move(other.name_)), seq_(other.seq_), written_(other.written_) {
    other.fd_ = -1;
    other.written_ = 0;
}

SpoolFile& SpoolFile::operator=(SpoolFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        name_ = std::move(other.name_);
        seq_ = other.seq_;
        written_ = other.written_;
        other.fd_ = -1;
        other.written_ = 0;
    }
    return *this;
}

Status SpoolFile::write(const u8* data, u64 size) noexcept {
    if (fd_ < 0) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (data == nullptr && size > 0) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    u64 done = 0;
    while (done < size) {
        ssize_t n = ::write(fd_, data + done, size - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_status(StatusDomain::Storage, StatusCode::Io, errno);
        }
        done += static_cast<u64>(n);
        written_ += static_cast<u64>(n);
    }
    return ok_status();
}

void SpoolFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ========================================================================
// Spool
// ========================================================================

Spool::~Spool() noexcept {
    close();
}

Status Spool::open(const SpoolConfig& cfg) noexcept {
    if (cfg.root == nullptr || cfg.root[0] == '\0') {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (dir_fd_ >= 0) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::string root{cfg.root};
    while (root.size() > 1 && root.back() == '/') {
        root.pop_back();
    }

    Status s = create_directories(root, cfg.dir_mode);
    if (!is_ok(s)) {
        return s;
    }

    int fd = ::open(root.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return make_status(StatusDomain::Storage, StatusCode::Io, errno);
    }

    dir_fd_ = fd;
    file_mode_ = cfg.file_mode;
    root_ = std::move(root);
    return ok_status();
}

void Spool::close() noexcept {
    if (dir_fd_ >= 0) {
        ::close(dir_fd_);
        dir_fd_ = -1;
    }
}

Status Spool::exists(const std::string& name, bool* out) const noexcept {
    if (out == nullptr || dir_fd_ < 0) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    struct stat st{};
    if (fstatat(dir_fd_, name.c_str(), &st, AT_SYMLINK_NOFOLLOW) == 0) {
        *out = true;
        return ok_status();
    }
    if (errno == ENOENT) {
        *out = false;
        return ok_status();
    }
    return make_status(StatusDomain::Storage, StatusCode::Io, errno);
}

Status Spool::create(std::string_view remote, std::string_view path, SpoolFile* out) noexcept {
    if (out == nullptr || dir_fd_ < 0) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    const std::string stem = destination_stem(remote, path);

    std::lock_guard<std::mutex> guard(lock_);

    // Linear probe from zero: the first free number wins, so numbers freed by
    // an external delete are reused.
    std::string name;
    u64 seq = 0;
    for (;; ++seq) {
        name = destination_name(stem, seq);
        bool taken = false;
        Status s = exists(name, &taken);
        if (!is_ok(s)) {
            return s;
        }
        if (!taken) {
            break;
        }
    }

    int fd = openat(dir_fd_, name.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_EXCL | O_CLOEXEC,
                    static_cast<mode_t>(file_mode_));
    if (fd < 0) {
        const int err = errno;
        if (err == EEXIST) {
            return make_status(StatusDomain::Storage, StatusCode::Conflict, err);
        }
        return make_status(StatusDomain::Storage, StatusCode::Io, err);
    }

    out->close();
    out->fd_ = fd;
    out->name_ = std::move(name);
    out->seq_ = seq;
    out->written_ = 0;
    return ok_status();
}

} // namespace postsink::storage
