#pragma once

#include <cstdio>

#include "postsink/core/errors.hpp"

namespace postsink::core {

    // Redirects log output (stderr by default). Passing nullptr restores stderr.
    void log_set_sink(std::FILE* sink) noexcept;

    // One timestamped line per call: "YYYY/MM/DD HH:MM:SS <message>\n".
    // Safe to call from any thread; lines never interleave.
    void log_printf(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));

    // "<context>: <Domain>/<Code>[: strerror]"
    void log_status(const char* context, Status s) noexcept;

} // namespace postsink::core
