#include "postsink/core/log.hpp"

#include <cstdarg>
#include <ctime>
#include <mutex>

namespace postsink::core {
    namespace {
        std::mutex g_log_mutex;
        std::FILE* g_log_sink = nullptr;

        std::FILE* current_sink() noexcept {
            return g_log_sink != nullptr ? g_log_sink : stderr;
        }

        void write_timestamp(std::FILE* f) noexcept {
            const std::time_t now = std::time(nullptr);
            std::tm tm_buf{};
            if (localtime_r(&now, &tm_buf) == nullptr) {
                std::fputs("0000/00/00 00:00:00 ", f);
                return;
            }
            char stamp[32];
            const size_t n = std::strftime(stamp, sizeof(stamp), "%Y/%m/%d %H:%M:%S ", &tm_buf);
            std::fwrite(stamp, 1, n, f);
        }
    } // namespace

    void log_set_sink(std::FILE* sink) noexcept {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_log_sink = sink;
    }

    void log_printf(const char* fmt, ...) noexcept {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::FILE* f = current_sink();
        write_timestamp(f);

        va_list ap;
        va_start(ap, fmt);
        std::vfprintf(f, fmt, ap);
        va_end(ap);

        std::fputc('\n', f);
        std::fflush(f);
    }

    void log_status(const char* context, Status s) noexcept {
        char detail[256];
        (void)status_describe(s, detail, sizeof(detail));
        log_printf("%s: %s", context, detail);
    }

} // namespace postsink::core
