#include "postsink/storage/naming.hpp"

#include <cstdio>
#include <vector>

namespace postsink::storage {
    namespace {
        constexpr char kSafeChar = '_';

        void append_safe(std::string* out, std::string_view s) {
            for (const char c : s) {
                out->push_back((c == '/' || c == '\0') ? kSafeChar : c);
            }
        }
    } // namespace

    std::string clean_path(std::string_view path) {
        if (path.empty()) {
            return ".";
        }

        const bool rooted = path.front() == '/';
        std::vector<std::string_view> segs;

        size_t i = 0;
        while (i < path.size()) {
            size_t j = path.find('/', i);
            if (j == std::string_view::npos) {
                j = path.size();
            }
            const std::string_view seg = path.substr(i, j - i);
            i = j + 1;

            if (seg.empty() || seg == ".") {
                continue;
            }
            if (seg == "..") {
                if (!segs.empty() && segs.back() != "..") {
                    segs.pop_back();
                } else if (!rooted) {
                    segs.push_back(seg);
                }
                continue;
            }
            segs.push_back(seg);
        }

        std::string out;
        out.reserve(path.size() + 1);
        if (rooted) {
            out.push_back('/');
        }
        for (size_t k = 0; k < segs.size(); ++k) {
            if (k > 0) {
                out.push_back('/');
            }
            out.append(segs[k]);
        }
        if (out.empty()) {
            out = ".";
        }
        return out;
    }

    std::string flatten_path(std::string_view path) {
        const std::string cleaned = clean_path(path);
        std::string_view rest{cleaned};
        if (!rest.empty() && rest.front() == '/') {
            rest.remove_prefix(1);
        }
        std::string out;
        out.reserve(rest.size());
        append_safe(&out, rest);
        return out;
    }

    std::string destination_stem(std::string_view remote, std::string_view path) {
        std::string out;
        out.reserve(remote.size() + path.size() + 2);
        append_safe(&out, remote);
        out.push_back('_');
        out.append(flatten_path(path));
        out.push_back('_');
        return out;
    }

    std::string destination_name(std::string_view stem, u64 seq) {
        char digits[24];
        const int n = std::snprintf(digits, sizeof(digits), "%0*llu",
                                    static_cast<int>(postsink::core::kSequenceDigits),
                                    static_cast<unsigned long long>(seq));
        std::string out;
        out.reserve(stem.size() + static_cast<size_t>(n));
        out.append(stem);
        out.append(digits, static_cast<size_t>(n));
        return out;
    }

} // namespace postsink::storage
