#pragma once

#include <string>
#include <string_view>

#include "postsink/core/types.hpp"

namespace postsink::storage {
    using u64 = postsink::core::u64;

    // Lexical path cleanup: collapses repeated '/', drops "." segments and
    // resolves ".." against the previous segment. A rooted path never climbs
    // above "/". An empty input yields ".".
    [[nodiscard]] std::string clean_path(std::string_view path);

    // The path as it appears inside a destination name: cleaned, leading '/'
    // removed, every remaining '/' (and NUL) replaced by '_'.
    [[nodiscard]] std::string flatten_path(std::string_view path);

    // "<remote>_<flattened path>_". Computed once per request; the sequence is
    // appended for every probe.
    [[nodiscard]] std::string destination_stem(std::string_view remote, std::string_view path);

    // "<stem><seq>" with seq zero-padded to kSequenceDigits.
    [[nodiscard]] std::string destination_name(std::string_view stem, u64 seq);

    [[nodiscard]] inline std::string destination_name(std::string_view remote, std::string_view path, u64 seq) {
        return destination_name(destination_stem(remote, path), seq);
    }

} // namespace postsink::storage
