#pragma once

#include <type_traits>

#include "postsink/core/errors.hpp"
#include "postsink/core/types.hpp"

namespace postsink::cli {
    using u8 = postsink::core::u8;
    using u32 = postsink::core::u32;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
    };

    enum class OptionId : u32 {
        None = 0,
        Http = 1,
        Fcgi = 2,
        Listen = 3,
        Cert = 4,
        Key = 5,
        Dir = 6,
        Help = 7,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* str{nullptr};   // String options only; points into argv
    };

    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Accepted forms: --name, --name=value, --name value, -name (long names
    // with a single dash), -x value, -xvalue. Parsing stops at "--" or the
    // first non-option argument; *consumed is the index it stopped at.
    // Errors are Cli/Invalid with aux set to the index of the offending token.
    [[nodiscard]] postsink::core::Status parse_options(const CliArgs& args,
                                                       const OptionSpec* specs,
                                                       u32 spec_count,
                                                       ParsedOptions* out,
                                                       u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);

} // namespace postsink::cli
