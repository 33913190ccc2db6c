#include "postsink/cli/options.hpp"

#include <cstring>

namespace postsink::cli {
    using postsink::core::Status;
    using postsink::core::StatusCode;
    using postsink::core::StatusDomain;
    using postsink::core::make_status;
    using postsink::core::ok_status;

    namespace {
        [[nodiscard]] Status bad_token(u32 index) noexcept {
            return make_status(StatusDomain::Cli, StatusCode::Invalid, index);
        }

        // Matches the first name_len bytes of name against a long option.
        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count,
                                                  const char* name, std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool push_option(ParsedOptions* out, const OptionSpec& spec, const char* value) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return false;
            }
            ParsedOption& opt = out->data[out->len++];
            opt.id = spec.id;
            opt.type = spec.type;
            opt.str = value;
            return true;
        }
    } // namespace

    Status parse_options(const CliArgs& args,
                         const OptionSpec* specs,
                         u32 spec_count,
                         ParsedOptions* out,
                         u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        out->len = 0;
        if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const u32 at = i;
            const bool double_dash = tok[1] == '-';
            const char* name = tok + (double_dash ? 2 : 1);
            const char* eq = std::strchr(name, '=');
            const std::size_t name_len = eq != nullptr ? static_cast<std::size_t>(eq - name) : std::strlen(name);

            // "-name" is tried as a long option before falling back to "-x[value]".
            const OptionSpec* spec = nullptr;
            const char* value = nullptr;
            if (double_dash || name_len > 1) {
                spec = find_long(specs, spec_count, name, name_len);
                if (spec != nullptr && eq != nullptr) {
                    value = eq + 1;
                }
            }
            if (spec == nullptr && !double_dash) {
                spec = find_short(specs, spec_count, name[0]);
                if (spec != nullptr && name[1] != '\0') {
                    if (spec->type == OptionType::Flag) {
                        return bad_token(at);
                    }
                    value = name[1] == '=' ? name + 2 : name + 1;
                }
            }
            if (spec == nullptr) {
                return bad_token(at);
            }
            ++i;

            if (spec->type == OptionType::Flag) {
                if (value != nullptr) {
                    return bad_token(at);
                }
            } else if (value == nullptr) {
                if (i >= args.argc || args.argv[i] == nullptr) {
                    return bad_token(at);
                }
                value = args.argv[i++];
            }

            if (!push_option(out, *spec, value)) {
                return make_status(StatusDomain::Cli, StatusCode::TooLarge, at);
            }
        }

        *consumed = i;
        return ok_status();
    }

} // namespace postsink::cli
