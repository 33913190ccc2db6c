#include "postsink/cli/config.hpp"

#include <array>

namespace postsink::cli {
    using postsink::core::Status;
    using postsink::core::StatusCode;
    using postsink::core::StatusDomain;
    using postsink::core::make_status;
    using postsink::core::ok_status;
    using postsink::core::is_ok;

    namespace {
        constexpr std::array<OptionSpec, 7> kSpecs = {{
            {OptionId::Http, OptionType::Flag, "http", '\0'},
            {OptionId::Fcgi, OptionType::Flag, "fcgi", '\0'},
            {OptionId::Listen, OptionType::String, "listen", 'l'},
            {OptionId::Cert, OptionType::String, "cert", 'c'},
            {OptionId::Key, OptionType::String, "key", 'k'},
            {OptionId::Dir, OptionType::String, "dir", 'd'},
            {OptionId::Help, OptionType::Flag, "help", 'h'},
        }};

        constexpr u32 kMaxParsed = 64;
    } // namespace

    Status load_config(int argc, const char* const* argv, ServerConfig* out) noexcept {
        if (out == nullptr || argc < 0 || (argc > 0 && argv == nullptr)) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        const u32 skip = argc > 0 ? 1u : 0u;
        const CliArgs args{argc > 0 ? argv + 1 : argv, static_cast<u32>(argc) - skip};

        ParsedOption buf[kMaxParsed]{};
        ParsedOptions parsed{buf, 0, kMaxParsed};
        u32 consumed = 0;
        Status s = parse_options(args, kSpecs.data(), static_cast<u32>(kSpecs.size()), &parsed, &consumed);
        if (!is_ok(s)) {
            s.aux += skip;
            return s;
        }
        if (consumed != args.argc) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid, consumed + skip);
        }

        ServerConfig cfg;
        bool http = false;
        bool fcgi = false;
        for (u32 i = 0; i < parsed.len; ++i) {
            const ParsedOption& opt = parsed.data[i];
            switch (opt.id) {
                case OptionId::Http: http = true; break;
                case OptionId::Fcgi: fcgi = true; break;
                case OptionId::Listen: cfg.listen = opt.str; break;
                case OptionId::Cert: cfg.cert = opt.str; break;
                case OptionId::Key: cfg.key = opt.str; break;
                case OptionId::Dir: cfg.dir = opt.str; break;
                case OptionId::Help: cfg.help = true; break;
                case OptionId::None: break;
            }
        }

        if (http && fcgi) {
            return make_status(StatusDomain::Cli, StatusCode::Conflict);
        }
        if (http) {
            cfg.mode = postsink::net::TransportMode::Plaintext;
        } else if (fcgi) {
            cfg.mode = postsink::net::TransportMode::Gateway;
        }
        if (!cfg.help && (cfg.listen.empty() || cfg.dir.empty())) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        *out = std::move(cfg);
        return ok_status();
    }

    void print_usage(std::FILE* out, const char* prog) noexcept {
        if (out == nullptr) {
            return;
        }
        std::fprintf(out,
                     "Usage: %s [options]\n"
                     "\n"
                     "Accepts POST requests via HTTPS (or plaintext HTTP with --http, or FastCGI\n"
                     "with --fcgi), and saves each body to a file named after the client address\n"
                     "and the request path.\n"
                     "\n"
                     "Options:\n"
                     "  --http               Serve plaintext HTTP\n"
                     "  --fcgi               Serve FastCGI; the listen address is a Unix socket path\n"
                     "  -l, --listen ADDR    Listen address (default %s)\n"
                     "  -c, --cert FILE      TLS certificate file (default %s)\n"
                     "  -k, --key FILE       TLS key file (default %s)\n"
                     "  -d, --dir DIR        Directory for received files (default %s)\n"
                     "  -h, --help           Show this help\n",
                     prog != nullptr ? prog : "postsink",
                     kDefaultListen, kDefaultCert, kDefaultKey, kDefaultDir);
    }

    postsink::net::ListenerConfig listener_config(const ServerConfig& cfg, const std::string& base_dir) {
        postsink::net::ListenerConfig lc;
        lc.mode = cfg.mode;
        lc.address = cfg.listen;
        lc.cert_path = cfg.cert;
        lc.key_path = cfg.key;
        lc.base_dir = base_dir;
        return lc;
    }

} // namespace postsink::cli
