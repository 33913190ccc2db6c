#pragma once

#include <cstdio>
#include <string>

#include "postsink/cli/options.hpp"
#include "postsink/net/listener.hpp"

namespace postsink::cli {

    inline constexpr char kDefaultListen[] = "0.0.0.0:4433";
    inline constexpr char kDefaultCert[] = "cert.pem";
    inline constexpr char kDefaultKey[] = "key.pem";
    inline constexpr char kDefaultDir[] = "posts";

    struct ServerConfig {
        postsink::net::TransportMode mode{postsink::net::TransportMode::Tls};
        std::string listen{kDefaultListen};
        std::string cert{kDefaultCert};
        std::string key{kDefaultKey};
        std::string dir{kDefaultDir};
        bool help{false};
    };

    // Parses argv (argv[0] is the program name). Errors:
    // - Cli/Invalid: unknown option, missing value or stray argument; aux is
    //   the argv index of the offending token
    // - Cli/Conflict: --http and --fcgi together
    [[nodiscard]] postsink::core::Status load_config(int argc, const char* const* argv, ServerConfig* out) noexcept;

    void print_usage(std::FILE* out, const char* prog) noexcept;

    // base_dir anchors a relative gateway socket path.
    [[nodiscard]] postsink::net::ListenerConfig listener_config(const ServerConfig& cfg, const std::string& base_dir);

} // namespace postsink::cli
