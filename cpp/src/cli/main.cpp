#include <atomic>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>
#include <unistd.h>

#include "postsink/cli/config.hpp"
#include "postsink/core/errors.hpp"
#include "postsink/core/log.hpp"
#include "postsink/ingest/handler.hpp"
#include "postsink/net/listener.hpp"
#include "postsink/server/server.hpp"
#include "postsink/storage/spool.hpp"

using postsink::core::Status;
using postsink::core::StatusCode;
using postsink::core::StatusDomain;
using postsink::core::is_ok;
using postsink::core::log_printf;

// ========================================================================
// Helpers
// ========================================================================

static std::string describe(Status s) {
    char buf[256];
    (void)postsink::core::status_describe(s, buf, sizeof(buf));
    return buf;
}

static int usage_error(const char* prog, int argc, char** argv, Status s) {
    if (s.code == StatusCode::Conflict) {
        std::fprintf(stderr, "%s: --http and --fcgi cannot be combined\n", prog);
    } else if (s.aux > 0 && s.aux < static_cast<postsink::core::u32>(argc)) {
        std::fprintf(stderr, "%s: bad option or argument: %s\n", prog, argv[s.aux]);
    } else {
        std::fprintf(stderr, "%s: invalid arguments\n", prog);
    }
    postsink::cli::print_usage(stderr, prog);
    return 2;
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    const char* prog = argc > 0 ? argv[0] : "postsink";

    postsink::cli::ServerConfig cfg;
    Status s = postsink::cli::load_config(argc, argv, &cfg);
    if (!is_ok(s)) {
        return usage_error(prog, argc, argv, s);
    }
    if (cfg.help) {
        postsink::cli::print_usage(stdout, prog);
        return 0;
    }

    // A relative socket path is relative to where we were started.
    char cwd[PATH_MAX];
    if (getcwd(cwd, sizeof(cwd)) == nullptr) {
        log_printf("Unable to get working directory: %s", std::strerror(errno));
        return 1;
    }

    postsink::storage::Spool spool;
    postsink::storage::SpoolConfig spool_cfg{};
    spool_cfg.root = cfg.dir.c_str();
    s = spool.open(spool_cfg);
    if (!is_ok(s)) {
        log_printf("Unable to open directory \"%s\": %s", cfg.dir.c_str(), describe(s).c_str());
        return 1;
    }

    // Signals are taken synchronously by one thread; every thread started
    // from here on inherits the mask.
    std::signal(SIGPIPE, SIG_IGN);
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    const int mask_rc = pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
    if (mask_rc != 0) {
        log_printf("Unable to block signals: %s", std::strerror(mask_rc));
        return 1;
    }

    std::unique_ptr<postsink::net::Listener> listener;
    s = postsink::net::acquire_listener(postsink::cli::listener_config(cfg, cwd), &listener);
    if (!is_ok(s)) {
        if (s.domain == StatusDomain::Tls) {
            log_printf("Unable to load keypair from %s and %s: %s",
                       cfg.cert.c_str(), cfg.key.c_str(), describe(s).c_str());
        } else {
            log_printf("Unable to listen on %s: %s", cfg.listen.c_str(), describe(s).c_str());
        }
        return 1;
    }
    log_printf("Listening for requests on %s", listener->address());

    postsink::ingest::IngestHandler handler(spool);
    postsink::server::Server server(*listener, handler);

    std::atomic<bool> finished{false};
    std::atomic<bool> caught{false};
    std::thread watcher([&] {
        int sig = 0;
        if (sigwait(&stop_signals, &sig) != 0 || finished.load(std::memory_order_acquire)) {
            return;
        }
        caught.store(true, std::memory_order_release);
        log_printf("Caught %s", strsignal(sig));
        server.stop();
    });

    const Status run_status = server.run();

    // Release the watcher if the server ended without a signal.
    finished.store(true, std::memory_order_release);
    if (!caught.load(std::memory_order_acquire)) {
        (void)pthread_kill(watcher.native_handle(), SIGTERM);
    }
    watcher.join();

    listener->close();
    if (cfg.mode == postsink::net::TransportMode::Gateway) {
        const Status removed = listener->close_status();
        if (is_ok(removed)) {
            log_printf("Removed socket %s", listener->address());
        } else {
            log_printf("Unable to remove socket %s: %s", listener->address(), describe(removed).c_str());
        }
    }
    if (!is_ok(run_status)) {
        log_printf("Server stopped: %s", describe(run_status).c_str());
        return 1;
    }
    return 0;
}
