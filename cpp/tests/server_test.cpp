#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <sys/stat.h>

#include "postsink/fcgi/record.hpp"
#include "postsink/ingest/handler.hpp"
#include "postsink/net/listener.hpp"
#include "postsink/net/tls.hpp"
#include "postsink/server/server.hpp"
#include "postsink/storage/naming.hpp"
#include "postsink/storage/spool.hpp"
#include "test_support.hpp"

using namespace postsink;
using core::Status;
using core::u8;
using core::u16;
using core::u32;
using core::StatusCode;
using core::StatusDomain;
using core::is_ok;
using core::make_status;
using net::Listener;
using net::ListenerConfig;
using net::TransportMode;
using test::TempDir;

namespace {
    // "127.0.0.1:port" of the client side of a connected socket.
    std::string local_endpoint(int fd) {
        sockaddr_in sin{};
        socklen_t len = sizeof(sin);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&sin), &len) != 0) {
            return "";
        }
        char ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &sin.sin_addr, ip, sizeof(ip));
        return std::string(ip) + ":" + std::to_string(ntohs(sin.sin_port));
    }

    template <typename Pred>
    bool wait_for(Pred pred, std::chrono::milliseconds limit = std::chrono::milliseconds{2000}) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!pred()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
        }
        return true;
    }

    // ========================================================================
    // FastCGI client side
    // ========================================================================

    std::string fcgi_record(fcgi::RecordType type, u16 id, const std::string& content) {
        fcgi::RecordHeader h{};
        h.type = type;
        h.request_id = id;
        h.content_len = static_cast<u16>(content.size());
        h.padding_len = fcgi::padding_for(static_cast<u32>(content.size()));
        u8 hdr[fcgi::kHeaderBytes];
        (void)fcgi::record_write_header(h, {hdr, sizeof(hdr)});
        std::string out(reinterpret_cast<const char*>(hdr), sizeof(hdr));
        out += content;
        out.append(h.padding_len, '\0');
        return out;
    }

    std::string fcgi_post(u16 id, const std::string& uri, const std::string& body) {
        std::string begin(8, '\0');
        begin[1] = static_cast<char>(fcgi::Role::Responder);
        std::string params;
        fcgi::encode_name_value("REQUEST_METHOD", "POST", &params);
        fcgi::encode_name_value("REQUEST_URI", uri, &params);
        fcgi::encode_name_value("SERVER_PROTOCOL", "HTTP/1.1", &params);
        fcgi::encode_name_value("REMOTE_ADDR", "198.51.100.4", &params);
        fcgi::encode_name_value("REMOTE_PORT", "6000", &params);

        std::string out = fcgi_record(fcgi::RecordType::BeginRequest, id, begin);
        out += fcgi_record(fcgi::RecordType::Params, id, params);
        out += fcgi_record(fcgi::RecordType::Params, id, "");
        for (std::size_t off = 0; off < body.size(); off += fcgi::kMaxContentBytes) {
            out += fcgi_record(fcgi::RecordType::Stdin, id, body.substr(off, fcgi::kMaxContentBytes));
        }
        out += fcgi_record(fcgi::RecordType::Stdin, id, "");
        return out;
    }

    // ========================================================================
    // TLS material
    // ========================================================================

    struct PkeyFree {
        void operator()(EVP_PKEY* k) const noexcept { EVP_PKEY_free(k); }
    };
    struct X509Free {
        void operator()(X509* x) const noexcept { X509_free(x); }
    };
    using UniquePkey = std::unique_ptr<EVP_PKEY, PkeyFree>;
    using UniqueX509 = std::unique_ptr<X509, X509Free>;

    UniquePkey make_key() {
        return UniquePkey(EVP_EC_gen("P-256"));
    }

    UniqueX509 make_self_signed(EVP_PKEY* key) {
        UniqueX509 x(X509_new());
        if (!x) {
            return x;
        }
        X509_set_version(x.get(), 2);
        ASN1_INTEGER_set(X509_get_serialNumber(x.get()), 1);
        X509_gmtime_adj(X509_getm_notBefore(x.get()), 0);
        X509_gmtime_adj(X509_getm_notAfter(x.get()), 3600);
        X509_set_pubkey(x.get(), key);
        X509_NAME* name = X509_get_subject_name(x.get());
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
        X509_set_issuer_name(x.get(), name);
        if (X509_sign(x.get(), key, EVP_sha256()) == 0) {
            x.reset();
        }
        return x;
    }

    bool write_cert(const std::string& path, X509* cert) {
        FILE* f = std::fopen(path.c_str(), "w");
        if (f == nullptr) {
            return false;
        }
        const bool ok = PEM_write_X509(f, cert) == 1;
        std::fclose(f);
        return ok;
    }

    bool write_key(const std::string& path, EVP_PKEY* key) {
        FILE* f = std::fopen(path.c_str(), "w");
        if (f == nullptr) {
            return false;
        }
        const bool ok = PEM_write_PrivateKey(f, key, nullptr, nullptr, 0, nullptr, nullptr) == 1;
        std::fclose(f);
        return ok;
    }

    // Sends the request over TLS and returns everything the server sent back.
    std::string tls_exchange(int fd, const std::string& request) {
        std::unique_ptr<SSL_CTX, void (*)(SSL_CTX*)> ctx(SSL_CTX_new(TLS_client_method()), SSL_CTX_free);
        if (!ctx) {
            return "";
        }
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
        net::UniqueSsl ssl(SSL_new(ctx.get()));
        if (!ssl || SSL_set_fd(ssl.get(), fd) != 1 || SSL_connect(ssl.get()) != 1) {
            return "";
        }
        if (SSL_write(ssl.get(), request.data(), static_cast<int>(request.size())) <= 0) {
            return "";
        }
        std::string out;
        char buf[4096];
        for (;;) {
            const int n = SSL_read(ssl.get(), buf, sizeof(buf));
            if (n <= 0) {
                break;
            }
            out.append(buf, static_cast<std::size_t>(n));
        }
        return out;
    }
} // namespace

// ============================================================================
// Fixture
// ============================================================================

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::signal(SIGPIPE, SIG_IGN);
        spool_root_ = tmp_.join("posts");
        storage::SpoolConfig cfg;
        cfg.root = spool_root_.c_str();
        ASSERT_TRUE(is_ok(spool_.open(cfg)));
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
        if (runner_.joinable()) {
            runner_.join();
        }
        server_.reset();
        listener_.reset();
    }

    void start(const ListenerConfig& cfg) {
        ASSERT_TRUE(is_ok(net::acquire_listener(cfg, &listener_)));
        server_ = std::make_unique<server::Server>(*listener_, handler_);
        runner_ = std::thread([this] { run_status_ = server_->run(); });
    }

    void start_plaintext() {
        ListenerConfig cfg;
        cfg.mode = TransportMode::Plaintext;
        cfg.address = "127.0.0.1:0";
        start(cfg);
    }

    Status finish() {
        server_->stop();
        runner_.join();
        return run_status_;
    }

    TempDir tmp_;
    std::string spool_root_;
    storage::Spool spool_;
    ingest::IngestHandler handler_{spool_};
    std::unique_ptr<Listener> listener_;
    std::unique_ptr<server::Server> server_;
    std::thread runner_;
    Status run_status_{};
};

// ============================================================================
// Plaintext HTTP
// ============================================================================

TEST_F(ServerTest, PlaintextPostIsCaptured) {
    start_plaintext();
    const std::string payload = test::make_payload(300000, 3);

    const int fd = test::connect_tcp(listener_->address());
    ASSERT_GE(fd, 0);
    const std::string remote = local_endpoint(fd);
    ASSERT_TRUE(test::send_all(fd, test::post_request("/up/load", payload)));
    const std::string response = test::recv_all(fd);
    ::close(fd);

    EXPECT_EQ(test::response_status(response), 200);
    EXPECT_EQ(test::response_body(response), "300000");

    const std::string name = storage::destination_name(remote, "/up/load", 0);
    EXPECT_EQ(test::read_file(spool_root_ + "/" + name), payload);

    struct stat st{};
    ASSERT_EQ(::stat((spool_root_ + "/" + name).c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    EXPECT_TRUE(is_ok(finish()));
}

TEST_F(ServerTest, KeepAliveConnectionCapturesEachRequest) {
    start_plaintext();
    const int fd = test::connect_tcp(listener_->address());
    ASSERT_GE(fd, 0);
    const std::string remote = local_endpoint(fd);

    const std::string pipeline = test::post_request("/k", "first", false) +
                                 test::post_request("/k", "second", true);
    ASSERT_TRUE(test::send_all(fd, pipeline));
    const std::string response = test::recv_all(fd);
    ::close(fd);

    EXPECT_EQ(test::response_status(response), 200);
    EXPECT_NE(response.find("HTTP/1.1 200", 10), std::string::npos);
    EXPECT_EQ(test::read_file(spool_root_ + "/" + storage::destination_name(remote, "/k", 0)), "first");
    EXPECT_EQ(test::read_file(spool_root_ + "/" + storage::destination_name(remote, "/k", 1)), "second");
    EXPECT_TRUE(is_ok(finish()));
}

TEST_F(ServerTest, ConcurrentClientsAreServedInParallel) {
    start_plaintext();
    constexpr int kClients = 12;
    std::vector<std::string> remotes(kClients);
    std::vector<std::string> responses(kClients);
    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([&, i] {
            const int fd = test::connect_tcp(listener_->address());
            if (fd < 0) {
                return;
            }
            remotes[i] = local_endpoint(fd);
            if (test::send_all(fd, test::post_request("/same", test::make_payload(50000 + i, i + 1)))) {
                responses[i] = test::recv_all(fd);
            }
            ::close(fd);
        });
    }
    for (auto& t : clients) {
        t.join();
    }

    for (int i = 0; i < kClients; ++i) {
        EXPECT_EQ(test::response_status(responses[i]), 200) << i;
        const std::string name = storage::destination_name(remotes[i], "/same", 0);
        EXPECT_EQ(test::read_file(spool_root_ + "/" + name), test::make_payload(50000 + i, i + 1)) << i;
    }
    EXPECT_EQ(test::list_dir(spool_root_).size(), static_cast<std::size_t>(kClients));
    EXPECT_TRUE(is_ok(finish()));
}

TEST_F(ServerTest, NonPostCreatesNothing) {
    start_plaintext();
    const int fd = test::connect_tcp(listener_->address());
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(test::send_all(fd, "GET /x HTTP/1.1\r\nHost: t\r\nConnection: close\r\n\r\n"));
    const std::string response = test::recv_all(fd);
    ::close(fd);

    EXPECT_EQ(test::response_status(response), 405);
    EXPECT_TRUE(test::list_dir(spool_root_).empty());
    EXPECT_TRUE(is_ok(finish()));
}

TEST_F(ServerTest, StopInterruptsIdleConnection) {
    start_plaintext();
    const int fd = test::connect_tcp(listener_->address());
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(wait_for([this] { return server_->live_connections() == 1; }));

    EXPECT_TRUE(is_ok(finish()));
    EXPECT_EQ(server_->live_connections(), 0u);
    EXPECT_EQ(test::recv_all(fd), "");
    ::close(fd);
}

TEST_F(ServerTest, StopWithoutClientsReturnsPromptly) {
    start_plaintext();
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_TRUE(is_ok(finish()));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds{2});
}

// ============================================================================
// Gateway (FastCGI over a Unix-domain socket)
// ============================================================================

TEST_F(ServerTest, GatewayRequestIsCapturedAndSocketRemoved) {
    ListenerConfig cfg;
    cfg.mode = TransportMode::Gateway;
    cfg.address = "gw.sock";
    cfg.base_dir = tmp_.path();
    start(cfg);

    const std::string sock = tmp_.join("gw.sock");
    const std::string payload = test::make_payload(150000, 9);
    const int fd = test::connect_unix(sock);
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(test::send_all(fd, fcgi_post(1, "/gw/in?x=1", payload)));
    const std::string wire = test::recv_all(fd);
    ::close(fd);

    EXPECT_NE(wire.find("Status: 200 OK\r\n"), std::string::npos);
    EXPECT_NE(wire.find("150000"), std::string::npos);

    const std::string name = storage::destination_name("198.51.100.4:6000", "/gw/in", 0);
    EXPECT_EQ(test::read_file(spool_root_ + "/" + name), payload);

    EXPECT_TRUE(is_ok(finish()));
    listener_->close();
    struct stat st{};
    EXPECT_NE(::lstat(sock.c_str(), &st), 0);
}

// ============================================================================
// TLS
// ============================================================================

TEST_F(ServerTest, TlsPostIsCaptured) {
    UniquePkey key = make_key();
    ASSERT_TRUE(key);
    UniqueX509 cert = make_self_signed(key.get());
    ASSERT_TRUE(cert);
    ASSERT_TRUE(write_cert(tmp_.join("cert.pem"), cert.get()));
    ASSERT_TRUE(write_key(tmp_.join("key.pem"), key.get()));

    ListenerConfig cfg;
    cfg.mode = TransportMode::Tls;
    cfg.address = "127.0.0.1:0";
    cfg.cert_path = tmp_.join("cert.pem");
    cfg.key_path = tmp_.join("key.pem");
    start(cfg);

    const int fd = test::connect_tcp(listener_->address());
    ASSERT_GE(fd, 0);
    const std::string remote = local_endpoint(fd);
    const std::string response = tls_exchange(fd, test::post_request("/secure", "over tls"));
    ::close(fd);

    EXPECT_EQ(test::response_status(response), 200);
    EXPECT_EQ(test::response_body(response), "8");
    EXPECT_EQ(test::read_file(spool_root_ + "/" + storage::destination_name(remote, "/secure", 0)), "over tls");
    EXPECT_TRUE(is_ok(finish()));
}

TEST_F(ServerTest, PlaintextClientOnTlsPortIsDropped) {
    UniquePkey key = make_key();
    ASSERT_TRUE(key);
    UniqueX509 cert = make_self_signed(key.get());
    ASSERT_TRUE(cert);
    ASSERT_TRUE(write_cert(tmp_.join("cert.pem"), cert.get()));
    ASSERT_TRUE(write_key(tmp_.join("key.pem"), key.get()));

    ListenerConfig cfg;
    cfg.mode = TransportMode::Tls;
    cfg.address = "127.0.0.1:0";
    cfg.cert_path = tmp_.join("cert.pem");
    cfg.key_path = tmp_.join("key.pem");
    start(cfg);

    const int fd = test::connect_tcp(listener_->address());
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(test::send_all(fd, test::post_request("/plain", "nope")));
    (void)test::recv_all(fd);
    ::close(fd);

    EXPECT_TRUE(test::list_dir(spool_root_).empty());
    EXPECT_TRUE(is_ok(finish()));
}

TEST(TlsCredentials, MissingFilesAreCryptoErrors) {
    TempDir tmp;
    net::SharedSslCtx ctx;
    const Status s = net::load_server_context(tmp.join("cert.pem"), tmp.join("key.pem"), &ctx);
    EXPECT_EQ(s.domain, StatusDomain::Tls);
    EXPECT_EQ(s.code, StatusCode::Crypto);
    EXPECT_FALSE(ctx);
}

TEST(TlsCredentials, MismatchedKeyIsRejectedBeforeBinding) {
    TempDir tmp;
    UniquePkey key = make_key();
    UniquePkey other = make_key();
    ASSERT_TRUE(key && other);
    UniqueX509 cert = make_self_signed(key.get());
    ASSERT_TRUE(cert);
    ASSERT_TRUE(write_cert(tmp.join("cert.pem"), cert.get()));
    ASSERT_TRUE(write_key(tmp.join("key.pem"), other.get()));

    ListenerConfig cfg;
    cfg.mode = TransportMode::Tls;
    cfg.address = "127.0.0.1:0";
    cfg.cert_path = tmp.join("cert.pem");
    cfg.key_path = tmp.join("key.pem");
    std::unique_ptr<Listener> l;
    const Status s = net::acquire_listener(cfg, &l);
    EXPECT_EQ(s.domain, StatusDomain::Tls);
    EXPECT_EQ(s.code, StatusCode::Crypto);
    EXPECT_EQ(l, nullptr);
}

// ============================================================================
// Accept errors
// ============================================================================

TEST(AcceptErrors, TransientClassification) {
    EXPECT_TRUE(server::accept_error_transient(make_status(StatusDomain::Net, StatusCode::Io, EMFILE)));
    EXPECT_TRUE(server::accept_error_transient(make_status(StatusDomain::Net, StatusCode::Io, ECONNABORTED)));
    EXPECT_TRUE(server::accept_error_transient(make_status(StatusDomain::Net, StatusCode::Io, ENOBUFS)));
    EXPECT_FALSE(server::accept_error_transient(make_status(StatusDomain::Net, StatusCode::Io, EBADF)));
    EXPECT_FALSE(server::accept_error_transient(make_status(StatusDomain::Net, StatusCode::Unavailable)));
    EXPECT_FALSE(server::accept_error_transient(make_status(StatusDomain::Storage, StatusCode::Io, EMFILE)));
}
