#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

#include <gtest/gtest.h>

#include "postsink/core/errors.hpp"
#include "postsink/core/log.hpp"

TEST(Status, DefaultIsOk) {
    postsink::core::Status s{};
    EXPECT_EQ(s.code, postsink::core::StatusCode::Ok);
    EXPECT_EQ(s.domain, postsink::core::StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
    EXPECT_TRUE(postsink::core::is_ok(s));
}

TEST(Status, DescribeNamesDomainAndCode) {
    const auto s = postsink::core::make_status(postsink::core::StatusDomain::Http, postsink::core::StatusCode::Invalid);
    char buf[128];
    postsink::core::status_describe(s, buf, sizeof(buf));
    EXPECT_STREQ(buf, "Http/Invalid");
}

TEST(Status, DescribeAppendsErrnoText) {
    const auto s = postsink::core::make_status(postsink::core::StatusDomain::Storage,
                                               postsink::core::StatusCode::Io, ENAMETOOLONG);
    char buf[256];
    postsink::core::status_describe(s, buf, sizeof(buf));
    const std::string text(buf);
    EXPECT_EQ(text.rfind("Storage/Io", 0), 0u);
    EXPECT_NE(text.find(std::strerror(ENAMETOOLONG)), std::string::npos);
}

TEST(Status, DescribeTruncatesSafely) {
    const auto s = postsink::core::make_status(postsink::core::StatusDomain::Storage,
                                               postsink::core::StatusCode::Unavailable);
    char buf[4];
    const int n = postsink::core::status_describe(s, buf, sizeof(buf));
    EXPECT_GT(n, 3);
    EXPECT_EQ(std::strlen(buf), 3u);
}

TEST(Status, EveryDomainHasAName) {
    using postsink::core::StatusDomain;
    EXPECT_STREQ(postsink::core::status_domain_name(StatusDomain::Core), "Core");
    EXPECT_STREQ(postsink::core::status_domain_name(StatusDomain::Storage), "Storage");
    EXPECT_STREQ(postsink::core::status_domain_name(StatusDomain::Net), "Net");
    EXPECT_STREQ(postsink::core::status_domain_name(StatusDomain::Tls), "Tls");
    EXPECT_STREQ(postsink::core::status_domain_name(StatusDomain::Http), "Http");
    EXPECT_STREQ(postsink::core::status_domain_name(StatusDomain::Fcgi), "Fcgi");
    EXPECT_STREQ(postsink::core::status_domain_name(StatusDomain::Cli), "Cli");
    EXPECT_STREQ(postsink::core::status_domain_name(static_cast<StatusDomain>(7)), "Unknown");
}

TEST(Status, CliIndexIsNotAnErrno) {
    const auto cli = postsink::core::make_status(postsink::core::StatusDomain::Cli,
                                                 postsink::core::StatusCode::Invalid, 2);
    EXPECT_FALSE(postsink::core::carries_errno(cli));
    char buf[64];
    postsink::core::status_describe(cli, buf, sizeof(buf));
    EXPECT_STREQ(buf, "Cli/Invalid");

    const auto sock = postsink::core::make_status(postsink::core::StatusDomain::Net,
                                                  postsink::core::StatusCode::Invalid, ENAMETOOLONG);
    EXPECT_TRUE(postsink::core::carries_errno(sock));
    EXPECT_FALSE(postsink::core::carries_errno(postsink::core::ok_status()));
}

TEST(Log, LinesAreTimestamped) {
    std::FILE* sink = std::tmpfile();
    ASSERT_NE(sink, nullptr);
    postsink::core::log_set_sink(sink);
    postsink::core::log_printf("Listening for requests on %s", "127.0.0.1:1");
    postsink::core::log_set_sink(nullptr);

    std::rewind(sink);
    char line[256]{};
    ASSERT_NE(std::fgets(line, sizeof(line), sink), nullptr);
    std::fclose(sink);

    const std::string text(line);
    // "YYYY/MM/DD HH:MM:SS "
    ASSERT_GT(text.size(), 20u);
    EXPECT_EQ(text[4], '/');
    EXPECT_EQ(text[7], '/');
    EXPECT_EQ(text[13], ':');
    EXPECT_EQ(text.substr(20), "Listening for requests on 127.0.0.1:1\n");
}
