#include <array>

#include <gtest/gtest.h>

#include "postsink/cli/options.hpp"

namespace cli = postsink::cli;
using postsink::core::Status;
using postsink::core::StatusCode;

namespace {
    constexpr std::array<cli::OptionSpec, 4> kSpecs = {{
        {cli::OptionId::Http, cli::OptionType::Flag, "http", '\0'},
        {cli::OptionId::Listen, cli::OptionType::String, "listen", 'l'},
        {cli::OptionId::Dir, cli::OptionType::String, "dir", 'd'},
        {cli::OptionId::Help, cli::OptionType::Flag, "help", 'h'},
    }};

    Status parse(const char* const* argv, cli::u32 argc, cli::ParsedOptions* out, cli::u32* consumed) {
        return cli::parse_options({argv, argc}, kSpecs.data(), static_cast<cli::u32>(kSpecs.size()), out, consumed);
    }
} // namespace

TEST(CliOptions, ParsesLongAndShortAndStopsAtPositional) {
    const char* argv[] = {"--http", "--listen", ":8080", "-d", "out", "extra", "--help"};
    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    cli::u32 consumed = 0;
    const Status s = parse(argv, 7, &out, &consumed);
    ASSERT_EQ(s.code, StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].id, cli::OptionId::Http);
    EXPECT_EQ(out.data[0].type, cli::OptionType::Flag);
    EXPECT_EQ(out.data[0].str, nullptr);

    EXPECT_EQ(out.data[1].id, cli::OptionId::Listen);
    EXPECT_STREQ(out.data[1].str, ":8080");

    EXPECT_EQ(out.data[2].id, cli::OptionId::Dir);
    EXPECT_STREQ(out.data[2].str, "out");
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const char* argv[] = {"--listen=127.0.0.1:1", "-dposts", "-l=[::1]:2"};
    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    cli::u32 consumed = 0;
    const Status s = parse(argv, 3, &out, &consumed);
    ASSERT_EQ(s.code, StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 3u);
    EXPECT_STREQ(out.data[0].str, "127.0.0.1:1");
    EXPECT_STREQ(out.data[1].str, "posts");
    EXPECT_STREQ(out.data[2].str, "[::1]:2");
}

TEST(CliOptions, SingleDashLongNames) {
    const char* argv[] = {"-http", "-dir", "spool", "-listen=:1"};
    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    cli::u32 consumed = 0;
    const Status s = parse(argv, 4, &out, &consumed);
    ASSERT_EQ(s.code, StatusCode::Ok);
    ASSERT_EQ(out.len, 3u);
    EXPECT_EQ(out.data[0].id, cli::OptionId::Http);
    EXPECT_EQ(out.data[1].id, cli::OptionId::Dir);
    EXPECT_STREQ(out.data[1].str, "spool");
    EXPECT_STREQ(out.data[2].str, ":1");
}

TEST(CliOptions, StopsAtDoubleDash) {
    const char* argv[] = {"-l", "x:1", "--", "--http"};
    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    cli::u32 consumed = 0;
    const Status s = parse(argv, 4, &out, &consumed);
    ASSERT_EQ(s.code, StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_STREQ(out.data[0].str, "x:1");
}

TEST(CliOptions, InvalidReportsTokenIndex) {
    cli::ParsedOption buf[4]{};
    cli::ParsedOptions out{buf, 0, 4};
    cli::u32 consumed = 0;
    {
        const char* argv[] = {"--http", "--nope"};
        const Status s = parse(argv, 2, &out, &consumed);
        EXPECT_EQ(s.code, StatusCode::Invalid);
        EXPECT_EQ(s.aux, 1u);
    }
    {
        const char* argv[] = {"-d"};
        const Status s = parse(argv, 1, &out, &consumed);
        EXPECT_EQ(s.code, StatusCode::Invalid);
        EXPECT_EQ(s.aux, 0u);
    }
    {
        const char* argv[] = {"--http=yes"};
        EXPECT_EQ(parse(argv, 1, &out, &consumed).code, StatusCode::Invalid);
    }
    {
        const char* argv[] = {"-hx"};
        EXPECT_EQ(parse(argv, 1, &out, &consumed).code, StatusCode::Invalid);
    }
}

TEST(CliOptions, TooManyOptions) {
    const char* argv[] = {"--http", "--http", "--http"};
    cli::ParsedOption buf[2]{};
    cli::ParsedOptions out{buf, 0, 2};
    cli::u32 consumed = 0;
    const Status s = parse(argv, 3, &out, &consumed);
    EXPECT_EQ(s.code, StatusCode::TooLarge);
    EXPECT_EQ(s.aux, 2u);
}
