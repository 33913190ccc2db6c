#include <gtest/gtest.h>

#include <string>

#include "postsink/http/message.hpp"
#include "postsink/http/parser.hpp"

using namespace postsink::http;
using postsink::core::StatusCode;
using postsink::core::is_ok;

namespace {
    ParseResult parse(const std::string& text, RequestHead* head, u32* consumed) {
        return parse_request_head({reinterpret_cast<const u8*>(text.data()), static_cast<u32>(text.size())},
                                  head, consumed);
    }
} // namespace

// ============================================================================
// Request head
// ============================================================================

TEST(HttpParser, ParsesRequestLineAndFields) {
    const std::string text =
        "POST /upload?x=1 HTTP/1.1\r\n"
        "Host: example.test\r\n"
        "User-Agent:  curl/8.0  \r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello";
    RequestHead head;
    u32 consumed = 0;
    ASSERT_EQ(parse(text, &head, &consumed), ParseResult::Ok);
    EXPECT_EQ(consumed, text.size() - 5);
    EXPECT_EQ(head.method, "POST");
    EXPECT_EQ(head.target, "/upload?x=1");
    EXPECT_EQ(head.proto, "HTTP/1.1");
    EXPECT_EQ(head.minor, 1);
    ASSERT_EQ(head.fields.size(), 3u);

    const std::string* ua = find_header(head, "user-agent");
    ASSERT_NE(ua, nullptr);
    EXPECT_EQ(*ua, "curl/8.0");
}

TEST(HttpParser, AcceptsBareLineFeeds) {
    RequestHead head;
    u32 consumed = 0;
    ASSERT_EQ(parse("GET / HTTP/1.0\nHost: a\n\n", &head, &consumed), ParseResult::Ok);
    EXPECT_EQ(head.minor, 0);
    EXPECT_EQ(consumed, 24u);
}

TEST(HttpParser, NeedMoreUntilBlankLine) {
    RequestHead head;
    u32 consumed = 0;
    EXPECT_EQ(parse("", &head, &consumed), ParseResult::NeedMore);
    EXPECT_EQ(parse("POST /a HTTP/1.1\r\n", &head, &consumed), ParseResult::NeedMore);
    EXPECT_EQ(parse("POST /a HTTP/1.1\r\nHost: a\r\n", &head, &consumed), ParseResult::NeedMore);
}

TEST(HttpParser, RejectsMalformedHeads) {
    RequestHead head;
    u32 consumed = 0;
    EXPECT_EQ(parse("POST /a\r\n\r\n", &head, &consumed), ParseResult::Invalid);
    EXPECT_EQ(parse("POST /a HTTP/2.0\r\n\r\n", &head, &consumed), ParseResult::Invalid);
    EXPECT_EQ(parse("PO ST /a HTTP/1.1\r\n\r\n", &head, &consumed), ParseResult::Invalid);
    EXPECT_EQ(parse("POST /a HTTP/1.1\r\nNoColon\r\n\r\n", &head, &consumed), ParseResult::Invalid);
    EXPECT_EQ(parse("POST /a HTTP/1.1\r\nBad Name: x\r\n\r\n", &head, &consumed), ParseResult::Invalid);
    EXPECT_EQ(parse("POST /a HTTP/1.1\r\nA: b\r\n folded\r\n\r\n", &head, &consumed), ParseResult::Invalid);
}

TEST(HttpParser, OversizedHeadIsTooLarge) {
    std::string text = "POST /a HTTP/1.1\r\nX-Fill: ";
    text.append(kMaxHeadBytes, 'f');
    RequestHead head;
    u32 consumed = 0;
    EXPECT_EQ(parse(text, &head, &consumed), ParseResult::TooLarge);
}

TEST(HttpParser, TooManyFieldsIsTooLarge) {
    std::string text = "POST /a HTTP/1.1\r\n";
    for (u32 i = 0; i <= kMaxHeaderFields; ++i) {
        text += "X-" + std::to_string(i) + ": v\r\n";
    }
    text += "\r\n";
    RequestHead head;
    u32 consumed = 0;
    EXPECT_EQ(parse(text, &head, &consumed), ParseResult::TooLarge);
}

// ============================================================================
// Targets
// ============================================================================

TEST(HttpParser, TargetPathStripsQueryAndDecodes) {
    std::string path;
    ASSERT_TRUE(is_ok(target_path("/a%20b/c?x=%zz", &path)));
    EXPECT_EQ(path, "/a b/c");

    ASSERT_TRUE(is_ok(target_path("/a%2Fb", &path)));
    EXPECT_EQ(path, "/a/b");

    ASSERT_TRUE(is_ok(target_path("http://example.test/up/load?q", &path)));
    EXPECT_EQ(path, "/up/load");

    ASSERT_TRUE(is_ok(target_path("https://example.test", &path)));
    EXPECT_EQ(path, "/");
}

TEST(HttpParser, TargetPathRejectsBadForms) {
    std::string path;
    EXPECT_FALSE(is_ok(target_path("", &path)));
    EXPECT_FALSE(is_ok(target_path("relative/path", &path)));
    EXPECT_FALSE(is_ok(target_path("/bad%4", &path)));
    EXPECT_FALSE(is_ok(target_path("/bad%g1", &path)));
    EXPECT_FALSE(is_ok(target_path("ftp://host/x", &path)));
}

TEST(HttpParser, PercentDecodeLeavesPlus) {
    std::string out;
    ASSERT_TRUE(percent_decode("a+b%41", &out));
    EXPECT_EQ(out, "a+bA");
}

// ============================================================================
// Body framing and connection management
// ============================================================================

namespace {
    RequestHead head_with(std::initializer_list<HeaderField> fields, u8 minor = 1) {
        RequestHead h;
        h.method = "POST";
        h.target = "/";
        h.proto = minor == 1 ? "HTTP/1.1" : "HTTP/1.0";
        h.minor = minor;
        h.fields = fields;
        return h;
    }
} // namespace

TEST(HttpParser, BodyPlanFromContentLength) {
    BodyPlan plan;
    ASSERT_TRUE(is_ok(body_plan(head_with({{"Content-Length", "42"}}), &plan)));
    EXPECT_EQ(plan.framing, BodyFraming::Length);
    EXPECT_EQ(plan.length, 42u);

    ASSERT_TRUE(is_ok(body_plan(head_with({}), &plan)));
    EXPECT_EQ(plan.framing, BodyFraming::None);

    ASSERT_TRUE(is_ok(body_plan(head_with({{"Content-Length", "7"}, {"content-length", "7"}}), &plan)));
    EXPECT_EQ(plan.length, 7u);
}

TEST(HttpParser, BodyPlanRejectsBadLengths) {
    BodyPlan plan;
    EXPECT_EQ(body_plan(head_with({{"Content-Length", "-1"}}), &plan).code, StatusCode::Invalid);
    EXPECT_EQ(body_plan(head_with({{"Content-Length", "12a"}}), &plan).code, StatusCode::Invalid);
    EXPECT_EQ(body_plan(head_with({{"Content-Length", "1"}, {"Content-Length", "2"}}), &plan).code,
              StatusCode::Invalid);
}

TEST(HttpParser, ChunkedOverridesLength) {
    BodyPlan plan;
    ASSERT_TRUE(is_ok(body_plan(head_with({{"Content-Length", "3"}, {"Transfer-Encoding", "Chunked"}}), &plan)));
    EXPECT_EQ(plan.framing, BodyFraming::Chunked);

    EXPECT_EQ(body_plan(head_with({{"Transfer-Encoding", "gzip"}}), &plan).code, StatusCode::Unsupported);
}

TEST(HttpParser, KeepAliveRules) {
    EXPECT_TRUE(wants_keep_alive(head_with({})));
    EXPECT_FALSE(wants_keep_alive(head_with({{"Connection", "close"}})));
    EXPECT_FALSE(wants_keep_alive(head_with({}, 0)));
    EXPECT_TRUE(wants_keep_alive(head_with({{"Connection", "Keep-Alive"}}, 0)));
    EXPECT_FALSE(wants_keep_alive(head_with({{"Connection", "keep-alive, close"}})));
}

TEST(HttpParser, ExpectContinue) {
    EXPECT_TRUE(expects_continue(head_with({{"Expect", "100-continue"}})));
    EXPECT_FALSE(expects_continue(head_with({{"Expect", "100-continue"}}, 0)));
    EXPECT_FALSE(expects_continue(head_with({})));
}

// ============================================================================
// Responses
// ============================================================================

TEST(HttpMessage, SuccessResponseHasBareCount) {
    const std::string r = format_response(200, "12", ConnectionHeader::None);
    EXPECT_EQ(r,
              "HTTP/1.1 200 OK\r\n"
              "Content-Type: text/plain; charset=utf-8\r\n"
              "Content-Length: 2\r\n"
              "\r\n"
              "12");
}

TEST(HttpMessage, ErrorResponseAddsNewlineAndNosniff) {
    const std::string r = format_response(405, "Invalid method", ConnectionHeader::Close);
    EXPECT_EQ(r,
              "HTTP/1.1 405 Method Not Allowed\r\n"
              "Content-Type: text/plain; charset=utf-8\r\n"
              "X-Content-Type-Options: nosniff\r\n"
              "Content-Length: 15\r\n"
              "Connection: close\r\n"
              "\r\n"
              "Invalid method\n");
}
