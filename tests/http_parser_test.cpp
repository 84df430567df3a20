#include <gtest/gtest.h>

#include <string>

#include "ph/internal/http_parser.hpp"

using namespace ph::internal;

TEST(HttpParser, FirstLineStopsAtCrlf) {
    EXPECT_EQ(first_request_line("GET /index.html HTTP/1.1\r\nHost: x\r\n\r\n"),
              "GET /index.html HTTP/1.1");
    EXPECT_EQ(first_request_line("no line break at all"), "no line break at all");
    EXPECT_EQ(first_request_line("\r\nHost: x"), "");
    // a bare LF is not a line terminator here
    EXPECT_EQ(first_request_line("GET /\nHost: x\r\n"), "GET /\nHost: x");
}

TEST(HttpParser, OnlyGetAndPostAreLogged) {
    EXPECT_TRUE(is_logged_request_line("GET / HTTP/1.1"));
    EXPECT_TRUE(is_logged_request_line("POST /offer HTTP/1.1"));
    EXPECT_TRUE(is_logged_request_line("GETX"));  // prefix match, as observed
    EXPECT_FALSE(is_logged_request_line("PUT / HTTP/1.1"));
    EXPECT_FALSE(is_logged_request_line("HEAD / HTTP/1.1"));
    EXPECT_FALSE(is_logged_request_line("get / HTTP/1.1"));
    EXPECT_FALSE(is_logged_request_line("GE"));
    EXPECT_FALSE(is_logged_request_line(""));
}

TEST(HttpParser, Utf8PrefixCountsCodePoints) {
    const std::string line = "GET /aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa HTTP/1.1";
    EXPECT_EQ(utf8_prefix(line, 40).size(), 40u);
    EXPECT_EQ(utf8_prefix("short", 40), "short");

    // 3 code points, 2 + 3 + 1 bytes
    const std::string mixed = "\xC3\xA9\xE2\x9C\x93z";
    EXPECT_EQ(utf8_prefix(mixed, 1), "\xC3\xA9");
    EXPECT_EQ(utf8_prefix(mixed, 2), "\xC3\xA9\xE2\x9C\x93");
    EXPECT_EQ(utf8_prefix(mixed, 3), mixed);
    EXPECT_EQ(utf8_prefix(mixed, 0), "");

    // "e" + U+0301 COMBINING ACUTE: one grapheme, two code points
    const std::string decomposed = "e\xCC\x81x";
    EXPECT_EQ(utf8_prefix(decomposed, 1), "e");
    EXPECT_EQ(utf8_prefix(decomposed, 2), "e\xCC\x81");
}

TEST(HttpParser, Utf8Validation) {
    auto ok = [](const std::string& s) { return is_valid_utf8(s.data(), s.size()); };
    EXPECT_TRUE(ok(""));
    EXPECT_TRUE(ok("plain ascii\r\n"));
    EXPECT_TRUE(ok("caf\xC3\xA9 \xE2\x9C\x93 \xF0\x9F\x98\x80"));

    EXPECT_FALSE(ok("\xFF\xFE"));
    EXPECT_FALSE(ok("\xC0\xAF"));          // overlong '/'
    EXPECT_FALSE(ok("\xE0\x80\xAF"));      // overlong
    EXPECT_FALSE(ok("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(ok("\xF4\x90\x80\x80"));  // > U+10FFFF
    EXPECT_FALSE(ok("abc\xE2\x9C"));       // truncated sequence
    EXPECT_FALSE(ok("\x80"));              // stray continuation
}

TEST(HttpParser, StaticResponseIsExact) {
    const std::string body = "<p>h\xC3\xA9llo \xE2\x9C\x93</p>";  // 17 bytes, 14 code points
    const std::string expected =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/html; charset=utf-8\r\n"
        "Content-Length: 17\r\n"
        "Connection: close\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "\r\n" + body;
    ASSERT_EQ(body.size(), 17u);
    EXPECT_EQ(build_static_response(body), expected);
}

TEST(HttpParser, StaticResponseWithEmptyBody) {
    const std::string r = build_static_response("");
    EXPECT_NE(r.find("Content-Length: 0\r\n"), std::string::npos);
    EXPECT_EQ(r.substr(r.size() - 4), "\r\n\r\n");
}
