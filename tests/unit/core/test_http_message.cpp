/**
 * @file test_http_message.cpp
 * @brief Unit tests for HTTP framing and response parsing
 */

#include <gtest/gtest.h>

#include <kcenon/media_relay/core/http_message.h>

#include <string>

namespace kcenon::media_relay::test {

// ============================================================================
// Request serialization
// ============================================================================

TEST(HttpRequestTest, GetWithoutBody) {
    http_request request;
    request.path = "/node/connectuser";
    request.headers["Session"] = "abc";

    auto head = serialize_request_head(request);
    EXPECT_EQ(head, "GET /node/connectuser HTTP/1.1\r\nSession: abc\r\n\r\n");
}

TEST(HttpRequestTest, PostBodyGetsContentLength) {
    http_request request;
    request.path = "/project/command";
    request.method = http_method::post;
    request.body = "hello";

    auto text = to_text(serialize_request(request));
    EXPECT_NE(text.find("POST /project/command HTTP/1.1\r\n"), std::string::npos);
    EXPECT_NE(text.find("Content-Length: 5\r\n"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 9), "\r\n\r\nhello");
}

TEST(HttpRequestTest, OverrideReplacesCallerLength) {
    http_request request;
    request.method = http_method::post;
    request.path = "/upload";
    request.headers["content-length"] = "1";

    auto head = serialize_request_head(request, 4096);
    EXPECT_EQ(head.find("content-length: 1"), std::string::npos);
    EXPECT_NE(head.find("Content-Length: 4096\r\n"), std::string::npos);
}

TEST(HttpRequestTest, UrlEncode) {
    EXPECT_EQ(url_encode("clip 01.mp4"), "clip%2001.mp4");
    EXPECT_EQ(url_encode("a&b=c"), "a%26b%3Dc");
    EXPECT_EQ(url_encode("safe-_.~"), "safe-_.~");
}

// ============================================================================
// Response parsing
// ============================================================================

TEST(HttpResponseTest, FindHeaderEnd) {
    auto incomplete = to_bytes("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n");
    EXPECT_FALSE(find_header_end(incomplete).has_value());

    auto complete = to_bytes("HTTP/1.1 200 OK\r\n\r\nxy");
    auto end = find_header_end(complete);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, complete.size() - 2);
}

TEST(HttpResponseTest, ContentLengthIsCaseInsensitive) {
    EXPECT_EQ(parse_content_length("HTTP/1.1 200 OK\r\ncontent-length: 12\r\n\r\n"), 12u);
    EXPECT_EQ(parse_content_length("HTTP/1.1 200 OK\r\nCONTENT-LENGTH:7\r\n\r\n"), 7u);
    EXPECT_FALSE(parse_content_length("HTTP/1.1 200 OK\r\nServer: x\r\n\r\n").has_value());
    EXPECT_FALSE(parse_content_length("HTTP/1.1 200 OK\r\nContent-Length: 1x\r\n\r\n").has_value());
}

TEST(HttpResponseTest, ParseFullResponse) {
    auto raw = to_bytes(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 17\r\n"
        "\r\n"
        "{\"taskID\":\"t-42\"}");
    auto response = parse_response(raw);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status_code, 200);
    EXPECT_EQ(response->status_line, "HTTP/1.1 200 OK");
    EXPECT_TRUE(response->is_success());
    EXPECT_EQ(response->header("content-type"), "application/json");
    EXPECT_EQ(response->body_text(), "{\"taskID\":\"t-42\"}");
}

TEST(HttpResponseTest, ErrorStatus) {
    auto response = parse_response(to_bytes("HTTP/1.1 404 Not Found\r\n\r\n"));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status_code, 404);
    EXPECT_FALSE(response->is_success());
    EXPECT_TRUE(response->body.empty());
}

TEST(HttpResponseTest, EmptyReasonPhrase) {
    auto response = parse_response(to_bytes("HTTP/1.1 200 \r\nContent-Length: 2\r\n\r\nok"));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status_code, 200);
    EXPECT_EQ(response->body_text(), "ok");

    auto bare = parse_response(to_bytes("HTTP/1.1 204\r\n\r\n"));
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->status_code, 204);
}

TEST(HttpResponseTest, MalformedStatusLine) {
    EXPECT_FALSE(parse_response(to_bytes("garbage\r\n\r\n")).has_value());
    EXPECT_FALSE(parse_response(to_bytes("HTTP/1.1 abc OK\r\n\r\n")).has_value());
    EXPECT_FALSE(parse_response(to_bytes("HTTP/1.1 20x OK\r\n\r\n")).has_value());
    EXPECT_FALSE(parse_response(to_bytes(" 200 OK\r\n\r\n")).has_value());
    EXPECT_FALSE(parse_response(to_bytes("HTTP/1.1 200 OK\r\n")).has_value());
}

TEST(HttpResponseTest, CaseInsensitiveCompare) {
    EXPECT_TRUE(equals_ignore_case("Content-Length", "content-LENGTH"));
    EXPECT_FALSE(equals_ignore_case("Content-Length", "Content-Type"));
    EXPECT_FALSE(equals_ignore_case("abc", "abcd"));
}

}  // namespace kcenon::media_relay::test
