/**
 * @file test_http_message.cpp
 * @brief Unit tests for the minimal HTTP/1.1 request and response handling
 */

#include "rigd/common/http_message.hpp"

#include <gtest/gtest.h>

using namespace rigd::common;

TEST(HttpMessageTest, ParsesRequestHead) {
    const auto request = parseRequestHead(
        "POST /freq?x=1 HTTP/1.1\r\nHost: localhost\r\nContent-Type: application/json\r\nContent-Length: 18");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method, "POST");
    EXPECT_EQ(request->target, "/freq?x=1");
    EXPECT_EQ(request->path, "/freq");
    EXPECT_EQ(request->version, "HTTP/1.1");
    EXPECT_EQ(request->header("content-type"), "application/json");
    EXPECT_EQ(request->header("CONTENT-TYPE"), "application/json");
    EXPECT_EQ(request->contentLength(), 18u);
}

TEST(HttpMessageTest, MissingContentLengthIsZero) {
    const auto request = parseRequestHead("GET /status HTTP/1.1\r\nHost: x");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->contentLength(), 0u);
}

TEST(HttpMessageTest, RejectsMalformedRequestLine) {
    EXPECT_FALSE(parseRequestHead("GET\r\n").has_value());
    EXPECT_FALSE(parseRequestHead("GET /status SPDY/3").has_value());
    EXPECT_FALSE(parseRequestHead("GET /status HTTP/1.1\r\nbroken header").has_value());
}

TEST(HttpMessageTest, SerializesJsonResponse) {
    auto response = HttpResponse::json(200, nlohmann::json{{"success", true}});
    const auto text = response.serialize();

    EXPECT_EQ(text.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(text.find("content-type: application/json\r\n"), std::string::npos);
    EXPECT_NE(text.find("content-length: 16\r\n"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 16), "{\"success\":true}");
}

TEST(HttpMessageTest, ErrorResponseCarriesMessage) {
    const auto response = HttpResponse::error(403, "PTT disabled in configuration");
    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(nlohmann::json::parse(response.body)["error"], "PTT disabled in configuration");
}

TEST(HttpMessageTest, ParsesResponseAndTruncatesBody) {
    const auto response = parseResponse("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello world");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 200);
    EXPECT_EQ(response->body, "hello");
}

TEST(HttpMessageTest, IncompleteResponseIsRejected) {
    EXPECT_FALSE(parseResponse("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n").has_value());
    EXPECT_FALSE(parseResponse("garbage\r\n\r\n").has_value());
}
