#include "utilities/errors.h"
#include "utilities/http.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace gutex;

TEST(HttpUtils, GenerateRequestString) {
  HTTP::HTTPREQUEST req;
  req.method = HTTP::HttpMethod::GET;
  req.uri = "/cache/epub/84/pg84.txt";
  req.headers["Range"] = HTTP::FormatRangeHeader(0, 4095);

  std::string raw = HTTP::GenerateHttpRequestString(req);
  EXPECT_EQ(raw.rfind("GET /cache/epub/84/pg84.txt HTTP/1.1\r\n", 0), 0u);
  EXPECT_NE(raw.find("Range: bytes=0-4095\r\n"), std::string::npos);
  EXPECT_EQ(raw.substr(raw.size() - 4), "\r\n\r\n");
}

TEST(HttpUtils, MethodNames) {
  EXPECT_EQ(HTTP::StringToHttpMethod("HEAD"), HTTP::HttpMethod::HEAD);
  EXPECT_EQ(HTTP::StringToHttpMethod("POST"), HTTP::HttpMethod::INVALID);
  EXPECT_EQ(HTTP::HttpMethodToString(HTTP::HttpMethod::GET), "GET");
}

TEST(HttpUtils, ParseResponseWithContentLength) {
  auto resp = HTTP::ParseHttpResponse("HTTP/1.1 206 Partial Content\r\n"
                                      "Content-Type: text/plain\r\n"
                                      "Content-Length: 5\r\n"
                                      "ETag: \"v1\"\r\n"
                                      "\r\n"
                                      "helloEXTRA");
  EXPECT_EQ(resp.protocol, "HTTP/1.1");
  EXPECT_EQ(resp.statusCodeNumber, 206);
  EXPECT_EQ(resp.reasonPhrase, "Partial Content");
  EXPECT_EQ(resp.contentType, "text/plain");
  EXPECT_EQ(resp.body, "hello");
  ASSERT_TRUE(HTTP::FindHeader(resp.headers, "etag"));
  EXPECT_EQ(*HTTP::FindHeader(resp.headers, "ETAG"), "\"v1\"");
  EXPECT_FALSE(HTTP::FindHeader(resp.headers, "Last-Modified"));
}

TEST(HttpUtils, ParseChunkedResponse) {
  auto resp = HTTP::ParseHttpResponse("HTTP/1.1 200 OK\r\n"
                                      "Transfer-Encoding: chunked\r\n"
                                      "\r\n"
                                      "5\r\nhello\r\n"
                                      "7;ext=1\r\n, world\r\n"
                                      "0\r\n\r\n");
  EXPECT_EQ(resp.body, "hello, world");
}

TEST(HttpUtils, MalformedResponsesThrow) {
  EXPECT_THROW(HTTP::ParseHttpResponse("garbage"), GutexError);
  EXPECT_THROW(HTTP::ParseHttpResponse("NOTHTTP 200 OK\r\n\r\n"), GutexError);
  EXPECT_THROW(HTTP::ParseHttpResponse("HTTP/1.1 200 OK\r\n"
                                       "Transfer-Encoding: chunked\r\n\r\n"
                                       "zz\r\nabc\r\n"),
               GutexError);
}

TEST(HttpUtils, ParseUrl) {
  auto url = HTTP::ParseUrl("https://www.gutenberg.org/cache/epub/1/pg1.txt");
  EXPECT_EQ(url.scheme, "https");
  EXPECT_EQ(url.host, "www.gutenberg.org");
  EXPECT_EQ(url.port, "443");
  EXPECT_EQ(url.target, "/cache/epub/1/pg1.txt");

  auto local = HTTP::ParseUrl("http://127.0.0.1:8080");
  EXPECT_EQ(local.port, "8080");
  EXPECT_EQ(local.target, "/");
  EXPECT_EQ(local.toString(), "http://127.0.0.1:8080/");

  auto v6 = HTTP::ParseUrl("http://[::1]:9000/x?y=1#frag");
  EXPECT_EQ(v6.host, "::1");
  EXPECT_EQ(v6.port, "9000");
  EXPECT_EQ(v6.target, "/x?y=1");

  EXPECT_THROW(HTTP::ParseUrl("ftp://mirror.example.org/"), std::invalid_argument);
  EXPECT_THROW(HTTP::ParseUrl("no-scheme"), std::invalid_argument);
  EXPECT_THROW(HTTP::ParseUrl("http:///path"), std::invalid_argument);
}

TEST(HttpUtils, ResolveLocation) {
  const std::string base = "http://mirror.example.org/dir/file.txt";
  EXPECT_EQ(HTTP::ResolveLocation(base, "https://other.example.org/a"),
            "https://other.example.org/a");
  EXPECT_EQ(HTTP::ResolveLocation(base, "/root.txt"),
            "http://mirror.example.org/root.txt");
  EXPECT_EQ(HTTP::ResolveLocation(base, "sibling.txt"),
            "http://mirror.example.org/dir/sibling.txt");
  EXPECT_EQ(HTTP::ResolveLocation(base, "//cdn.example.org/x"),
            "http://cdn.example.org/x");
}

TEST(HttpUtils, Trim) {
  EXPECT_EQ(trim("  value \r\n"), "value");
  EXPECT_EQ(trim(" \t "), "");
}
