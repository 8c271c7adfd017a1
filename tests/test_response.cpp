#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "pinfetch/response.hpp"

using pinfetch::canonical_header_key;
using pinfetch::parse_beast_response;
using pinfetch::Response;

TEST(ResponseTest, CanonicalHeaderKey) {
    EXPECT_EQ(canonical_header_key("content-type"), "Content-Type");
    EXPECT_EQ(canonical_header_key("X-REQUEST-ID"), "X-Request-Id");
    EXPECT_EQ(canonical_header_key("etag"), "Etag");
    EXPECT_EQ(canonical_header_key("bad name"), "bad name");
}

TEST(ResponseTest, ParseBeastResponseKeepsEveryValue) {
    namespace http = boost::beast::http;
    http::response<http::string_body> beast_res;
    beast_res.result(http::status::ok);
    beast_res.version(11);
    beast_res.insert("set-cookie", "a=1");
    beast_res.insert("Set-Cookie", "b=2");
    beast_res.set(http::field::content_type, "text/plain");
    beast_res.body() = "hello";
    beast_res.prepare_payload();

    Response out = parse_beast_response(std::move(beast_res));
    EXPECT_EQ(out.status_code, 200);
    EXPECT_EQ(out.status(), "200 OK");
    EXPECT_EQ(out.protocol(), "HTTP/1.1");
    EXPECT_EQ(out.headers["Set-Cookie"],
              (std::vector<std::string>{"a=1", "b=2"}));
    EXPECT_EQ(out.header("content-type"), "text/plain");
    EXPECT_EQ(out.header("Content-Length"), "5");
    EXPECT_EQ(out.body, "hello");
}

TEST(ResponseTest, CustomReasonPhraseIsKept) {
    namespace http = boost::beast::http;
    http::response<http::string_body> beast_res;
    beast_res.result(418);
    beast_res.reason("Short And Stout");
    beast_res.version(10);

    Response out = parse_beast_response(std::move(beast_res));
    EXPECT_EQ(out.status(), "418 Short And Stout");
    EXPECT_EQ(out.protocol(), "HTTP/1.0");
}

TEST(ResponseTest, MissingHeaderIsEmpty) {
    Response r;
    EXPECT_EQ(r.header("X-Nope"), "");
}
