#include <gtest/gtest.h>

#include <boost/beast/http.hpp>
#include <map>
#include <string>

#include "pinfetch/request.hpp"
#include "pinfetch/target.hpp"

using namespace pinfetch;
namespace http = boost::beast::http;

namespace {

    Target target_of(const std::string& url) {
        auto t = resolve_target(url);
        EXPECT_TRUE(t.has_value()) << url;
        return t.value();
    }

}  // namespace

TEST(PrepareGetTest, HostHeaderIsLogicalHost) {
    auto r = prepare_get(target_of("https://example.com/"), "test-agent");
    ASSERT_TRUE(r.has_value()) << r.error().message;
    const auto& req = r.value().beast_req;
    EXPECT_EQ(req.method(), http::verb::get);
    EXPECT_EQ(req.target(), "/");
    EXPECT_EQ(req[http::field::host], "example.com");
    EXPECT_EQ(req[http::field::user_agent], "test-agent");
    EXPECT_TRUE(req.keep_alive());
    EXPECT_EQ(req.version(), 11u);
}

TEST(PrepareGetTest, ExplicitPortInHostHeader) {
    auto r = prepare_get(target_of("https://example.com:8443/path?x=1"), "ua");
    ASSERT_TRUE(r.has_value());
    const auto& req = r.value().beast_req;
    EXPECT_EQ(req.target(), "/path?x=1");
    EXPECT_EQ(req[http::field::host], "example.com:8443");
    EXPECT_EQ(r.value().endpoint.address(), "example.com:8443");
    EXPECT_TRUE(r.value().endpoint.https);
}

TEST(PrepareGetTest, EmptyUserAgentLeftUnset) {
    auto r = prepare_get(target_of("http://example.com/"), "");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r.value().beast_req.find(http::field::user_agent) ==
                r.value().beast_req.end());
}

TEST(PrepareGetTest, ExtraHeaders) {
    std::map<std::string, std::string> headers = {{"X-Test", "foo"},
                                                  {"Accept", "*/*"}};
    auto r = prepare_get(target_of("http://example.com/"), "ua", headers);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().beast_req["X-Test"], "foo");
    EXPECT_EQ(r.value().beast_req["Accept"], "*/*");
}

TEST(PrepareGetTest, HostCannotBeOverridden) {
    auto r = prepare_get(target_of("http://example.com/"), "ua",
                         {{"host", "evil.example"}});
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::RequestBuildFailed);
}

TEST(PrepareGetTest, InvalidHeaderText) {
    auto bad_name = prepare_get(target_of("http://example.com/"), "ua",
                                {{"Bad Name", "v"}});
    ASSERT_TRUE(bad_name.has_error());
    EXPECT_EQ(bad_name.error().code, Error::Code::RequestBuildFailed);

    auto bad_value = prepare_get(target_of("http://example.com/"), "ua",
                                 {{"X-Ok", "line\r\nInjected: 1"}});
    ASSERT_TRUE(bad_value.has_error());
    EXPECT_EQ(bad_value.error().code, Error::Code::RequestBuildFailed);
}

TEST(PrepareGetTest, UnsupportedSchemeWithExplicitPort) {
    auto r = prepare_get(target_of("gopher://example.com:70/"), "ua");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::RequestBuildFailed);
}

TEST(RequestUtilsTest, EscapeRequestTarget) {
    using request_utils::escape_request_target;
    EXPECT_EQ(escape_request_target("/a b"), "/a%20b");
    EXPECT_EQ(escape_request_target("/ok%20already"), "/ok%20already");
    EXPECT_EQ(escape_request_target("/caf\xc3\xa9"), "/caf%C3%A9");
}
