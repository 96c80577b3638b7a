#include "url.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>

using namespace volley;

TEST(URLTest, ParsesHostPortPathAndQuery) {
    URL url = URL::parse("http://Example.COM:8080/a/b?x=1&y=2#frag");
    EXPECT_EQ(url.scheme, "http");
    EXPECT_EQ(url.host, "example.com");
    EXPECT_EQ(url.port, 8080);
    EXPECT_EQ(url.path, "/a/b");
    EXPECT_EQ(url.query, "x=1&y=2");
    EXPECT_EQ(url.target(), "/a/b?x=1&y=2");
}

TEST(URLTest, DefaultsPortAndPath) {
    URL http = URL::parse("http://example.com");
    EXPECT_EQ(http.port, 80);
    EXPECT_EQ(http.path, "/");
    EXPECT_FALSE(http.is_tls());

    URL https = URL::parse("HTTPS://example.com?q");
    EXPECT_EQ(https.port, 443);
    EXPECT_EQ(https.path, "/");
    EXPECT_EQ(https.query, "q");
    EXPECT_TRUE(https.is_tls());
}

TEST(URLTest, ParsesIPv6AndDropsUserinfo) {
    URL url = URL::parse("http://user:pw@[::1]:9000/x");
    EXPECT_EQ(url.host, "::1");
    EXPECT_EQ(url.port, 9000);
    EXPECT_EQ(url.to_string(), "http://[::1]:9000/x");
}

TEST(URLTest, RejectsBadInput) {
    EXPECT_THROW(URL::parse("example.com/path"), MissingSchema);
    EXPECT_THROW(URL::parse("ftp://example.com/"), InvalidSchema);
    EXPECT_THROW(URL::parse("http:///path"), InvalidURL);
    EXPECT_THROW(URL::parse("http://example.com:99999/"), InvalidURL);
    EXPECT_THROW(URL::parse("http://example.com:abc/"), InvalidURL);
    EXPECT_THROW(URL::parse("http://[::1/"), InvalidURL);
}

TEST(URLTest, MissingSchemaIsAnInvalidURL) {
    try {
        URL::parse("localhost:8080");
        FAIL() << "expected an exception";
    } catch (const InvalidURL&) {
        SUCCEED();
    }
}

TEST(URLTest, AddParamsEncodesValues) {
    URL url = URL::parse("http://example.com/search?lang=en");
    url.add_params({{"q", "a b&c"}, {"page", "2"}});
    EXPECT_EQ(url.query, "lang=en&q=a%20b%26c&page=2");
}

TEST(URLTest, ToStringOmitsDefaultPort) {
    EXPECT_EQ(URL::parse("https://example.com:443/p").to_string(), "https://example.com/p");
    EXPECT_EQ(URL::parse("http://example.com:81/p?q=1").to_string(),
              "http://example.com:81/p?q=1");
}

TEST(URLTest, ResolvesRedirectLocations) {
    URL base = URL::parse("http://example.com/a/b/c?old=1");

    EXPECT_EQ(base.resolve("https://other.org/x").to_string(), "https://other.org/x");
    EXPECT_EQ(base.resolve("//cdn.example.com/lib.js").to_string(),
              "http://cdn.example.com/lib.js");
    EXPECT_EQ(base.resolve("/root?z=9").to_string(), "http://example.com/root?z=9");
    EXPECT_EQ(base.resolve("d").to_string(), "http://example.com/a/b/d");
    EXPECT_EQ(base.resolve("../d").to_string(), "http://example.com/a/d");
    EXPECT_EQ(base.resolve("./").to_string(), "http://example.com/a/b/");
    EXPECT_EQ(base.resolve("?new=2").to_string(), "http://example.com/a/b/c?new=2");
}

TEST(URLTest, PercentEncodeKeepsUnreserved) {
    EXPECT_EQ(percent_encode("AZaz09-_.~"), "AZaz09-_.~");
    EXPECT_EQ(percent_encode("/?="), "%2F%3F%3D");
}
