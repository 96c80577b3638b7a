#include "response.hpp"
#include "errors.hpp"
#include "options.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <string>

using namespace volley;

namespace {

// Hands out a fixed string in small reads
class StringReader : public BodyReader {
public:
    explicit StringReader(std::string data, size_t step = 3)
        : data_(std::move(data)), step_(step) {}

    size_t read(uint8_t* buf, size_t len) override {
        size_t n = std::min({len, step_, data_.size() - pos_});
        std::copy(data_.begin() + pos_, data_.begin() + pos_ + n, buf);
        pos_ += n;
        return n;
    }

private:
    std::string data_;
    size_t step_;
    size_t pos_ = 0;
};

} // namespace

TEST(HeadersTest, LookupIsCaseInsensitive) {
    Headers headers{{"Content-Type", "text/plain"}};
    EXPECT_EQ(headers.get("content-type").value_or(""), "text/plain");
    EXPECT_TRUE(headers.contains("CONTENT-TYPE"));
    EXPECT_FALSE(headers.get("Accept").has_value());

    headers.set("content-TYPE", "application/json");
    EXPECT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers.get("Content-Type").value_or(""), "application/json");

    EXPECT_TRUE(headers.erase("CONTENT-type"));
    EXPECT_TRUE(headers.empty());
}

TEST(HeadersTest, AddFoldsRepeatedFields) {
    Headers headers;
    headers.add("Vary", "Accept");
    headers.add("vary", "Origin");
    EXPECT_EQ(headers.get("Vary").value_or(""), "Accept, Origin");
}

TEST(HeadersTest, UpdateReplacesByName) {
    Headers base{{"Accept", "*/*"}, {"X-One", "1"}};
    Headers extra{{"accept", "text/html"}, {"X-Two", "2"}};
    base.update(extra);
    EXPECT_EQ(base.size(), 3u);
    EXPECT_EQ(base.get("Accept").value_or(""), "text/html");
}

TEST(ResponseTest, OkAndRaiseForStatus) {
    Response resp;
    resp.status_code = 204;
    EXPECT_TRUE(resp.ok());
    EXPECT_NO_THROW(resp.raise_for_status());

    resp.status_code = 404;
    resp.reason = "Not Found";
    resp.url = "http://example.com/missing";
    EXPECT_FALSE(resp.ok());
    try {
        resp.raise_for_status();
        FAIL() << "expected HTTPError";
    } catch (const HTTPError& e) {
        EXPECT_EQ(e.status_code(), 404);
        EXPECT_NE(std::string(e.what()).find("Client Error"), std::string::npos);
    }

    resp.status_code = 503;
    EXPECT_THROW(resp.raise_for_status(), HTTPError);
}

TEST(ResponseTest, RedirectNeedsLocation) {
    Response resp;
    resp.status_code = 302;
    EXPECT_FALSE(resp.is_redirect());
    resp.headers.set("Location", "/next");
    EXPECT_TRUE(resp.is_redirect());
    resp.status_code = 304;
    EXPECT_FALSE(resp.is_redirect());
}

TEST(ResponseTest, ContentReadsStreamedBodyOnce) {
    Response resp;
    resp.set_body_reader(std::make_shared<StringReader>("hello world"));
    EXPECT_TRUE(resp.is_streaming());
    EXPECT_EQ(resp.text(), "hello world");
    EXPECT_FALSE(resp.is_streaming());
    // Cached after the first read
    EXPECT_EQ(resp.text(), "hello world");
}

TEST(ResponseTest, EmptyBodyCanBeReadRepeatedly) {
    Response resp;
    EXPECT_TRUE(resp.content().empty());
    EXPECT_TRUE(resp.content().empty());
}

TEST(ResponseTest, IterContentStreamsThenRefuses) {
    Response resp;
    resp.set_body_reader(std::make_shared<StringReader>("abcdefgh", 8));

    std::string collected;
    size_t calls = 0;
    resp.iter_content(4, [&](const uint8_t* data, size_t len) {
        collected.append(reinterpret_cast<const char*>(data), len);
        calls++;
    });
    EXPECT_EQ(collected, "abcdefgh");
    EXPECT_EQ(calls, 2u);

    EXPECT_THROW(resp.content(), StreamConsumedError);
    EXPECT_THROW(resp.iter_content(4, [](const uint8_t*, size_t) {}), StreamConsumedError);
}

TEST(ResponseTest, IterContentChunksBufferedBody) {
    Response resp;
    resp.set_content({'1', '2', '3', '4', '5'});
    std::vector<size_t> sizes;
    resp.iter_content(2, [&](const uint8_t*, size_t len) { sizes.push_back(len); });
    EXPECT_EQ(sizes, (std::vector<size_t>{2, 2, 1}));
    // Buffered content stays available
    EXPECT_EQ(resp.text(), "12345");
}

TEST(ResponseTest, CloseDropsUnreadStream) {
    Response resp;
    resp.set_body_reader(std::make_shared<StringReader>("unused"));
    resp.close();
    EXPECT_FALSE(resp.is_streaming());
    EXPECT_THROW(resp.content(), StreamConsumedError);
}

TEST(RequestOptionsTest, OverridesWinAndHooksAppend) {
    int first = 0;
    int second = 0;

    RequestOptions base;
    base.headers = Headers{{"Accept", "text/html"}, {"X-Base", "1"}};
    base.timeout = std::chrono::milliseconds(500);
    base.stream = true;
    base.hooks.response.push_back([&](Response&) { first++; });

    RequestOptions overrides;
    overrides.headers = Headers{{"accept", "application/json"}};
    overrides.stream = false;
    overrides.hooks.response.push_back([&](Response&) { second++; });

    RequestOptions merged = base.merged_with(overrides);
    ASSERT_TRUE(merged.headers.has_value());
    EXPECT_EQ(merged.headers->get("Accept").value_or(""), "application/json");
    EXPECT_EQ(merged.headers->get("X-Base").value_or(""), "1");
    EXPECT_EQ(merged.timeout.value_or(std::chrono::milliseconds(0)).count(), 500);
    EXPECT_FALSE(merged.stream.value_or(true));
    ASSERT_EQ(merged.hooks.response.size(), 2u);

    Response resp;
    for (auto& hook : merged.hooks.response) {
        hook(resp);
    }
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
}

TEST(ErrorsTest, HierarchyAndDescribe) {
    EXPECT_THROW(throw ConnectTimeout("slow"), ConnectionError);
    EXPECT_THROW(throw ConnectTimeout("slow"), Timeout);
    EXPECT_THROW(throw ConnectTimeout("slow"), RequestException);
    EXPECT_THROW(throw SSLError("bad cert"), ConnectionError);

    EXPECT_EQ(describe(nullptr), "no error");
    EXPECT_EQ(describe(std::make_exception_ptr(ReadTimeout("idle"))), "ReadTimeout: idle");
    EXPECT_EQ(describe(std::make_exception_ptr(ConnectionError("refused"))),
              "ConnectionError: refused");
    EXPECT_EQ(describe(std::make_exception_ptr(std::runtime_error("plain"))), "plain");
}
