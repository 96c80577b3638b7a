#include "async_request.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace volley;
using volley::test::FakeTransport;

TEST(AsyncRequestTest, KeepsMethodUrlAndOptions) {
    auto transport = std::make_shared<FakeTransport>();
    RequestOptions opts;
    opts.timeout = std::chrono::milliseconds(250);

    AsyncRequest req("GET", "http://example.com/a", opts, transport);
    EXPECT_EQ(req.method(), "GET");
    EXPECT_EQ(req.url(), "http://example.com/a");
    EXPECT_EQ(req.options().timeout.value_or(std::chrono::milliseconds(0)).count(), 250);
    EXPECT_EQ(req.session(), transport);
}

TEST(AsyncRequestTest, CreatesOwnSessionWhenNoneGiven) {
    AsyncRequest first("GET", "http://example.com/");
    AsyncRequest second("GET", "http://example.com/");
    ASSERT_NE(first.session(), nullptr);
    ASSERT_NE(second.session(), nullptr);
    EXPECT_NE(first.session(), second.session());
    EXPECT_NE(dynamic_cast<Session*>(first.session().get()), nullptr);
}

TEST(AsyncRequestTest, ShortcutsBindMethod) {
    auto transport = std::make_shared<FakeTransport>();
    EXPECT_EQ(get("http://h/", {}, transport).method(), "GET");
    EXPECT_EQ(options("http://h/", {}, transport).method(), "OPTIONS");
    EXPECT_EQ(head("http://h/", {}, transport).method(), "HEAD");
    EXPECT_EQ(post("http://h/", {}, transport).method(), "POST");
    EXPECT_EQ(put("http://h/", {}, transport).method(), "PUT");
    EXPECT_EQ(patch("http://h/", {}, transport).method(), "PATCH");
    EXPECT_EQ(delete_("http://h/", {}, transport).method(), "DELETE");
    EXPECT_EQ(request("PROPFIND", "http://h/", {}, transport).method(), "PROPFIND");
}

TEST(ExecutionUnitTest, SuccessFillsOnlyTheResponse) {
    auto transport = std::make_shared<FakeTransport>();
    ExecutionUnit unit(get("http://example.com/ok", {}, transport));
    EXPECT_FALSE(unit.executed());

    ExecutionUnit& same = unit.execute(false);
    EXPECT_EQ(&same, &unit);
    EXPECT_TRUE(unit.executed());
    EXPECT_TRUE(unit.succeeded());
    EXPECT_FALSE(unit.failed());
    EXPECT_TRUE(unit.exception() == nullptr);
    EXPECT_EQ(unit.response().status_code, 200);
    EXPECT_EQ(unit.response().text(), "http://example.com/ok");
}

TEST(ExecutionUnitTest, FailureIsCapturedNotThrown) {
    auto transport = std::make_shared<FakeTransport>();
    ExecutionUnit unit(get("http://example.com/fail", {}, transport));

    EXPECT_NO_THROW(unit.execute(false));
    EXPECT_TRUE(unit.failed());
    EXPECT_FALSE(unit.succeeded());
    ASSERT_TRUE(unit.exception() != nullptr);
    EXPECT_THROW(std::rethrow_exception(unit.exception()), ConnectionError);
    EXPECT_THROW(unit.response(), std::logic_error);
}

TEST(ExecutionUnitTest, InvalidUrlThroughRealSessionIsCaptured) {
    ExecutionUnit unit(get("not a url"));
    unit.execute(false);
    ASSERT_TRUE(unit.failed());
    EXPECT_THROW(std::rethrow_exception(unit.exception()), MissingSchema);
}

TEST(ExecutionUnitTest, RunsAtMostOnce) {
    auto transport = std::make_shared<FakeTransport>();
    ExecutionUnit unit(get("http://example.com/ok", {}, transport));
    unit.execute(false);
    EXPECT_THROW(unit.execute(false), std::logic_error);
    EXPECT_EQ(transport->calls().size(), 1u);
}

TEST(ExecutionUnitTest, StreamOverrideWins) {
    auto transport = std::make_shared<FakeTransport>();
    RequestOptions opts;
    opts.stream = false;

    ExecutionUnit unit(get("http://example.com/ok", opts, transport));
    unit.execute(true);

    auto flags = transport->stream_flags();
    ASSERT_EQ(flags.size(), 1u);
    EXPECT_TRUE(flags[0]);
    // The stored options are untouched
    EXPECT_FALSE(unit.request().options().stream.value_or(true));
}

TEST(ExecutionUnitTest, CallbackRunsAsHookOnSuccessOnly) {
    auto transport = std::make_shared<FakeTransport>();
    int called = 0;
    std::string seen_url;
    auto callback = [&](Response& resp) {
        called++;
        seen_url = resp.url;
    };

    ExecutionUnit ok(get("http://example.com/ok", {}, transport, callback));
    EXPECT_EQ(ok.request().options().hooks.response.size(), 1u);
    ok.execute(false);
    EXPECT_EQ(called, 1);
    EXPECT_EQ(seen_url, "http://example.com/ok");

    ExecutionUnit bad(get("http://example.com/fail", {}, transport, callback));
    bad.execute(false);
    EXPECT_EQ(called, 1);
}

TEST(ExecutionUnitTest, CallbackIsAppendedAfterExistingHooks) {
    auto transport = std::make_shared<FakeTransport>();
    std::vector<int> order;
    RequestOptions opts;
    opts.hooks.response.push_back([&](Response&) { order.push_back(1); });

    ExecutionUnit unit(get("http://example.com/ok", opts, transport,
                           [&](Response&) { order.push_back(2); }));
    unit.execute(false);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}
