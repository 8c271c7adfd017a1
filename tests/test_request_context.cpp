#include <chrono>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "pinfetch/request_context.hpp"

using pinfetch::RequestContext;
using pinfetch::RequestTrace;

TEST(RequestContextTest, DefaultHasNoOverride) {
    RequestContext ctx;
    EXPECT_FALSE(ctx.dial_override().has_value());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_EQ(ctx.trace(), nullptr);
    EXPECT_FALSE(ctx.cancellation().stop_possible());
    EXPECT_FALSE(ctx.done());
}

TEST(RequestContextTest, AttachReturnsNewScopeAndLeavesOriginal) {
    const RequestContext base;
    const RequestContext a = base.with_dial_override("203.0.113.10");
    const RequestContext b = base.with_dial_override("198.51.100.7");

    EXPECT_FALSE(base.dial_override().has_value());
    ASSERT_TRUE(a.dial_override().has_value());
    ASSERT_TRUE(b.dial_override().has_value());
    EXPECT_EQ(*a.dial_override(), "203.0.113.10");
    EXPECT_EQ(*b.dial_override(), "198.51.100.7");
}

TEST(RequestContextTest, OverrideIsNotValidated) {
    auto ctx = RequestContext{}.with_dial_override("not an address!");
    ASSERT_TRUE(ctx.dial_override().has_value());
    EXPECT_EQ(*ctx.dial_override(), "not an address!");
}

TEST(RequestContextTest, LaterWithCallsKeepEarlierValues) {
    std::stop_source src;
    auto ctx = RequestContext{}
                   .with_dial_override("10.0.0.1")
                   .with_cancellation(src.get_token())
                   .with_trace(RequestTrace{});
    ASSERT_TRUE(ctx.dial_override().has_value());
    EXPECT_EQ(*ctx.dial_override(), "10.0.0.1");
    EXPECT_TRUE(ctx.cancellation().stop_possible());
    EXPECT_NE(ctx.trace(), nullptr);
}

TEST(RequestContextTest, DoneAfterCancel) {
    std::stop_source src;
    auto ctx = RequestContext{}.with_cancellation(src.get_token());
    EXPECT_FALSE(ctx.done());
    src.request_stop();
    EXPECT_TRUE(ctx.done());
}

TEST(RequestContextTest, DoneAfterDeadline) {
    auto past = RequestContext{}.with_deadline(
        std::chrono::steady_clock::now() - std::chrono::milliseconds(1));
    EXPECT_TRUE(past.done());

    auto future = RequestContext{}.with_deadline(
        std::chrono::steady_clock::now() + std::chrono::hours(1));
    EXPECT_FALSE(future.done());
}

TEST(RequestContextTest, ConcurrentScopesDoNotInterfere) {
    const RequestContext base;
    std::vector<std::thread> threads;
    std::vector<int> mismatches(8, 0);

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            const std::string mine = "10.0.0." + std::to_string(i);
            for (int n = 0; n < 1000; ++n) {
                auto ctx = base.with_dial_override(mine);
                if (!ctx.dial_override() || *ctx.dial_override() != mine)
                    ++mismatches[i];
            }
        });
    }
    for (auto& t : threads) t.join();

    for (int m : mismatches) EXPECT_EQ(m, 0);
    EXPECT_FALSE(base.dial_override().has_value());
}
