#include <gtest/gtest.h>

#include "chat/ConversationContext.hpp"

TEST(ConversationContextTest, SetGetClear) {
    ConversationContext ctx;
    EXPECT_TRUE(ctx.empty());
    EXPECT_FALSE(ctx.get("photo").has_value());

    ctx.set("photo", "bytes");
    ctx.set("aspect_ratio", "4:3");
    EXPECT_TRUE(ctx.contains("photo"));
    EXPECT_EQ(ctx.get("photo"), std::optional<std::string>("bytes"));
    EXPECT_EQ(ctx.getOr("aspect_ratio", "1:1"), "4:3");

    ctx.set("aspect_ratio", "16:9");
    EXPECT_EQ(ctx.getOr("aspect_ratio", "1:1"), "16:9");

    ctx.clear();
    EXPECT_TRUE(ctx.empty());
    EXPECT_FALSE(ctx.contains("photo"));
    EXPECT_EQ(ctx.getOr("aspect_ratio", "1:1"), "1:1");
}

TEST(SessionStoreTest, ContextsAreScopedPerChat) {
    SessionStore store;
    store.context(1).set("photo", "a");
    store.context(2).set("photo", "b");

    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.context(1).getOr("photo", ""), "a");
    EXPECT_EQ(store.context(2).getOr("photo", ""), "b");

    store.context(1).clear();
    EXPECT_FALSE(store.context(1).contains("photo"));
    EXPECT_TRUE(store.context(2).contains("photo"));
}

TEST(SessionStoreTest, ReferenceStaysValid) {
    SessionStore store;
    ConversationContext& first = store.context(42);
    for (int i = 0; i < 100; ++i) store.context(i);
    first.set("k", "v");
    EXPECT_EQ(store.context(42).getOr("k", ""), "v");
}
