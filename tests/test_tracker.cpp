#include <gtest/gtest.h>
#include <map>
#include "wbind_tracker.hpp"

TEST(TrackerTest, RegisterLookupUnregister) {
    WbindTracker t;
    int a = 0, b = 0;

    t.register_alloc(&a, 16);
    t.register_alloc(&b, 48);
    EXPECT_EQ(t.count(), 2u);
    EXPECT_EQ(t.total_bytes(), 64u);

    size_t size = 0;
    ASSERT_TRUE(t.get_alloc(&a, size));
    EXPECT_EQ(size, 16u);

    t.unregister_alloc(&a);
    EXPECT_FALSE(t.get_alloc(&a, size));
    EXPECT_EQ(t.count(), 1u);
    EXPECT_EQ(t.total_bytes(), 48u);
}

TEST(TrackerTest, DuplicateRegisterKeepsFirstEntry) {
    WbindTracker t;
    int a = 0;
    EXPECT_TRUE(t.register_alloc(&a, 16));
    EXPECT_FALSE(t.register_alloc(&a, 32));

    size_t size = 0;
    ASSERT_TRUE(t.get_alloc(&a, size));
    EXPECT_EQ(size, 16u);
    EXPECT_EQ(t.count(), 1u);
    EXPECT_EQ(t.total_bytes(), 16u);
}

TEST(TrackerTest, UnregisterUnknownIsIgnored) {
    WbindTracker t;
    int a = 0, b = 0;
    t.register_alloc(&a, 8);
    t.unregister_alloc(&b);
    EXPECT_EQ(t.count(), 1u);
    EXPECT_EQ(t.total_bytes(), 8u);
}

TEST(TrackerTest, RekeyMovesEntry) {
    WbindTracker t;
    int a = 0, b = 0;
    t.register_alloc(&a, 16);

    t.rekey_alloc(&a, &b, 64);
    size_t size = 0;
    EXPECT_FALSE(t.get_alloc(&a, size));
    ASSERT_TRUE(t.get_alloc(&b, size));
    EXPECT_EQ(size, 64u);
    EXPECT_EQ(t.count(), 1u);
    EXPECT_EQ(t.total_bytes(), 64u);

    // same address, new size
    t.rekey_alloc(&b, &b, 24);
    ASSERT_TRUE(t.get_alloc(&b, size));
    EXPECT_EQ(size, 24u);
    EXPECT_EQ(t.total_bytes(), 24u);
}

TEST(TrackerTest, DrainVisitsEveryEntryOnce) {
    WbindTracker t;
    int blocks[4] = {};
    for (int i = 0; i < 4; i++) t.register_alloc(&blocks[i], (i + 1) * 8);

    std::map<void*, size_t> seen;
    t.drain([&](void* ptr, size_t size) { seen[ptr] += size; });

    EXPECT_EQ(seen.size(), 4u);
    for (int i = 0; i < 4; i++) EXPECT_EQ(seen[&blocks[i]], static_cast<size_t>((i + 1) * 8));
    EXPECT_EQ(t.count(), 0u);
    EXPECT_EQ(t.total_bytes(), 0u);
}
