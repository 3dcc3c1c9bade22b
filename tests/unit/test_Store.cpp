#include <gtest/gtest.h>
#include "cache/Store.hpp"
#include "types/stats/CacheStats.hpp"

#include <stdexcept>

using namespace tt::cache;
using namespace tt::types;
using namespace std::chrono_literals;

class StoreTest : public ::testing::Test {
protected:
    CacheStats stats;
    Store store{&stats};
    Clock::time_point t0 = Clock::now();

    static CacheEntry file(const std::string& key, uint64_t value, Clock::time_point at) {
        return CacheEntry::make(key, EntryKind::File, EntryStatus::Ready, value, at);
    }

    static CacheEntry dir(const std::string& key, uint64_t value, Clock::time_point at) {
        return CacheEntry::make(key, EntryKind::Directory, EntryStatus::Ready, value, at);
    }
};

TEST_F(StoreTest, GetIsIdempotent) {
    store.put(file("/a.txt", 10, t0));

    const auto first = store.get("/a.txt");
    const auto second = store.get("/a.txt");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(store.size(), 1u);

    const auto s = stats.snapshot();
    EXPECT_EQ(s.hits, 2u);
    EXPECT_EQ(s.misses, 0u);
}

TEST_F(StoreTest, MissIsCounted) {
    EXPECT_FALSE(store.get("/missing.txt").has_value());
    EXPECT_EQ(stats.snapshot().misses, 1u);
}

TEST_F(StoreTest, PutReplacesWholeEntry) {
    store.put(file("/a.txt", 10, t0));
    store.put(CacheEntry::make("/a.txt", EntryKind::File, EntryStatus::Estimated, 1'500, t0 + 1s));

    const auto e = store.get("/a.txt");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->value, 1'500u);
    EXPECT_EQ(e->status, EntryStatus::Estimated);
    EXPECT_EQ(e->displayText, "1.5k~");
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(StoreTest, PutRejectsEmptyKey) {
    EXPECT_THROW(store.put(file("", 1, t0)), std::invalid_argument);
}

TEST_F(StoreTest, FindDoesNotTouchCounters) {
    store.put(file("/a.txt", 10, t0));
    ASSERT_NE(store.find("/a.txt"), nullptr);
    EXPECT_EQ(store.find("/b.txt"), nullptr);
    const auto s = stats.snapshot();
    EXPECT_EQ(s.hits + s.misses, 0u);
}

TEST_F(StoreTest, SweepUsesTtlPerKind) {
    store.put(file("/old.txt", 1, t0));
    store.put(file("/new.txt", 2, t0 + 4min));
    store.put(dir("/dir", 3, t0));

    const auto result = store.sweep(t0 + 6min, 5min, 10min, 100);

    EXPECT_EQ(result.expired, 1u);
    EXPECT_EQ(result.evicted, 0u);
    EXPECT_FALSE(store.get("/old.txt").has_value());
    EXPECT_TRUE(store.get("/new.txt").has_value());
    EXPECT_TRUE(store.get("/dir").has_value());
    EXPECT_EQ(stats.snapshot().expirations, 1u);
}

TEST_F(StoreTest, SweepEvictsOldestBeyondCeiling) {
    for (int i = 0; i < 10; ++i) store.put(file("/f" + std::to_string(i) + ".txt", i, t0 + std::chrono::seconds(i)));

    const auto result = store.sweep(t0 + 10s, 5min, 10min, 6);

    EXPECT_EQ(result.expired, 0u);
    EXPECT_EQ(result.evicted, 4u);
    EXPECT_EQ(store.size(), 6u);
    for (int i = 0; i < 4; ++i) EXPECT_FALSE(store.contains("/f" + std::to_string(i) + ".txt")) << i;
    for (int i = 4; i < 10; ++i) EXPECT_TRUE(store.contains("/f" + std::to_string(i) + ".txt")) << i;
    EXPECT_EQ(stats.snapshot().evictions, 4u);
}

TEST_F(StoreTest, CountsByKind) {
    store.put(file("/a.txt", 1, t0));
    store.put(file("/b.txt", 1, t0));
    store.put(dir("/d", 2, t0));
    EXPECT_EQ(store.count(EntryKind::File), 2u);
    EXPECT_EQ(store.count(EntryKind::Directory), 1u);
    EXPECT_EQ(store.snapshot().size(), 3u);

    EXPECT_TRUE(store.erase("/a.txt"));
    EXPECT_FALSE(store.erase("/a.txt"));
    store.clear();
    EXPECT_EQ(store.size(), 0u);
}
