#include <gtest/gtest.h>
#include "cache/Context.hpp"
#include "cache/DirectoryAggregator.hpp"
#include "cache/Processor.hpp"
#include "notify/NotificationBatcher.hpp"
#include "TestHelpers.hpp"

using namespace tt::cache;
using namespace tt::types;
using namespace tt::test;

class DirectoryAggregatorTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::shared_ptr<ScriptedCounter> counter = std::make_shared<ScriptedCounter>();
    Context ctx{testConfig()};
    tt::notify::NotificationBatcher batcher{ctx.config()->notification_batch_window};
    Processor processor{ctx, counter, batcher, 2};
    DirectoryAggregator aggregator{ctx, processor, batcher};

    // Children worth 10, 20 and 30 plus files the governor turns away.
    std::string fixture(const std::string& name) {
        const auto dir = tmp.mkdir(name);
        tmp.write(name + "/ten.txt", repeat(10));
        tmp.write(name + "/twenty.md", repeat(20));
        tmp.write(name + "/image.png", repeat(50));
        tmp.write(name + "/thirty.cpp", repeat(30));
        tmp.write(name + "/.hidden.txt", repeat(70));
        tmp.write(name + "/Cargo.lock", repeat(90));
        return dir;
    }

    std::optional<CacheEntry> stored(const std::string& key) {
        std::scoped_lock lock(ctx.mutex);
        return ctx.store.get(key);
    }
};

TEST_F(DirectoryAggregatorTest, SumsEligibleChildren) {
    const auto dir = fixture("project");

    const auto result = aggregator.computeDirectory(dir).get();

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.sum, 60u);
    EXPECT_EQ(result.counted, 3u);
    EXPECT_EQ(result.reused, 0u);
    EXPECT_EQ(counter->calls.load(), 3);

    const auto entry = stored(dir);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->kind, EntryKind::Directory);
    EXPECT_EQ(entry->status, EntryStatus::Ready);
    EXPECT_EQ(entry->value, 60u);
    EXPECT_EQ(batcher.pendingCount(), 4u);   // three files and the directory
}

TEST_F(DirectoryAggregatorTest, SumDoesNotDependOnCreationOrder) {
    const auto dir = tmp.mkdir("reversed");
    tmp.write("reversed/thirty.cpp", repeat(30));
    tmp.write("reversed/image.png", repeat(50));
    tmp.write("reversed/twenty.md", repeat(20));
    tmp.write("reversed/ten.txt", repeat(10));

    EXPECT_EQ(aggregator.computeDirectory(dir).get().sum, 60u);
}

TEST_F(DirectoryAggregatorTest, FreshChildrenAreNotCountedTwice) {
    const auto dir = fixture("project");
    ASSERT_TRUE(processor.process(dir + "/ten.txt").get().ok());
    ASSERT_EQ(counter->calls.load(), 1);

    const auto first = aggregator.computeDirectory(dir).get();
    EXPECT_EQ(first.sum, 60u);
    EXPECT_EQ(first.reused, 1u);
    EXPECT_EQ(counter->calls.load(), 3);

    const auto second = aggregator.computeDirectory(dir).get();
    EXPECT_EQ(second.sum, 60u);
    EXPECT_EQ(second.reused, 3u);
    EXPECT_EQ(counter->calls.load(), 3);
}

TEST_F(DirectoryAggregatorTest, RecursiveSkipsDotDirectories) {
    const auto dir = fixture("project");
    tmp.write("project/sub/five.txt", repeat(5));
    tmp.write("project/sub/deeper/six.txt", repeat(6));
    tmp.write("project/.git/objects/blob.txt", repeat(1000));
    tmp.write("project/.cache/big.txt", repeat(1000));

    EXPECT_EQ(aggregator.computeDirectory(dir, false).get().sum, 60u);
    EXPECT_EQ(aggregator.computeDirectory(dir, true).get().sum, 71u);
}

TEST_F(DirectoryAggregatorTest, CounterFailureMarksDirectoryEstimated) {
    counter->fail = true;
    const auto dir = fixture("project");

    const auto result = aggregator.computeDirectory(dir).get();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.sum, 2u + 5u + 7u);   // chars / 4 for each child
    EXPECT_EQ(stored(dir)->status, EntryStatus::Estimated);
}

TEST_F(DirectoryAggregatorTest, MissingDirectoryReportsError) {
    const auto dir = (tmp.path() / "nope").string();

    const auto result = aggregator.computeDirectory(dir).get();

    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(stored(dir).has_value());
    std::scoped_lock lock(ctx.mutex);
    EXPECT_TRUE(ctx.processing.empty());
}

TEST_F(DirectoryAggregatorTest, DirectoryAlreadyProcessing) {
    const auto dir = fixture("project");
    ASSERT_TRUE(ctx.tryClaim(dir));

    const auto result = aggregator.computeDirectory(dir).get();
    EXPECT_EQ(result.error, "already processing");

    ctx.release(dir);
}

TEST_F(DirectoryAggregatorTest, QueueDirectoryAddsOnlyStaleEligibleChildren) {
    const auto dir = fixture("project");
    ASSERT_TRUE(processor.process(dir + "/ten.txt").get().ok());

    EXPECT_EQ(aggregator.queueDirectory(dir), 2u);
    EXPECT_EQ(aggregator.queueDirectory(dir), 0u);   // already queued

    std::scoped_lock lock(ctx.mutex);
    EXPECT_TRUE(ctx.queue.contains(dir + "/twenty.md"));
    EXPECT_TRUE(ctx.queue.contains(dir + "/thirty.cpp"));
    EXPECT_FALSE(ctx.queue.contains(dir + "/ten.txt"));
    EXPECT_FALSE(ctx.queue.contains(dir + "/image.png"));
}

TEST_F(DirectoryAggregatorTest, QueueDirectoryDropsBeyondCeiling) {
    auto cfg = testConfig();
    cfg.max_queue_length = 3;
    ctx.replaceConfig(cfg);

    const auto dir = tmp.mkdir("many");
    for (int i = 0; i < 8; ++i) tmp.write("many/f" + std::to_string(i) + ".txt", repeat(4));

    EXPECT_EQ(aggregator.queueDirectory(dir), 3u);
    EXPECT_EQ(ctx.stats.snapshot().dropped_enqueues, 5u);
}
