#include <gtest/gtest.h>
#include "cache/Context.hpp"
#include "cache/Processor.hpp"
#include "notify/NotificationBatcher.hpp"
#include "TestHelpers.hpp"

#include <set>
#include <vector>

using namespace tt::cache;
using namespace tt::types;
using namespace tt::test;
using Outcome = ProcessResult::Outcome;
using namespace std::chrono_literals;

class ProcessorTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::shared_ptr<ScriptedCounter> counter = std::make_shared<ScriptedCounter>();
    std::set<std::string> activeKeys;
    std::unique_ptr<Context> ctx;
    std::unique_ptr<tt::notify::NotificationBatcher> batcher;
    std::unique_ptr<Processor> processor;

    void SetUp() override { build(testConfig()); }

    void build(tt::config::CacheConfig cfg) {
        processor.reset();
        batcher.reset();
        ctx = std::make_unique<Context>(std::move(cfg), Hooks{[this](const std::string& k) { return activeKeys.contains(k); }, {}});
        batcher = std::make_unique<tt::notify::NotificationBatcher>(ctx->config()->notification_batch_window);
        processor = std::make_unique<Processor>(*ctx, counter, *batcher, 2);
    }

    std::optional<CacheEntry> stored(const std::string& key) const {
        std::scoped_lock lock(ctx->mutex);
        return ctx->store.get(key);
    }

    std::size_t inFlight() const {
        std::scoped_lock lock(ctx->mutex);
        return ctx->processing.size();
    }
};

TEST_F(ProcessorTest, WritesReadyEntryAndNotifies) {
    const auto path = tmp.write("a.txt", repeat(42));

    const auto result = processor->process(path).get();

    ASSERT_EQ(result.outcome, Outcome::Updated);
    ASSERT_TRUE(result.entry.has_value());
    EXPECT_EQ(result.entry->value, 42u);
    EXPECT_EQ(result.entry->status, EntryStatus::Ready);
    EXPECT_EQ(stored(path), result.entry);
    EXPECT_EQ(inFlight(), 0u);
    EXPECT_EQ(batcher->pendingCount(), 1u);
    EXPECT_EQ(counter->calls.load(), 1);
}

TEST_F(ProcessorTest, EmptyFileIsZeroWithoutCallingCounter) {
    const auto path = tmp.write("empty.txt", "");
    const auto result = processor->process(path).get();
    ASSERT_EQ(result.outcome, Outcome::Updated);
    EXPECT_EQ(result.entry->value, 0u);
    EXPECT_EQ(result.entry->status, EntryStatus::Ready);
    EXPECT_EQ(counter->calls.load(), 0);
}

TEST_F(ProcessorTest, CounterFailureDegradesToEstimate) {
    counter->fail = true;
    const auto path = tmp.write("a.txt", repeat(400));

    const auto result = processor->process(path).get();

    ASSERT_EQ(result.outcome, Outcome::Updated);
    EXPECT_EQ(result.entry->status, EntryStatus::Estimated);
    EXPECT_EQ(result.entry->value, 100u);   // 400 chars / 4
    EXPECT_EQ(result.entry->displayText, "100~");
    EXPECT_EQ(ctx->stats.snapshot().estimated, 1u);
}

TEST_F(ProcessorTest, NonStandardCounterThrowDegradesToEstimate) {
    auto thrower = std::make_shared<tt::counting::FunctionCounter>(
        [](std::string_view, const std::string&) -> uint64_t { throw 7; }, "thrower");
    Processor local(*ctx, thrower, *batcher, 1);
    const auto path = tmp.write("a.txt", repeat(400));

    const auto result = local.process(path).get();

    ASSERT_EQ(result.outcome, Outcome::Updated);
    EXPECT_EQ(result.entry->status, EntryStatus::Estimated);
    EXPECT_EQ(result.entry->value, 100u);
    EXPECT_EQ(ctx->stats.snapshot().estimated, 1u);
    EXPECT_EQ(inFlight(), 0u);
}

TEST_F(ProcessorTest, IneligibleIsSkippedWithoutTouchingStore) {
    const auto path = tmp.write("image.png", "binary");
    const auto result = processor->process(path).get();
    EXPECT_EQ(result.outcome, Outcome::Ineligible);
    EXPECT_EQ(result.error, "invalid_extension");
    EXPECT_FALSE(stored(path).has_value());
    EXPECT_EQ(inFlight(), 0u);
}

TEST_F(ProcessorTest, MissingFileLeavesStoreUntouched) {
    const auto path = (tmp.path() / "gone.txt").string();
    const auto result = processor->process(path).get();
    EXPECT_EQ(result.outcome, Outcome::Ineligible);
    EXPECT_FALSE(stored(path).has_value());
    EXPECT_EQ(inFlight(), 0u);
}

TEST_F(ProcessorTest, ReadFailureReleasesKey) {
    const auto path = tmp.write("a.txt", repeat(10));
    ASSERT_TRUE(ctx->tryClaim(path));
    fs::remove(path);

    const auto result = processor->run(path, Processor::ReadMode::Bounded);

    EXPECT_EQ(result.outcome, Outcome::ReadFailed);
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(stored(path).has_value());
    EXPECT_EQ(inFlight(), 0u);
    EXPECT_EQ(ctx->stats.snapshot().read_failures, 1u);
}

TEST_F(ProcessorTest, OversizedFileIsEstimatedFromSample) {
    auto cfg = testConfig();
    cfg.max_file_size_bytes = 1024;
    cfg.sample_bytes = 100;
    build(cfg);

    const auto path = tmp.write("big.txt", repeat(4000));
    const auto result = processor->process(path).get();

    ASSERT_EQ(result.outcome, Outcome::Updated);
    EXPECT_EQ(result.entry->status, EntryStatus::Oversized);
    EXPECT_EQ(result.entry->value, 1000u);   // 25 per 100-byte sample, scaled by 40
    EXPECT_EQ(result.entry->displayText, "1.0k*");
    EXPECT_EQ(counter->calls.load(), 0);
    EXPECT_EQ(ctx->stats.snapshot().oversized, 1u);
}

TEST_F(ProcessorTest, ActiveOversizedFileBypassesCeiling) {
    auto cfg = testConfig();
    cfg.max_file_size_bytes = 1024;
    build(cfg);

    const auto path = tmp.write("active.txt", repeat(4000));
    activeKeys.insert(path);

    const auto result = processor->process(path).get();

    ASSERT_EQ(result.outcome, Outcome::Updated);
    EXPECT_EQ(result.entry->status, EntryStatus::Ready);
    EXPECT_EQ(result.entry->value, 4000u);
    EXPECT_EQ(counter->calls.load(), 1);
}

TEST_F(ProcessorTest, AtMostOneRunInFlightPerKey) {
    std::promise<void> release;
    counter->gate = release.get_future().share();
    const auto path = tmp.write("a.txt", repeat(5));

    auto first = processor->process(path);
    ASSERT_TRUE(waitFor([&] { return counter->calls.load() == 1; }));

    std::vector<std::future<ProcessResult>> others;
    for (int i = 0; i < 20; ++i) others.push_back(processor->process(path));

    for (auto& f : others) EXPECT_EQ(f.get().outcome, Outcome::AlreadyProcessing);

    release.set_value();
    EXPECT_EQ(first.get().outcome, Outcome::Updated);
    EXPECT_EQ(counter->calls.load(), 1);
    EXPECT_EQ(inFlight(), 0u);
}

TEST_F(ProcessorTest, StoppedProcessorCancelsAndReleases) {
    const auto path = tmp.write("a.txt", repeat(5));
    processor->stop();

    const auto result = processor->process(path).get();

    EXPECT_EQ(result.outcome, Outcome::Cancelled);
    EXPECT_EQ(inFlight(), 0u);
    EXPECT_FALSE(stored(path).has_value());
}

TEST_F(ProcessorTest, FreshAfterProcessGoneAfterSweep) {
    const auto path = tmp.write("a.txt", repeat(8));
    ASSERT_EQ(processor->process(path).get().outcome, Outcome::Updated);

    const auto e = stored(path);
    ASSERT_TRUE(e.has_value());
    EXPECT_TRUE(e->isFreshCount(Clock::now(), ctx->config()->ttl_file));

    ctx->sweep(Clock::now() + ctx->config()->ttl_file + 1s);
    EXPECT_FALSE(stored(path).has_value());
}
