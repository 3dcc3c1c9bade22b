#include <gtest/gtest.h>
#include "cache/Context.hpp"
#include "cache/Debouncer.hpp"
#include "cache/Processor.hpp"
#include "cache/Scheduler.hpp"
#include "notify/NotificationBatcher.hpp"
#include "TestHelpers.hpp"

#include <atomic>

using namespace tt::cache;
using namespace tt::types;
using namespace tt::test;
using namespace std::chrono_literals;

class DebouncerTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::shared_ptr<ScriptedCounter> counter = std::make_shared<ScriptedCounter>();
    std::atomic<bool> busy{false};
    Context ctx{testConfig(), Hooks{{}, [this] { return busy.load(); }}};
    tt::notify::NotificationBatcher batcher{ctx.config()->notification_batch_window};
    Processor processor{ctx, counter, batcher, 2};
    Scheduler scheduler{ctx, processor};
    Debouncer debouncer{ctx, scheduler};
    Clock::time_point t0 = Clock::now();

    std::vector<std::string> drainQueue() {
        std::scoped_lock lock(ctx.mutex);
        return ctx.queue.popFront(ctx.queue.size());
    }
};

class DebounceCoalescingTest : public DebouncerTest, public ::testing::WithParamInterface<int> {};

TEST_P(DebounceCoalescingTest, BurstWithinWindowFiresOnce) {
    const int calls = GetParam();
    const auto path = tmp.write("a.txt", repeat(12));

    // Each call lands 99ms after the previous one, inside the 100ms window.
    auto t = t0;
    for (int i = 0; i < calls; ++i) {
        t = t0 + i * 99ms;
        debouncer.requestImmediate(path, t);
        EXPECT_EQ(debouncer.fireDue(t + 99ms), 0u) << "fired early at call " << i;
    }
    EXPECT_EQ(debouncer.pendingCount(), 1u);

    EXPECT_EQ(debouncer.fireDue(t + 100ms), 1u);
    EXPECT_EQ(debouncer.pendingCount(), 0u);
    EXPECT_EQ(debouncer.fireDue(t + 10s), 0u);

    EXPECT_EQ(scheduler.tick(t + 100ms).dispatched, 1u);
    ASSERT_TRUE(waitFor([&] {
        std::scoped_lock lock(ctx.mutex);
        return ctx.store.contains(path);
    }));
    EXPECT_EQ(counter->calls.load(), 1);
}

INSTANTIATE_TEST_SUITE_P(Bursts, DebounceCoalescingTest, ::testing::Values(1, 5, 100));

TEST_F(DebouncerTest, CallsSpacedBeyondWindowFireEach) {
    std::size_t fired = 0;
    for (int i = 0; i < 5; ++i) {
        const auto t = t0 + i * 101ms;
        debouncer.requestImmediate("/p/a.txt", t);
        fired += debouncer.fireDue(t + 101ms);
    }
    EXPECT_EQ(fired, 5u);
}

TEST_F(DebouncerTest, ExpiredKeyGoesToFrontOfQueue) {
    {
        std::scoped_lock lock(ctx.mutex);
        ctx.queue.pushBack("/p/background1.txt");
        ctx.queue.pushBack("/p/background2.txt");
    }
    debouncer.requestImmediate("/p/urgent.txt", t0);
    ASSERT_EQ(debouncer.fireDue(t0 + 100ms), 1u);

    const auto order = drainQueue();
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order.front(), "/p/urgent.txt");
}

TEST_F(DebouncerTest, PriorityBypassesFullQueue) {
    auto cfg = testConfig();
    cfg.max_queue_length = 2;
    ctx.replaceConfig(cfg);
    {
        std::scoped_lock lock(ctx.mutex);
        ctx.queue.pushBack("/p/1.txt");
        ctx.queue.pushBack("/p/2.txt");
        EXPECT_EQ(ctx.queue.pushBack("/p/3.txt"), WorkQueue::Push::Dropped);
    }

    debouncer.requestImmediate("/p/3.txt", t0);
    EXPECT_EQ(debouncer.fireDue(t0 + 100ms), 1u);
    EXPECT_EQ(drainQueue().front(), "/p/3.txt");
}

TEST_F(DebouncerTest, BusyHostDoublesWindow) {
    busy = true;
    debouncer.requestImmediate("/p/a.txt", t0);
    EXPECT_EQ(debouncer.fireDue(t0 + 150ms), 0u);
    EXPECT_EQ(debouncer.fireDue(t0 + 200ms), 1u);
}

TEST_F(DebouncerTest, KeyAlreadyProcessingIsNotRequeued) {
    ASSERT_TRUE(ctx.tryClaim("/p/a.txt"));
    debouncer.requestImmediate("/p/a.txt", t0);
    EXPECT_EQ(debouncer.fireDue(t0 + 100ms), 0u);
    EXPECT_TRUE(drainQueue().empty());
    ctx.release("/p/a.txt");
}

TEST_F(DebouncerTest, CancelAndClear) {
    debouncer.requestImmediate("/p/a.txt", t0);
    debouncer.requestImmediate("/p/b.txt", t0);
    debouncer.requestImmediate("", t0);
    EXPECT_EQ(debouncer.pendingCount(), 2u);

    EXPECT_TRUE(debouncer.cancel("/p/a.txt"));
    EXPECT_FALSE(debouncer.cancel("/p/a.txt"));
    debouncer.clear();
    EXPECT_EQ(debouncer.fireDue(t0 + 1s), 0u);
}

TEST_F(DebouncerTest, RunningServiceFiresOnItsOwn) {
    debouncer.start();
    debouncer.requestImmediate("/p/a.txt");
    EXPECT_TRUE(waitFor([&] {
        std::scoped_lock lock(ctx.mutex);
        return ctx.queue.contains("/p/a.txt");
    }));
    debouncer.stop();
}
