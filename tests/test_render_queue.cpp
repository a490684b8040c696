#include <gtest/gtest.h>
#include "scoreboard/render_queue.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace scoreboard;
using namespace std::chrono_literals;

TEST(RenderQueue, CapacityIsAtLeastOne) {
    EXPECT_EQ(RenderQueue(0).capacity(), 1);
    EXPECT_EQ(RenderQueue(3).capacity(), 3);
}

TEST(RenderQueue, SlotReleasesOnDestruction) {
    RenderQueue queue(1);
    {
        auto slot = queue.acquire(Clock::now() + 1s);
        ASSERT_TRUE(slot.has_value());
        EXPECT_TRUE(slot->held());
        EXPECT_EQ(queue.in_use(), 1);
    }
    EXPECT_EQ(queue.in_use(), 0);
}

TEST(RenderQueue, TryAcquireFailsWhenFull) {
    RenderQueue queue(2);
    auto a = queue.try_acquire();
    auto b = queue.try_acquire();
    ASSERT_TRUE(a && b);
    EXPECT_FALSE(queue.try_acquire().has_value());

    a->release();
    EXPECT_FALSE(a->held());
    EXPECT_TRUE(queue.try_acquire().has_value());
}

TEST(RenderQueue, ReleaseIsIdempotent) {
    RenderQueue queue(1);
    auto slot = queue.try_acquire();
    ASSERT_TRUE(slot);
    slot->release();
    slot->release();
    EXPECT_EQ(queue.in_use(), 0);
}

TEST(RenderQueue, MovedSlotReleasesOnce) {
    RenderQueue queue(1);
    auto slot = queue.try_acquire();
    ASSERT_TRUE(slot);

    RenderSlot moved = std::move(*slot);
    EXPECT_FALSE(slot->held());
    EXPECT_TRUE(moved.held());
    EXPECT_EQ(queue.in_use(), 1);

    RenderSlot other;
    other = std::move(moved);
    EXPECT_EQ(queue.in_use(), 1);
    other.release();
    EXPECT_EQ(queue.in_use(), 0);
}

TEST(RenderQueue, TimesOutWhenFull) {
    RenderQueue queue(1);
    auto held = queue.try_acquire();
    ASSERT_TRUE(held);

    auto start = Clock::now();
    auto slot = queue.acquire(start + 50ms);
    ASSERT_FALSE(slot.has_value());
    EXPECT_EQ(slot.error(), AdmissionFailure::TimedOut);
    EXPECT_GE(Clock::now() - start, 50ms);
    EXPECT_EQ(queue.in_use(), 1);
}

TEST(RenderQueue, StopRequestWakesWaiter) {
    RenderQueue queue(1);
    auto held = queue.try_acquire();
    ASSERT_TRUE(held);

    std::stop_source stop;
    std::expected<RenderSlot, AdmissionFailure> result = std::unexpected(AdmissionFailure::TimedOut);
    std::jthread waiter([&] { result = queue.acquire(Clock::now() + 10s, stop.get_token()); });

    std::this_thread::sleep_for(20ms);
    auto start = Clock::now();
    stop.request_stop();
    waiter.join();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AdmissionFailure::Cancelled);
    EXPECT_LT(Clock::now() - start, 5s);
}

TEST(RenderQueue, WaiterAdmittedWhenSlotFrees) {
    RenderQueue queue(1);
    auto held = queue.try_acquire();
    ASSERT_TRUE(held);

    std::atomic<bool> admitted{false};
    std::jthread waiter([&] {
        auto slot = queue.acquire(Clock::now() + 5s);
        admitted = slot.has_value();
    });

    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(admitted.load());
    held->release();
    waiter.join();
    EXPECT_TRUE(admitted.load());
    EXPECT_EQ(queue.in_use(), 0);
}

TEST(RenderQueue, NeverExceedsCapacity) {
    constexpr int capacity = 2;
    RenderQueue queue(capacity);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    std::vector<std::jthread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&] {
            for (int n = 0; n < 5; ++n) {
                auto slot = queue.acquire(Clock::now() + 10s);
                ASSERT_TRUE(slot.has_value());
                int now = ++active;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                std::this_thread::sleep_for(2ms);
                --active;
            }
        });
    }
    workers.clear();

    EXPECT_LE(peak.load(), capacity);
    EXPECT_EQ(queue.in_use(), 0);
}
