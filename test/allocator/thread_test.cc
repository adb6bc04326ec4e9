#include <gtest/gtest.h>
#include "../../src/allocator/thread.h"

#include <chrono>
#include <optional>
#include <thread>

using namespace Sluice;
using namespace std::chrono_literals;

TEST(ThreadAllocatorTest, OwnerIsTheConstructingThread) {
    ThreadAllocator allocator(2, 4);
    EXPECT_EQ(allocator.Index(), 2u);
    EXPECT_EQ(allocator.Peers(), 4u);
    EXPECT_TRUE(allocator.Owner().BoundToCurrentThread());
    EXPECT_TRUE(allocator.Owner().SameTarget(Buzzer()));

    bool bound_elsewhere = true;
    std::thread([&] { bound_elsewhere = allocator.Owner().BoundToCurrentThread(); }).join();
    EXPECT_FALSE(bound_elsewhere);
}

TEST(ThreadAllocatorTest, OwnerBuzzWakesAwait) {
    ThreadAllocator allocator(0, 1);
    Buzzer owner = allocator.Owner();
    std::thread waker([owner] {
        std::this_thread::sleep_for(20ms);
        owner.Buzz();
    });
    auto start = std::chrono::steady_clock::now();
    allocator.AwaitEvents(std::nullopt);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    waker.join();
}

TEST(ThreadAllocatorTest, AwaitOffOwningThreadAborts) {
    std::optional<ThreadAllocator> allocator;
    std::thread([&allocator] { allocator.emplace(3, 4); }).join();
    EXPECT_DEATH(allocator->AwaitEvents(1ms), "awaited events off the thread that built it");
}
