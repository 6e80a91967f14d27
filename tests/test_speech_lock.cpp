/**
 * @file test_speech_lock.cpp
 * @brief Tests for the in-process speech lock and the scoped guard
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "test_helpers.h"
#include "voxgate/speech/speech_lock.h"

using namespace std::chrono_literals;
using voxgate::speech::LocalSpeechLock;
using voxgate::speech::ScopedSpeechLock;

TEST(LocalSpeechLock, AcquireReleaseAndHolder) {
    LocalSpeechLock lock("assistant");
    EXPECT_FALSE(lock.is_locked());
    EXPECT_FALSE(lock.who_holds().has_value());

    ASSERT_TRUE(lock.acquire(10ms));
    EXPECT_TRUE(lock.held());
    EXPECT_TRUE(lock.is_locked());
    EXPECT_EQ(lock.who_holds().value_or(""), "assistant");

    lock.release();
    EXPECT_FALSE(lock.held());
    EXPECT_FALSE(lock.is_locked());

    lock.release();  // idempotent
    EXPECT_FALSE(lock.is_locked());
}

TEST(LocalSpeechLock, DoubleAcquireOnSameHandleFails) {
    voxgate::test::QuietLogs quiet;
    LocalSpeechLock lock;
    ASSERT_TRUE(lock.acquire(10ms));
    EXPECT_FALSE(lock.acquire(10ms));
    EXPECT_TRUE(lock.held());
}

TEST(LocalSpeechLock, SharedDomainExcludesOtherHandles) {
    LocalSpeechLock::Domain domain;
    LocalSpeechLock first(domain, "first");
    LocalSpeechLock second(domain, "second");

    ASSERT_TRUE(first.acquire(10ms));
    EXPECT_FALSE(second.acquire(30ms));
    EXPECT_EQ(second.who_holds().value_or(""), "first");

    second.release();  // not the holder: no effect
    EXPECT_TRUE(first.held());

    first.release();
    EXPECT_TRUE(second.acquire(10ms));
    EXPECT_EQ(first.who_holds().value_or(""), "second");
}

TEST(LocalSpeechLock, WaiterWakesOnRelease) {
    LocalSpeechLock::Domain domain;
    LocalSpeechLock first(domain, "first");
    LocalSpeechLock second(domain, "second");
    ASSERT_TRUE(first.acquire(10ms));

    std::thread releaser([&first] {
        std::this_thread::sleep_for(50ms);
        first.release();
    });

    EXPECT_TRUE(second.acquire(2000ms));
    releaser.join();
    EXPECT_TRUE(second.held());
}

TEST(LocalSpeechLock, DestructorReleases) {
    LocalSpeechLock::Domain domain;
    {
        LocalSpeechLock scoped(domain, "short-lived");
        ASSERT_TRUE(scoped.acquire(10ms));
    }
    LocalSpeechLock other(domain, "other");
    EXPECT_TRUE(other.acquire(10ms));
}

TEST(LocalSpeechLock, NeverTwoHoldersAtOnce) {
    LocalSpeechLock::Domain domain;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::atomic<int> entries{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&domain, &inside, &max_inside, &entries, t] {
            LocalSpeechLock lock(domain, "worker-" + std::to_string(t));
            for (int i = 0; i < 25; ++i) {
                if (!lock.acquire(2000ms)) {
                    continue;
                }
                int now_inside = ++inside;
                int seen = max_inside.load();
                while (now_inside > seen && !max_inside.compare_exchange_weak(seen, now_inside)) {
                }
                ++entries;
                std::this_thread::sleep_for(100us);
                --inside;
                lock.release();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(entries.load(), 100);
}

// =============================================================================
// ScopedSpeechLock
// =============================================================================

TEST(ScopedSpeechLock, ReleasesOnScopeExit) {
    LocalSpeechLock lock;
    {
        ScopedSpeechLock guard(lock, 10ms);
        ASSERT_TRUE(guard.owns_lock());
        EXPECT_TRUE(static_cast<bool>(guard));
        EXPECT_TRUE(lock.held());
    }
    EXPECT_FALSE(lock.held());
}

TEST(ScopedSpeechLock, DoesNotReleaseWhatItFailedToTake) {
    LocalSpeechLock::Domain domain;
    LocalSpeechLock holder(domain, "holder");
    LocalSpeechLock other(domain, "other");
    ASSERT_TRUE(holder.acquire(10ms));
    {
        ScopedSpeechLock guard(other, 10ms);
        EXPECT_FALSE(guard.owns_lock());
    }
    EXPECT_TRUE(holder.held());
    EXPECT_TRUE(other.is_locked());
}
