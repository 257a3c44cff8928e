#include <gtest/gtest.h>

#include "rci/interner.hh"
#include <mutex>
#include <string>
#include <thread>
#include <vector>

///
/// ARC INTERNER TESTS
/// - the table is guarded by the caller; handles taken out of it are not
///

namespace {

    constexpr int kThreadCount = 8;
    constexpr int kRoundCount = 1024;
    constexpr int kKeyCount = 16;

    std::string key_for(int round) {
        return "key-" + std::to_string(round % kKeyCount);
    }

}

TEST(ArcInternerTests1, MutexGuardedInternYieldsOneHandlePerValue) {
    rci::ArcStrInterner interner;
    std::mutex interner_mutex;
    std::vector<std::vector<rci::Arc<std::string>>> results(kThreadCount);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreadCount; t++) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kRoundCount; i++) {
                rci::Arc<std::string> handle;
                {
                    std::lock_guard<std::mutex> lock{interner_mutex};
                    handle = interner.intern_string(key_for(i));
                }
                results[t].push_back(std::move(handle));
            }
        });
    }
    for (auto& thread: threads) {
        thread.join();
    }

    EXPECT_EQ(interner.size(), static_cast<size_t>(kKeyCount));
    for (int t = 0; t < kThreadCount; t++) {
        ASSERT_EQ(results[t].size(), static_cast<size_t>(kRoundCount));
        for (int i = 0; i < kRoundCount; i++) {
            auto canonical = interner.try_intern(key_for(i));
            ASSERT_TRUE(canonical.has_value());
            EXPECT_TRUE(results[t][i].ptr_eq(*canonical));
        }
    }

    // every thread holds kRoundCount / kKeyCount clones of each key, plus the table's reference
    size_t const expected_count = kThreadCount * (kRoundCount / kKeyCount) + 1;
    for (int k = 0; k < kKeyCount; k++) {
        auto canonical = interner.try_intern(key_for(k));
        ASSERT_TRUE(canonical.has_value());
        EXPECT_EQ(canonical->strong_count(), expected_count + 1);
    }
}

TEST(ArcInternerTests1, HandlesDroppedOnOtherThreadsAreCompacted) {
    rci::ArcInterner<int> interner;
    std::vector<rci::Arc<int>> handles;
    for (int i = 0; i < 64; i++) {
        handles.push_back(interner.intern(i));
    }

    // even values are released on worker threads, odd ones are kept here
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        std::vector<rci::Arc<int>> batch;
        for (int i = t * 16; i < (t + 1) * 16; i += 2) {
            batch.push_back(std::move(handles[i]));
        }
        threads.emplace_back([batch = std::move(batch)]() mutable {
            batch.clear();
        });
    }
    for (auto& thread: threads) {
        thread.join();
    }

    interner.compact();
    EXPECT_EQ(interner.size(), 32u);
    for (int i = 0; i < 64; i++) {
        auto found = interner.try_intern(i);
        if (i % 2 == 0) {
            EXPECT_FALSE(found.has_value()) << "value " << i;
        } else {
            ASSERT_TRUE(found.has_value()) << "value " << i;
            EXPECT_TRUE(found->ptr_eq(handles[i]));
        }
    }
}

TEST(ArcInternerTests1, SliceHandlesShareAcrossThreads) {
    rci::ArcSliceInterner<int> interner;
    int const items[] = {1, 2, 3};
    auto canonical = interner.intern_slice(items);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreadCount; t++) {
        threads.emplace_back([canonical]() {
            for (int i = 0; i < kRoundCount; i++) {
                rci::Arc<std::vector<int>> clone = canonical;
                EXPECT_EQ((*clone)[2], 3);
            }
        });
    }
    for (auto& thread: threads) {
        thread.join();
    }
    EXPECT_EQ(canonical.strong_count(), 2u);
}
