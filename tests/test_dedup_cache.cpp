#include "dedup_cache.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

TEST(dedup_cache, first_sighting_wins) {
    session_tail::dedup_cache seen(10);

    EXPECT_TRUE(seen.try_mark_seen("a"));
    EXPECT_FALSE(seen.try_mark_seen("a"));
    EXPECT_TRUE(seen.try_mark_seen("b"));
    EXPECT_TRUE(seen.contains("a"));
    EXPECT_EQ(seen.size(), 2u);
}

TEST(dedup_cache, evicts_oldest_first) {
    session_tail::dedup_cache seen(3);

    seen.try_mark_seen("1");
    seen.try_mark_seen("2");
    seen.try_mark_seen("3");
    seen.try_mark_seen("4");

    EXPECT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen.evictions(), 1u);
    EXPECT_FALSE(seen.contains("1"));
    EXPECT_TRUE(seen.contains("2"));
    EXPECT_TRUE(seen.contains("4"));

    // An evicted key is accepted again
    EXPECT_TRUE(seen.try_mark_seen("1"));
    EXPECT_FALSE(seen.contains("2"));
}

TEST(dedup_cache, stays_bounded_at_default_capacity) {
    session_tail::dedup_cache seen;
    ASSERT_EQ(seen.capacity(), 100000u);

    for (int i = 0; i < 150000; ++i) {
        ASSERT_TRUE(seen.try_mark_seen("key-" + std::to_string(i)));
    }

    EXPECT_EQ(seen.size(), 100000u);
    EXPECT_EQ(seen.evictions(), 50000u);
    EXPECT_FALSE(seen.contains("key-0"));
    EXPECT_FALSE(seen.contains("key-49999"));
    EXPECT_TRUE(seen.contains("key-50000"));
    EXPECT_TRUE(seen.contains("key-149999"));

    // Replaying the newest keys is rejected
    for (int i = 50000; i < 150000; ++i) {
        ASSERT_FALSE(seen.try_mark_seen("key-" + std::to_string(i))) << i;
    }
    EXPECT_EQ(seen.evictions(), 50000u);
}

TEST(dedup_cache, concurrent_marks_accept_each_key_once) {
    session_tail::dedup_cache seen(1000);
    std::atomic<int> accepted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                if (seen.try_mark_seen(std::to_string(i))) accepted++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(accepted.load(), 500);
}

TEST(dedup_cache, clear_forgets_everything) {
    session_tail::dedup_cache seen(5);
    seen.try_mark_seen("x");
    seen.clear();

    EXPECT_EQ(seen.size(), 0u);
    EXPECT_TRUE(seen.try_mark_seen("x"));
}
