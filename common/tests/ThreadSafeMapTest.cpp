#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <string>

struct Lease {
    std::string owner;

    explicit Lease(const std::string& o = "") : owner(o) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, Lease> map;
};

TEST_F(ThreadSafeMapTest, InsertFindAndRemove) {
    map.insert("user-1", std::make_shared<Lease>("batch"));

    auto found = map.find("user-1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->owner, "batch");

    EXPECT_TRUE(map.remove("user-1"));
    EXPECT_FALSE(map.remove("user-1"));
    EXPECT_EQ(map.find("user-1"), nullptr);
    EXPECT_EQ(map.size(), 0u);
}

TEST_F(ThreadSafeMapTest, TryInsertDoesNotOverwrite) {
    EXPECT_TRUE(map.tryInsert("user-1", std::make_shared<Lease>("first")));
    EXPECT_FALSE(map.tryInsert("user-1", std::make_shared<Lease>("second")));

    auto found = map.find("user-1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->owner, "first");
}

// Ровно один поток из многих получает ключ
TEST_F(ThreadSafeMapTest, ConcurrentTryInsert_SingleWinner) {
    const int NUM_THREADS = 16;
    std::atomic<int> winners(0);
    std::vector<std::thread> threads;

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([this, &winners, i]() {
            if (map.tryInsert("user-1", std::make_shared<Lease>(std::to_string(i)))) {
                winners++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners, 1);
    EXPECT_EQ(map.size(), 1u);
}

// Захват и освобождение в цикле: после join словарь пуст
TEST_F(ThreadSafeMapTest, ConcurrentAcquireRelease_LeavesMapEmpty) {
    const int NUM_THREADS = 8;
    const int ITERATIONS = 200;
    std::atomic<int> acquired(0);
    std::vector<std::thread> threads;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this, &acquired, t]() {
            const std::string key = "user-" + std::to_string(t % 2);
            for (int i = 0; i < ITERATIONS; ++i) {
                if (map.tryInsert(key, std::make_shared<Lease>())) {
                    acquired++;
                    map.remove(key);
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_GT(acquired, 0);
    EXPECT_EQ(map.size(), 0u);
}
