#include "collab/rt/KeyedMutex.hpp"
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace collab::rt;

TEST(KeyedMutexTest, SameKeyMapsToSameStripe) {
    KeyedMutex km(16);
    EXPECT_EQ(km.stripes(), 16u);
    EXPECT_EQ(&km.forKey("order-1"), &km.forKey("order-1"));
}

TEST(KeyedMutexTest, ZeroStripesFallsBackToOne) {
    KeyedMutex km(0);
    EXPECT_EQ(km.stripes(), 1u);
    EXPECT_EQ(&km.forKey("a"), &km.forKey("b"));
    std::lock_guard<std::mutex> lk(km.forKey("a"));
    bool acquired = true;
    std::thread other([&]{
        acquired = km.forKey("b").try_lock();
        if (acquired) km.forKey("b").unlock();
    });
    other.join();
    EXPECT_FALSE(acquired);
}

TEST(KeyedMutexTest, SerializesWritersOnOneKey) {
    KeyedMutex km;
    int counter = 0;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]{
            for (int i = 0; i < 1000; ++i) {
                std::lock_guard<std::mutex> lk(km.forKey("order-1"));
                ++counter;
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(counter, 8000);
}
