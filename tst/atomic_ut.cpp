//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis 
#include "atomic.hpp"

#include <thread>
#include <chrono>
#include <mutex>
#include <vector>
#include <string>

#include <gtest/gtest.h>

TEST(spinlock, construct) {
    gsd::spinlock slk;
    EXPECT_EQ(std::string("gsd::spinlock"), slk.name());
}

TEST(spinlock, lock_unlock) {
    bool written = false;
    bool tested = false;
    gsd::spinlock slk;

    slk.lock();

    std::thread tester([&]{
        slk.lock();
        EXPECT_TRUE(written);
        tested = true;
        slk.unlock();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    written = true;

    slk.unlock();

    tester.join();
    EXPECT_TRUE(tested);
}

TEST(spinlock, try_lock_unlock) {
    gsd::spinlock slk;

    slk.lock();

    std::thread tester([&]{
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        slk.unlock();
    });

    for(size_t i=0; i<100; ++i) {
        EXPECT_FALSE(slk.try_lock());
    }

    tester.join();

    EXPECT_TRUE(slk.try_lock());
    slk.unlock();
    EXPECT_TRUE(slk.try_lock());
    slk.unlock();
}

TEST(spinlock, lock_guard_contention) {
    const size_t thread_count = 4;
    const size_t increments = 10000;
    size_t counter = 0;
    gsd::spinlock slk;
    std::vector<std::thread> thds;

    for(size_t t=0; t<thread_count; ++t) {
        thds.emplace_back([&]{
            for(size_t i=0; i<increments; ++i) {
                std::lock_guard<gsd::spinlock> lk(slk);
                ++counter;
            }
        });
    }

    for(auto& thd : thds) { thd.join(); }

    EXPECT_EQ(thread_count * increments, counter);
}
