//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis 
#include <vector>
#include <string>

#include "loguru.hpp"
#include "waiter_list.hpp"

#include <gtest/gtest.h>

TEST(waiter_list, construct) {
    gsd::waiter_list wl;

    EXPECT_EQ(0u, wl.size());
    EXPECT_TRUE(wl.empty());
    EXPECT_EQ(0u, wl.slots());
    EXPECT_EQ(0u, wl.empty_slots());
    EXPECT_EQ(0u, wl.epoch());
    EXPECT_EQ(std::string("gsd::waiter_list"), wl.name());
}

TEST(waiter_list, add_wake_all) {
    gsd::waiter_list wl;
    std::vector<int> called;

    for(int i=0; i<5; ++i) {
        wl.add([&called,i]{ called.push_back(i); });
        EXPECT_EQ((size_t)(i+1), wl.size());
    }

    EXPECT_EQ(0u, called.size());

    wl.wake_all();

    ASSERT_EQ(5u, called.size());

    for(int i=0; i<5; ++i) {
        EXPECT_EQ(i, called[i]);
    }

    EXPECT_TRUE(wl.empty());
    EXPECT_EQ(0u, wl.slots());
    EXPECT_EQ(1u, wl.epoch());

    // a second wake calls nothing
    wl.wake_all();
    EXPECT_EQ(5u, called.size());
    EXPECT_EQ(2u, wl.epoch());
}

TEST(waiter_list, remove) {
    gsd::waiter_list wl;
    int first = 0;
    int second = 0;

    auto k1 = wl.add([&]{ ++first; });
    auto k2 = wl.add([&]{ ++second; });
    EXPECT_EQ(2u, wl.size());

    EXPECT_TRUE(wl.remove(k1));
    EXPECT_EQ(1u, wl.size());
    EXPECT_EQ(1u, wl.empty_slots());

    // a removed registration cannot be removed again
    EXPECT_FALSE(wl.remove(k1));
    EXPECT_EQ(1u, wl.size());

    wl.wake_all();

    EXPECT_EQ(0, first);
    EXPECT_EQ(1, second);

    // k2 was woken
    EXPECT_FALSE(wl.remove(k2));
}

TEST(waiter_list, slot_reuse) {
    gsd::waiter_list wl;

    wl.add([]{});
    auto k = wl.add([]{});
    wl.add([]{});

    EXPECT_EQ(3u, wl.slots());
    EXPECT_TRUE(wl.remove(k));
    EXPECT_EQ(2u, wl.size());
    EXPECT_EQ(3u, wl.slots());

    auto k2 = wl.add([]{});
    EXPECT_EQ(k.index, k2.index);
    EXPECT_EQ(3u, wl.size());
    EXPECT_EQ(3u, wl.slots());
    EXPECT_EQ(0u, wl.empty_slots());
}

TEST(waiter_list, bounded_by_live_registrations) {
    gsd::waiter_list wl;
    auto k = wl.add([]{});

    for(size_t i=0; i<1000; ++i) {
        auto k2 = wl.add([]{});
        EXPECT_TRUE(wl.remove(k2));
    }

    EXPECT_EQ(1u, wl.size());
    EXPECT_EQ(2u, wl.slots());
    EXPECT_TRUE(wl.remove(k));
    EXPECT_EQ(0u, wl.size());
}

TEST(waiter_list, stale_keys) {
    gsd::waiter_list wl;
    int called = 0;

    auto k = wl.add([&]{ ++called; });
    EXPECT_EQ(0u, k.epoch);
    EXPECT_EQ(0u, k.index);

    wl.wake_all();
    EXPECT_EQ(1, called);

    // same index, new epoch
    auto k2 = wl.add([&]{ ++called; });
    EXPECT_EQ(1u, k2.epoch);
    EXPECT_EQ(k.index, k2.index);

    // the key from the previous epoch must not remove the new registration
    EXPECT_FALSE(wl.remove(k));
    EXPECT_EQ(1u, wl.size());

    // keys which were never issued are ignored
    EXPECT_FALSE(wl.remove(gsd::waiter_list::key{ 1, 10 }));
    EXPECT_EQ(1u, wl.size());

    wl.wake_all();
    EXPECT_EQ(2, called);
}

TEST(waiter_list, add_during_wake_all) {
    gsd::waiter_list wl;
    int called = 0;

    // a callback registering again waits for the next wake
    wl.add([&]{
        ++called;
        wl.add([&]{ ++called; });
    });

    wl.wake_all();
    EXPECT_EQ(1, called);
    EXPECT_EQ(1u, wl.size());

    wl.wake_all();
    EXPECT_EQ(2, called);
    EXPECT_TRUE(wl.empty());
}
