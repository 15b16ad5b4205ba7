//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis 
#include <string>
#include <thread>
#include <type_traits>

#include "loguru.hpp"
#include "shutdown.hpp"

#include <gtest/gtest.h> 
#include "test_helpers.hpp"

TEST(delay_token, move_only) {
    EXPECT_FALSE(std::is_copy_constructible_v<gsd::delay_token<int>>);
    EXPECT_FALSE(std::is_copy_assignable_v<gsd::delay_token<int>>);
    EXPECT_TRUE(std::is_move_constructible_v<gsd::delay_token<int>>);
    EXPECT_TRUE(std::is_move_assignable_v<gsd::delay_token<int>>);
}

TEST(delay_token, default_is_inert) {
    gsd::delay_token<int> tok;
    EXPECT_FALSE(tok.valid());
    tok.reset();
    EXPECT_FALSE(tok.valid());
}

TEST(delay_token, release_on_destruction) {
    gsd::shutdown<int> sd;

    {
        auto tok = sd.delay_shutdown_token();
        ASSERT_TRUE(tok);
        EXPECT_TRUE(tok->valid());
        EXPECT_EQ(1u, sd.delay_count());
        EXPECT_TRUE(sd.trigger_shutdown(1));
        EXPECT_FALSE(sd.is_completed());
    }

    EXPECT_EQ(0u, sd.delay_count());
    EXPECT_TRUE(sd.is_completed());
}

TEST(delay_token, reset_is_idempotent) {
    gsd::shutdown<int> sd;
    auto tok1 = sd.delay_shutdown_token();
    auto tok2 = sd.delay_shutdown_token();
    ASSERT_TRUE(tok1);
    ASSERT_TRUE(tok2);
    EXPECT_EQ(2u, sd.delay_count());

    tok1->reset();
    EXPECT_FALSE(tok1->valid());
    EXPECT_EQ(1u, sd.delay_count());

    // repeated releases do not release tok2's delay
    tok1->reset();
    tok1->reset();
    EXPECT_EQ(1u, sd.delay_count());

    EXPECT_TRUE(sd.trigger_shutdown(1));
    EXPECT_FALSE(sd.is_completed());

    tok2->reset();
    EXPECT_TRUE(sd.is_completed());
    EXPECT_EQ(0u, sd.delay_count());
}

TEST(delay_token, move) {
    gsd::shutdown<int> sd;
    auto r = sd.delay_shutdown_token();
    ASSERT_TRUE(r);

    gsd::delay_token<int> tok = std::move(*r);
    EXPECT_TRUE(tok.valid());
    EXPECT_FALSE(r->valid());
    EXPECT_EQ(1u, sd.delay_count());

    // the moved-from token is inert
    r->reset();
    EXPECT_EQ(1u, sd.delay_count());

    gsd::delay_token<int> tok2(std::move(tok));
    EXPECT_FALSE(tok.valid());
    EXPECT_TRUE(tok2.valid());
    EXPECT_EQ(1u, sd.delay_count());

    tok2.reset();
    EXPECT_EQ(0u, sd.delay_count());
}

TEST(delay_token, move_assign_releases_previous) {
    gsd::shutdown<int> sd;
    gsd::delay_token<int> tok1 = std::move(*(sd.delay_shutdown_token()));
    gsd::delay_token<int> tok2 = std::move(*(sd.delay_shutdown_token()));
    EXPECT_EQ(2u, sd.delay_count());

    tok1 = std::move(tok2);
    EXPECT_TRUE(tok1.valid());
    EXPECT_FALSE(tok2.valid());
    EXPECT_EQ(1u, sd.delay_count());

    tok1 = gsd::delay_token<int>();
    EXPECT_FALSE(tok1.valid());
    EXPECT_EQ(0u, sd.delay_count());
}

TEST(delay_token, outlives_coordinator) {
    gsd::delay_token<int> tok;

    {
        gsd::shutdown<int> sd;
        tok = std::move(*(sd.delay_shutdown_token()));
        EXPECT_TRUE(sd.trigger_shutdown(1));
    }

    // the shared state is kept alive by the token
    EXPECT_TRUE(tok.valid());
    tok.reset();
    EXPECT_FALSE(tok.valid());
}

TEST(delay_token, release_from_another_thread) {
    gsd::shutdown<int> sd;
    auto tok = sd.delay_shutdown_token();
    ASSERT_TRUE(tok);
    EXPECT_TRUE(sd.trigger_shutdown(5));

    std::thread thd([t = std::move(*tok)]() mutable { t.reset(); });

    int reason = sd.wait_shutdown_complete();
    EXPECT_EQ(5, reason);
    thd.join();

    EXPECT_TRUE(sd.is_completed());
}

TEST(trigger_token, move_only) {
    EXPECT_FALSE(std::is_copy_constructible_v<gsd::trigger_token<int>>);
    EXPECT_FALSE(std::is_copy_assignable_v<gsd::trigger_token<int>>);
    EXPECT_TRUE(std::is_move_constructible_v<gsd::trigger_token<int>>);
    EXPECT_TRUE(std::is_move_assignable_v<gsd::trigger_token<int>>);
}

TEST(trigger_token, default_is_inert) {
    gsd::trigger_token<int> tok;
    EXPECT_FALSE(tok.valid());
    EXPECT_FALSE(tok.reason());
    tok.reset();
    EXPECT_FALSE(tok.valid());
}

TEST(trigger_token, trigger_on_destruction) {
    gsd::shutdown<int> sd;

    {
        auto tok = sd.trigger_shutdown_token(1);
        EXPECT_TRUE(tok.valid());
        EXPECT_EQ(1, *(tok.reason()));
        EXPECT_FALSE(sd.is_triggered());
    }

    EXPECT_TRUE(sd.is_triggered());
    EXPECT_TRUE(sd.is_completed());
    ASSERT_TRUE(sd.shutdown_reason());
    EXPECT_EQ(1, *(sd.shutdown_reason()));
}

TEST(trigger_token, reset) {
    gsd::shutdown<std::string> sd;
    auto tok = sd.trigger_shutdown_token("stop");

    tok.reset();
    EXPECT_FALSE(tok.valid());
    EXPECT_TRUE(sd.is_triggered());
    EXPECT_EQ(std::string("stop"), *(sd.shutdown_reason()));

    // further releases do nothing
    tok.reset();
    EXPECT_EQ(std::string("stop"), *(sd.shutdown_reason()));
}

TEST(trigger_token, does_not_override) {
    gsd::shutdown<int> sd;
    auto tok = sd.trigger_shutdown_token(1);

    EXPECT_TRUE(sd.trigger_shutdown(2));

    tok.reset();
    EXPECT_EQ(2, *(sd.shutdown_reason()));
}

TEST(trigger_token, first_released_wins) {
    gsd::shutdown<int> sd;
    auto tok1 = sd.trigger_shutdown_token(1);
    auto tok2 = sd.vital_token(2);

    tok2.reset();
    tok1.reset();
    EXPECT_EQ(2, *(sd.shutdown_reason()));
}

TEST(trigger_token, move) {
    gsd::shutdown<int> sd;
    auto tok = sd.trigger_shutdown_token(3);
    gsd::trigger_token<int> tok2(std::move(tok));

    EXPECT_FALSE(tok.valid());
    EXPECT_TRUE(tok2.valid());
    EXPECT_EQ(3, *(tok2.reason()));
    EXPECT_FALSE(tok.reason());

    // the moved-from token is inert
    tok.reset();
    EXPECT_FALSE(sd.is_triggered());

    gsd::trigger_token<int> tok3;
    tok3 = std::move(tok2);
    EXPECT_FALSE(tok2.valid());
    EXPECT_FALSE(sd.is_triggered());

    tok3.reset();
    EXPECT_TRUE(sd.is_triggered());
    EXPECT_EQ(3, *(sd.shutdown_reason()));
}

TEST(trigger_token, move_assign_releases_previous) {
    gsd::shutdown<int> sd;
    auto tok1 = sd.trigger_shutdown_token(1);
    auto tok2 = sd.trigger_shutdown_token(2);

    // tok1's previous capability is released by the assignment
    tok1 = std::move(tok2);
    EXPECT_TRUE(sd.is_triggered());
    EXPECT_EQ(1, *(sd.shutdown_reason()));
    EXPECT_TRUE(tok1.valid());
    EXPECT_EQ(2, *(tok1.reason()));
    EXPECT_FALSE(tok2.reason());
}

TEST(trigger_token, wakes_waiters) {
    gsd::shutdown<int> sd;
    test::queue<int> q;

    std::thread thd([&]{ 
        int reason = sd.wait_shutdown_triggered();
        q.push(reason);
    });

    test::wait_until([&]{ return sd.waiter_count() == 1; });

    {
        auto tok = sd.trigger_shutdown_token(4);
    }

    EXPECT_EQ(4, q.pop());
    thd.join();
}

TEST(trigger_token, with_delay) {
    gsd::shutdown<int> sd;
    auto delay = sd.delay_shutdown_token();
    ASSERT_TRUE(delay);

    sd.trigger_shutdown_token(6).reset();

    EXPECT_TRUE(sd.is_triggered());
    EXPECT_FALSE(sd.is_completed());

    delay->reset();
    EXPECT_TRUE(sd.is_completed());
    EXPECT_EQ(6, *(sd.shutdown_reason()));
}
