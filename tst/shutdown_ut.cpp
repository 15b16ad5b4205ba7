//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis 
#include <deque>
#include <string>
#include <thread>
#include <chrono>
#include <vector>
#include <atomic>

#include "loguru.hpp"
#include "scheduler.hpp"
#include "shutdown.hpp"

#include <gtest/gtest.h> 
#include "test_helpers.hpp"

namespace test {
namespace shutdown {

template <typename T>
gsd::co<T> co_wait_triggered(gsd::shutdown<T> sd) {
    co_return co_await sd.wait_shutdown_triggered();
}

template <typename T>
gsd::co<T> co_wait_complete(gsd::shutdown<T> sd) {
    co_return co_await sd.wait_shutdown_complete();
}

template <typename T>
size_t wait_triggered_threads_T(const size_t thread_count) {
    std::string fname = gsd::type::templatize<T>("wait_triggered_threads_T");
    GSD_INFO_FUNCTION_ENTER(fname);

    size_t success_count = 0;
    test::queue<T> q;
    gsd::shutdown<T> sd;
    std::vector<std::thread> thds;

    for(size_t i=0; i<thread_count; ++i) {
        thds.emplace_back([&]{
            T reason = sd.wait_shutdown_triggered();
            q.push(std::move(reason));
        });
    }

    // every thread is registered before the trigger
    test::wait_until([&]{ return sd.waiter_count() == thread_count; });
    EXPECT_EQ(0u, q.size());

    EXPECT_TRUE(sd.trigger_shutdown(test::init<T>(5)));

    for(size_t i=0; i<thread_count; ++i) {
        EXPECT_EQ((T)test::init<T>(5), q.pop());
    }

    for(auto& thd : thds) { thd.join(); }

    EXPECT_EQ(0u, sd.waiter_count());
    ++success_count;
    return success_count;
}

template <typename T>
size_t wait_coroutines_T(const size_t coroutine_count) {
    std::string fname = gsd::type::templatize<T>("wait_coroutines_T");
    GSD_INFO_FUNCTION_ENTER(fname);

    size_t success_count = 0;
    gsd::shutdown<T> sd;
    auto tok = sd.delay_shutdown_token();
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();
    std::deque<gsd::awt<T>> triggered;
    std::deque<gsd::awt<T>> completed;

    for(size_t i=0; i<coroutine_count; ++i) {
        triggered.push_back(sch.schedule(co_wait_triggered<T>(sd)));
        completed.push_back(sch.schedule(co_wait_complete<T>(sd)));
    }

    test::wait_until([&]{ return sd.waiter_count() == 2 * coroutine_count; });

    EXPECT_TRUE(sd.trigger_shutdown(test::init<T>(6)));

    while(triggered.size()) {
        T reason = triggered.front();
        triggered.pop_front();
        EXPECT_EQ((T)test::init<T>(6), reason);
    }

    // the delay keeps every completion waiter registered
    EXPECT_FALSE(sd.is_completed());
    EXPECT_EQ(coroutine_count, sd.waiter_count());

    tok->reset();

    while(completed.size()) {
        T reason = completed.front();
        completed.pop_front();
        EXPECT_EQ((T)test::init<T>(6), reason);
    }

    EXPECT_TRUE(sd.is_completed());
    EXPECT_EQ(0u, sd.waiter_count());
    ++success_count;
    return success_count;
}

}
}

TEST(shutdown, construct) {
    gsd::shutdown<int> sd;

    EXPECT_FALSE(sd.is_triggered());
    EXPECT_FALSE(sd.is_completed());
    EXPECT_FALSE(sd.shutdown_reason());
    EXPECT_EQ(0u, sd.waiter_count());
    EXPECT_EQ(0u, sd.delay_count());
    EXPECT_NE(std::string::npos, sd.name().find("gsd::shutdown"));
}

TEST(shutdown, copies_share_state) {
    gsd::shutdown<int> sd;
    gsd::shutdown<int> sd2 = sd;
    gsd::shutdown<int> sd3;
    sd3 = sd2;

    EXPECT_TRUE(sd3.trigger_shutdown(4));

    EXPECT_TRUE(sd.is_triggered());
    EXPECT_TRUE(sd2.is_triggered());
    EXPECT_EQ(4, *(sd.shutdown_reason()));
    EXPECT_EQ(4, *(sd2.shutdown_reason()));
}

TEST(shutdown, moved_from_stays_usable) {
    gsd::shutdown<int> sd;
    gsd::shutdown<int> sd2(std::move(sd));
    gsd::shutdown<int> sd3;
    sd3 = std::move(sd2);

    EXPECT_FALSE(sd.is_triggered());
    EXPECT_EQ(0u, sd2.waiter_count());

    EXPECT_TRUE(sd2.trigger_shutdown(5));
    EXPECT_TRUE(sd.is_completed());
    EXPECT_TRUE(sd3.is_completed());
    EXPECT_EQ(5, *(sd3.shutdown_reason()));
}

TEST(shutdown, trigger_first_wins) {
    gsd::shutdown<int> sd;

    auto r = sd.trigger_shutdown(1);
    EXPECT_TRUE(r);
    EXPECT_TRUE(sd.is_triggered());
    EXPECT_EQ(1, *(sd.shutdown_reason()));

    auto r2 = sd.trigger_shutdown(2);
    ASSERT_FALSE(r2);
    EXPECT_EQ(1, r2.error().reason);
    EXPECT_EQ(1, *(sd.shutdown_reason()));
}

TEST(shutdown, trigger_concurrently) {
    const int thread_count = 8;
    gsd::shutdown<int> sd;
    std::atomic<int> winners(0);
    std::atomic<int> winner(-1);
    std::atomic<bool> go(false);
    std::vector<std::thread> thds;

    for(int i=0; i<thread_count; ++i) {
        thds.emplace_back([&,i]{
            while(!go) { std::this_thread::yield(); }

            if(sd.trigger_shutdown(i)) {
                ++winners;
                winner = i;
            }
        });
    }

    go = true;

    for(auto& thd : thds) { thd.join(); }

    EXPECT_EQ(1, winners.load());
    EXPECT_EQ(winner.load(), *(sd.shutdown_reason()));
}

TEST(shutdown, trigger_without_delays_completes) {
    gsd::shutdown<int> sd;

    EXPECT_TRUE(sd.trigger_shutdown(3));
    EXPECT_TRUE(sd.is_triggered());
    EXPECT_TRUE(sd.is_completed());
}

TEST(shutdown, delay_blocks_completion) {
    gsd::shutdown<std::string> c;
    test::queue<bool> release_q;

    auto tok = c.delay_shutdown_token();
    ASSERT_TRUE(tok);
    EXPECT_EQ(1u, c.delay_count());

    // unit A holds the delay until it is told to release
    std::thread a([&release_q, t = std::move(*tok)]() mutable {
        release_q.pop();
        t.reset();
    });

    EXPECT_TRUE(c.trigger_shutdown("boom"));
    EXPECT_TRUE(c.is_triggered());
    EXPECT_FALSE(c.is_completed());

    release_q.push(true);
    a.join();

    EXPECT_TRUE(c.is_completed());
    EXPECT_EQ(0u, c.delay_count());

    std::string reason = c.wait_shutdown_complete();
    EXPECT_EQ(std::string("boom"), reason);
}

TEST(shutdown, delay_after_trigger) {
    gsd::shutdown<int> sd;

    auto tok1 = sd.delay_shutdown_token();
    ASSERT_TRUE(tok1);
    EXPECT_TRUE(sd.trigger_shutdown(1));

    // a triggered shutdown can still be delayed
    auto tok2 = sd.delay_shutdown_token();
    ASSERT_TRUE(tok2);
    EXPECT_EQ(2u, sd.delay_count());

    tok1->reset();
    EXPECT_FALSE(sd.is_completed());

    tok2->reset();
    EXPECT_TRUE(sd.is_completed());

    // a completed shutdown cannot
    auto tok3 = sd.delay_shutdown_token();
    ASSERT_FALSE(tok3);
    EXPECT_EQ(1, tok3.error().reason);
    EXPECT_EQ(0u, sd.delay_count());
}

TEST(shutdown, release_delays_before_trigger) {
    gsd::shutdown<int> sd;

    {
        auto tok1 = sd.delay_shutdown_token();
        auto tok2 = sd.delay_shutdown_token();
        EXPECT_EQ(2u, sd.delay_count());
    }

    // releasing every delay does not complete an untriggered shutdown
    EXPECT_EQ(0u, sd.delay_count());
    EXPECT_FALSE(sd.is_triggered());
    EXPECT_FALSE(sd.is_completed());

    EXPECT_TRUE(sd.trigger_shutdown(2));
    EXPECT_TRUE(sd.is_completed());
}

TEST(shutdown, delays_concurrently) {
    const size_t thread_count = 8;
    const size_t iterations = 1000;
    gsd::shutdown<int> sd;
    auto tok = sd.delay_shutdown_token();
    std::vector<std::thread> thds;

    for(size_t i=0; i<thread_count; ++i) {
        thds.emplace_back([&]{
            for(size_t j=0; j<iterations; ++j) {
                auto t = sd.delay_shutdown_token();
                EXPECT_TRUE(t);
            }
        });
    }

    EXPECT_TRUE(sd.trigger_shutdown(1));

    for(auto& thd : thds) { thd.join(); }

    EXPECT_FALSE(sd.is_completed());
    EXPECT_EQ(1u, sd.delay_count());

    tok->reset();

    EXPECT_TRUE(sd.is_completed());
    EXPECT_EQ(0u, sd.delay_count());
}

TEST(shutdown, wait_resolves_immediately) {
    gsd::shutdown<int> sd;
    EXPECT_TRUE(sd.trigger_shutdown(8));

    int triggered = sd.wait_shutdown_triggered();
    int completed = sd.wait_shutdown_complete();

    EXPECT_EQ(8, triggered);
    EXPECT_EQ(8, completed);
    EXPECT_EQ(0u, sd.waiter_count());
}

TEST(shutdown, wait_triggered_threads) {
    const size_t expected = 1;
    EXPECT_EQ(expected, test::shutdown::wait_triggered_threads_T<int>(1));
    EXPECT_EQ(expected, test::shutdown::wait_triggered_threads_T<int>(8));
    EXPECT_EQ(expected, test::shutdown::wait_triggered_threads_T<size_t>(8));
    EXPECT_EQ(expected, test::shutdown::wait_triggered_threads_T<double>(8));
    EXPECT_EQ(expected, test::shutdown::wait_triggered_threads_T<std::string>(8));
    EXPECT_EQ(expected, test::shutdown::wait_triggered_threads_T<test::CustomObject>(8));
}

TEST(shutdown, wait_coroutines) {
    const size_t expected = 1;
    EXPECT_EQ(expected, test::shutdown::wait_coroutines_T<int>(1));
    EXPECT_EQ(expected, test::shutdown::wait_coroutines_T<int>(16));
    EXPECT_EQ(expected, test::shutdown::wait_coroutines_T<size_t>(16));
    EXPECT_EQ(expected, test::shutdown::wait_coroutines_T<double>(16));
    EXPECT_EQ(expected, test::shutdown::wait_coroutines_T<std::string>(16));
    EXPECT_EQ(expected, test::shutdown::wait_coroutines_T<test::CustomObject>(16));
}

TEST(shutdown, wait_complete_requires_trigger) {
    gsd::shutdown<int> sd;
    test::queue<int> q;

    std::thread thd([&]{ 
        int reason = sd.wait_shutdown_complete();
        q.push(reason);
    });

    test::wait_until([&]{ return sd.waiter_count() == 1; });

    // no delays exist, but the shutdown was never triggered
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(0u, q.size());
    EXPECT_FALSE(sd.is_completed());

    EXPECT_TRUE(sd.trigger_shutdown(2));
    EXPECT_EQ(2, q.pop());
    thd.join();

    EXPECT_EQ(0u, sd.waiter_count());
}

TEST(shutdown, wait_complete_requires_delays_released) {
    gsd::shutdown<int> sd;
    test::queue<int> q;
    auto tok = sd.delay_shutdown_token();
    ASSERT_TRUE(tok);

    std::thread thd([&]{ 
        int reason = sd.wait_shutdown_complete();
        q.push(reason);
    });

    test::wait_until([&]{ return sd.waiter_count() == 1; });
    EXPECT_TRUE(sd.trigger_shutdown(3));

    EXPECT_TRUE(sd.is_triggered());
    EXPECT_FALSE(sd.is_completed());
    EXPECT_EQ(1u, sd.waiter_count());
    EXPECT_EQ(0u, q.size());

    tok->reset();

    EXPECT_EQ(3, q.pop());
    thd.join();

    EXPECT_TRUE(sd.is_completed());
    EXPECT_EQ(0u, sd.waiter_count());
}

TEST(shutdown, halt_removes_suspended_waiters) {
    const size_t count = 100;
    test::queue<int> q;
    gsd::shutdown<int> sd;

    struct helper {
        static inline gsd::co<void> wait(gsd::shutdown<int> sd, test::queue<int>& q) {
            q.push(co_await sd.wait_shutdown_triggered());
        }
    };

    {
        auto lf = gsd::scheduler::make();

        for(size_t i=0; i<count; ++i) {
            lf->scheduler().detach(helper::wait(sd, q));
        }

        test::wait_until([&]{ return sd.waiter_count() == count; });
    }

    // the suspended coroutines were destroyed with their registrations
    EXPECT_EQ(0u, sd.waiter_count());
    EXPECT_TRUE(sd.trigger_shutdown(1));
    EXPECT_EQ(0u, q.size());
}
