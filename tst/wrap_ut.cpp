//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis 
#include <deque>
#include <string>
#include <stdexcept>

#include "loguru.hpp"
#include "scheduler.hpp"
#include "shutdown.hpp"

#include <gtest/gtest.h> 
#include "test_helpers.hpp"

namespace test {
namespace wrap {

inline gsd::co<void> co_void() { co_return; }

template <typename T>
inline gsd::co<T> co_return_T(T t) {
    co_return t;
}

inline gsd::co<int> co_throw() {
    throw std::runtime_error("co_throw");
    co_return 0;
}

/*
 Waits until `gate` is triggered, then pushes `i` and returns it. Lets a test
 decide when a wrapped operation completes.
 */
inline gsd::co<int> co_gated(gsd::shutdown<int> gate, test::queue<int>& q, int i) {
    co_await gate.wait_shutdown_triggered();
    q.push(i);
    co_return i;
}

inline gsd::co<void> co_gated_void(gsd::shutdown<int> gate, test::queue<int>& q) {
    co_await gate.wait_shutdown_triggered();
    q.push(0);
    co_return;
}

// wait until a gated operation is suspended
inline void wait_for_gate(gsd::shutdown<int>& gate) {
    test::wait_until([&]{ return gate.waiter_count() == 1; });
}

/*
 Occupies the scheduler's thread: reports it is running on `running`, then
 blocks until something is pushed to `release`.
 */
inline gsd::co<void> co_occupy(test::queue<int>& running, test::queue<int>& release) {
    running.push(0);
    release.pop();
    co_return;
}

}
}

TEST(wrap_cancel, finishes_first) {
    gsd::shutdown<int> sd;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    for(int i=0; i<100; ++i) {
        gsd::result<int,int> r = sch.schedule(
            sd.wrap_cancel(test::wrap::co_return_T<int>(i)));
        ASSERT_TRUE(r);
        EXPECT_EQ(i, *r);

        // the trigger registration is removed once the operation finishes
        EXPECT_EQ(0u, sd.waiter_count());
    }

    EXPECT_FALSE(sd.is_triggered());
}

TEST(wrap_cancel, finishes_first_void) {
    gsd::shutdown<int> sd;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    gsd::result<void,int> r = sch.schedule(sd.wrap_cancel(test::wrap::co_void()));
    EXPECT_TRUE(r);
    EXPECT_EQ(0u, sd.waiter_count());
}

TEST(wrap_cancel, string_result) {
    gsd::shutdown<std::string> sd;

    // driven by the global scheduler
    gsd::result<std::string,std::string> r = gsd::schedule(
        sd.wrap_cancel(test::wrap::co_return_T<std::string>("done")));
    ASSERT_TRUE(r);
    EXPECT_EQ(std::string("done"), r.value());
    EXPECT_EQ(0u, sd.waiter_count());
}

TEST(wrap_cancel, already_triggered) {
    test::queue<int> q;
    gsd::shutdown<int> sd;
    gsd::shutdown<int> gate;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    EXPECT_TRUE(sd.trigger_shutdown(3));

    gsd::result<int,int> r = sch.schedule(
        sd.wrap_cancel(test::wrap::co_gated(gate, q, 1)));
    ASSERT_FALSE(r);
    EXPECT_EQ(3, r.error());
    EXPECT_THROW(r.value(), gsd::bad_result_access);

    // the operation was never started
    EXPECT_EQ(0u, gate.waiter_count());
    EXPECT_EQ(0u, q.size());
    EXPECT_EQ(0u, sd.waiter_count());
}

TEST(wrap_cancel, triggered_while_pending) {
    test::queue<int> q;
    gsd::shutdown<int> sd;
    gsd::shutdown<int> gate;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    auto awt = sch.schedule(sd.wrap_cancel(test::wrap::co_gated(gate, q, 1)));
    test::wrap::wait_for_gate(gate);
    EXPECT_EQ(1u, sd.waiter_count());

    EXPECT_TRUE(sd.trigger_shutdown(7));

    gsd::result<int,int> r = awt;
    ASSERT_FALSE(r);
    EXPECT_EQ(7, r.error());
    EXPECT_EQ(0u, sd.waiter_count());

    // the cancelled operation was destroyed while suspended
    EXPECT_EQ(0u, gate.waiter_count());
    EXPECT_TRUE(gate.trigger_shutdown(0));
    EXPECT_EQ(0u, q.size());
}

TEST(wrap_cancel, triggered_while_pending_void) {
    test::queue<int> q;
    gsd::shutdown<int> sd;
    gsd::shutdown<int> gate;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    auto awt = sch.schedule(sd.wrap_cancel(test::wrap::co_gated_void(gate, q)));
    test::wrap::wait_for_gate(gate);

    EXPECT_TRUE(sd.trigger_shutdown(8));

    gsd::result<void,int> r = awt;
    ASSERT_FALSE(r);
    EXPECT_EQ(8, r.error());
    EXPECT_EQ(0u, gate.waiter_count());
    EXPECT_EQ(0u, q.size());
}

TEST(wrap_cancel, many_pending) {
    const size_t count = 16;
    test::queue<int> q;
    gsd::shutdown<int> sd;
    gsd::shutdown<int> gate;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    std::deque<gsd::awt<gsd::result<int,int>>> awts;

    for(size_t i=0; i<count; ++i) {
        awts.push_back(sch.schedule(
            sd.wrap_cancel(test::wrap::co_gated(gate, q, (int)i))));
    }

    test::wait_until([&]{ return gate.waiter_count() == count; });
    EXPECT_EQ(count, sd.waiter_count());

    EXPECT_TRUE(sd.trigger_shutdown(9));

    while(awts.size()) {
        gsd::result<int,int> r = awts.front();
        awts.pop_front();
        ASSERT_FALSE(r);
        EXPECT_EQ(9, r.error());
    }

    EXPECT_EQ(0u, sd.waiter_count());
    EXPECT_EQ(0u, gate.waiter_count());
    EXPECT_EQ(0u, q.size());
}

TEST(wrap_cancel, releases_delay_of_cancelled_operation) {
    test::queue<int> q;
    gsd::shutdown<int> sd;
    gsd::shutdown<int> gate;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    auto w = sd.wrap_delay_shutdown(test::wrap::co_gated(gate, q, 1));
    ASSERT_TRUE(w);

    auto awt = sch.schedule(sd.wrap_cancel(std::move(*w)));
    test::wrap::wait_for_gate(gate);
    EXPECT_EQ(1u, sd.delay_count());

    EXPECT_TRUE(sd.trigger_shutdown(2));

    gsd::result<int,int> r = awt;
    ASSERT_FALSE(r);
    EXPECT_EQ(2, r.error());

    // the delay held inside the cancelled operation was released with it
    EXPECT_EQ(0u, sd.delay_count());
    EXPECT_TRUE(sd.is_completed());
    EXPECT_EQ(2, sd.wait_shutdown_complete());
    EXPECT_EQ(0u, gate.waiter_count());
    EXPECT_EQ(0u, q.size());
}

TEST(wrap_cancel, halted_while_pending) {
    test::queue<int> q;
    gsd::shutdown<int> sd;
    gsd::shutdown<int> gate;

    {
        auto lf = gsd::scheduler::make();
        lf->scheduler().detach(sd.wrap_cancel(test::wrap::co_gated(gate, q, 1)));
        test::wrap::wait_for_gate(gate);
        EXPECT_EQ(1u, sd.waiter_count());
    }

    // halting destroyed both the adapter and its operation
    EXPECT_EQ(0u, sd.waiter_count());
    EXPECT_EQ(0u, gate.waiter_count());
    EXPECT_FALSE(sd.is_triggered());
    EXPECT_EQ(0u, q.size());
}

TEST(wrap_cancel, trigger_after_completion) {
    test::queue<int> q;
    test::queue<int> running;
    test::queue<int> release1;
    test::queue<int> release2;
    gsd::shutdown<int> sd;
    gsd::shutdown<int> gate;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    auto awt = sch.schedule(sd.wrap_cancel(test::wrap::co_gated(gate, q, 1)));
    test::wrap::wait_for_gate(gate);

    sch.detach(test::wrap::co_occupy(running, release1));
    running.pop();

    // queue the operation, then something to hold the adapter back after it
    EXPECT_TRUE(gate.trigger_shutdown(0));
    sch.detach(test::wrap::co_occupy(running, release2));

    release1.push(0);
    running.pop();

    // the operation finished but the adapter has not run yet
    EXPECT_EQ(1, q.pop());
    EXPECT_EQ(0u, sd.waiter_count());

    EXPECT_TRUE(sd.trigger_shutdown(7));
    release2.push(0);

    gsd::result<int,int> r = awt;
    ASSERT_TRUE(r);
    EXPECT_EQ(1, *r);
}

TEST(wrap_cancel, operation_throws) {
    gsd::shutdown<int> sd;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    {
        auto awt = sch.schedule(sd.wrap_cancel(test::wrap::co_throw()));
        EXPECT_THROW((gsd::result<int,int>)awt, 
                     gsd::awaitable_destroyed_without_joining_result);
    }

    EXPECT_EQ(0u, sd.waiter_count());
    EXPECT_FALSE(sd.is_triggered());
}

TEST(wrap_delay_shutdown, holds_completion) {
    test::queue<int> q;
    gsd::shutdown<int> sd;
    gsd::shutdown<int> gate;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    auto w = sd.wrap_delay_shutdown(test::wrap::co_gated(gate, q, 2));
    ASSERT_TRUE(w);
    EXPECT_EQ(1u, sd.delay_count());

    auto awt = sch.schedule(std::move(*w));
    EXPECT_TRUE(sd.trigger_shutdown(1));
    EXPECT_TRUE(sd.is_triggered());
    EXPECT_FALSE(sd.is_completed());

    EXPECT_TRUE(gate.trigger_shutdown(0));

    int r = awt;
    EXPECT_EQ(2, r);
    EXPECT_EQ(2, q.pop());
    EXPECT_TRUE(sd.is_completed());
    EXPECT_EQ(0u, sd.delay_count());
}

TEST(wrap_delay_shutdown, holds_completion_void) {
    test::queue<int> q;
    gsd::shutdown<int> sd;
    gsd::shutdown<int> gate;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    auto w = sd.wrap_delay_shutdown(test::wrap::co_gated_void(gate, q));
    ASSERT_TRUE(w);

    {
        auto awt = sch.schedule(std::move(*w));
        EXPECT_TRUE(sd.trigger_shutdown(1));
        EXPECT_FALSE(sd.is_completed());
        EXPECT_TRUE(gate.trigger_shutdown(0));
    }

    EXPECT_EQ(0, q.pop());
    EXPECT_TRUE(sd.is_completed());
}

TEST(wrap_delay_shutdown, does_not_trigger) {
    gsd::shutdown<int> sd;

    auto w = sd.wrap_delay_shutdown(test::wrap::co_return_T<int>(3));
    ASSERT_TRUE(w);

    int r = gsd::schedule(std::move(*w));
    EXPECT_EQ(3, r);
    EXPECT_FALSE(sd.is_triggered());
    EXPECT_EQ(0u, sd.delay_count());
}

TEST(wrap_delay_shutdown, released_before_join) {
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    for(int i=0; i<100; ++i) {
        gsd::shutdown<int> sd;
        auto w = sd.wrap_delay_shutdown(test::wrap::co_return_T<int>(i));
        ASSERT_TRUE(w);
        EXPECT_TRUE(sd.trigger_shutdown(i));

        int r = sch.schedule(std::move(*w));
        EXPECT_EQ(i, r);

        // the delay is gone by the time the result is delivered
        EXPECT_EQ(0u, sd.delay_count());
        EXPECT_TRUE(sd.is_completed());
    }
}

TEST(wrap_delay_shutdown, abandoned) {
    gsd::shutdown<int> sd;

    {
        auto w = sd.wrap_delay_shutdown(test::wrap::co_return_T<int>(1));
        ASSERT_TRUE(w);
        EXPECT_EQ(1u, sd.delay_count());
        EXPECT_TRUE(sd.trigger_shutdown(1));
        EXPECT_FALSE(sd.is_completed());
    }

    // destroying the unstarted wrapper released its delay
    EXPECT_EQ(0u, sd.delay_count());
    EXPECT_TRUE(sd.is_completed());
}

TEST(wrap_delay_shutdown, already_completed) {
    gsd::shutdown<int> sd;
    EXPECT_TRUE(sd.trigger_shutdown(4));

    auto w = sd.wrap_delay_shutdown(test::wrap::co_return_T<int>(1));
    ASSERT_FALSE(w);
    EXPECT_EQ(4, w.error().reason);
    EXPECT_EQ(0u, sd.delay_count());
}

TEST(wrap_delay_shutdown, operation_throws) {
    gsd::shutdown<int> sd;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    auto w = sd.wrap_delay_shutdown(test::wrap::co_throw());
    ASSERT_TRUE(w);
    EXPECT_TRUE(sd.trigger_shutdown(1));

    {
        auto awt = sch.schedule(std::move(*w));
        EXPECT_THROW((int)awt, gsd::awaitable_destroyed_without_joining_result);
    }

    EXPECT_EQ(0u, sd.delay_count());
    EXPECT_TRUE(sd.is_completed());
}

TEST(delay_token, wrap) {
    gsd::shutdown<int> sd;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    auto tok = sd.delay_shutdown_token();
    ASSERT_TRUE(tok);

    auto c = std::move(*tok).wrap(test::wrap::co_return_T<int>(5));
    EXPECT_FALSE(tok->valid());
    EXPECT_EQ(1u, sd.delay_count());

    int r = sch.schedule(std::move(c));
    EXPECT_EQ(5, r);
    EXPECT_EQ(0u, sd.delay_count());
}

TEST(wrap_trigger_shutdown, triggers_on_completion) {
    gsd::shutdown<int> sd;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    int r = sch.schedule(sd.wrap_trigger_shutdown(test::wrap::co_return_T<int>(4), 9));
    EXPECT_EQ(4, r);
    EXPECT_TRUE(sd.is_triggered());
    EXPECT_TRUE(sd.is_completed());
    EXPECT_EQ(9, *(sd.shutdown_reason()));
}

TEST(wrap_trigger_shutdown, triggered_before_join) {
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    for(int i=0; i<100; ++i) {
        gsd::shutdown<int> sd;

        sch.schedule(sd.wrap_trigger_shutdown(test::wrap::co_void(), i));
        EXPECT_TRUE(sd.is_triggered());
        EXPECT_EQ(i, *(sd.shutdown_reason()));
    }
}

TEST(wrap_trigger_shutdown, waits_for_operation) {
    test::queue<int> q;
    gsd::shutdown<int> sd;
    gsd::shutdown<int> gate;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    auto awt = sch.schedule(sd.wrap_trigger_shutdown(test::wrap::co_gated(gate, q, 1), 2));
    test::wrap::wait_for_gate(gate);
    EXPECT_FALSE(sd.is_triggered());

    EXPECT_TRUE(gate.trigger_shutdown(0));

    int r = awt;
    EXPECT_EQ(1, r);
    EXPECT_EQ(1, q.pop());
    EXPECT_EQ(2, *(sd.shutdown_reason()));
}

TEST(wrap_trigger_shutdown, does_not_override) {
    gsd::shutdown<int> sd;
    EXPECT_TRUE(sd.trigger_shutdown(1));

    int r = gsd::schedule(sd.wrap_trigger_shutdown(test::wrap::co_return_T<int>(4), 2));
    EXPECT_EQ(4, r);
    EXPECT_EQ(1, *(sd.shutdown_reason()));
}

TEST(wrap_trigger_shutdown, abandoned) {
    gsd::shutdown<int> sd;

    {
        auto c = sd.wrap_trigger_shutdown(test::wrap::co_return_T<int>(4), 5);
        EXPECT_FALSE(sd.is_triggered());
    }

    EXPECT_TRUE(sd.is_triggered());
    EXPECT_EQ(5, *(sd.shutdown_reason()));
}

TEST(wrap_trigger_shutdown, operation_throws) {
    gsd::shutdown<int> sd;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    {
        auto awt = sch.schedule(sd.wrap_trigger_shutdown(test::wrap::co_throw(), 6));
        EXPECT_THROW((int)awt, gsd::awaitable_destroyed_without_joining_result);
    }

    EXPECT_TRUE(sd.is_triggered());
    EXPECT_EQ(6, *(sd.shutdown_reason()));
}

TEST(wrap_vital, void_operation) {
    gsd::shutdown<int> sd;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    sch.schedule(sd.wrap_vital(test::wrap::co_void(), 3));

    EXPECT_TRUE(sd.is_triggered());
    EXPECT_EQ(3, *(sd.shutdown_reason()));
}

TEST(trigger_token, wrap) {
    gsd::shutdown<int> sd;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    auto tok = sd.trigger_shutdown_token(7);
    auto c = std::move(tok).wrap(test::wrap::co_return_T<int>(1));
    EXPECT_FALSE(tok.valid());
    EXPECT_FALSE(sd.is_triggered());

    int r = sch.schedule(std::move(c));
    EXPECT_EQ(1, r);
    EXPECT_EQ(7, *(sd.shutdown_reason()));
}

TEST(wrap, worker_service) {
    test::queue<int> q;
    gsd::shutdown<int> sd;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    // each worker keeps the shutdown from completing until it observes the trigger
    struct helper {
        static inline gsd::co<int> worker(gsd::shutdown<int> sd, 
                                          test::queue<int>& q, 
                                          int id) {
            int reason = co_await sd.wait_shutdown_triggered();
            q.push(id);
            co_return reason;
        }
    };

    std::deque<gsd::awt<int>> workers;

    for(int i=0; i<4; ++i) {
        auto w = sd.wrap_delay_shutdown(helper::worker(sd, q, i));
        ASSERT_TRUE(w);
        workers.push_back(sch.schedule(std::move(*w)));
    }

    test::wait_until([&]{ return sd.waiter_count() == 4; });
    EXPECT_EQ(4u, sd.delay_count());

    // a vital operation finishing triggers the shutdown
    sch.schedule(sd.wrap_vital(test::wrap::co_void(), 42));

    int reason = sd.wait_shutdown_complete();
    EXPECT_EQ(42, reason);
    EXPECT_EQ(0u, sd.delay_count());

    for(int i=0; i<4; ++i) { q.pop(); }

    while(workers.size()) {
        int r = workers.front();
        workers.pop_front();
        EXPECT_EQ(42, r);
    }
}
