//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <atomic>
#include <deque>
#include <string>
#include <stdexcept>

#include "loguru.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "scheduler.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace scheduler {

// counts the destruction of the frames holding one
struct frame_counter {
    frame_counter(std::atomic<size_t>& destroyed) : destroyed_(destroyed) { }
    ~frame_counter() { ++destroyed_; }

private:
    std::atomic<size_t>& destroyed_;
};

// an operation which never completes, its coroutine can only be abandoned
struct never :
    public gsd::scheduler::reschedule<
        gsd::awaitable::lockable<
            gsd::spinlock,
            gsd::awt<void>::interface>>
{
    typedef gsd::scheduler::reschedule<
        gsd::awaitable::lockable<
            gsd::spinlock,
            gsd::awt<void>::interface>> base;

    never() : base(lk_, gsd::awaitable::resume::policy::lock) { }

    static inline std::string info_name() { return "test::scheduler::never"; }
    inline std::string name() const { return never::info_name(); }

    inline bool on_ready() { return false; }
    inline void on_suspend() { base::on_suspend(); }
    inline void on_resume(void* m) { }
    inline bool on_abandon() { return true; }

private:
    gsd::spinlock lk_;
};

inline gsd::co<void> co_void() { co_return; }

template <typename T>
inline gsd::co<T> co_return_T(T t) {
    co_return t;
}

template <typename T>
inline gsd::co<void> co_push_T(test::queue<T>& q, T t) {
    q.push(std::move(t));
    co_return;
}

inline gsd::co<int> co_throw() {
    throw std::runtime_error("co_throw");
    co_return 0;
}

template <typename T>
inline gsd::co<T> co_join_T(gsd::scheduler& sch, T t) {
    co_return co_await sch.schedule(co_return_T<T>(std::move(t)));
}

// reports its own address, then suspends forever
inline gsd::co<void> co_never(test::queue<void*>& addrs,
                              std::atomic<size_t>& destroyed) {
    frame_counter fc(destroyed);
    addrs.push(gsd::coroutine::local().address());
    co_await gsd::awt<void>::make<never>();
}

// reports its own address, then joins a child which never completes
inline gsd::co<void> co_parent(test::queue<void*>& addrs,
                               std::atomic<size_t>& destroyed) {
    frame_counter fc(destroyed);
    addrs.push(gsd::coroutine::local().address());
    co_await gsd::scheduler::local().schedule(co_never(addrs, destroyed));
}

inline gsd::co<void> co_abandon(void* addr) {
    gsd::coroutine::abandon(std::coroutine_handle<>::from_address(addr));
    co_return;
}

inline gsd::co<void> co_where(test::queue<void*>& q) {
    q.push(gsd::scheduler::in() ? (void*)1 : (void*)0);
    q.push(&(gsd::scheduler::local()));
    q.push(&(gsd::scheduler::global()));
    q.push(&(gsd::scheduler::get()));
    co_return;
}

template <typename T>
size_t detach_order_T() {
    GSD_INFO_FUNCTION_ENTER(gsd::type::templatize<T>("detach_order_T"));
    test::queue<T> q;
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    for(int i=0; i<3; ++i) {
        sch.detach(co_push_T<T>(q, test::init<T>(i)));
    }

    // a single scheduler runs its coroutines in order
    for(int i=0; i<3; ++i) {
        EXPECT_EQ((T)test::init<T>(i), q.pop());
    }

    return 1;
}

template <typename T>
size_t join_T() {
    GSD_INFO_FUNCTION_ENTER(gsd::type::templatize<T>("join_T"));
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();
    std::deque<gsd::awt<T>> awts;

    for(int i=0; i<3; ++i) {
        awts.push_back(sch.schedule(co_return_T<T>(test::init<T>(i))));
    }

    // joined in reverse order
    for(int i=2; i>=0; --i) {
        T t = awts.back();
        awts.pop_back();
        EXPECT_EQ((T)test::init<T>(i), t);
    }

    // joined from another coroutine on the same scheduler
    T t = sch.schedule(co_join_T<T>(sch, test::init<T>(7)));
    EXPECT_EQ((T)test::init<T>(7), t);

    return 1;
}

}
}

TEST(scheduler, make) {
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();
    EXPECT_EQ(gsd::scheduler::state::executing, sch.status());
    EXPECT_EQ(std::string("gsd::scheduler"), sch.name());

    gsd::scheduler::config c;
    c.log_level = 3;
    auto lf2 = gsd::scheduler::make(c);
    EXPECT_EQ(3, lf2->scheduler().log_level());
    EXPECT_NE(&sch, &(lf2->scheduler()));
}

TEST(scheduler, detach) {
    EXPECT_EQ(1u, test::scheduler::detach_order_T<int>());
    EXPECT_EQ(1u, test::scheduler::detach_order_T<size_t>());
    EXPECT_EQ(1u, test::scheduler::detach_order_T<double>());
    EXPECT_EQ(1u, test::scheduler::detach_order_T<void*>());
    EXPECT_EQ(1u, test::scheduler::detach_order_T<std::string>());
    EXPECT_EQ(1u, test::scheduler::detach_order_T<test::CustomObject>());
}

TEST(scheduler, join) {
    EXPECT_EQ(1u, test::scheduler::join_T<int>());
    EXPECT_EQ(1u, test::scheduler::join_T<size_t>());
    EXPECT_EQ(1u, test::scheduler::join_T<double>());
    EXPECT_EQ(1u, test::scheduler::join_T<void*>());
    EXPECT_EQ(1u, test::scheduler::join_T<std::string>());
    EXPECT_EQ(1u, test::scheduler::join_T<test::CustomObject>());
}

TEST(scheduler, join_void) {
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();
    std::deque<gsd::awt<void>> awts;

    for(int i=0; i<3; ++i) {
        awts.push_back(sch.schedule(test::scheduler::co_void()));
    }

    // destroying an awaitable blocks until its coroutine is done
    while(awts.size()) { awts.pop_front(); }
}

TEST(scheduler, join_across_schedulers) {
    auto lf1 = gsd::scheduler::make();
    auto lf2 = gsd::scheduler::make();

    int r = lf1->scheduler().schedule(
        test::scheduler::co_join_T<int>(lf2->scheduler(), 5));
    EXPECT_EQ(5, r);
}

TEST(scheduler, thread_locals) {
    test::queue<void*> q;
    gsd::scheduler* global_sch = &(gsd::scheduler::global());
    auto lf = gsd::scheduler::make();
    gsd::scheduler* sch = &(lf->scheduler());

    EXPECT_FALSE(gsd::scheduler::in());
    EXPECT_EQ(global_sch, &(gsd::scheduler::get()));

    sch->schedule(test::scheduler::co_where(q));
    EXPECT_NE(nullptr, q.pop());
    EXPECT_EQ(sch, q.pop());
    EXPECT_EQ(global_sch, q.pop());

    // get() prefers the local scheduler
    EXPECT_EQ(sch, q.pop());

    // the free function schedules on the global scheduler from threads
    gsd::schedule(test::scheduler::co_where(q));
    EXPECT_NE(nullptr, q.pop());
    EXPECT_EQ(global_sch, q.pop());
    EXPECT_EQ(global_sch, q.pop());
    EXPECT_EQ(global_sch, q.pop());
}

TEST(scheduler, schedule_invalid) {
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    EXPECT_THROW(sch.schedule(gsd::co<int>()),
                 gsd::scheduler::invalid_coroutine_exception);
    EXPECT_THROW(sch.detach(gsd::co<void>()),
                 gsd::scheduler::invalid_coroutine_exception);

    gsd::co<int> co = test::scheduler::co_return_T<int>(3);
    co.resume();
    ASSERT_TRUE(co.done());
    EXPECT_THROW(sch.schedule(std::move(co)),
                 gsd::scheduler::invalid_coroutine_exception);
}

TEST(scheduler, schedule_exception) {
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    // the joiner cannot receive a result from a coroutine which threw
    {
        auto awt = sch.schedule(test::scheduler::co_throw());
        EXPECT_THROW((int)awt, gsd::awaitable_destroyed_without_joining_result);
    }

    // the scheduler keeps running
    int result = sch.schedule(test::scheduler::co_return_T<int>(4));
    EXPECT_EQ(4, result);
    EXPECT_EQ(gsd::scheduler::state::executing, sch.status());
}

TEST(scheduler, abandon_joining_parent) {
    test::queue<void*> addrs;
    std::atomic<size_t> destroyed(0);
    auto lf = gsd::scheduler::make();
    gsd::scheduler& sch = lf->scheduler();

    sch.detach(test::scheduler::co_parent(addrs, destroyed));
    void* parent = addrs.pop();
    addrs.pop();
    EXPECT_EQ(0u, destroyed.load());

    // the child on the same scheduler is abandoned with its parent
    sch.schedule(test::scheduler::co_abandon(parent));
    EXPECT_EQ(2u, destroyed.load());
}

TEST(scheduler, halt_destroys_suspended) {
    const size_t count = 20;
    test::queue<void*> addrs;
    std::atomic<size_t> destroyed(0);

    {
        auto lf = gsd::scheduler::make();

        for(size_t i=0; i<count; ++i) {
            lf->scheduler().detach(test::scheduler::co_never(addrs, destroyed));
        }

        lf->scheduler().detach(test::scheduler::co_parent(addrs, destroyed));

        for(size_t i=0; i<count + 2; ++i) { addrs.pop(); }
        EXPECT_EQ(0u, destroyed.load());
    }

    EXPECT_EQ(count + 2, destroyed.load());
}
