//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include "loguru.hpp"
#include "atomic.hpp"
#include "coroutine.hpp"

#include <string>
#include <exception>
#include <stdexcept>

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace coroutine {

// sets `destroyed` when the frame holding it is destroyed
struct sentinel {
    sentinel(bool& destroyed) : destroyed_(destroyed) { }
    ~sentinel() { destroyed_ = true; }

private:
    bool& destroyed_;
};

inline gsd::co<void> co_void() {
    co_return;
}

template <typename T>
inline gsd::co<T> co_value(T t) {
    co_return t;
}

inline gsd::co<int> co_throw() {
    throw std::runtime_error("co_throw");
    co_return 0;
}

inline gsd::co<void> co_where(bool& in, void*& addr) {
    in = gsd::coroutine::in();
    addr = gsd::coroutine::local().address();
    co_return;
}

/*
 Awaitable which never completes by itself. When resumed it parks the
 suspended handle in `dest` instead of scheduling it. If `keep` is set it
 refuses to give the handle up when its coroutine is abandoned.
 */
template <typename T>
struct slot :
    public gsd::awaitable::lockable<
        gsd::spinlock,
        typename gsd::awt<T>::interface>
{
    slot(std::coroutine_handle<>& dest, T t, bool keep=false) :
        gsd::awaitable::lockable<
            gsd::spinlock,
            typename gsd::awt<T>::interface>(
                lk_,
                gsd::awaitable::resume::policy::lock),
        dest_(dest),
        t_(std::move(t)),
        keep_(keep)
    { }

    static inline std::string info_name() { return "test::coroutine::slot"; }
    inline std::string name() const { return slot<T>::info_name(); }

    inline bool on_ready() { return false; }
    inline void on_suspend() { }
    inline void on_resume(void* m) { }
    inline bool on_abandon() { return !keep_; }
    inline T get_result() { return t_; }

    inline void to_destination(std::coroutine_handle<> h) { dest_ = h; }
    inline void leave_destination() { ++left; }

    size_t left = 0;

private:
    gsd::spinlock lk_;
    std::coroutine_handle<>& dest_;
    T t_;
    const bool keep_;
};

template <typename T>
inline gsd::co<T> co_await_slot(gsd::awt<T> a, bool& destroyed) {
    sentinel s(destroyed);
    co_return co_await std::move(a);
}

template <typename T>
inline void co_return_value_T() {
    gsd::co<T> co = co_value<T>(test::init<T>(3));
    EXPECT_FALSE(co.done());
    co.resume();
    EXPECT_TRUE(co.done());
    EXPECT_TRUE(gsd::get_promise(co).returned);
    ASSERT_TRUE((bool)gsd::get_promise(co).result);
    EXPECT_EQ((T)test::init<T>(3), *(gsd::get_promise(co).result));

    // the value survives type erasure
    gsd::coroutine erased(std::move(co));
    EXPECT_FALSE(co);
    auto& p = static_cast<gsd::co_promise_type<T>&>(gsd::get_promise(erased));
    EXPECT_EQ((T)test::init<T>(3), *(p.result));
}

template <typename T>
inline void co_await_T() {
    std::coroutine_handle<> dest;
    bool destroyed = false;
    auto s = new slot<T>(dest, test::init<T>(4));
    gsd::co<T> co = co_await_slot<T>(gsd::awt<T>(s), destroyed);

    // the awaitable takes the handle when the coroutine suspends on it
    co.resume();
    EXPECT_FALSE(co);
    EXPECT_FALSE(dest);

    s->resume(nullptr);
    ASSERT_TRUE(dest);

    co.reset(dest);
    co.resume();
    EXPECT_TRUE(co.done());
    EXPECT_TRUE(destroyed);
    EXPECT_EQ((T)test::init<T>(4), *(gsd::get_promise(co).result));
    EXPECT_EQ(0u, s->left);
}

// records the calls of a join operation
struct join_record {
    static inline void joined(void* r, gsd::coroutine::promise_type& p) {
        auto self = static_cast<join_record*>(r);
        ++self->calls;
        self->returned = p.returned;
        self->threw = (bool)p.eptr;
    }

    size_t calls = 0;
    bool returned = false;
    bool threw = false;
};

}
}

TEST(coroutine, address) {
    gsd::co<void> co;
    EXPECT_EQ(nullptr, co.address());
    EXPECT_FALSE(co);

    co = test::coroutine::co_void();
    void* addr = co.address();
    EXPECT_NE(nullptr, addr);

    co = test::coroutine::co_void();
    EXPECT_NE(nullptr, co.address());
    EXPECT_NE(addr, co.address());
}

TEST(coroutine, release_reset_swap) {
    gsd::co<void> co = test::coroutine::co_void();
    gsd::co<void> co2 = test::coroutine::co_void();
    void* addr = co.address();
    void* addr2 = co2.address();

    co.swap(co2);
    EXPECT_EQ(addr2, co.address());
    EXPECT_EQ(addr, co2.address());

    std::coroutine_handle<> h = co.release();
    EXPECT_FALSE(co);
    EXPECT_EQ(addr2, h.address());

    // reset destroys the owned frame and takes the new handle
    co2.reset(h);
    EXPECT_EQ(addr2, co2.address());

    co2.reset();
    EXPECT_FALSE(co2);
}

TEST(coroutine, co_return_void) {
    gsd::coroutine co = test::coroutine::co_void();
    EXPECT_TRUE(co);
    EXPECT_FALSE(co.done());
    EXPECT_FALSE(gsd::get_promise(co).returned);

    co.resume();
    EXPECT_TRUE(co.done());
    EXPECT_TRUE(gsd::get_promise(co).returned);
    EXPECT_FALSE(co.abandoned());
}

TEST(coroutine, co_return_value) {
    test::coroutine::co_return_value_T<int>();
    test::coroutine::co_return_value_T<size_t>();
    test::coroutine::co_return_value_T<double>();
    test::coroutine::co_return_value_T<char>();
    test::coroutine::co_return_value_T<void*>();
    test::coroutine::co_return_value_T<std::string>();
    test::coroutine::co_return_value_T<test::CustomObject>();
}

TEST(coroutine, co_return_exception) {
    gsd::co<int> co = test::coroutine::co_throw();
    EXPECT_FALSE(gsd::coroutine::in());
    EXPECT_THROW(co.resume(), std::runtime_error);

    // the thread local coroutine is restored
    EXPECT_FALSE(gsd::coroutine::in());
    EXPECT_TRUE(co.done());
    EXPECT_TRUE((bool)(gsd::get_promise(co).eptr));
    EXPECT_FALSE(gsd::get_promise(co).returned);
    EXPECT_FALSE((bool)(gsd::get_promise(co).result));
}

TEST(coroutine, local) {
    bool in = false;
    void* addr = nullptr;
    gsd::co<void> co = test::coroutine::co_where(in, addr);

    co.resume();
    EXPECT_TRUE(in);
    EXPECT_EQ(co.address(), addr);
    EXPECT_FALSE(gsd::coroutine::in());
}

TEST(coroutine, co_await) {
    test::coroutine::co_await_T<int>();
    test::coroutine::co_await_T<size_t>();
    test::coroutine::co_await_T<double>();
    test::coroutine::co_await_T<void*>();
    test::coroutine::co_await_T<std::string>();
    test::coroutine::co_await_T<test::CustomObject>();
}

TEST(coroutine, join) {
    // completed
    {
        test::coroutine::join_record rec;

        {
            gsd::co<int> co = test::coroutine::co_value<int>(1);
            gsd::get_promise(co).join(&test::coroutine::join_record::joined, &rec);
            co.resume();
            EXPECT_EQ(0u, rec.calls);
        }

        EXPECT_EQ(1u, rec.calls);
        EXPECT_TRUE(rec.returned);
        EXPECT_FALSE(rec.threw);
    }

    // destroyed before running
    {
        test::coroutine::join_record rec;

        {
            gsd::co<void> co = test::coroutine::co_void();
            gsd::get_promise(co).join(&test::coroutine::join_record::joined, &rec);
        }

        EXPECT_EQ(1u, rec.calls);
        EXPECT_FALSE(rec.returned);
    }

    // threw
    {
        test::coroutine::join_record rec;

        {
            gsd::co<int> co = test::coroutine::co_throw();
            gsd::get_promise(co).join(&test::coroutine::join_record::joined, &rec);
            EXPECT_THROW(co.resume(), std::runtime_error);
        }

        EXPECT_EQ(1u, rec.calls);
        EXPECT_FALSE(rec.returned);
        EXPECT_TRUE(rec.threw);
    }

    // unjoined
    {
        test::coroutine::join_record rec;

        {
            gsd::co<void> co = test::coroutine::co_void();
            gsd::get_promise(co).join(&test::coroutine::join_record::joined, &rec);
            gsd::get_promise(co).unjoin();
            co.resume();
        }

        EXPECT_EQ(0u, rec.calls);
    }
}

TEST(coroutine, abandon_suspended) {
    std::coroutine_handle<> dest;
    bool destroyed = false;
    test::coroutine::join_record rec;
    auto s = new test::coroutine::slot<int>(dest, 1);

    gsd::co<int> co = test::coroutine::co_await_slot<int>(gsd::awt<int>(s), destroyed);
    gsd::get_promise(co).join(&test::coroutine::join_record::joined, &rec);
    auto h = std::coroutine_handle<>::from_address(co.address());

    co.resume();
    EXPECT_FALSE(co);
    EXPECT_FALSE(destroyed);

    // the awaitable gives up the handle and the frame is destroyed at once
    EXPECT_EQ(0u, s->left);
    gsd::coroutine::abandon(h);
    EXPECT_TRUE(destroyed);
    EXPECT_FALSE(dest);
    EXPECT_EQ(1u, rec.calls);
    EXPECT_FALSE(rec.returned);
}

TEST(coroutine, abandon_refused) {
    std::coroutine_handle<> dest;
    bool destroyed = false;
    auto s = new test::coroutine::slot<int>(dest, 1, true);

    gsd::co<int> co = test::coroutine::co_await_slot<int>(gsd::awt<int>(s), destroyed);
    auto h = std::coroutine_handle<>::from_address(co.address());
    co.resume();

    // the awaitable keeps the handle, the frame is only marked
    gsd::coroutine::abandon(h);
    EXPECT_FALSE(destroyed);

    s->resume(nullptr);
    ASSERT_TRUE(dest);

    // whoever would resume it must destroy it instead
    gsd::coroutine resumed(std::move(dest));
    EXPECT_TRUE(resumed.abandoned());
    EXPECT_FALSE(resumed.done());
    resumed.reset();
    EXPECT_TRUE(destroyed);
}
