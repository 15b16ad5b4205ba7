//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis 
#ifndef GRACEFUL_SHUTDOWN_TEST_HELPERS
#define GRACEFUL_SHUTDOWN_TEST_HELPERS

#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <string>

#include "logging.hpp"
#include "atomic.hpp"

namespace test {

/*
 Unbounded blocking queue for handing values between the test thread and
 coroutines running on a scheduler. `pop()` blocks a system thread, so a
 coroutine calling it occupies its scheduler until a value arrives.
 */
template <typename T>
struct queue {
    template <typename TSHADOW>
    void push(TSHADOW&& t) {
        {
            std::lock_guard<gsd::spinlock> lk(lk_);
            vals_.push_back(std::forward<TSHADOW>(t));
        }

        cv_.notify_one();
    }

    T pop() {
        std::unique_lock<gsd::spinlock> lk(lk_);
        cv_.wait(lk, [&]{ return !vals_.empty(); });
        T t = std::move(vals_.front());
        vals_.pop_front();
        return t;
    }

    size_t size() {
        std::lock_guard<gsd::spinlock> lk(lk_);
        return vals_.size();
    }

private:
    gsd::spinlock lk_;
    std::condition_variable_any cv_;
    std::deque<T> vals_;
};

/*
 Converts an integer to a `T`, so one templated test body can run for numbers,
 pointers and strings alike.
 */
template <typename T>
struct init {
    template <typename A>
    init(A a) : t_((T)a) { }

    inline operator T() { return std::move(t_); }

private:
    T t_;
};

template <>
struct init<void*> {
    template <typename A>
    init(A a) : t_((void*)(size_t)a) { }

    inline operator void*() { return t_; }

private:
    void* t_;
};

template <>
struct init<std::string> {
    template <typename A>
    init(A a) : t_(std::to_string(a)) { }

    inline operator std::string() { return std::move(t_); }

private:
    std::string t_;
};

// a user type with no special support from the library
struct CustomObject {
    CustomObject() : i_(0) { }
    CustomObject(int i) : i_(i) { }

    inline bool operator==(const CustomObject& rhs) const { return i_ == rhs.i_; }
    inline bool operator!=(const CustomObject& rhs) const { return i_ != rhs.i_; }

    inline int get() const { return i_; }

private:
    int i_;
};

/*
 Spin until `pred` returns true. Used to wait for another thread or coroutine
 to reach a state which has no awaitable of its own, such as registering as a
 waiter.
 */
template <typename PREDICATE>
void wait_until(PREDICATE&& pred) {
    while(!pred()) { std::this_thread::yield(); }
}

}

#endif
