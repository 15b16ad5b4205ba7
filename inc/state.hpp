//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_STATE
#define GRACEFUL_SHUTDOWN_STATE

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "result.hpp"
#include "coroutine.hpp"
#include "scheduler.hpp"
#include "waiter_list.hpp"

namespace gsd {

/**
 @brief error returned when triggering a shutdown which was already triggered

 Carries a copy of the reason the shutdown was first triggered with.
 */
template <typename T>
struct already_triggered : public printable {
    already_triggered(T r) : reason(std::move(r)) { }
    virtual ~already_triggered() { }

    static inline std::string info_name() {
        return type::templatize<T>("gsd::already_triggered");
    }

    inline std::string name() const { return already_triggered<T>::info_name(); }

    /// the reason of the existing shutdown
    T reason;
};

/**
 @brief error returned when delaying a shutdown which has already completed

 Carries a copy of the reason the shutdown was triggered with.
 */
template <typename T>
struct already_completed : public printable {
    already_completed(T r) : reason(std::move(r)) { }
    virtual ~already_completed() { }

    static inline std::string info_name() {
        return type::templatize<T>("gsd::already_completed");
    }

    inline std::string name() const { return already_completed<T>::info_name(); }

    /// the reason of the completed shutdown
    T reason;
};

namespace detail {

/*
 The mutually exclusive state shared by every coordinator, token and wrapper
 adapter of a single shutdown.

 `triggered` and `completed` only ever go from false to true, and only while
 `lk` is held. `reason` is set in the same critical section which sets
 `triggered`. `completed` is only set while `triggered` is set and
 `delay_count` is 0.

 Methods ending in `_locked` require `lk` to be held by the caller. Waiter
 callbacks are called with `lk` held, so they must never block or lock it.
 */
template <typename T>
struct state : public printable {
    state() { GSD_MED_CONSTRUCTOR(); }
    virtual ~state() { GSD_MED_DESTRUCTOR(); }

    static inline std::string info_name() {
        return type::templatize<T>("gsd::detail::state");
    }

    inline std::string name() const { return state<T>::info_name(); }

    // only logged while `lk` is held, or during construction and destruction
    inline std::string content() const {
        std::stringstream ss;
        ss << "triggered:" << triggered
           << ", completed:" << completed
           << ", delays:" << delay_count
           << ", waiters:" << (trigger_waiters.size() + complete_waiters.size());
        return ss.str();
    }

    /// trigger with `r`, or return the reason of the existing trigger
    inline gsd::result<void,already_triggered<T>> trigger(T r) {
        std::lock_guard<gsd::spinlock> lk(this->lk);

        if(triggered) {
            GSD_MED_METHOD_BODY("trigger","already triggered");
            return gsd::unexpected<already_triggered<T>>(*reason);
        }

        trigger_locked_(std::move(r));
        return {};
    }

    /// trigger with `r` unless already triggered, return true if triggered by this call
    inline bool trigger_if_untriggered(T r) {
        std::lock_guard<gsd::spinlock> lk(this->lk);

        if(triggered) { return false; }

        trigger_locked_(std::move(r));
        return true;
    }

    inline bool is_triggered() {
        std::lock_guard<gsd::spinlock> lk(this->lk);
        return triggered;
    }

    inline bool is_completed() {
        std::lock_guard<gsd::spinlock> lk(this->lk);
        return completed;
    }

    inline std::optional<T> shutdown_reason() {
        std::lock_guard<gsd::spinlock> lk(this->lk);
        return reason;
    }

    /// acquire one unit of delay, failing only if the shutdown is completed
    inline gsd::result<void,already_completed<T>> acquire_delay() {
        std::lock_guard<gsd::spinlock> lk(this->lk);

        if(completed) {
            GSD_MED_METHOD_BODY("acquire_delay","already completed");
            return gsd::unexpected<already_completed<T>>(*reason);
        }

        ++delay_count;
        GSD_MIN_METHOD_BODY("acquire_delay","delays:",delay_count);
        return {};
    }

    /// release one unit of delay acquired with acquire_delay()
    inline void release_delay() {
        std::lock_guard<gsd::spinlock> lk(this->lk);
        --delay_count;
        GSD_MIN_METHOD_BODY("release_delay","delays:",delay_count);
        check_completed_locked_();
    }

    inline size_t delays() {
        std::lock_guard<gsd::spinlock> lk(this->lk);
        return delay_count;
    }

    inline size_t waiter_count() {
        std::lock_guard<gsd::spinlock> lk(this->lk);
        return trigger_waiters.size() + complete_waiters.size();
    }

    gsd::spinlock lk;
    bool triggered = false;
    std::optional<T> reason;
    bool completed = false;
    size_t delay_count = 0;
    gsd::waiter_list trigger_waiters;
    gsd::waiter_list complete_waiters;

private:
    inline void trigger_locked_(T r) {
        GSD_MED_METHOD_BODY("trigger","triggered, delays:",delay_count);
        triggered = true;
        reason = std::move(r);
        trigger_waiters.wake_all();
        check_completed_locked_();
    }

    // the two events which can complete a shutdown both end here
    inline void check_completed_locked_() {
        if(triggered && !completed && delay_count == 0) {
            GSD_MED_METHOD_BODY("check_completed","completed");
            completed = true;
            complete_waiters.wake_all();
        }
    }
};

/*
 Awaitable implementation resolving with a copy of the shutdown reason once
 its event has occurred.

 The predicate is checked and the wake callback registered under the same
 acquisition of the state's lock, so a wakeup can never be lost. The
 registration is consumed by the wake_all() which calls it, and removed again
 if the suspended coroutine is abandoned first.
 */
template <typename T>
struct waiter :
    public gsd::scheduler::reschedule<
        gsd::awaitable::lockable<
            gsd::spinlock,
            typename gsd::awt<T>::interface>>
{
    typedef gsd::scheduler::reschedule<
        gsd::awaitable::lockable<
            gsd::spinlock,
            typename gsd::awt<T>::interface>> base;

    enum event {
        triggered,
        completed
    };

    waiter(std::shared_ptr<state<T>> st, event ev) :
        // resumed by wake_all() while the lock is held
        base(st->lk, gsd::awaitable::resume::policy::no_lock),
        st_(std::move(st)),
        ev_(ev)
    {
        GSD_LOW_CONSTRUCTOR(ev_ == triggered ? "triggered" : "completed");
    }

    virtual ~waiter() {
        GSD_LOW_DESTRUCTOR();

        if(registered_) [[unlikely]] {
            std::lock_guard<gsd::spinlock> lk(st_->lk);
            unregister_locked_();
        }
    }

    static inline std::string info_name() {
        return type::templatize<T>("gsd::detail::waiter");
    }

    inline std::string name() const { return waiter<T>::info_name(); }

    inline bool on_ready() {
        if(happened_()) {
            result_ = *(st_->reason);
            return true;
        } else {
            return false;
        }
    }

    inline void on_suspend() {
        base::on_suspend();
        key_ = list_().add([this]{ this->resume(nullptr); });
        registered_ = true;
    }

    inline void on_resume(void* m) {
        registered_ = false;
        result_ = *(st_->reason);
    }

    inline bool on_abandon() {
        unregister_locked_();
        return true;
    }

    inline T get_result() { return std::move(*result_); }

private:
    inline bool happened_() const {
        return ev_ == triggered ? st_->triggered : st_->completed;
    }

    inline gsd::waiter_list& list_() {
        return ev_ == triggered ? st_->trigger_waiters : st_->complete_waiters;
    }

    inline void unregister_locked_() {
        if(registered_) {
            list_().remove(key_);
            registered_ = false;
        }
    }

    std::shared_ptr<state<T>> st_;
    const event ev_;
    gsd::waiter_list::key key_;
    bool registered_ = false;
    std::optional<T> result_;
};

}
}

#endif
