//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_WRAP
#define GRACEFUL_SHUTDOWN_WRAP

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "logging.hpp"
#include "atomic.hpp"
#include "result.hpp"
#include "coroutine.hpp"
#include "scheduler.hpp"
#include "state.hpp"
#include "token.hpp"

namespace gsd {
namespace detail {
namespace wrap {

/*
 The outcome of a cancel adapter, owned by the adapter's frame. It joins the
 wrapped operation and listens for the trigger. Whichever of the two is
 observed first under the state's lock decides the outcome, the other is
 discarded.
 */
template <typename R, typename T>
struct race : public printable {
    typedef std::conditional_t<std::is_void_v<R>, bool, R> value_type;

    enum status {
        pending, //< neither event has happened
        inner_done, //< the operation returned first
        cancelled, //< the shutdown was triggered first
        failed //< the operation threw or was destroyed without returning
    };

    race(std::shared_ptr<detail::state<T>> st) : st_(std::move(st)) {
        GSD_LOW_CONSTRUCTOR();
    }

    virtual ~race() { GSD_LOW_DESTRUCTOR(); }

    static inline std::string info_name() {
        return type::templatize<R,T>("gsd::detail::wrap::race");
    }

    inline std::string name() const { return race<R,T>::info_name(); }

    inline gsd::spinlock& lock() { return st_->lk; }

    /*
     Register for the trigger. If the shutdown is already triggered nothing is
     registered and its reason is returned.
     */
    inline std::optional<T> arm() {
        std::lock_guard<gsd::spinlock> lk(st_->lk);

        if(st_->triggered) {
            status_ = cancelled;
            reason_ = st_->reason;
            return reason_;
        }

        key_ = st_->trigger_waiters.add([this]{ this->on_trigger_locked_(); });
        registered_ = true;
        return {};
    }

    /// join `op` and detach it on `sch`
    inline void start(gsd::scheduler& sch, gsd::co<R> op) {
        inner_ = std::coroutine_handle<>::from_address(op.address());
        gsd::get_promise(op).join(&race<R,T>::joined, this);
        sch.detach(std::move(op));
    }

    /*
     Silence the trigger and the operation. Returns the operation's handle if
     its frame still exists, the caller must abandon it.
     */
    inline std::coroutine_handle<> disown() {
        std::lock_guard<gsd::spinlock> lk(st_->lk);
        unregister_locked_();
        awaiter_ = nullptr;

        auto h = inner_;

        if(h) {
            std::coroutine_handle<gsd::coroutine::promise_type>::from_address(
                h.address()).promise().unjoin();
            inner_ = std::coroutine_handle<>();
        }

        return h;
    }

    // the following require the lock to be held

    inline bool resolved_locked() const { return status_ != pending; }

    inline void suspend_locked(gsd::awaitable::interface* a) { awaiter_ = a; }

    inline gsd::result<R,T> get_result_locked() {
        if(status_ == failed) {
            if(eptr_) { std::rethrow_exception(eptr_); }
            throw awaitable_destroyed_without_joining_result(nullptr, this);
        } else if(status_ == cancelled) {
            return gsd::unexpected<T>(*reason_);
        } else if constexpr(std::is_void_v<R>) {
            return {};
        } else {
            return gsd::result<R,T>(std::move(*value_));
        }
    }

private:
    // called by the operation's promise destructor
    static inline void joined(void* r, gsd::coroutine::promise_type& p) {
        auto self = static_cast<race<R,T>*>(r);

        if(!p.returned) {
            self->fail(p.eptr);
        } else if constexpr(std::is_void_v<R>) {
            self->finish(true);
        } else {
            self->finish(std::move(*(static_cast<gsd::co_promise_type<R>&>(p).result)));
        }
    }

    inline void finish(value_type v) {
        std::lock_guard<gsd::spinlock> lk(st_->lk);
        inner_ = std::coroutine_handle<>();

        if(status_ == pending) {
            GSD_LOW_METHOD_BODY("finish","operation returned first");
            value_ = std::move(v);
            status_ = inner_done;
            unregister_locked_();
            resume_awaiter_locked_();
        } else {
            GSD_LOW_METHOD_BODY("finish","discarding result of cancelled operation");
        }
    }

    inline void fail(std::exception_ptr eptr) {
        std::lock_guard<gsd::spinlock> lk(st_->lk);
        inner_ = std::coroutine_handle<>();

        if(status_ == pending) {
            GSD_ERROR_METHOD_BODY("fail","operation did not return");
            eptr_ = eptr;
            status_ = failed;
            unregister_locked_();
            resume_awaiter_locked_();
        }
    }

    // called by wake_all(), which consumed the registration
    inline void on_trigger_locked_() {
        registered_ = false;

        if(status_ == pending) {
            GSD_LOW_METHOD_BODY("on_trigger","shutdown triggered first");
            status_ = cancelled;
            reason_ = st_->reason;
            resume_awaiter_locked_();
        }
    }

    inline void unregister_locked_() {
        if(registered_) {
            st_->trigger_waiters.remove(key_);
            registered_ = false;
        }
    }

    inline void resume_awaiter_locked_() {
        if(awaiter_) {
            auto a = awaiter_;
            awaiter_ = nullptr;
            a->resume(nullptr);
        }
    }

    std::shared_ptr<detail::state<T>> st_;
    status status_ = pending;
    gsd::waiter_list::key key_;
    bool registered_ = false;
    std::coroutine_handle<> inner_;
    std::optional<value_type> value_;
    std::optional<T> reason_;
    std::exception_ptr eptr_;
    gsd::awaitable::interface* awaiter_ = nullptr;
};

// suspends the cancel adapter until its race is decided
template <typename R, typename T>
struct race_awaiter :
    public gsd::scheduler::reschedule<
        gsd::awaitable::lockable<
            gsd::spinlock,
            typename gsd::awt<gsd::result<R,T>>::interface>>
{
    typedef gsd::scheduler::reschedule<
        gsd::awaitable::lockable<
            gsd::spinlock,
            typename gsd::awt<gsd::result<R,T>>::interface>> base;

    race_awaiter(race<R,T>& rc) :
        base(rc.lock(), gsd::awaitable::resume::policy::no_lock),
        rc_(rc)
    { }

    virtual ~race_awaiter() { }

    static inline std::string info_name() {
        return type::templatize<R,T>("gsd::detail::wrap::race_awaiter");
    }

    inline std::string name() const { return race_awaiter<R,T>::info_name(); }

    inline bool on_ready() { return rc_.resolved_locked(); }

    inline void on_suspend() {
        base::on_suspend();
        rc_.suspend_locked(this);
    }

    inline void on_resume(void* m) { }

    inline bool on_abandon() {
        rc_.suspend_locked(nullptr);
        return true;
    }

    inline gsd::result<R,T> get_result() {
        std::lock_guard<gsd::spinlock> lk(rc_.lock());
        return rc_.get_result_locked();
    }

private:
    race<R,T>& rc_;
};

/// cancel-on-trigger adapter
template <typename R, typename T>
gsd::co<gsd::result<R,T>> cancel(std::shared_ptr<detail::state<T>> st,
                                 gsd::co<R> op) {
    race<R,T> rc(std::move(st));
    auto reason = rc.arm();

    if(reason) {
        // `op` is destroyed with this frame without ever starting
        co_return gsd::unexpected<T>(std::move(*reason));
    }

    // however this frame ends, an operation still running is abandoned
    struct abandon_guard {
        ~abandon_guard() {
            auto h = rc.disown();
            if(h) { gsd::coroutine::abandon(h); }
        }

        race<R,T>& rc;
    };

    abandon_guard g{rc};
    rc.start(gsd::scheduler::get(), std::move(op));
    co_return co_await gsd::awt<gsd::result<R,T>>::template make<race_awaiter<R,T>>(rc);
}

/*
 The tokens of the following adapters are moved into the body, so they are
 released before the frame's promise resumes its joiner.
 */

/// delay-until-done adapter
template <typename R, typename T>
gsd::co<R> delay(gsd::delay_token<T> tok, gsd::co<R> op) {
    gsd::delay_token<T> held(std::move(tok));

    if constexpr(std::is_void_v<R>) {
        co_await gsd::scheduler::get().schedule(std::move(op));
        held.reset();
    } else {
        R r = co_await gsd::scheduler::get().schedule(std::move(op));
        held.reset();
        co_return r;
    }
}

/// trigger-on-completion adapter
template <typename R, typename T>
gsd::co<R> trigger(gsd::trigger_token<T> tok, gsd::co<R> op) {
    gsd::trigger_token<T> held(std::move(tok));

    if constexpr(std::is_void_v<R>) {
        co_await gsd::scheduler::get().schedule(std::move(op));
        held.reset();
    } else {
        R r = co_await gsd::scheduler::get().schedule(std::move(op));
        held.reset();
        co_return r;
    }
}

}
}

template <typename T>
template <typename R>
gsd::co<R> delay_token<T>::wrap(gsd::co<R> op) && {
    GSD_MED_METHOD_ENTER("wrap",op);
    return detail::wrap::delay<R,T>(std::move(*this), std::move(op));
}

template <typename T>
template <typename R>
gsd::co<R> trigger_token<T>::wrap(gsd::co<R> op) && {
    GSD_MED_METHOD_ENTER("wrap",op);
    return detail::wrap::trigger<R,T>(std::move(*this), std::move(op));
}

}

#endif
