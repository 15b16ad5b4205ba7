//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_SHUTDOWN
#define GRACEFUL_SHUTDOWN_SHUTDOWN

#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "logging.hpp"
#include "result.hpp"
#include "coroutine.hpp"
#include "state.hpp"
#include "token.hpp"
#include "wrap.hpp"

namespace gsd {

/**
 @brief coordinator of a graceful shutdown

 Every copy of a `shutdown` refers to the same shared state, copies are made to
 hand the coordinator to every concurrent unit of work. The state is destroyed
 with its last coordinator, token or wrapper adapter.

 A shutdown moves through three phases:
 - running: not triggered
 - triggered: `trigger_shutdown()` was called (or a trigger token released),
   the reason is fixed and operations are asked to stop
 - completed: triggered, and every delay token has been released

 `T` is the reason type. It is copied to every waiter and must be copy
 constructible.

 Waiting operations return awaitables: a coroutine `co_await`s them, a system
 thread converts them to `T` (or lets them go out of scope) and blocks:
 ```
 gsd::shutdown<int> sd;

 // coroutine
 int reason = co_await sd.wait_shutdown_triggered();

 // system thread
 int reason = sd.wait_shutdown_complete();
 ```

 Wrapper adapters return coroutines which must be scheduled (IE,
 `gsd::schedule(sd.wrap_cancel(my_op()))`) and drive their wrapped operation on
 the scheduler they are running on.
 */
template <typename T>
struct shutdown : public printable {
    typedef T reason_type;

    /// construct a coordinator with a new state
    shutdown() : st_(std::make_shared<detail::state<T>>()) {
        GSD_HIGH_CONSTRUCTOR();
    }

    // copies share the state, a move copies so the source stays usable
    shutdown(const shutdown<T>&) = default;
    virtual ~shutdown() { }

    shutdown<T>& operator=(const shutdown<T>&) = default;

    static inline std::string info_name() {
        return type::templatize<T>("gsd::shutdown");
    }

    inline std::string name() const { return shutdown<T>::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << st_.get();
        return ss.str();
    }

    /**
     @brief trigger the shutdown

     The first call wins: the reason is stored and every waiter of
     `wait_shutdown_triggered()` is resumed. If no delay tokens exist the
     shutdown completes in the same step.

     @param reason the reason for the shutdown
     @return nothing on success, or `already_triggered<T>` carrying the existing reason
     */
    inline gsd::result<void,already_triggered<T>> trigger_shutdown(T reason) {
        GSD_HIGH_METHOD_ENTER("trigger_shutdown");
        return st_->trigger(std::move(reason));
    }

    /// return true if the shutdown was triggered, else false
    inline bool is_triggered() const { return st_->is_triggered(); }

    /// return true if the shutdown was completed, else false
    inline bool is_completed() const { return st_->is_completed(); }

    /// return the reason of a triggered shutdown, or an empty optional
    inline std::optional<T> shutdown_reason() const {
        return st_->shutdown_reason();
    }

    /**
     @brief wait for the shutdown to be triggered

     Resolves immediately if already triggered.

     @return an awaitable resolving with the shutdown reason
     */
    inline gsd::awt<T> wait_shutdown_triggered() const {
        GSD_MED_METHOD_ENTER("wait_shutdown_triggered");
        return gsd::awt<T>::template make<detail::waiter<T>>(
            st_,
            detail::waiter<T>::triggered);
    }

    /**
     @brief wait for the shutdown to be completed

     Resolves immediately if already completed. Never resolves before the
     shutdown is triggered.

     @return an awaitable resolving with the shutdown reason
     */
    inline gsd::awt<T> wait_shutdown_complete() const {
        GSD_MED_METHOD_ENTER("wait_shutdown_complete");
        return gsd::awt<T>::template make<detail::waiter<T>>(
            st_,
            detail::waiter<T>::completed);
    }

    /**
     @brief acquire a token delaying completion of the shutdown

     Fails only if the shutdown is already completed. A triggered shutdown can
     still be delayed.

     @return a delay token, or `already_completed<T>` carrying the shutdown reason
     */
    inline gsd::result<delay_token<T>,already_completed<T>> delay_shutdown_token() const {
        GSD_MED_METHOD_ENTER("delay_shutdown_token");
        auto r = st_->acquire_delay();

        if(!r) {
            return gsd::unexpected<already_completed<T>>(std::move(r).error());
        }

        return delay_token<T>(st_);
    }

    /**
     @brief acquire a token which triggers the shutdown when released
     @param reason the reason to trigger with
     @return a trigger token
     */
    inline trigger_token<T> trigger_shutdown_token(T reason) const {
        GSD_MED_METHOD_ENTER("trigger_shutdown_token");
        return trigger_token<T>(st_, std::move(reason));
    }

    /**
     @brief acquire a token for an operation the process can't run without

     Identical to `trigger_shutdown_token()`.
     */
    inline trigger_token<T> vital_token(T reason) const {
        return trigger_shutdown_token(std::move(reason));
    }

    /**
     @brief wrap a coroutine so it is cancelled when the shutdown is triggered

     If the shutdown is already triggered when the returned coroutine starts,
     it completes immediately with the reason and `op` never runs. Otherwise
     `op` is started on the current scheduler and the returned coroutine
     completes with whichever happens first: `op`'s value, or the reason of a
     trigger. A cancelled `op` is abandoned: destroyed at once when it is
     suspended, otherwise by its scheduler instead of being resumed.
     Destroying it releases any tokens it holds.

     @param op the coroutine to wrap
     @return a coroutine yielding `op`'s value or the shutdown reason as an error
     */
    template <typename R>
    inline gsd::co<gsd::result<R,T>> wrap_cancel(gsd::co<R> op) const {
        GSD_MED_METHOD_ENTER("wrap_cancel",op);
        return detail::wrap::cancel<R,T>(st_, std::move(op));
    }

    /**
     @brief wrap a coroutine so the shutdown can't complete while it runs

     @param op the coroutine to wrap
     @return the wrapped coroutine, or `already_completed<T>` if the shutdown already completed
     */
    template <typename R>
    inline gsd::result<gsd::co<R>,already_completed<T>> wrap_delay_shutdown(gsd::co<R> op) const {
        GSD_MED_METHOD_ENTER("wrap_delay_shutdown",op);
        auto tok = delay_shutdown_token();

        if(!tok) {
            return gsd::unexpected<already_completed<T>>(std::move(tok).error());
        }

        return std::move(*tok).wrap(std::move(op));
    }

    /**
     @brief wrap a coroutine so the shutdown is triggered when it finishes

     The shutdown is also triggered if the returned coroutine is destroyed
     before it completes.

     @param op the coroutine to wrap
     @param reason the reason to trigger with
     @return the wrapped coroutine
     */
    template <typename R>
    inline gsd::co<R> wrap_trigger_shutdown(gsd::co<R> op, T reason) const {
        GSD_MED_METHOD_ENTER("wrap_trigger_shutdown",op);
        return trigger_shutdown_token(std::move(reason)).wrap(std::move(op));
    }

    /// identical to `wrap_trigger_shutdown()`
    template <typename R>
    inline gsd::co<R> wrap_vital(gsd::co<R> op, T reason) const {
        return wrap_trigger_shutdown(std::move(op), std::move(reason));
    }

    /**
     @brief the count of registered waiters

     Includes suspended `wait_shutdown_triggered()` and
     `wait_shutdown_complete()` calls and running cancel adapters.
     */
    inline size_t waiter_count() const { return st_->waiter_count(); }

    /// the count of live delay tokens
    inline size_t delay_count() const { return st_->delays(); }

private:
    std::shared_ptr<detail::state<T>> st_;
};

}

#endif
