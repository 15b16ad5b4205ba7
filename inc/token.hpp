//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_TOKEN
#define GRACEFUL_SHUTDOWN_TOKEN

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "logging.hpp"
#include "coroutine.hpp"
#include "state.hpp"

namespace gsd {

template <typename T>
struct shutdown;

/**
 @brief a capability which prevents a shutdown from completing while it exists

 Obtained from `gsd::shutdown<T>::delay_shutdown_token()`. The shutdown can
 still be triggered, but `gsd::shutdown<T>::is_completed()` stays `false` and
 `wait_shutdown_complete()` stays suspended until every delay token has been
 released.

 Releasing happens exactly once, by `reset()` or by destruction. A moved-from
 token is inert.
 */
template <typename T>
struct delay_token : public printable {
    /// construct an inert token
    delay_token() { }

    delay_token(const delay_token<T>&) = delete;

    delay_token(delay_token<T>&& rhs) : st_(std::move(rhs.st_)) { }

    virtual ~delay_token() { reset(); }

    delay_token<T>& operator=(const delay_token<T>&) = delete;

    inline delay_token<T>& operator=(delay_token<T>&& rhs) {
        if(this != &rhs) {
            reset();
            st_ = std::move(rhs.st_);
        }

        return *this;
    }

    static inline std::string info_name() {
        return type::templatize<T>("gsd::delay_token");
    }

    inline std::string name() const { return delay_token<T>::info_name(); }

    /// return true if the token still delays the shutdown, else false
    inline bool valid() const { return (bool)st_; }

    /**
     @brief release the delay early

     If this was the last delay of a triggered shutdown, the shutdown
     completes. Further calls do nothing.
     */
    inline void reset() {
        if(st_) {
            GSD_MED_METHOD_ENTER("reset");
            auto st = std::move(st_);
            st->release_delay();
        }
    }

    /**
     @brief wrap a coroutine so this token is released when it finishes

     The returned coroutine runs `op` to completion, releases the token and
     yields `op`'s result unchanged. Destroying the returned coroutine before
     it completes releases the token. Unlike
     `gsd::shutdown<T>::wrap_delay_shutdown()` this cannot fail, because
     holding the token proves the shutdown has not completed.

     @param op the coroutine to wrap
     @return the wrapped coroutine
     */
    template <typename R>
    gsd::co<R> wrap(gsd::co<R> op) &&;

private:
    // the delay must already be acquired
    delay_token(std::shared_ptr<detail::state<T>> st) : st_(std::move(st)) {
        GSD_MED_CONSTRUCTOR();
    }

    std::shared_ptr<detail::state<T>> st_;

    friend struct gsd::shutdown<T>;
};

/**
 @brief a capability which triggers a shutdown when released

 Obtained from `gsd::shutdown<T>::trigger_shutdown_token()`. When released, by
 `reset()` or by destruction, the shutdown is triggered with the reason given
 at creation, unless it was already triggered. A moved-from token is inert.
 */
template <typename T>
struct trigger_token : public printable {
    /// construct an inert token
    trigger_token() { }

    trigger_token(const trigger_token<T>&) = delete;

    trigger_token(trigger_token<T>&& rhs) :
        st_(std::move(rhs.st_)),
        reason_(std::move(rhs.reason_))
    {
        rhs.reason_.reset();
    }

    virtual ~trigger_token() { reset(); }

    trigger_token<T>& operator=(const trigger_token<T>&) = delete;

    inline trigger_token<T>& operator=(trigger_token<T>&& rhs) {
        if(this != &rhs) {
            reset();
            st_ = std::move(rhs.st_);
            reason_ = std::move(rhs.reason_);
            rhs.reason_.reset();
        }

        return *this;
    }

    static inline std::string info_name() {
        return type::templatize<T>("gsd::trigger_token");
    }

    inline std::string name() const { return trigger_token<T>::info_name(); }

    /// return true if the token will still trigger when released, else false
    inline bool valid() const { return (bool)st_; }

    /// return the reason this token triggers with, empty for an inert token
    inline const std::optional<T>& reason() const { return reason_; }

    /**
     @brief release the token early, triggering the shutdown

     Does nothing if the shutdown was already triggered. Further calls do
     nothing.
     */
    inline void reset() {
        if(st_) {
            GSD_MED_METHOD_ENTER("reset");
            auto st = std::move(st_);

            if(!(st->trigger_if_untriggered(*reason_))) {
                GSD_MED_METHOD_BODY("reset","shutdown was already triggered");
            }
        }
    }

    /**
     @brief wrap a coroutine so the shutdown is triggered when it finishes

     The returned coroutine runs `op` to completion, triggers the shutdown with
     this token's reason (if not already triggered) and yields `op`'s result
     unchanged. Destroying the returned coroutine before it completes also
     triggers the shutdown.

     @param op the coroutine to wrap
     @return the wrapped coroutine
     */
    template <typename R>
    gsd::co<R> wrap(gsd::co<R> op) &&;

private:
    trigger_token(std::shared_ptr<detail::state<T>> st, T reason) :
        st_(std::move(st)),
        reason_(std::move(reason))
    {
        GSD_MED_CONSTRUCTOR();
    }

    std::shared_ptr<detail::state<T>> st_;
    std::optional<T> reason_;

    friend struct gsd::shutdown<T>;
};

}

#endif
