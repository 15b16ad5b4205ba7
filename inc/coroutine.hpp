//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_COROUTINE
#define GRACEFUL_SHUTDOWN_COROUTINE

// c++
#include <memory>
#include <mutex>
#include <condition_variable>
#include <coroutine>
#include <exception>
#include <string>
#include <ostream>
#include <sstream>

// local
#include "utility.hpp"
#include "logging.hpp"

namespace gsd {

struct coroutine;

namespace detail {
namespace coroutine {

// always points to the coroutine running on this thread
gsd::coroutine*& tl_this_coroutine();

/*
 Whatever holds the handle of a suspended coroutine until something resumes
 it. Implemented by gsd::awaitable::interface.
 */
struct parking {
    virtual ~parking() { }

    /*
     Take the held handle back so the coroutine can be destroyed instead of
     resumed. Returns a null handle if the handle was already passed to its
     destination, or if the holder refuses to let it go.
     */
    virtual std::coroutine_handle<> reclaim() = 0;
};

}
}

/**
 @brief interface coroutine type

 An actual coroutine must be an implementation of descendent type co<T> in order
 to have a valid promise_type.

 Coroutine objects in this library own their handle the way a
 `std::unique_ptr` owns its pointer. Destroying a coroutine which has not
 completed destroys its frame, running the destructors of every object alive
 inside it. Tokens held by an operation are released this way when the
 operation is abandoned.
 */
struct coroutine : public printable {
    struct promise_type : public printable {
        /// called with the joiner and this promise when the frame is destroyed
        using join_operation = void (*)(void*, promise_type&);

        promise_type() { }
        virtual ~promise_type() { }

        inline coroutine get_return_object() {
            return {
                std::coroutine_handle<promise_type>::from_promise(*this)
            };
        }

        inline std::suspend_always initial_suspend() { return {}; }
        inline std::suspend_always final_suspend() noexcept { return {}; }
        inline void unhandled_exception() { eptr = std::current_exception(); }

        /// the exception which escaped the coroutine body, if any
        std::exception_ptr eptr = nullptr;

        /// holder of the handle while suspended, stale once queued
        detail::coroutine::parking* parked = nullptr;

        /// when set the coroutine is destroyed instead of resumed
        bool abandoned = false;

        /// set by `co_return`
        bool returned = false;

        /**
         @brief connect the single joiner of this coroutine

         `op` is called with `joiner` when the frame is destroyed, whether or
         not the coroutine completed.
         */
        inline void join(join_operation op, void* joiner) {
            GSD_LOW_METHOD_ENTER("join", joiner);
            join_op_ = op;
            joiner_ = joiner;
        }

        /// disconnect the joiner, the frame will be destroyed silently
        inline void unjoin() {
            GSD_LOW_METHOD_ENTER("unjoin", joiner_);
            join_op_ = nullptr;
            joiner_ = nullptr;
        }

    protected:
        /*
         Called by the co<T>::promise_type destructor, which still owns the
         `co_return`ed value the joiner collects.
         */
        inline void joined_() {
            if(join_op_) {
                auto op = join_op_;
                join_op_ = nullptr;
                op(joiner_, *this);
            }
        }

    private:
        join_operation join_op_ = nullptr;
        void* joiner_ = nullptr;
    };

    coroutine() { }
    coroutine(const coroutine&) = delete;

    coroutine(coroutine&& rhs) {
        GSD_MED_GUARD(rhs.handle_, GSD_MED_CONSTRUCTOR(rhs));
        swap(rhs);
    }

    // take ownership of a type erased handle
    coroutine(std::coroutine_handle<>&& h) : handle_(h) {
        GSD_MIN_GUARD(h,GSD_MIN_CONSTRUCTOR(h));
        h = std::coroutine_handle<>();
    }

    inline coroutine& operator=(const coroutine&) = delete;

    inline coroutine& operator=(coroutine&& rhs) {
        GSD_MED_METHOD_ENTER("operator=",rhs);
        swap(rhs);
        return *this;
    }

    virtual ~coroutine() {
        GSD_MED_GUARD(handle_,GSD_MED_DESTRUCTOR());
        reset();
    }

    static inline std::string info_name() { return "gsd::coroutine"; }
    inline std::string name() const { return coroutine::info_name(); }

    inline std::string content() const {
        if(!handle_) { return std::string(); }
        std::stringstream ss;
        ss << handle_;
        return ss.str();
    }

    /// return true if a handle is owned, else false
    inline operator bool() const { return (bool)handle_; }

    /// give up ownership of the handle
    inline std::coroutine_handle<> release() {
        GSD_LOW_METHOD_ENTER("release");
        auto h = handle_;
        handle_ = std::coroutine_handle<>();
        return h;
    }

    /// destroy the owned frame, if any
    inline void reset() { reset(std::coroutine_handle<>()); }

    /// destroy the owned frame, if any, and take ownership of `h`
    inline void reset(std::coroutine_handle<> h) {
        GSD_TRACE_METHOD_ENTER("reset", h);
        if(handle_) [[likely]] { handle_.destroy(); }
        handle_ = h;
    }

    inline void swap(coroutine& rhs) noexcept { std::swap(handle_, rhs.handle_); }

    /// return true if the coroutine has completed, else false
    inline bool done() const { return handle_.done(); }

    /// return true if the coroutine was abandoned while suspended
    inline bool abandoned() const { return promise_().abandoned; }

    inline void* address() const { return handle_.address(); }

    /// return true if called inside a running coroutine, else false
    static inline bool in() {
        return (bool)detail::coroutine::tl_this_coroutine();
    }

    /// return the coroutine running on this thread
    static inline coroutine& local() {
        return *(detail::coroutine::tl_this_coroutine());
    }

    /**
     @brief resume the coroutine

     Rethrows any exception which escaped the coroutine body.
     */
    inline void resume() {
        GSD_MED_METHOD_ENTER("resume");
        auto& tl_co = detail::coroutine::tl_this_coroutine();
        auto parent_co = tl_co;
        tl_co = this;
        promise_().parked = nullptr;
        handle_.resume();
        tl_co = parent_co;

        // an awaitable takes the handle when the coroutine suspends on it
        if(handle_) [[unlikely]] {
            auto eptr = promise_().eptr;
            if(eptr) [[unlikely]] { std::rethrow_exception(eptr); }
        }
    }

    /**
     @brief destroy a suspended coroutine without resuming it

     Must be called on the thread of the scheduler the coroutine belongs to,
     and never by the coroutine itself.

     A coroutine whose handle is held by an awaitable is destroyed before this
     returns. One waiting in its scheduler's queue, or held by an awaitable
     which refuses to give it up, is destroyed by its scheduler when it would
     next be resumed.

     Destroying the frame runs the destructors of every object inside it, and
     resumes its joiner (if any) without a result.

     @param h handle of a coroutine owned by someone else
     */
    static inline void abandon(std::coroutine_handle<> h) {
        GSD_MED_FUNCTION_ENTER("gsd::coroutine::abandon", h);
        auto& p = std::coroutine_handle<promise_type>::from_address(
            h.address()).promise();

        if(p.abandoned) { return; }

        p.abandoned = true;

        if(p.parked) {
            auto reclaimed = p.parked->reclaim();

            if(reclaimed) {
                p.parked = nullptr;
                coroutine co(std::move(reclaimed));
                return;
            }
        }

        GSD_LOW_FUNCTION_BODY("gsd::coroutine::abandon", h, " is destroyed by its scheduler");
    }

protected:
    inline promise_type& promise_() const {
        return std::coroutine_handle<promise_type>::from_address(
            handle_.address()).promise();
    }

    std::coroutine_handle<> handle_;
};

/// return the coroutine handle's promise
template <typename COROUTINE>
inline typename COROUTINE::promise_type& get_promise(COROUTINE& c) {
    return std::coroutine_handle<typename COROUTINE::promise_type>::from_address(
        c.address()).promise();
};

/**
 @brief stackless management coroutine object with templated return type

 User coroutines return this object to name their `co_return` type. Every
 operation handed to a `gsd::shutdown` wrapper adapter is one of these.
 */
template <typename T>
struct co : public coroutine {
    typedef T value_type;

    struct promise_type : public coroutine::promise_type {
        promise_type() { }
        virtual ~promise_type() { joined_(); }

        static inline std::string info_name() {
            return gsd::co<T>::info_name() + "::promise_type";
        }

        virtual inline std::string name() const {
            return gsd::co<T>::promise_type::info_name();
        }

        template <typename TSHADOW>
        inline void return_value(TSHADOW&& t) {
            result.reset(new T(std::forward<TSHADOW>(t)));
            returned = true;
        }

        /// the `co_return`ed value, empty until the coroutine completes
        std::unique_ptr<T> result;
    };

    co() = default;
    co(const co<T>&) = delete;
    co(co<T>&& rhs) = default;
    co(std::coroutine_handle<> h) : coroutine(std::move(h)) { }
    co(coroutine&& rhs) : coroutine(std::move(rhs)) { }

    virtual ~co(){}

    inline co<T>& operator=(const co<T>&) = delete;
    inline co<T>& operator=(co<T>&& rhs) = default;

    inline co<T>& operator=(coroutine&& rhs) {
        *this = co<T>(std::move(rhs));
        return *this;
    }

    static inline std::string info_name() {
        return type::templatize<T>("gsd::co");
    }

    inline std::string name() const { return co<T>::info_name(); }
};

template <>
struct co<void> : public coroutine {
    typedef void value_type;

    struct promise_type : public coroutine::promise_type {
        promise_type() { }
        virtual ~promise_type() { joined_(); }

        static inline std::string info_name() {
            return co<void>::info_name() + "::promise_type";
        }

        virtual inline std::string name() const {
            return co<void>::promise_type::info_name();
        }

        inline void return_void(){ returned = true; }
    };

    co() = default;
    co(const co<void>&) = delete;
    co(co<void>&& rhs) = default;
    co(std::coroutine_handle<> h) : coroutine(std::move(h)) { }
    co(coroutine&& rhs) : coroutine(std::move(rhs)) { }

    virtual ~co(){}

    inline co<void>& operator=(const co<void>&) = delete;
    inline co<void>& operator=(co<void>&& rhs) = default;

    inline co<void>& operator=(coroutine&& rhs) {
        *this = co<void>(std::move(rhs));
        return *this;
    }

    static inline std::string info_name() { return "gsd::co<void>"; }
    inline std::string name() const { return co<void>::info_name(); }
};

template <typename T>
using co_promise_type = typename co<T>::promise_type;

namespace detail {
namespace coroutine {

/// blocks a system thread, which has no handle to suspend, on an awaitable
struct this_thread : public printable {
    static inline std::string info_name() {
        return "gsd::detail::coroutine::this_thread";
    }

    inline std::string name() const { return this_thread::info_name(); }

    // the this_thread of the calling thread
    static this_thread* get();

    // block the calling thread, `lk` is unlocked while blocked
    template <typename LOCK>
    static inline void block(LOCK& lk) {
        auto tt = this_thread::get();
        GSD_TRACE_FUNCTION_ENTER("gsd::detail::coroutine::this_thread::block", tt);
        while(!tt->ready_) { tt->cv_.wait(lk); }
        tt->ready_ = false;
    }

    // the caller already holds the lock which was passed to block()
    inline void unblock() {
        GSD_TRACE_METHOD_ENTER("unblock");
        ready_ = true;
        cv_.notify_one();
    }

    // the lock passed to block() is unlocked before notifying
    template <typename LOCK>
    inline void unblock(LOCK& lk) {
        GSD_TRACE_METHOD_ENTER("unblock");
        ready_ = true;
        lk.unlock();
        cv_.notify_one();
    }

private:
    this_thread() { }

    bool ready_ = false;
    std::condition_variable_any cv_;
};

}
}

/**
 @brief shared base of every awaitable in this library

 An awaitable is transient. A coroutine `co_await`s it, a system thread
 converts it to its result or lets it go out of scope, in both cases blocking
 until the operation completes.

 The behavior lives in a type erased implementation of
 `awaitable::interface`, owned by a single unique pointer.
 */
struct awaitable : public printable {
    struct resume {
        /// how the caller of awaitable::interface::resume() synchronizes
        enum policy {
            lock, //< resume() locks and unlocks the awaitable's lock
            no_lock //< the caller of resume() already holds the lock
        };
    };

    /**
     @brief pure virtual interface for an awaitable's implementation

     `await_ready()` and `await_suspend()` are driven by `co_await` (or by
     `awaitable::wait()` on a system thread), `resume()` by whatever completes
     the operation, and `reclaim()` by `gsd::coroutine::abandon()`.

     Implementations are assembled from partial implementations: the lock is
     provided by `awaitable::lockable<Lock,INTERFACE>` and the destination of a
     resumed coroutine by `scheduler::reschedule<INTERFACE>`.
     */
    struct interface : public printable, public detail::coroutine::parking {
        interface() { GSD_LOW_CONSTRUCTOR(); }
        interface(const interface& rhs) = delete;
        interface(interface&& rhs) = delete;

        virtual ~interface() {
            GSD_TRACE_DESTRUCTOR();

            if(this->handle_) [[unlikely]] {
                std::stringstream ss;
                ss << *this << " destroyed while holding " << this->handle_;
                GSD_FATAL_METHOD_BODY("~interface",ss.str());
                std::terminate();
            }
        }

        interface& operator=(const interface& rhs) = delete;
        interface& operator=(interface&& rhs) = delete;

        static inline std::string info_name() {
            return "gsd::awaitable::interface";
        }

        inline std::string name() const { return interface::info_name(); }

        virtual inline bool awaited() final { return this->awaited_; }

        // returns unlocked when ready, otherwise locked for await_suspend()
        virtual inline bool await_ready() final {
            GSD_LOW_METHOD_ENTER("await_ready");
            this->lock();
            this->awaited_ = true;

            if(this->on_ready()) [[unlikely]] {
                this->unlock();
                return true;
            }

            return false;
        }

        virtual inline void await_suspend(std::coroutine_handle<> h) final {
            GSD_LOW_METHOD_ENTER("await_suspend", h);
            this->on_suspend();

            if(h) [[likely]] {
                this->handle_ = h;
                std::coroutine_handle<coroutine::promise_type>::from_address(
                    h.address()).promise().parked = this;

                // the handle is ours until resume() or reclaim()
                coroutine::local().release();
            } else [[unlikely]] {
                this->tt_ = detail::coroutine::this_thread::get();
                detail::coroutine::this_thread::block(*this);
            }

            this->unlock();
        }

        /**
         @brief complete the operation and continue whoever awaits it

         @param m arbitary memory passed to on_resume()
         */
        virtual inline void resume(void* m) final {
            GSD_LOW_METHOD_ENTER("resume", m);
            const bool locking = this->resume_policy() == resume::policy::lock;

            if(locking) { this->lock(); }

            this->on_resume(m);

            if(this->handle_) [[likely]] {
                auto h = this->handle_;
                this->handle_ = std::coroutine_handle<>();

                // a lock owned by this object may not outlive the handle's next run
                if(locking) { this->unlock(); }
                this->to_destination(h);
            } else if(this->tt_) [[unlikely]] {
                auto tt = this->tt_;
                this->tt_ = nullptr;
                if(locking) { tt->unblock(*this); }
                else { tt->unblock(); }
            } else if(locking) {
                // resumed before anybody waited
                this->unlock();
            }
        }

        virtual inline std::coroutine_handle<> reclaim() final {
            GSD_LOW_METHOD_ENTER("reclaim");
            std::coroutine_handle<> h;
            this->lock();

            if(this->handle_ && this->on_abandon()) {
                h = this->handle_;
                this->handle_ = std::coroutine_handle<>();
                this->leave_destination();
            }

            this->unlock();
            return h;
        }

        virtual resume::policy resume_policy() const = 0;
        virtual void lock() = 0;
        virtual void unlock() = 0;

        /**
         Called during resume() with the suspended handle, and is responsible
         for scheduling it. The lock is only held during this call under the
         `no_lock` resume policy.
         */
        virtual void to_destination(std::coroutine_handle<>) = 0;

        /// called under the lock when a reclaimed handle never reaches its destination
        virtual void leave_destination() = 0;

        /// under the lock, return true if the operation already completed
        virtual bool on_ready() = 0;

        /// under the lock, immediately before suspending
        virtual void on_suspend() = 0;

        /// under the lock, `m` is the argument of resume()
        virtual void on_resume(void* m) = 0;

        /**
         @brief under the lock, stop whatever would resume the held handle

         @return false to keep the handle, it is then destroyed by its scheduler once resumed
         */
        virtual bool on_abandon() = 0;

    private:
        bool awaited_ = false;
        detail::coroutine::this_thread* tt_ = nullptr;
        std::coroutine_handle<> handle_;
    };

    /// partial implementation of awaitable::interface for a templated Lock
    template <typename Lock, typename INTERFACE>
    struct lockable : public INTERFACE {
        template <typename... As>
        lockable(Lock& lk, resume::policy rp, As&&... as) :
            INTERFACE(std::forward<As>(as)...),
            lk_(&lk),
            resume_policy_(rp),
            locked_(false)
        { }

        virtual ~lockable() { if(locked_){ unlock(); } }

        inline resume::policy resume_policy() const { return resume_policy_; }

        inline void lock() final {
            lk_->lock();
            locked_ = true;
        }

        inline void unlock() final {
            locked_ = false;
            lk_->unlock();
        }

    private:
        Lock* lk_;
        const resume::policy resume_policy_;
        bool locked_;
    };

    awaitable() : impl_(nullptr) { }
    awaitable(const awaitable&) = delete;
    awaitable(awaitable&& rhs) = default;

    virtual ~awaitable() { wait(); }

    inline awaitable& operator=(const awaitable&) = delete;
    inline awaitable& operator=(awaitable&& rhs) = default;

    static inline std::string info_name() { return "gsd::awaitable"; }
    inline std::string name() const { return awaitable::info_name(); }

    inline std::string content() const {
        return impl_ ? impl_->to_string() : std::string();
    }

    /// return true if an implementation is owned, else false
    inline bool valid() const { return (bool)impl_; }

    interface& implementation() { return *impl_; }

    inline bool await_ready() { return impl_->await_ready(); }

    // a null handle blocks the calling system thread until resumed
    inline void await_suspend(std::coroutine_handle<> h) {
        impl_->await_suspend(h);
    }

    /**
     @brief block a system thread until the operation completes

     Coroutines must `co_await` instead. Called by the destructor.
     */
    inline void wait() {
        if(impl_ && !(impl_->awaited())) [[unlikely]] {
            if(coroutine::in()) [[unlikely]] {
                std::stringstream ss;
                ss << gsd::coroutine::local()
                   << " did not call co_await on "
                   << *this;
                GSD_FATAL_METHOD_BODY("wait",ss.str());
                std::terminate();
            } else if(!await_ready()) [[likely]] {
                await_suspend(std::coroutine_handle<>());
            }
        }
    }

protected:
    template <typename IMPLEMENTATION>
    awaitable(IMPLEMENTATION* i) :
        impl_(static_cast<awaitable::interface*>(i))
    { }

private:
    std::unique_ptr<interface> impl_;
};

/**
 @brief typed awaitable returned by this library

 Given function `awt<T> my_operation()`:

 coroutine:
 ```
 T my_t = co_await my_operation();
 ```

 non-coroutine:
 ```
 T my_t = my_operation();
 ```
 */
template <typename T>
struct awt : public awaitable {
    typedef T value_type;

    struct interface : public awaitable::interface {
        virtual ~interface() { }

        static inline std::string info_name() {
            return gsd::awt<T>::info_name() + "::interface";
        }

        inline std::string name() const { return interface::info_name(); }

        /// return the final result of the operation
        virtual T get_result() = 0;
    };

    awt(){}
    awt(const awt<T>& rhs) = delete;
    awt(awt<T>&& rhs) = default;

    template <typename IMPLEMENTATION>
    awt(IMPLEMENTATION* i) : awaitable(static_cast<interface*>(i)) { }

    ~awt(){ }

    inline awt& operator=(const awt<T>& rhs) = delete;
    inline awt& operator=(awt<T>&& rhs) = default;

    static inline std::string info_name() {
        return type::templatize<T>("gsd::awt");
    }

    inline std::string name() const { return awt<T>::info_name(); }

    template <typename IMPLEMENTATION, typename... As>
    static inline awt<T> make(As&&... as) {
        return awt<T>(new IMPLEMENTATION(std::forward<As>(as)...));
    }

    inline T await_resume(){
        return static_cast<interface&>(this->implementation()).get_result();
    }

    /// block a system thread until the result is available
    inline operator T() {
        this->wait();
        return await_resume();
    }
};

template <>
struct awt<void> : public awaitable {
    typedef void value_type;

    struct interface : public awaitable::interface {
        virtual ~interface() { }

        static inline std::string info_name() {
            return gsd::awt<void>::info_name() + "::interface";
        }

        inline std::string name() const { return interface::info_name(); }
    };

    awt(){}
    awt(const awt<void>& rhs) = delete;
    awt(awt<void>&& rhs) = default;

    template <typename IMPLEMENTATION>
    awt(IMPLEMENTATION* i) : awaitable(static_cast<interface*>(i)) { }

    ~awt() { }

    inline awt<void>& operator=(const awt<void>& rhs) = delete;
    inline awt<void>& operator=(awt<void>&& rhs) = default;

    static inline std::string info_name() {
        return type::templatize<void>("gsd::awt");
    }

    inline std::string name() const { return awt<void>::info_name(); }

    template <typename IMPLEMENTATION, typename... As>
    static inline awt<void> make(As&&... as) {
        return awt<void>(new IMPLEMENTATION(std::forward<As>(as)...));
    }

    inline void await_resume(){ }
};

template <typename T>
using awt_interface = typename gsd::awt<T>::interface;

}

#endif
