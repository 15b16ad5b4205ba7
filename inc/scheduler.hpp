//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_SCHEDULER
#define GRACEFUL_SHUTDOWN_SCHEDULER

// c++
#include <cstddef>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <exception>
#include <deque>
#include <unordered_set>
#include <string>
#include <sstream>
#include <thread>

// local
#include "logging.hpp"
#include "utility.hpp"
#include "atomic.hpp"
#include "coroutine.hpp"

namespace gsd {

struct scheduler;
struct lifecycle;

/// thrown by a joined awaitable whose coroutine was destroyed before it returned
struct awaitable_destroyed_without_joining_result : public std::exception {
    awaitable_destroyed_without_joining_result(void* c, void* j) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << "coroutine@" << c
               << " was destroyed before it returned, "
               << "awaitable@" << j << " has no result";
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

namespace detail {
namespace scheduler {

// the scheduler running on the calling thread
gsd::scheduler*& tl_this_scheduler();

/*
 Shared half of the joiners: waits for a scheduled coroutine's frame to be
 destroyed.

 When the coroutine awaiting the joiner is abandoned, a child on the same
 scheduler is abandoned with it. A child on another scheduler can't be touched
 from here, so the awaiting coroutine stays suspended until the child finishes
 and is then destroyed by its scheduler.
 */
template <typename INTERFACE>
struct join_point :
    public gsd::awaitable::lockable<gsd::spinlock, INTERFACE>
{
    join_point(gsd::coroutine& child, gsd::scheduler* sch) :
        gsd::awaitable::lockable<gsd::spinlock, INTERFACE>(
            lk_,
            gsd::awaitable::resume::policy::lock),
        child_(std::coroutine_handle<>::from_address(child.address())),
        sch_(sch)
    { }

    virtual ~join_point() {
        if(orphaned_) { gsd::coroutine::abandon(child_); }
    }

    inline void* address() { return child_.address(); }
    inline bool on_ready() { return ready_; }

    inline bool on_abandon() {
        if(sch_ != tl_this_scheduler()) { return false; }

        std::coroutine_handle<gsd::coroutine::promise_type>::from_address(
            child_.address()).promise().unjoin();
        orphaned_ = true;
        return true;
    }

protected:
    bool ready_ = false;

private:
    gsd::spinlock lk_;
    std::coroutine_handle<> child_;
    gsd::scheduler* sch_;
    bool orphaned_ = false;
};

// joins a coroutine returning a T
template <typename T>
struct joiner : public join_point<typename gsd::awt<T>::interface> {
    joiner(gsd::co<T>& co, gsd::scheduler* sch) :
        join_point<typename gsd::awt<T>::interface>(co, sch)
    {
        GSD_TRACE_CONSTRUCTOR(co);
        gsd::get_promise(co).join(&joiner<T>::joined, this);
    }

    virtual ~joiner(){}

    static inline std::string info_name() {
        return type::templatize<T>("gsd::detail::scheduler::joiner");
    }

    inline std::string name() const { return joiner<T>::info_name(); }

    inline void on_resume(void* m) {
        this->ready_ = true;
        if(m) [[likely]] { t_ = std::move(*static_cast<std::unique_ptr<T>*>(m)); }
    }

    inline T get_result() {
        if(!t_) [[unlikely]] {
            throw awaitable_destroyed_without_joining_result(this->address(), this);
        }

        return std::move(*t_);
    }

private:
    // called by the child's promise destructor, which still owns its result
    static inline void joined(void* j, gsd::coroutine::promise_type& p) {
        auto self = static_cast<joiner<T>*>(j);
        auto& promise = static_cast<gsd::co_promise_type<T>&>(p);

        if(promise.result) [[likely]] {
            self->resume(&(promise.result));
        } else {
            GSD_ERROR_FUNCTION_BODY(joiner<T>::info_name() + "::joined", self->address(), " returned nothing");
            self->resume(nullptr);
        }
    }

    std::unique_ptr<T> t_;
};

template <>
struct joiner<void> : public join_point<gsd::awt<void>::interface> {
    joiner(gsd::co<void>& co, gsd::scheduler* sch) :
        join_point<gsd::awt<void>::interface>(co, sch)
    {
        GSD_TRACE_CONSTRUCTOR(co);
        gsd::get_promise(co).join(&joiner<void>::joined, this);
    }

    virtual ~joiner(){}

    static inline std::string info_name() {
        return type::templatize<void>("gsd::detail::scheduler::joiner");
    }

    inline std::string name() const { return joiner<void>::info_name(); }
    inline void on_resume(void* m) { this->ready_ = true; }

private:
    static inline void joined(void* j, gsd::coroutine::promise_type& p) {
        static_cast<joiner<void>*>(j)->resume(nullptr);
    }
};

}
}

/**
 @brief object responsible for scheduling and executing coroutines

 A `scheduler` cannot be created directly, it must be created by calling
 `scheduler::make()`, or by the `gsd::lifecycle` for the global scheduler.

 `scheduler` API, unless otherwise specified, is threadsafe and coroutine-safe.

 Every coroutine the scheduler owns is destroyed when it halts, whether it is
 queued or suspended on an awaitable of this library.
*/
struct scheduler : public printable {
    enum state {
        executing, /// scheduler is executing coroutines
        halted /// scheduler accepts no new coroutines
    };

    struct halted_exception : public std::exception {
        halted_exception(scheduler* sch) :
            estr([&]() -> std::string {
                std::stringstream ss;
                ss << "cannot schedule on halted " << sch;
                return ss.str();
            }())
        { }

        inline const char* what() const noexcept { return estr.c_str(); }

    private:
        const std::string estr;
    };

    struct no_global_exception : public std::exception {
        inline const char* what() const noexcept {
            return "gsd::scheduler::global() requires an existing gsd::lifecycle";
        }
    };

    /// thrown when scheduling an empty or already completed coroutine
    struct invalid_coroutine_exception : public std::exception {
        invalid_coroutine_exception(const gsd::coroutine& c) :
            estr([&]() -> std::string {
                std::stringstream ss;
                ss << "cannot schedule " << (c ? "completed " : "empty ") << c;
                return ss.str();
            }())
        { }

        inline const char* what() const noexcept { return estr.c_str(); }

    private:
        const std::string estr;
    };

    /**
     @brief partial implementation of gsd::awaitable::interface

     Parks a suspending coroutine with the scheduler it runs on, and queues it
     there again when it is resumed. Implementations which override
     `on_suspend()` must call `reschedule<INTERFACE>::on_suspend()`.
     */
    template <typename INTERFACE>
    struct reschedule : public INTERFACE {
        template <typename... As>
        reschedule(As&&... as) : INTERFACE(std::forward<As>(as)...) { }

        virtual ~reschedule(){}

        inline void to_destination(std::coroutine_handle<> h) {
            auto d = destination_.lock();

            if(!d) [[unlikely]] {
                GSD_ERROR_METHOD_BODY("to_destination","no destination for ",h);
            } else if(!(d->resume_(this, h))) [[unlikely]] {
                GSD_ERROR_METHOD_BODY("to_destination","cannot resume ",h," on stopped ",d.get());
            }
        }

        inline void leave_destination() {
            auto d = destination_.lock();
            if(d) { d->unpark_(this); }
        }

        inline void on_suspend() {
            auto tl_sch = detail::scheduler::tl_this_scheduler();

            // system threads block instead of parking
            if(tl_sch) {
                destination_ = tl_sch->self_wptr_;
                tl_sch->park_(this);
            }
        }

    private:
        std::weak_ptr<scheduler> destination_;
    };

    /// complete awaitable returned by `gsd::scheduler::schedule()`
    template <typename T>
    struct joiner :
        public gsd::scheduler::reschedule<gsd::detail::scheduler::joiner<T>>
    {
        joiner(gsd::co<T>& co, gsd::scheduler* sch) :
            gsd::scheduler::reschedule<gsd::detail::scheduler::joiner<T>>(co, sch)
        { }

        virtual ~joiner() { }

        static inline std::string info_name() {
            return type::templatize<T>("gsd::scheduler::joiner");
        }

        inline std::string name() const { return joiner<T>::info_name(); }
    };

    /**
     @brief owner of a scheduler and the thread running it

     Destroying the `lifecycle` halts the scheduler and joins its thread.
     */
    struct lifecycle : public printable {
        virtual ~lifecycle(){
            GSD_HIGH_DESTRUCTOR();
            sch_->halt_();
            thd_.join();
        }

        static inline std::string info_name() {
            return "gsd::scheduler::lifecycle";
        }

        inline std::string name() const { return lifecycle::info_name(); }

        inline gsd::scheduler& scheduler() { return *sch_; }

    private:
        lifecycle() = delete;
        lifecycle(lifecycle&&) = delete;
        lifecycle(const lifecycle&) = delete;
        lifecycle& operator=(lifecycle&&) = delete;
        lifecycle& operator=(const lifecycle&) = delete;

        lifecycle(std::shared_ptr<gsd::scheduler> sch) :
            sch_(std::move(sch)),
            thd_([](gsd::scheduler* s){ s->run(); }, sch_.get())
        {
            GSD_HIGH_CONSTRUCTOR();
        }

        std::shared_ptr<gsd::scheduler> sch_;
        std::thread thd_;
        friend struct gsd::scheduler;
    };

    /// runtime behavior of a `scheduler`
    struct config {
        config(){}

        /// log level of the scheduler's thread, between -9 and 9
        int log_level = -1;
    };

    virtual ~scheduler() { GSD_HIGH_DESTRUCTOR(); }

    static inline std::string info_name() { return "gsd::scheduler"; }
    inline std::string name() const { return scheduler::info_name(); }

    /**
     @brief construct a scheduler running on a new system thread

     @param c optional config of the scheduler
     @return the lifecycle owning the scheduler
     */
    static inline std::unique_ptr<lifecycle> make(config c = {}) {
        GSD_HIGH_FUNCTION_ENTER("gsd::scheduler::make",c.log_level);
        std::shared_ptr<scheduler> s(new scheduler);
        s->self_wptr_ = s;
        s->log_level_ = c.log_level;
        return std::unique_ptr<lifecycle>(new lifecycle(std::move(s)));
    }

    /// return true if the calling thread is running a scheduler, else false
    static inline bool in() {
        return (bool)detail::scheduler::tl_this_scheduler();
    }

    /// the scheduler running the calling thread, requires `in()`
    static inline scheduler& local() {
        return *(detail::scheduler::tl_this_scheduler());
    }

    /**
     @brief the process wide scheduler owned by the `gsd::lifecycle`

     Throws `no_global_exception` if no lifecycle exists.
     */
    static inline scheduler& global() {
        if(!scheduler::global_) [[unlikely]] { throw no_global_exception(); }
        return *(scheduler::global_);
    }

    /// `local()` if `in()`, else `global()`
    static inline scheduler& get() {
        return scheduler::in() ? scheduler::local() : scheduler::global();
    }

    inline int log_level() const { return log_level_; }

    inline state status() const {
        std::lock_guard<spinlock> lk(lk_);
        return state_;
    }

    /**
     @brief schedule a coroutine and return an awaitable joining it

     The awaitable resolves with the `co_return`ed value once the coroutine's
     frame is destroyed. It throws `awaitable_destroyed_without_joining_result`
     if the coroutine threw or was destroyed before returning.

     @param co a coroutine to schedule
     @return an awaitable joining the coroutine
     */
    template <typename T>
    inline gsd::awt<T> schedule(gsd::co<T> co) {
        GSD_HIGH_METHOD_ENTER("schedule",co);
        validate_(co);

        std::unique_ptr<gsd::scheduler::joiner<T>> j(
            new gsd::scheduler::joiner<T>(co, this));

        if(!schedule_(std::coroutine_handle<>::from_address(co.address()))) [[unlikely]] {
            // the frame is destroyed with `co`, the joiner is never resumed
            gsd::get_promise(co).unjoin();
            throw halted_exception(this);
        }

        co.release();
        return gsd::awt<T>(j.release());
    }

    /**
     @brief schedule a coroutine which nobody joins

     @param co a coroutine to schedule
     */
    template <typename T>
    inline void detach(gsd::co<T> co) {
        GSD_HIGH_METHOD_ENTER("detach",co);
        validate_(co);

        if(!schedule_(std::coroutine_handle<>::from_address(co.address()))) [[unlikely]] {
            throw halted_exception(this);
        }

        co.release();
    }

private:
    scheduler() { GSD_HIGH_CONSTRUCTOR(); }

    inline void validate_(const gsd::coroutine& co) {
        if(!co || co.done()) [[unlikely]] {
            throw invalid_coroutine_exception(co);
        }
    }

    // queue a new coroutine, false if halted
    inline bool schedule_(std::coroutine_handle<> h) {
        std::lock_guard<spinlock> lk(lk_);
        if(state_ == halted) [[unlikely]] { return false; }
        coroutine_queue_.push_back(h);
        coroutines_notify_();
        return true;
    }

    // queue a resumed coroutine, false once run() returned
    inline bool resume_(gsd::awaitable::interface* a, std::coroutine_handle<> h) {
        std::lock_guard<spinlock> lk(lk_);
        parked_.erase(a);
        if(stopped_) [[unlikely]] { return false; }
        coroutine_queue_.push_back(h);
        coroutines_notify_();
        return true;
    }

    inline void park_(gsd::awaitable::interface* a) {
        std::lock_guard<spinlock> lk(lk_);
        parked_.insert(a);
    }

    inline void unpark_(gsd::awaitable::interface* a) {
        std::lock_guard<spinlock> lk(lk_);
        parked_.erase(a);
    }

    inline void halt_() {
        std::lock_guard<gsd::spinlock> lk(lk_);

        if(state_ != halted) {
            state_ = halted;
            coroutines_notify_();
        }
    }

    inline void coroutines_notify_() {
        if(waiting_for_coroutines_) {
            waiting_for_coroutines_ = false;
            coroutines_cv_.notify_one();
        }
    }

    // execute coroutines until halted, then destroy every remaining one
    void run() {
        struct scoped_locals {
            scoped_locals(int log_level, scheduler* s) :
                prev_log_level_(gsd::logger::thread_log_level())
            {
                gsd::logger::thread_log_level(log_level);
                detail::scheduler::tl_this_scheduler() = s;
            }

            ~scoped_locals() {
                detail::scheduler::tl_this_scheduler() = nullptr;
                gsd::logger::thread_log_level(prev_log_level_);
            }

        private:
            int prev_log_level_;
        };

        scoped_locals stl(log_level_, this);

        GSD_HIGH_METHOD_ENTER("run");

        std::deque<std::coroutine_handle<>> local_queue;
        std::unique_lock<spinlock> lk(lk_);

        while(state_ == executing) [[likely]] {
            if(coroutine_queue_.empty()) [[unlikely]] {
                waiting_for_coroutines_ = true;
                coroutines_cv_.wait(lk);
                continue;
            }

            std::swap(local_queue, coroutine_queue_);
            lk.unlock();

            coroutine co;

            for(auto h : local_queue) {
                co.reset(h);

                if(co.abandoned()) [[unlikely]] {
                    co.reset();
                    continue;
                }

                try {
                    co.resume();
                } catch(const std::exception& e) {
                    GSD_ERROR_METHOD_BODY("run",co," threw: ",e.what());
                }

                if(co && !co.done()) [[unlikely]] {
                    GSD_ERROR_METHOD_BODY("run",co," suspended without an awaitable, destroying");
                }

                // destroying the frame resumes its joiner
                co.reset();
            }

            local_queue.clear();
            lk.lock();
        }

        GSD_HIGH_METHOD_BODY("run","halted, abandoning ",parked_.size()," suspended and ",coroutine_queue_.size()," queued coroutines");

        // destroying a frame can resume or abandon others, repeat until none remain
        while(parked_.size() || coroutine_queue_.size()) {
            if(parked_.size()) {
                auto a = *(parked_.begin());
                parked_.erase(parked_.begin());
                lk.unlock();

                auto h = a->reclaim();
                if(h) { coroutine co(std::move(h)); }
            } else {
                std::swap(local_queue, coroutine_queue_);
                lk.unlock();

                for(auto h : local_queue) { coroutine co(std::move(h)); }
                local_queue.clear();
            }

            lk.lock();
        }

        stopped_ = true;
    }

    mutable gsd::spinlock lk_;
    std::weak_ptr<scheduler> self_wptr_;
    state state_ = executing;
    int log_level_ = -1;

    // set once run() destroyed every coroutine it owned
    bool stopped_ = false;

    bool waiting_for_coroutines_ = false;
    std::condition_variable_any coroutines_cv_;
    std::deque<std::coroutine_handle<>> coroutine_queue_;

    // awaitables holding the handles of this scheduler's suspended coroutines
    std::unordered_set<gsd::awaitable::interface*> parked_;

    // the global scheduler, set by the gsd::lifecycle
    static scheduler* global_;

    friend gsd::lifecycle;
};

/// schedule() on `gsd::scheduler::get()`
template <typename... As>
inline auto schedule(As&&... as) {
    return scheduler::get().schedule(std::forward<As>(as)...);
}

}

#endif
