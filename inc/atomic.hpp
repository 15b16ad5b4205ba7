//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_ATOMIC
#define GRACEFUL_SHUTDOWN_ATOMIC

#include <atomic>

#include "logging.hpp"

namespace gsd {

/**
@brief core mechanism for atomic synchronization.

Implements atomic lock API without operating system blocking. Every transition
of a shutdown state is made while holding one of these, and no holder ever
suspends while it is locked.
*/
struct spinlock : public printable {
    spinlock() {
        GSD_MIN_CONSTRUCTOR();
        lock_.clear();
    }

    virtual ~spinlock() { GSD_MIN_DESTRUCTOR(); }

    static inline std::string info_name() { return "gsd::spinlock"; }
    inline std::string name() const { return spinlock::info_name(); }

    inline void lock() {
        GSD_MIN_METHOD_ENTER("lock");
        while(lock_.test_and_set(std::memory_order_acquire)){ }
    }

    inline bool try_lock() {
        GSD_MIN_METHOD_ENTER("try_lock");
        return !(lock_.test_and_set(std::memory_order_acquire));
    }

    inline void unlock() {
        GSD_MIN_METHOD_ENTER("unlock");
        lock_.clear(std::memory_order_release);
    }

private:
    std::atomic_flag lock_;
};

}

#endif
