//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_WAITER_LIST
#define GRACEFUL_SHUTDOWN_WAITER_LIST

#include <cstddef>
#include <string>
#include <vector>

#include "utility.hpp"
#include "logging.hpp"

namespace gsd {

/**
 @brief a registry of callbacks waiting for a single event

 Registrations are stored in reusable slots. `add()` returns a `key` which can
 `remove()` the registration again in constant time, so operations which stop
 waiting do not leave their callback behind.

 `wake_all()` calls every registered callback, clears the list and starts a new
 epoch. Keys from an earlier epoch are stale and `remove()` ignores them.

 This object is not synchronized. It is always accessed while holding the lock
 of the object which owns it.
 */
struct waiter_list : public printable {
    /// identifies a single registration
    struct key {
        size_t epoch;
        size_t index;
    };

    waiter_list() : epoch_(0) { }
    waiter_list(const waiter_list&) = delete;
    waiter_list(waiter_list&&) = delete;
    virtual ~waiter_list() { }

    waiter_list& operator=(const waiter_list&) = delete;
    waiter_list& operator=(waiter_list&&) = delete;

    static inline std::string info_name() { return "gsd::waiter_list"; }
    inline std::string name() const { return waiter_list::info_name(); }

    std::string content() const;

    /**
     @brief register a callback to be called by the next `wake_all()`
     @param t the callback
     @return a key which can remove the registration
     */
    key add(thunk t);

    /**
     @brief remove a registration so `wake_all()` will not call it

     A key must not be removed twice, its slot may have been reused by a
     later `add()`.

     @param k a key returned by `add()` on this list
     @return true if the registration was removed, false if it was already woken or removed
     */
    bool remove(const key& k);

    /// call every registered callback, clear the list and increment the epoch
    void wake_all();

    /// return the count of live registrations
    inline size_t size() const { return slots_.size() - empty_slots_.size(); }

    /// return true if there are no live registrations
    inline bool empty() const { return size() == 0; }

    /// return the count of slots, including empty ones
    inline size_t slots() const { return slots_.size(); }

    /// return the count of empty, reusable slots
    inline size_t empty_slots() const { return empty_slots_.size(); }

    /// return the current epoch
    inline size_t epoch() const { return epoch_; }

private:
    std::vector<thunk> slots_;
    std::vector<size_t> empty_slots_;
    size_t epoch_;
};

}

#endif
