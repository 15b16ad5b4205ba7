//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include <sstream>
#include <utility>

#include "waiter_list.hpp"

std::string gsd::waiter_list::content() const {
    std::stringstream ss;
    ss << "epoch:" << epoch_
       << ", waiters:" << size()
       << ", slots:" << slots_.size();
    return ss.str();
}

gsd::waiter_list::key gsd::waiter_list::add(gsd::thunk t) {
    size_t index;

    if(empty_slots_.size()) {
        index = empty_slots_.back();
        empty_slots_.pop_back();
        slots_[index] = std::move(t);
    } else {
        index = slots_.size();
        slots_.push_back(std::move(t));
    }

    GSD_MIN_METHOD_BODY("add","epoch:",epoch_,", index:",index);
    return key{ epoch_, index };
}

bool gsd::waiter_list::remove(const gsd::waiter_list::key& k) {
    if(k.epoch != epoch_ || k.index >= slots_.size() || !slots_[k.index]) {
        GSD_MIN_METHOD_BODY("remove","stale key, epoch:",k.epoch,", index:",k.index);
        return false;
    }

    slots_[k.index] = nullptr;
    empty_slots_.push_back(k.index);
    GSD_MIN_METHOD_BODY("remove","epoch:",k.epoch,", index:",k.index);
    return true;
}

void gsd::waiter_list::wake_all() {
    GSD_LOW_METHOD_ENTER("wake_all");

    // the list is cleared before any callback runs
    std::vector<gsd::thunk> woken;
    std::swap(woken, slots_);
    empty_slots_.clear();
    ++epoch_;

    for(auto& t : woken) {
        if(t) { t(); }
    }
}
