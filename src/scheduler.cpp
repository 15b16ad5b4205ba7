//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include "scheduler.hpp"

gsd::scheduler* gsd::scheduler::global_ = nullptr;

gsd::scheduler*& gsd::detail::scheduler::tl_this_scheduler() {
    thread_local gsd::scheduler* p = nullptr;
    return p;
}
