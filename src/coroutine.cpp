//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include <memory>

#include "coroutine.hpp"

gsd::coroutine*& gsd::detail::coroutine::tl_this_coroutine() {
    thread_local gsd::coroutine* p = nullptr;
    return p;
}

gsd::detail::coroutine::this_thread*
gsd::detail::coroutine::this_thread::get() {
    thread_local std::unique_ptr<gsd::detail::coroutine::this_thread> tt(
        new gsd::detail::coroutine::this_thread);
    return tt.get();
}
