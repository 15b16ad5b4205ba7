//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN
#define GRACEFUL_SHUTDOWN

#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "result.hpp"
#include "coroutine.hpp"
#include "scheduler.hpp"
#include "lifecycle.hpp"
#include "waiter_list.hpp"
#include "state.hpp"
#include "token.hpp"
#include "wrap.hpp"
#include "shutdown.hpp"

#endif
