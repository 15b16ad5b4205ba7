//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include "logging.hpp"

int& gsd::logger::tl_loglevel() {
    // -10 passes no log line
    thread_local int level = -10;
    thread_local bool initialized = false;

    // threads inherit the process default the first time they log, logging
    // while the default is read is suppressed
    if(!initialized) [[unlikely]] {
        initialized = true;
        level = gsd::config::logging::default_log_level();
    }

    return level;
}

/// return the thread local loglevel
int gsd::logger::thread_log_level() { return gsd::logger::tl_loglevel(); }

/// set the thread local loglevel
void gsd::logger::thread_log_level(int level) {
    if(level > 9) { level = 9; }
    else if(level < -9) { level = -9; }
    gsd::logger::tl_loglevel() = level;
}
