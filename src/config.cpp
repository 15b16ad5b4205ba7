//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
/*
 This file contains the `gsd::config::` implementations necessary for reading
 runtime framework values.

 They are accessors to the `gsd::lifecycle::config` of the existing
 `gsd::lifecycle`. Coordinators can be used without a lifecycle, so every
 accessor falls back to the compile time defaults when none exists.
 */
#include "logging.hpp"
#include "scheduler.hpp"
#include "lifecycle.hpp"

int gsd::config::logging::default_log_level() {
    auto lf = gsd::lifecycle::instance();
    return lf
        ? lf->get_config().log.loglevel
        : gsd::lifecycle::config::logging().loglevel;
}

gsd::scheduler::config gsd::config::scheduler::global_config() {
    auto lf = gsd::lifecycle::instance();
    return lf
        ? lf->get_config().sch.global_config
        : gsd::lifecycle::config::scheduler().global_config;
}
