//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include <string>
#include <sstream>

#include <loguru.hpp>

#include "logging.hpp"
#include "scheduler.hpp"
#include "lifecycle.hpp"

#ifndef GSDLOGLEVEL
/*
 Library compile time macro determining default printing log level. Default to
 loguru::Verbosity_WARNING.
 */
#define GSDLOGLEVEL -1
#endif

// force a loglevel of -9 or higher
#if GSDLOGLEVEL < -9
#undef GSDLOGLEVEL
#define GSDLOGLEVEL -9
#endif

// force a loglevel of 9 or lower
#if GSDLOGLEVEL > 9
#undef GSDLOGLEVEL
#define GSDLOGLEVEL 9
#endif

gsd::spinlock gsd::lifecycle::slk_;
gsd::lifecycle* gsd::lifecycle::instance_ = nullptr;

gsd::lifecycle::config::logging::logging() :
    loglevel(GSDLOGLEVEL)
{ }

gsd::lifecycle::config::scheduler::scheduler() :
    global_config([]() -> gsd::scheduler::config {
        gsd::scheduler::config c;
        c.log_level = GSDLOGLEVEL;
        return c;
    }())
{ }

// called with slk_ held
gsd::lifecycle::lifecycle(const config& c) : config_(c) {
    GSD_INFO_CONSTRUCTOR();
    lifecycle::logging_init_(config_.log.loglevel);
    global_scheduler_ = gsd::scheduler::make(config_.sch.global_config);
    gsd::scheduler::global_ = &(global_scheduler_->scheduler());
}

gsd::lifecycle::~lifecycle() {
    GSD_INFO_DESTRUCTOR();

    {
        std::lock_guard<gsd::spinlock> lk(slk_);
        gsd::scheduler::global_ = nullptr;
        instance_ = nullptr;
    }

    // halt and join the global scheduler
    global_scheduler_.reset();
}

gsd::lifecycle* gsd::lifecycle::instance() {
    std::lock_guard<gsd::spinlock> lk(slk_);
    return instance_;
}

void gsd::lifecycle::logging_init_(int loglevel) {
    struct do_once {
        do_once(int loglevel) {
            std::stringstream ss;
            ss << "-v" << loglevel;
            std::string process("gsd");
            std::string verbosity = ss.str();

            // Create raw char pointers for argc/argv
            const char* argv[] = {process.c_str(), verbosity.c_str(), nullptr};
            int argc = 2;

            loguru::Options opt;
            opt.main_thread_name = nullptr;

            // this library never installs signal handlers
            opt.signal_options = loguru::SignalOptions::none();
            loguru::init(argc, const_cast<char**>(argv), opt);
        }
    };

    static do_once d(loglevel);
}

std::unique_ptr<gsd::lifecycle> gsd::initialize(gsd::lifecycle::config c) {
    // initialize the calling thread's log level before slk_ is held
    gsd::logger::thread_log_level(c.log.loglevel);

    std::unique_ptr<gsd::lifecycle> lf;

    {
        std::lock_guard<gsd::spinlock> lk(gsd::lifecycle::slk_);

        if(gsd::lifecycle::instance_) [[unlikely]] {
            throw gsd::lifecycle::already_initialized(gsd::lifecycle::instance_);
        }

        lf.reset(new gsd::lifecycle(c));
        gsd::lifecycle::instance_ = lf.get();
    }

    GSD_INFO_FUNCTION_BODY("gsd::initialize",*lf);
    return lf;
}
