//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_LIFECYCLE
#define GRACEFUL_SHUTDOWN_LIFECYCLE

#include <memory>
#include <string>
#include <sstream>
#include <exception>
#include <mutex>

#include "logging.hpp"
#include "atomic.hpp"
#include "scheduler.hpp"

namespace gsd {
namespace config {
namespace scheduler {

/**
 @brief provide the global scheduler configuration

 Reads the configuration of the existing `gsd::lifecycle`, or the compile time
 defaults if none exists.

 @return a copy of the global scheduler configuration
 */
gsd::scheduler::config global_config();

}
}

/**
 @brief RAII configuration and management object for this framework

 The instance of this object configures the framework and constructs and
 maintains the global scheduler. Coordinators and their tokens do not require
 a lifecycle, but wrapper adapters started from system threads are driven by
 the global scheduler.
 */
struct lifecycle : public printable {
    struct already_initialized : public std::exception {
        already_initialized(lifecycle* existing) :
            estr([&]() -> std::string {
                std::stringstream ss;
                ss << "gsd::initialize() failed because "
                   << existing
                   << " already exists";
                return ss.str();
            }())
        { }

        inline const char* what() const noexcept { return estr.c_str(); }

    private:
        const std::string estr;
    };

    /**
     @brief configuration for the framework

     The user can customize these options at runtime and pass the result to
     `gsd::initialize()` to set the process-wide configuration.

     Default values are determined by compiler defines.
     */
    struct config {
        struct logging {
            logging();

            /**
             @brief runtime default log level

             Defaults set by compiler define(s):
             GSDLOGLEVEL
             */
            int loglevel;
        };

        struct scheduler {
            scheduler();

            /**
             @brief global scheduler config

             Defaults set by compiler define(s):
             GSDLOGLEVEL
             */
            gsd::scheduler::config global_config;
        };

        logging log;
        scheduler sch;
    };

    virtual ~lifecycle();

    static inline std::string info_name() { return "gsd::lifecycle"; }
    inline std::string name() const { return lifecycle::info_name(); }

    /// return the lifecycle's config
    inline const config& get_config() const { return config_; }

    /// return the existing lifecycle, or nullptr if none exists
    static lifecycle* instance();

private:
    lifecycle(const config& c);

    // initialize loguru exactly once per process
    static void logging_init_(int loglevel);

    static gsd::spinlock slk_;
    static lifecycle* instance_;

    config config_;

    // declared last so the global scheduler is halted first
    std::unique_ptr<gsd::scheduler::lifecycle> global_scheduler_;

    friend std::unique_ptr<gsd::lifecycle> initialize(lifecycle::config);
};

/**
 @brief set the global configuration and start the framework

 The returned lifecycle object owns the global scheduler. When it goes out of
 scope the global scheduler is halted and joined. All coroutines scheduled
 on the global scheduler should complete before this happens.

 There can only be one lifecycle in existence at a time, a second call while
 the first one exists throws `gsd::lifecycle::already_initialized`.

 @param c optional framework configuration
 @return a lifecycle object managing the framework
 */
std::unique_ptr<gsd::lifecycle> initialize(lifecycle::config c = {});

}

#endif
