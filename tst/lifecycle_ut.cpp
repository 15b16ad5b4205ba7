//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis 

#include "lifecycle.hpp"
#include "scheduler.hpp"

#include <gtest/gtest.h>

TEST(lifecycle, config_logging) {
    gsd::lifecycle::config c;

    EXPECT_LT(c.log.loglevel, 10);
    EXPECT_GT(c.log.loglevel, -10);
}

TEST(lifecycle, config_scheduler) {
    gsd::lifecycle::config c;

    EXPECT_EQ(c.log.loglevel, c.sch.global_config.log_level);
}

TEST(lifecycle, instance) {
    // main() keeps a lifecycle for the duration of the tests
    gsd::lifecycle* lf = gsd::lifecycle::instance();
    ASSERT_NE(nullptr, lf);
    EXPECT_EQ(std::string("gsd::lifecycle"), lf->name());

    gsd::lifecycle::config c;
    EXPECT_EQ(c.log.loglevel, lf->get_config().log.loglevel);
    EXPECT_EQ(c.log.loglevel, gsd::config::logging::default_log_level());
    EXPECT_EQ(c.sch.global_config.log_level, 
              gsd::config::scheduler::global_config().log_level);
}

TEST(lifecycle, already_initialized) {
    EXPECT_THROW(gsd::initialize(), gsd::lifecycle::already_initialized);

    // the existing lifecycle is untouched
    EXPECT_NE(nullptr, gsd::lifecycle::instance());
    EXPECT_EQ(gsd::scheduler::state::executing, 
              gsd::scheduler::global().status());
}

TEST(lifecycle, global_scheduler) {
    gsd::scheduler& sch = gsd::scheduler::global();

    EXPECT_FALSE(gsd::scheduler::in());
    EXPECT_EQ(&sch, &(gsd::scheduler::get()));
    EXPECT_EQ(gsd::lifecycle::config().sch.global_config.log_level, 
              sch.log_level());
}
