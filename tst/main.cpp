//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis 
#include <gtest/gtest.h>

#include "gsd.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Enable fail-fast
    GTEST_FLAG_SET(fail_fast, true);

    // initialize logging and the global scheduler
    auto lifecycle = gsd::initialize();

    return RUN_ALL_TESTS();
}
