//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis 
#include <memory>
#include <string>

#include "loguru.hpp"
#include "result.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace test {
namespace result {

template <typename T>
gsd::result<T,std::string> maybe_T(bool succeed, int i) {
    if(succeed) {
        return gsd::result<T,std::string>((T)test::init<T>(i));
    } else {
        return gsd::unexpected<std::string>("failed");
    }
}

template <typename T>
size_t value_error_T() {
    size_t success_count = 0;

    {
        auto r = maybe_T<T>(true, 3);
        EXPECT_TRUE(r.has_value());
        EXPECT_TRUE((bool)r);
        EXPECT_EQ((T)test::init<T>(3), r.value());
        EXPECT_EQ((T)test::init<T>(3), *r);
        ++success_count;
    }

    {
        auto r = maybe_T<T>(false, 3);
        EXPECT_FALSE(r.has_value());
        EXPECT_FALSE((bool)r);
        EXPECT_EQ(std::string("failed"), r.error());
        EXPECT_THROW(r.value(), gsd::bad_result_access);
        ++success_count;
    }

    {
        auto r = maybe_T<T>(false, 3);
        auto r2 = r;
        EXPECT_FALSE(r2);
        EXPECT_EQ(r.error(), r2.error());

        r2 = maybe_T<T>(true, 4);
        EXPECT_TRUE(r2);
        EXPECT_EQ((T)test::init<T>(4), r2.value());
        ++success_count;
    }

    return success_count;
}

}
}

TEST(result, value_error) {
    const size_t expected = 3;
    EXPECT_EQ(expected, test::result::value_error_T<int>());
    EXPECT_EQ(expected, test::result::value_error_T<unsigned int>());
    EXPECT_EQ(expected, test::result::value_error_T<size_t>());
    EXPECT_EQ(expected, test::result::value_error_T<double>());
    EXPECT_EQ(expected, test::result::value_error_T<char>());
    EXPECT_EQ(expected, test::result::value_error_T<void*>());
    EXPECT_EQ(expected, test::result::value_error_T<std::string>());
    EXPECT_EQ(expected, test::result::value_error_T<test::CustomObject>());
}

TEST(result, same_value_and_error_type) {
    gsd::result<int,int> r(3);
    EXPECT_TRUE(r);
    EXPECT_EQ(3, *r);

    gsd::result<int,int> e = gsd::unexpected<int>(4);
    EXPECT_FALSE(e);
    EXPECT_EQ(4, e.error());
}

TEST(result, void_value) {
    gsd::result<void,std::string> r;
    EXPECT_TRUE(r.has_value());
    EXPECT_TRUE((bool)r);
    EXPECT_NO_THROW(r.value());

    gsd::result<void,std::string> e = gsd::unexpected<std::string>("failed");
    EXPECT_FALSE(e.has_value());
    EXPECT_FALSE((bool)e);
    EXPECT_EQ(std::string("failed"), e.error());
    EXPECT_THROW(e.value(), gsd::bad_result_access);
}

TEST(result, move_only_value) {
    gsd::result<std::unique_ptr<int>,int> r(std::make_unique<int>(5));
    ASSERT_TRUE(r);
    EXPECT_EQ(5, **r);

    std::unique_ptr<int> p = std::move(r).value();
    ASSERT_NE(nullptr, p);
    EXPECT_EQ(5, *p);
}

TEST(result, arrow) {
    gsd::result<std::string,int> r(std::string("hello"));
    EXPECT_EQ(5u, r->size());
}

TEST(result, name) {
    gsd::result<int,std::string> r(1);
    EXPECT_NE(std::string::npos, r.name().find("gsd::result"));
    EXPECT_EQ(std::string("value"), r.content());

    gsd::result<int,std::string> e = gsd::unexpected<std::string>("failed");
    EXPECT_EQ(std::string("error"), e.content());
}
