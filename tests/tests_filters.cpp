/*!
 * @file
 * @brief One-Euro filter tests.
 */

#include "math/Filters.hpp"

#include "catch2/catch.hpp"

using math::OneEuroFilter;

TEST_CASE("OneEuroFilter")
{
    OneEuroFilter filter(1.0, 0.007);
    CHECK_FALSE(filter.initialized());

    CHECK(filter.filter(5.0, 0.0) == 5.0);
    CHECK(filter.initialized());

    SECTION("constant input stays put")
    {
        for (int i = 1; i < 20; ++i) {
            CHECK(filter.filter(5.0, i * 0.033) == Approx(5.0));
        }
    }

    SECTION("step input converges monotonically")
    {
        double prev = 5.0;
        for (int i = 1; i < 200; ++i) {
            double v = filter.filter(10.0, i * 0.033);
            REQUIRE(v >= prev);
            REQUIRE(v <= 10.0);
            prev = v;
        }
        CHECK(prev == Approx(10.0).margin(0.05));
    }

    SECTION("non-increasing timestamp returns the estimate")
    {
        double v = filter.filter(8.0, 0.033);
        CHECK(filter.filter(100.0, 0.033) == v);
        CHECK(filter.filter(100.0, 0.010) == v);
    }

    SECTION("reset")
    {
        filter.reset();
        CHECK_FALSE(filter.initialized());
        CHECK(filter.filter(-3.0, 1.0) == -3.0);
    }
}
