/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "infquad/kronrod.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numbers>

#include "infquad/transform.hpp"

constexpr double inf = std::numeric_limits<double>::infinity();
constexpr double eps = std::numeric_limits<double>::epsilon();

/**
 * Tests a constant transformed integrand, for which both rules are exact.
 */
TEST(Kronrod, ConstantTransformedIntegrand) {
    auto transform = transform::make_transform(1.0, inf);
    auto f = [](double x) { return 1.0 / (x * x); };

    auto estimate = kronrod::qk15i(f, transform, 0.0, 1.0);

    ASSERT_NEAR(1.0, estimate.area, 1.0e-14);
    ASSERT_NEAR(1.0, estimate.res_abs, 1.0e-14);
    ASSERT_NEAR(0.0, estimate.res_asc, 1.0e-14);
    /* error is floored at the achievable accuracy */
    ASSERT_GE(estimate.abs_err, 50.0 * eps * estimate.res_abs);
    ASSERT_LE(estimate.abs_err, 1.0e-12);
}

/**
 * Tests the rule on a subinterval of the transformed domain.
 */
TEST(Kronrod, Subinterval) {
    auto transform = transform::make_transform(1.0, inf);
    auto f = [](double x) { return 1.0 / (x * x); };

    auto estimate = kronrod::qk15i(f, transform, 0.25, 0.5);

    /* t in [0.25, 0.5] corresponds to x in [2, 4] */
    ASSERT_NEAR(0.25, estimate.area, 1.0e-14);
}

/**
 * Tests the rule on e^-x over [0, inf).
 */
TEST(Kronrod, ExpDecay) {
    auto transform = transform::make_transform(0.0, inf);
    auto f = [](double x) { return std::exp(-x); };

    auto estimate = kronrod::qk15i(f, transform, 0.0, 1.0);

    ASSERT_NEAR(1.0, estimate.area, 1.0e-2);
    ASSERT_GT(estimate.abs_err, 0.0);
    ASSERT_LE(estimate.abs_err, estimate.res_asc);
    ASSERT_NEAR(estimate.area, estimate.res_abs, 1.0e-14);
}

/**
 * Tests that the two-sided domain sums both half-lines.
 */
TEST(Kronrod, GaussianBothInfinite) {
    auto both = transform::make_transform(-inf, inf);
    auto upper = transform::make_transform(0.0, inf);
    auto f = [](double x) { return std::exp(-x * x); };

    auto estimate_both = kronrod::qk15i(f, both, 0.0, 1.0);
    auto estimate_upper = kronrod::qk15i(f, upper, 0.0, 1.0);

    ASSERT_NEAR(2.0 * estimate_upper.area, estimate_both.area, 1.0e-14);
    ASSERT_NEAR(std::sqrt(std::numbers::pi), estimate_both.area, 5.0e-2);
}

/**
 * Tests that the integrand is evaluated at exactly 15 points of the open interval.
 */
TEST(Kronrod, SamplesFifteenInteriorPoints) {
    auto transform = transform::make_transform(0.0, inf);
    int calls = 0;
    double x_min = inf;
    auto f = [&calls, &x_min](double x) {
        ++calls;
        x_min = std::min(x_min, x);
        return std::exp(-x);
    };

    kronrod::qk15i(f, transform, 0.0, 1.0);

    ASSERT_EQ(15, calls);
    /* t = 1 is never sampled, so x stays strictly positive */
    ASSERT_GT(x_min, 0.0);
}

/**
 * Tests a rough integrand, for which the error estimate is not smaller than the actual error.
 */
TEST(Kronrod, RoughIntegrandErrorEstimate) {
    auto transform = transform::make_transform(0.0, inf);
    auto f = [](double x) { return std::exp(-x) * std::abs(std::sin(5.0 * x)); };

    auto estimate = kronrod::qk15i(f, transform, 0.0, 1.0);

    ASSERT_GT(estimate.abs_err, 1.0e-6);
    ASSERT_LE(estimate.abs_err, estimate.res_asc);
}

/**
 * Tests that a zero integrand gives a zero estimate.
 */
TEST(Kronrod, ZeroIntegrand) {
    auto transform = transform::make_transform(0.0, inf);
    auto f = [](double x) { return 0.0; };

    auto estimate = kronrod::qk15i(f, transform, 0.0, 1.0);

    ASSERT_EQ(0.0, estimate.area);
    ASSERT_EQ(0.0, estimate.abs_err);
    ASSERT_EQ(0.0, estimate.res_abs);
    ASSERT_EQ(0.0, estimate.res_asc);
}
