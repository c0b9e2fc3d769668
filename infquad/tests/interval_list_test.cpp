/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "infquad/interval_list.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

/**
 * Error assigned to a subinterval in the tests below. Deterministic but not monotone in position.
 */
static double pseudo_error(double a, double b) { return (b - a) * (1.5 + std::sin(37.0 * a + 11.0 * b)); }

/**
 * Bisects the selected subinterval of the list and restores the order.
 */
static void bisect(interval_list::IntervalList &list) {
    const auto parent = list.current();
    const double mid = 0.5 * (parent.a + parent.b);

    list.split({parent.a, mid, 0.5 * parent.area, pseudo_error(parent.a, mid)},
               {mid, parent.b, 0.5 * parent.area, pseudo_error(mid, parent.b)});
    list.sort();
}

/**
 * Tests construction with an invalid limit.
 */
TEST(IntervalList, InvalidLimit) { EXPECT_THROW(interval_list::IntervalList(0), std::invalid_argument); }

/**
 * Tests the state after reset.
 */
TEST(IntervalList, Reset) {
    interval_list::IntervalList list(10);
    list.reset({0.0, 1.0, 2.0, 0.5});

    ASSERT_EQ(1, list.size());
    ASSERT_EQ(10, list.limit());
    ASSERT_EQ(0, list.selected());
    ASSERT_EQ(0, list.rank());
    ASSERT_EQ(0.5, list.max_error());
    ASSERT_EQ(2.0, list.area_sum());
    ASSERT_EQ(1.0, list.width_sum());
}

/**
 * Tests that the half with the larger error keeps the slot of the parent.
 */
TEST(IntervalList, SplitKeepsLargerErrorInPlace) {
    interval_list::IntervalList list(10);
    list.reset({0.0, 1.0, 1.0, 1.0});

    list.split({0.0, 0.5, 0.3, 0.3}, {0.5, 1.0, 0.7, 0.6});
    list.sort();

    ASSERT_EQ(2, list.size());
    ASSERT_EQ(0.5, list[0].a);
    ASSERT_EQ(0.6, list[0].error);
    ASSERT_EQ(0.0, list[1].a);
    ASSERT_EQ(0, list.order(0));
    ASSERT_EQ(1, list.order(1));
    ASSERT_EQ(0, list.selected());
    ASSERT_EQ(0.6, list.max_error());
}

/**
 * Tests insertion of a decreased error below a larger one.
 */
TEST(IntervalList, SortMovesDecreasedErrorDown) {
    interval_list::IntervalList list(10);
    list.reset({0.0, 1.0, 1.0, 1.0});

    list.split({0.0, 0.5, 0.3, 0.3}, {0.5, 1.0, 0.7, 0.6});
    list.sort();
    list.split({0.5, 0.75, 0.35, 0.1}, {0.75, 1.0, 0.35, 0.05});
    list.sort();

    ASSERT_EQ(3, list.size());
    ASSERT_EQ(1, list.order(0));
    ASSERT_EQ(0, list.order(1));
    ASSERT_EQ(2, list.order(2));
    ASSERT_EQ(1, list.selected());
    ASSERT_EQ(0.3, list.max_error());
}

/**
 * Tests that the subintervals always partition the transformed domain.
 */
TEST(IntervalList, PartitionInvariant) {
    interval_list::IntervalList list(100);
    list.reset({0.0, 1.0, 1.0, pseudo_error(0.0, 1.0)});

    while (list.size() < list.limit()) {
        bisect(list);

        ASSERT_NEAR(1.0, list.width_sum(), 1.0e-14);
        ASSERT_NEAR(1.0, list.area_sum(), 1.0e-14);
        for (int i = 0; i < list.size(); ++i) {
            ASSERT_LT(list[i].a, list[i].b);
            ASSERT_GE(list[i].error, 0.0);
        }
    }
}

/**
 * Tests that the maintained prefix of the order is descending and starts with the largest error.
 */
TEST(IntervalList, DescendingOrder) {
    interval_list::IntervalList list(60);
    list.reset({0.0, 1.0, 1.0, pseudo_error(0.0, 1.0)});

    while (list.size() < list.limit()) {
        bisect(list);

        const int n = list.sorted_prefix();
        for (int r = 1; r < n; ++r) {
            ASSERT_GE(list[list.order(r - 1)].error, list[list.order(r)].error);
        }

        if (list.size() <= list.limit() / 2 + 2) {
            double largest = 0.0;
            for (int i = 0; i < list.size(); ++i) {
                largest = std::max(largest, list[i].error);
            }
            ASSERT_EQ(largest, list.max_error());
            ASSERT_EQ(list.order(0), list.selected());
        }
    }
}

/**
 * Tests selection by rank.
 */
TEST(IntervalList, Select) {
    interval_list::IntervalList list(10);
    list.reset({0.0, 1.0, 1.0, pseudo_error(0.0, 1.0)});
    for (int i = 0; i < 4; ++i) {
        bisect(list);
    }

    list.select(2);

    ASSERT_EQ(2, list.rank());
    ASSERT_EQ(list.order(2), list.selected());
    ASSERT_EQ(list[list.order(2)].error, list.max_error());
}

/**
 * Tests that splitting a full list throws.
 */
TEST(IntervalList, SplitFullList) {
    interval_list::IntervalList list(2);
    list.reset({0.0, 1.0, 1.0, 1.0});
    list.split({0.0, 0.5, 0.5, 0.5}, {0.5, 1.0, 0.5, 0.5});
    list.sort();

    EXPECT_THROW(list.split({0.0, 0.25, 0.25, 0.25}, {0.25, 0.5, 0.25, 0.25}), std::length_error);
}
