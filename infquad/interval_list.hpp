/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

namespace interval_list {

/**
 * @brief Piece of the transformed integration domain with its current estimates.
 */
struct Subinterval {
    double a;     /* Left endpoint in transformed coordinate */
    double b;     /* Right endpoint in transformed coordinate */
    double area;  /* Integral estimate over [a, b] */
    double error; /* Error estimate of area */

    double width() const { return b - a; }
};

/**
 * @brief Working list of subintervals kept in descending order of error estimates.
 *
 * Subintervals are stored in an arena that only grows, and a separate order array maps ranks to arena slots. After a
 * bisection only the neighbourhood of the two affected entries is shifted. Once more than half of the allowed
 * subintervals are in use, only the leading limit + 3 - size ranks are kept sorted, since the rest can never be
 * bisected before the limit is reached.
 */
class IntervalList {
public:
    /**
     * @brief Construct a list able to hold up to limit subintervals.
     *
     * @param limit Maximum number of subintervals (must be >= 1).
     *
     * @throws std::invalid_argument if limit < 1.
     */
    explicit IntervalList(int limit);

    /**
     * @brief Start over with a single subinterval covering the whole transformed domain.
     *
     * @param whole Initial subinterval.
     */
    void reset(const Subinterval &whole);

    /**
     * @brief Replace the currently selected subinterval by its two halves.
     *
     * The half with the larger error takes over the slot of the parent, the other one is appended. The list order is
     * not updated, call sort() afterwards.
     *
     * @param left  Left half of the selected subinterval.
     * @param right Right half of the selected subinterval.
     *
     * @throws std::length_error if the list is full.
     */
    void split(const Subinterval &left, const Subinterval &right);

    /**
     * @brief Restore the descending error order after split() and select the next subinterval to bisect.
     */
    void sort();

    /**
     * @brief Select the subinterval with the given rank in the error order.
     *
     * @param rank Zero-based position in the error order.
     */
    void select(int rank);

    /**
     * @brief Rank of the selected subinterval.
     */
    int rank() const { return nrmax_; }

    /**
     * @brief Arena slot of the selected subinterval.
     */
    int selected() const { return maxerr_; }

    /**
     * @brief Error estimate of the selected subinterval.
     */
    double max_error() const { return errmax_; }

    const Subinterval &current() const { return intervals_[maxerr_]; }

    const Subinterval &operator[](int i) const { return intervals_[i]; }

    /**
     * @brief Arena slot of the subinterval at the given rank.
     */
    int order(int rank) const { return order_[rank]; }

    int size() const { return size_; }

    int limit() const { return limit_; }

    /**
     * @brief Number of leading ranks that are guaranteed to be in descending order.
     */
    int sorted_prefix() const;

    /**
     * @brief Sum of the area estimates of all subintervals.
     */
    double area_sum() const;

    /**
     * @brief Sum of the widths of all subintervals. Equals the width of the whole transformed domain.
     */
    double width_sum() const;

private:
    int limit_;
    int size_;

    std::vector<Subinterval> intervals_;
    std::vector<int> order_;

    int maxerr_;    /* arena slot of the subinterval to bisect next */
    double errmax_; /* its error estimate */
    int nrmax_;     /* its rank in the error order */
};

}; /* namespace interval_list */
