/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include "infquad/consts.hpp"

namespace epsilon_table {

/**
 * @brief Extrapolated limit of a sequence together with its error estimate.
 */
struct Extrapolation {
    double value;
    double abs_err;
};

/**
 * @brief Wynn's epsilon algorithm applied incrementally to a sequence of partial results.
 *
 * The table stores the last diagonal of the epsilon scheme. Every call to extrapolate() computes a new diagonal from
 * the most recently pushed element and keeps the best estimate found on it. The error of an extrapolation is
 * estimated from the distance to the previous three results, so the first three calls report the largest double.
 */
class EpsilonTable {
public:
    EpsilonTable();

    /**
     * @brief Discard all elements and the history of previous results.
     */
    void reset();

    /**
     * @brief Append a new element of the sequence.
     *
     * When the table is already at its working limit, the two oldest elements are dropped first. This only happens
     * when push() is called repeatedly without extrapolate(), which itself shrinks a full table.
     *
     * @param value New element.
     */
    void push(double value);

    /**
     * @brief Compute a new diagonal of the epsilon table and return the extrapolated limit.
     *
     * The number of working elements may shrink if the table shows irregular behaviour or reaches its limit.
     *
     * @return Extrapolated value and its error estimate, floored at 5 * eps * |value|.
     */
    Extrapolation extrapolate();

    /**
     * @brief Number of working elements.
     */
    int size() const { return n_; }

    /**
     * @brief Number of calls to extrapolate() since the last reset.
     */
    int calls() const { return n_res_; }

private:
    std::array<double, consts::epsilon::table_size> table_;
    std::array<double, consts::epsilon::n_last> res_last_;
    int n_;
    int n_res_;
};

}; /* namespace epsilon_table */
