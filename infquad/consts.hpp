/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>

namespace consts {

/* Machine constants. */
constexpr double epmach = std::numeric_limits<double>::epsilon(); /* Relative machine precision. */
constexpr double uflow = std::numeric_limits<double>::min();      /* Smallest positive normalized number. */
constexpr double oflow = std::numeric_limits<double>::max();      /* Largest finite number. */

namespace qagi {

/* Default tolerances and subdivision limit. */
constexpr double eps_abs = 0.0;    /* Absolute error tolerance. */
constexpr double eps_rel = 1.0e-3; /* Relative error tolerance. */
constexpr int max_intervals = 100; /* Maximum number of subintervals. */

/* Smallest admissible relative tolerance when no absolute tolerance is given. */
constexpr double min_eps_rel = 5.0e-15;

/* Roundoff detection thresholds. */
constexpr int roundoff_combined = 10; /* Non-improving bisections (iroff1 + iroff2). */
constexpr int roundoff_growing = 20;  /* Bisections that increased the error (iroff3). */
constexpr int roundoff_extrap = 5;    /* Non-improving bisections while extrapolating (iroff2). */

/* Number of stalled extrapolations after which the run is abandoned. */
constexpr int max_stalled_extrapolations = 5;

/* Width below which a subinterval is treated as "small" at the first extrapolation. */
constexpr double initial_small = 0.375;

}; /* namespace qagi */

namespace epsilon {

constexpr int lim_exp = 50;    /* Maximum number of working elements in the epsilon table. */
constexpr int table_size = 52; /* Storage slots; two extra for the in-place column update. */
constexpr int n_last = 3;      /* Number of previous extrapolated results kept for the error estimate. */

}; /* namespace epsilon */

}; /* namespace consts */
