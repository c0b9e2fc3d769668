/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include "infquad/transform.hpp"

namespace kronrod {

/**
 * @brief Result of applying the Gauss-Kronrod rule to a single subinterval.
 */
struct RuleEstimate {
    double area;    /* 15-point Kronrod approximation of the integral */
    double abs_err; /* Estimate of the absolute error */
    double res_abs; /* Approximation of the integral of |f| */
    double res_asc; /* Approximation of the integral of |f - mean(f)| */
};

/**
 * @brief Apply the 15-point Gauss-Kronrod rule to a subinterval of the transformed domain.
 *
 * The integrand is mapped onto (0, 1] by the given transform, and the rule is applied on [a, b] of the transformed
 * coordinate. The error estimate is the difference between the 15-point Kronrod and the embedded 7-point Gauss
 * result, scaled by the (200 * err / res_asc)^1.5 heuristic and floored by the achievable machine accuracy.
 *
 * @param f         Integrand over the original domain.
 * @param transform Mapping of the domain onto (0, 1].
 * @param a         Lower limit in transformed coordinate, 0 <= a < b.
 * @param b         Upper limit in transformed coordinate, b <= 1.
 *
 * @return Area, error and the auxiliary |f| integrals.
 */
RuleEstimate qk15i(const std::function<double(double)> &f, const transform::Transform &transform, double a, double b);

}; /* namespace kronrod */
