/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <string_view>

namespace transform {

/**
 * @brief Kind of unbounded integration domain.
 */
enum class Domain {
    LowerInfinite, /* (-inf, b] */
    UpperInfinite, /* [a, +inf) */
    BothInfinite,  /* (-inf, +inf) */
};

/**
 * @brief Returns a printable name of the domain kind.
 */
std::string_view to_string(Domain domain);

/**
 * @brief Maps the unit interval (0, 1] onto an unbounded integration domain.
 *
 * The substitution is x = bound + sign * (1 - t) / t with dx = -sign / t^2 dt. For the two-sided domain the negative
 * half-line is folded onto the positive one, so the integrand is sampled at both x and -x.
 */
class Transform {
public:
    /**
     * @brief Construct a transform for the given domain kind.
     *
     * @param domain Domain kind.
     * @param bound  Finite anchor bound. Ignored (set to 0) for the two-sided domain.
     */
    Transform(Domain domain, double bound);

    /**
     * @brief Maps a transformed coordinate back into the integration domain.
     *
     * @param t Transformed coordinate in (0, 1].
     *
     * @return Point of the original domain.
     */
    double point(double t) const { return bound_ + sign_ * (1.0 - t) / t; }

    /**
     * @brief Evaluates the transformed integrand, including the 1 / t^2 Jacobian.
     *
     * @param f Integrand over the original domain.
     * @param t Transformed coordinate in (0, 1]. Must not be 0.
     *
     * @return Value of the transformed integrand at t.
     */
    double evaluate(const std::function<double(double)> &f, double t) const;

    Domain domain() const { return domain_; }

    double bound() const { return bound_; }

    /**
     * @brief Number of integrand calls made per transformed evaluation.
     */
    int calls_per_point() const { return domain_ == Domain::BothInfinite ? 2 : 1; }

private:
    Domain domain_;
    double bound_;
    double sign_;
};

/**
 * @brief Builds the transform for integrating over [a, b] where at least one bound is infinite.
 *
 * @param a Lower limit of integration, finite or -inf.
 * @param b Upper limit of integration, finite or +inf.
 *
 * @return Transform for the domain.
 *
 * @throws std::invalid_argument if both bounds are finite, a bound is NaN, or an infinite bound points the wrong way.
 */
Transform make_transform(double a, double b);

}; /* namespace transform */
