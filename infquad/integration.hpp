/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <limits>
#include <string_view>
#include <utility>

#include "infquad/consts.hpp"

namespace integration {

/**
 * @brief Outcome of an integration run.
 *
 * Every status other than InputInvalid comes with the best estimate available at termination.
 */
enum class Status {
    Success,                /* Requested accuracy has been achieved */
    MaxSubdivisionsReached, /* Subinterval limit hit before convergence */
    RoundoffLimited,        /* Roundoff error prevents the requested accuracy */
    BadIntegrandBehavior,   /* Extremely bad integrand behaviour at some point of the domain */
    ExtrapolationStalled,   /* Extrapolation does not converge, roundoff detected in the extrapolation table */
    ProbablyDivergent,      /* Integral is probably divergent or slowly convergent */
    InputInvalid,           /* Tolerances or subinterval limit are invalid */
};

/**
 * @brief Returns a printable name of the status.
 */
std::string_view to_string(Status status);

/**
 * @brief Integration configuration options.
 */
struct Options {
    double eps_abs = consts::qagi::eps_abs;
    double eps_rel = consts::qagi::eps_rel;
    int max_intervals = consts::qagi::max_intervals;
};

/**
 * @brief Result of an integration run.
 */
struct Result {
    double value = 0.0;  /* Approximation of the integral */
    double error = 0.0;  /* Estimate of the absolute error */
    int evaluations = 0; /* Number of integrand evaluations */
    int intervals = 0;   /* Number of subintervals produced by the bisection process */
    Status status = Status::InputInvalid;
};

/**
 * @brief Compute the integral of a function over a semi-infinite or infinite interval.
 *
 * The domain is mapped onto (0, 1] and integrated with adaptive bisection using the 15-point Gauss-Kronrod rule. The
 * subinterval with the largest error estimate is bisected first, and the sequence of partial results is accelerated
 * with Wynn's epsilon algorithm. Non-convergence is reported through Result::status, with the best available
 * estimate.
 *
 * @param f       Function to integrate.
 * @param a       Lower limit of integration, finite or -inf.
 * @param b       Upper limit of integration, finite or +inf.
 * @param options Tolerances and subinterval limit.
 *
 * @return Integral estimate, error bound, evaluation count and status.
 *
 * @throws std::invalid_argument if both bounds are finite or the domain is otherwise malformed.
 */
Result integrate(const std::function<double(double)> &f, double a, double b, const Options &options = {});

/**
 * @brief Stateful integrator keeping the integrand, the domain and the outcome of the last run.
 */
class InfiniteIntegrator {
public:
    InfiniteIntegrator() = default;

    /**
     * @brief Construct an integrator over [0, +inf).
     *
     * @param function Function to integrate.
     */
    explicit InfiniteIntegrator(std::function<double(double)> function);

    /**
     * @brief Construct an integrator over [a, b].
     *
     * @param function Function to integrate.
     * @param a        Lower limit of integration, finite or -inf.
     * @param b        Upper limit of integration, finite or +inf.
     *
     * @throws std::invalid_argument if the domain is malformed.
     */
    InfiniteIntegrator(std::function<double(double)> function, double a, double b);

    void set_function(std::function<double(double)> function) { function_ = std::move(function); }

    /**
     * @brief Set the integration domain.
     *
     * @throws std::invalid_argument if the domain is malformed.
     */
    void set_range(double a, double b);

    void set_tolerance_absolute(double eps_abs) { options_.eps_abs = eps_abs; }

    void set_tolerance_relative(double eps_rel) { options_.eps_rel = eps_rel; }

    void set_max_intervals(int max_intervals) { options_.max_intervals = max_intervals; }

    double lower() const { return a_; }

    double upper() const { return b_; }

    const Options &options() const { return options_; }

    /**
     * @brief Run the integration and record its outcome.
     *
     * @return Approximation of the integral.
     *
     * @throws std::logic_error if no function has been set.
     */
    double compute();

    double area() const { return last_.value; }

    double error() const { return last_.error; }

    int evaluations() const { return last_.evaluations; }

    Status status() const { return last_.status; }

    const Result &result() const { return last_; }

private:
    std::function<double(double)> function_;
    double a_ = 0.0;
    double b_ = std::numeric_limits<double>::infinity();
    Options options_;
    Result last_;
};

}; /* namespace integration */
