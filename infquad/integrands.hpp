/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <string_view>
#include <vector>

namespace integrands {

/**
 * @brief Integrand registered under a name, as selected from the command line.
 */
struct Integrand {
    std::string_view name;
    std::string_view formula;
    std::function<double(double)> f;
};

/**
 * @brief Exponential decay e^-x.
 */
double exp_decay(double x);

/**
 * @brief Gaussian e^-x^2.
 */
double gaussian(double x);

/**
 * @brief Inverse square 1 / x^2.
 */
double inverse_square(double x);

/**
 * @brief Lorentzian 1 / (1 + x^2).
 */
double lorentzian(double x);

/**
 * @brief Probability density of the log-logistic distribution.
 *
 * @param x     Point of evaluation, x >= 0.
 * @param alpha Scale parameter (alpha > 0).
 * @param beta  Shape parameter (beta > 0).
 *
 * @return Density at x, 0 for x < 0.
 */
double log_logistic_pdf(double x, double alpha = 1.0, double beta = 2.0);

/**
 * @brief Identity x, whose integral over any unbounded domain diverges.
 */
double linear(double x);

/**
 * @brief Returns the integrand registered under the given name.
 *
 * @param name Integrand name (e.g. "gaussian").
 *
 * @return Registered integrand.
 *
 * @throws std::invalid_argument if no integrand has this name.
 */
const Integrand &find(std::string_view name);

/**
 * @brief Returns the names of all registered integrands.
 */
std::vector<std::string_view> names();

}; /* namespace integrands */
