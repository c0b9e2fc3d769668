/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

#include "infquad/integrands.hpp"

namespace integrands {

double exp_decay(double x) { return std::exp(-x); }

double gaussian(double x) { return std::exp(-x * x); }

double inverse_square(double x) { return 1.0 / (x * x); }

double lorentzian(double x) { return 1.0 / (1.0 + x * x); }

double log_logistic_pdf(double x, double alpha, double beta) {
    if (x < 0.0) {
        return 0.0;
    }

    const double ba = beta / alpha;
    const double xa = x / alpha;
    const double den = 1.0 + std::pow(xa, beta);

    return ba * std::pow(xa, beta - 1.0) / (den * den);
}

double linear(double x) { return x; }

/**
 * @brief Registered integrands.
 */
static const std::array<Integrand, 6> registry = {{
    {"exp_decay", "e^-x", exp_decay},
    {"gaussian", "e^-x^2", gaussian},
    {"inverse_square", "1 / x^2", inverse_square},
    {"lorentzian", "1 / (1 + x^2)", lorentzian},
    {"log_logistic_pdf", "log-logistic density, alpha = 1, beta = 2", [](double x) { return log_logistic_pdf(x); }},
    {"linear", "x", linear},
}};

const Integrand &find(std::string_view name) {
    for (const auto &integrand : registry) {
        if (integrand.name == name) {
            return integrand;
        }
    }

    throw std::invalid_argument("Unknown integrand: " + std::string(name));
}

std::vector<std::string_view> names() {
    std::vector<std::string_view> result;
    result.reserve(registry.size());
    for (const auto &integrand : registry) {
        result.push_back(integrand.name);
    }
    return result;
}

}; /* namespace integrands */
