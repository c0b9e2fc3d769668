/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cmath>
#include <stdexcept>

#include "spdlog/spdlog.h"

#include "infquad/transform.hpp"

namespace transform {

std::string_view to_string(Domain domain) {
    switch (domain) {
    case Domain::LowerInfinite:
        return "(-inf, b]";
    case Domain::UpperInfinite:
        return "[a, +inf)";
    case Domain::BothInfinite:
        return "(-inf, +inf)";
    default:
        return "unknown";
    }
}

Transform::Transform(Domain domain, double bound)
    : domain_(domain),
      bound_(domain == Domain::BothInfinite ? 0.0 : bound),
      sign_(domain == Domain::LowerInfinite ? -1.0 : 1.0) {}

double Transform::evaluate(const std::function<double(double)> &f, double t) const {
    const double x = point(t);
    double value = f(x);

    if (domain_ == Domain::BothInfinite) {
        value += f(-x);
    }

    return value / t / t;
}

Transform make_transform(double a, double b) {
    if (std::isnan(a) || std::isnan(b)) {
        spdlog::error("Integration bound is nan: [{}, {}]", a, b);
        throw std::invalid_argument("Integration bounds must not be nan");
    }

    const bool a_inf = std::isinf(a);
    const bool b_inf = std::isinf(b);

    if (!a_inf && !b_inf) {
        spdlog::error("Finite domain [{}, {}] is not supported", a, b);
        throw std::invalid_argument("At least one integration bound must be infinite");
    }
    if ((a_inf && a > 0.0) || (b_inf && b < 0.0)) {
        spdlog::error("Malformed domain [{}, {}]", a, b);
        throw std::invalid_argument("Lower bound must be finite or -inf and upper bound finite or +inf");
    }

    if (a_inf && b_inf) {
        return Transform(Domain::BothInfinite, 0.0);
    }
    if (a_inf) {
        return Transform(Domain::LowerInfinite, b);
    }
    return Transform(Domain::UpperInfinite, a);
}

}; /* namespace transform */
