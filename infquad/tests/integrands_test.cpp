/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "infquad/integrands.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

/**
 * Tests lookup of registered integrands.
 */
TEST(Integrands, Find) {
    ASSERT_DOUBLE_EQ(std::exp(-2.0), integrands::find("exp_decay").f(2.0));
    ASSERT_DOUBLE_EQ(std::exp(-4.0), integrands::find("gaussian").f(2.0));
    ASSERT_DOUBLE_EQ(0.25, integrands::find("inverse_square").f(2.0));
    ASSERT_DOUBLE_EQ(0.2, integrands::find("lorentzian").f(2.0));
    ASSERT_DOUBLE_EQ(2.0, integrands::find("linear").f(2.0));
}

/**
 * Tests lookup of an unknown integrand.
 */
TEST(Integrands, FindUnknown) { EXPECT_THROW(integrands::find("unknown"), std::invalid_argument); }

/**
 * Tests that every listed name can be looked up.
 */
TEST(Integrands, Names) {
    auto names = integrands::names();

    ASSERT_EQ(6u, names.size());
    ASSERT_NE(names.end(), std::find(names.begin(), names.end(), "log_logistic_pdf"));
    for (auto name : names) {
        ASSERT_EQ(name, integrands::find(name).name);
        ASSERT_FALSE(integrands::find(name).formula.empty());
    }
}

/**
 * Tests the log-logistic density against its closed form 2x / (1 + x^2)^2.
 */
TEST(Integrands, LogLogisticPdf) {
    ASSERT_EQ(0.0, integrands::log_logistic_pdf(-1.0));
    ASSERT_DOUBLE_EQ(0.0, integrands::log_logistic_pdf(0.0));
    ASSERT_DOUBLE_EQ(0.5, integrands::log_logistic_pdf(1.0));
    ASSERT_DOUBLE_EQ(4.0 / 25.0, integrands::log_logistic_pdf(2.0));
}

/**
 * Tests the scale parameter of the log-logistic density.
 */
TEST(Integrands, LogLogisticPdfScale) {
    /* f(x; alpha, beta) = f(x / alpha; 1, beta) / alpha */
    ASSERT_DOUBLE_EQ(integrands::log_logistic_pdf(1.5, 1.0, 3.0) / 2.0, integrands::log_logistic_pdf(3.0, 2.0, 3.0));
}
