/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>
#include <cstdlib>
#include <exception>
#include <limits>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/strings/str_join.h"
#include "spdlog/spdlog.h"

#include "infquad/consts.hpp"
#include "infquad/integrands.hpp"
#include "infquad/integration.hpp"
#include "infquad/parse_verbosity.hpp"

/* Define cli args */
ABSL_FLAG(std::string, integrand, "gaussian", "Name of the integrand to integrate");
ABSL_FLAG(double, lower, -std::numeric_limits<double>::infinity(), "Lower limit of integration (finite or -inf)");
ABSL_FLAG(double, upper, std::numeric_limits<double>::infinity(), "Upper limit of integration (finite or inf)");
ABSL_FLAG(double, eps_abs, consts::qagi::eps_abs, "Absolute error tolerance");
ABSL_FLAG(double, eps_rel, consts::qagi::eps_rel, "Relative error tolerance");
ABSL_FLAG(int, max_intervals, consts::qagi::max_intervals, "Maximum number of subintervals");
ABSL_FLAG(spdlog::level::level_enum, verbosity, spdlog::level::info, "Logging verbosity");

int main(int argc, char *argv[]) {
    absl::SetProgramUsageMessage("Integrates a catalog function over a semi-infinite or infinite interval.\n"
                                 "Available integrands: " +
                                 absl::StrJoin(integrands::names(), ", ", absl::StreamFormatter()));
    absl::ParseCommandLine(argc, argv);

    auto integrand_name = absl::GetFlag(FLAGS_integrand);
    auto lower = absl::GetFlag(FLAGS_lower);
    auto upper = absl::GetFlag(FLAGS_upper);
    auto verbosity = absl::GetFlag(FLAGS_verbosity);

    integration::Options options;
    options.eps_abs = absl::GetFlag(FLAGS_eps_abs);
    options.eps_rel = absl::GetFlag(FLAGS_eps_rel);
    options.max_intervals = absl::GetFlag(FLAGS_max_intervals);

    spdlog::set_level(verbosity);

    spdlog::info("Parameters:");
    spdlog::info("\tintegrand: {}", integrand_name);
    spdlog::info("\tlower: {}", lower);
    spdlog::info("\tupper: {}", upper);
    spdlog::info("\teps_abs: {}", options.eps_abs);
    spdlog::info("\teps_rel: {}", options.eps_rel);
    spdlog::info("\tmax_intervals: {}", options.max_intervals);

    integration::Result result;

    try {
        const integrands::Integrand &integrand = integrands::find(integrand_name);
        spdlog::info("Integrating {}", integrand.formula);

        auto start = std::chrono::steady_clock::now();
        result = integration::integrate(integrand.f, lower, upper, options);
        std::chrono::duration<double> elapsed_seconds = std::chrono::steady_clock::now() - start;

        spdlog::info("Integration done in {:.6f} s", elapsed_seconds.count());
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("Result:");
    spdlog::info("\tvalue: {:.15g}", result.value);
    spdlog::info("\terror: {:.3e}", result.error);
    spdlog::info("\tevaluations: {}", result.evaluations);
    spdlog::info("\tintervals: {}", result.intervals);
    spdlog::info("\tstatus: {}", integration::to_string(result.status));

    return result.status == integration::Status::Success ? EXIT_SUCCESS : EXIT_FAILURE;
}
