/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "infquad/integration.hpp"

#include <benchmark/benchmark.h>

#include <cmath>
#include <limits>

#include "spdlog/spdlog.h"

#include "infquad/integrands.hpp"
#include "infquad/kronrod.hpp"
#include "infquad/transform.hpp"

constexpr double inf = std::numeric_limits<double>::infinity();

static void BM_Qk15iUpperInfinite(benchmark::State &state) {
    auto transform = transform::make_transform(0.0, inf);

    for (auto _ : state) {
        auto estimate = kronrod::qk15i(integrands::exp_decay, transform, 0.0, 1.0);
        benchmark::DoNotOptimize(estimate);
        benchmark::ClobberMemory();
    }
}

static void BM_IntegrateUpperInfinite(benchmark::State &state) {
    integration::Options options;
    options.eps_rel = std::pow(10.0, -static_cast<double>(state.range(0)));

    for (auto _ : state) {
        auto result = integration::integrate(integrands::lorentzian, 0.0, inf, options);
        benchmark::DoNotOptimize(result);
    }
}

static void BM_IntegrateLowerInfinite(benchmark::State &state) {
    integration::Options options;
    options.eps_rel = std::pow(10.0, -static_cast<double>(state.range(0)));
    auto f = [](double x) { return std::exp(x) * std::abs(std::cos(x)); };

    for (auto _ : state) {
        auto result = integration::integrate(f, -inf, 0.0, options);
        benchmark::DoNotOptimize(result);
    }
}

static void BM_IntegrateBothInfinite(benchmark::State &state) {
    integration::Options options;
    options.eps_rel = std::pow(10.0, -static_cast<double>(state.range(0)));

    for (auto _ : state) {
        auto result = integration::integrate(integrands::gaussian, -inf, inf, options);
        benchmark::DoNotOptimize(result);
    }
}

BENCHMARK(BM_Qk15iUpperInfinite);
BENCHMARK(BM_IntegrateUpperInfinite)->DenseRange(3, 12, 3);
BENCHMARK(BM_IntegrateLowerInfinite)->DenseRange(3, 12, 3);
BENCHMARK(BM_IntegrateBothInfinite)->DenseRange(3, 12, 3);

int main(int argc, char **argv) {
    /* non-converging runs would otherwise log a warning per iteration */
    spdlog::set_level(spdlog::level::err);

    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
