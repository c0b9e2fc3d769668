/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "spdlog/spdlog.h"

#include "infquad/consts.hpp"
#include "infquad/epsilon_table.hpp"
#include "infquad/integration.hpp"
#include "infquad/interval_list.hpp"
#include "infquad/kronrod.hpp"
#include "infquad/transform.hpp"

namespace integration {

/**
 * @brief Way the bisection loop ended.
 */
enum class Exit {
    SumAreas,     /* error sum within tolerance, the result is the sum of the subinterval areas */
    Extrapolated, /* loop interrupted, the result is chosen between the extrapolated value and the area sum */
    Done,         /* result already final */
};

/**
 * @brief Adaptive integration of a transformed integrand over (0, 1].
 *
 * @param f         Function to integrate.
 * @param transform Mapping of the domain onto (0, 1].
 * @param options   Tolerances and subinterval limit.
 *
 * @return Integration result.
 */
static Result qagie(const std::function<double(double)> &f, const transform::Transform &transform,
                    const Options &options);

/**
 * @brief Checks whether a rule estimate is usable, i.e. the integrand stayed finite at every node.
 */
static bool finite_estimate(const kronrod::RuleEstimate &estimate) {
    return std::isfinite(estimate.area) && std::isfinite(estimate.abs_err);
}

std::string_view to_string(Status status) {
    switch (status) {
    case Status::Success:
        return "success";
    case Status::MaxSubdivisionsReached:
        return "max subdivisions reached";
    case Status::RoundoffLimited:
        return "roundoff limited";
    case Status::BadIntegrandBehavior:
        return "bad integrand behavior";
    case Status::ExtrapolationStalled:
        return "extrapolation stalled";
    case Status::ProbablyDivergent:
        return "probably divergent";
    case Status::InputInvalid:
        return "input invalid";
    default:
        return "unknown";
    }
}

Result integrate(const std::function<double(double)> &f, double a, double b, const Options &options) {
    const transform::Transform transform = transform::make_transform(a, b);

    spdlog::debug("Integrating over {} with bound {}, eps_abs={}, eps_rel={}, max_intervals={}",
                  transform::to_string(transform.domain()),
                  transform.bound(),
                  options.eps_abs,
                  options.eps_rel,
                  options.max_intervals);

    Result result = qagie(f, transform, options);

    spdlog::debug("Integration done: value={}, error={}, evaluations={}, intervals={}, status={}",
                  result.value,
                  result.error,
                  result.evaluations,
                  result.intervals,
                  to_string(result.status));
    if (result.status != Status::Success) {
        spdlog::warn("Integration over {} ended with status: {}",
                     transform::to_string(transform.domain()),
                     to_string(result.status));
    }

    return result;
}

static Result qagie(const std::function<double(double)> &f, const transform::Transform &transform,
                    const Options &options) {
    using consts::epmach;
    using consts::oflow;
    using consts::uflow;

    const double eps_abs = options.eps_abs;
    const double eps_rel = options.eps_rel;
    const int limit = options.max_intervals;

    Result out;

    if (limit < 1 || (eps_abs <= 0.0 && eps_rel < std::max(50.0 * epmach, consts::qagi::min_eps_rel))) {
        spdlog::error("Invalid input: eps_abs={}, eps_rel={}, max_intervals={}", eps_abs, eps_rel, limit);
        out.status = Status::InputInvalid;
        return out;
    }

    /* first approximation to the integral */
    const kronrod::RuleEstimate first = kronrod::qk15i(f, transform, 0.0, 1.0);

    interval_list::IntervalList list(limit);
    list.reset({0.0, 1.0, first.area, first.abs_err});

    double result = first.area;
    double abserr = first.abs_err;
    const double defabs = first.res_abs; /* integral of |f| over the whole domain */
    const double dres = std::abs(result);
    double errbnd = std::max(eps_abs, eps_rel * dres);

    Status status = Status::Success;
    if (abserr <= 100.0 * epmach * defabs && abserr > errbnd) {
        status = Status::RoundoffLimited;
    }
    if (limit == 1) {
        status = Status::MaxSubdivisionsReached;
    }
    if (!finite_estimate(first)) {
        status = Status::BadIntegrandBehavior;
    }

    Exit exit = Exit::Done;
    double area = result;
    double errsum = abserr;
    bool extrap_roundoff = false; /* roundoff detected while extrapolating */
    double correc = 0.0;

    const int ksgn = dres >= (1.0 - 50.0 * epmach) * defabs ? 1 : -1;

    const bool early = status != Status::Success || (abserr <= errbnd && abserr != first.res_asc) || abserr == 0.0;

    if (!early) {
        epsilon_table::EpsilonTable table;
        table.push(result);

        abserr = oflow;
        int ktmin = 0;
        bool extrap = false;
        bool noext = false;
        int iroff1 = 0;
        int iroff2 = 0;
        int iroff3 = 0;
        double small = 0.0;
        double erlarg = 0.0;
        double ertest = 0.0;

        exit = Exit::Extrapolated;

        while (list.size() < limit) {
            const int last = list.size() + 1;

            /* bisect the subinterval with the nrmax-th largest error estimate */
            const interval_list::Subinterval parent = list.current();
            const double a1 = parent.a;
            const double b1 = 0.5 * (parent.a + parent.b);
            const double a2 = b1;
            const double b2 = parent.b;
            const double erlast = list.max_error();

            const kronrod::RuleEstimate left = kronrod::qk15i(f, transform, a1, b1);
            const kronrod::RuleEstimate right = kronrod::qk15i(f, transform, a2, b2);

            /* improve previous approximations to integral and error and test for accuracy */
            const double area12 = left.area + right.area;
            const double erro12 = left.abs_err + right.abs_err;
            errsum = errsum + erro12 - erlast;
            area = area + area12 - parent.area;

            if (left.res_asc != left.abs_err && right.res_asc != right.abs_err) {
                if (std::abs(parent.area - area12) <= 1.0e-5 * std::abs(area12) && erro12 >= 0.99 * erlast) {
                    if (extrap) {
                        ++iroff2;
                    } else {
                        ++iroff1;
                    }
                }
                if (last > 10 && erro12 > erlast) {
                    ++iroff3;
                }
            }

            errbnd = std::max(eps_abs, eps_rel * std::abs(area));

            /* test for roundoff error and eventually set error flag */
            if (iroff1 + iroff2 >= consts::qagi::roundoff_combined || iroff3 >= consts::qagi::roundoff_growing) {
                status = Status::RoundoffLimited;
            }
            if (iroff2 >= consts::qagi::roundoff_extrap) {
                extrap_roundoff = true;
            }

            /* number of subintervals equals limit */
            if (last == limit) {
                status = Status::MaxSubdivisionsReached;
            }

            /* bad integrand behaviour at a point of the integration range */
            if (std::max(std::abs(a1), std::abs(b2)) <= (1.0 + 100.0 * epmach) * (std::abs(a2) + 1000.0 * uflow)) {
                status = Status::BadIntegrandBehavior;
            }

            /* integrand hit a pole at one of the rule nodes */
            if (!finite_estimate(left) || !finite_estimate(right)) {
                status = Status::BadIntegrandBehavior;
            }

            list.split({a1, b1, left.area, left.abs_err}, {a2, b2, right.area, right.abs_err});
            list.sort();

            spdlog::trace("Bisected [{}, {}], area={}, errsum={}, next=[{}, {}]",
                          a1,
                          b2,
                          area,
                          errsum,
                          list.current().a,
                          list.current().b);

            if (errsum <= errbnd) {
                exit = Exit::SumAreas;
                break;
            }
            if (status != Status::Success) {
                break;
            }

            if (last == 2) {
                small = consts::qagi::initial_small;
                erlarg = errsum;
                ertest = errbnd;
                table.push(area);
                continue;
            }
            if (noext) {
                continue;
            }

            erlarg -= erlast;
            if (std::abs(b1 - a1) > small) {
                erlarg += erro12;
            }

            if (!extrap) {
                /* extrapolate only once the interval to be bisected next is the smallest one */
                if (list.current().width() > small) {
                    continue;
                }
                extrap = true;
                list.select(1);
            }

            if (!extrap_roundoff && erlarg > ertest) {
                /* the smallest interval has the largest error. before bisecting decrease the sum of the errors over
                   the larger intervals (erlarg) and perform extrapolation */
                const int jupbnd = list.sorted_prefix();
                bool large_left = false;
                for (int k = list.rank(); k < jupbnd; ++k) {
                    list.select(k);
                    if (list.current().width() > small) {
                        large_left = true;
                        break;
                    }
                }
                if (large_left) {
                    continue;
                }
            }

            /* perform extrapolation */
            table.push(area);
            const epsilon_table::Extrapolation extrapolation = table.extrapolate();

            ++ktmin;
            if (ktmin > consts::qagi::max_stalled_extrapolations && abserr < 1.0e-3 * errsum) {
                status = Status::ExtrapolationStalled;
            }
            if (extrapolation.abs_err < abserr) {
                ktmin = 0;
                abserr = extrapolation.abs_err;
                result = extrapolation.value;
                correc = erlarg;
                ertest = std::max(eps_abs, eps_rel * std::abs(extrapolation.value));
                if (abserr <= ertest) {
                    break;
                }
            }

            /* prepare bisection of the smallest interval */
            if (table.size() == 1) {
                noext = true;
            }
            if (status == Status::ExtrapolationStalled) {
                break;
            }
            list.select(0);
            extrap = false;
            small *= 0.5;
            erlarg = errsum;
        }
    }

    /* set final result and error estimate */
    if (exit == Exit::Extrapolated) {
        bool divergence_test = true;

        if (abserr == oflow) {
            exit = Exit::SumAreas;
            divergence_test = false;
        } else if (status != Status::Success || extrap_roundoff) {
            if (extrap_roundoff) {
                abserr += correc;
            }
            if (status == Status::Success) {
                status = Status::RoundoffLimited;
            }
            if (result != 0.0 && area != 0.0) {
                if (abserr / std::abs(result) > errsum / std::abs(area)) {
                    exit = Exit::SumAreas;
                    divergence_test = false;
                }
            } else if (abserr > errsum) {
                exit = Exit::SumAreas;
                divergence_test = false;
            } else if (area == 0.0) {
                divergence_test = false;
            }
        }

        /* test on divergence */
        if (divergence_test && !(ksgn == -1 && std::max(std::abs(result), std::abs(area)) <= 0.01 * defabs)) {
            if (0.01 > result / area || result / area > 100.0 || errsum > std::abs(area)) {
                status = Status::ProbablyDivergent;
            }
        }
    }

    /* compute global integral sum */
    if (exit == Exit::SumAreas) {
        result = list.area_sum();
        abserr = errsum;
    }

    out.value = result;
    out.error = abserr;
    out.intervals = list.size();
    out.evaluations = (30 * list.size() - 15) * transform.calls_per_point();
    out.status = status;
    return out;
}

InfiniteIntegrator::InfiniteIntegrator(std::function<double(double)> function) : function_(std::move(function)) {}

InfiniteIntegrator::InfiniteIntegrator(std::function<double(double)> function, double a, double b)
    : function_(std::move(function)) {
    set_range(a, b);
}

void InfiniteIntegrator::set_range(double a, double b) {
    /* validate eagerly so that a bad range is reported where it is set */
    transform::make_transform(a, b);
    a_ = a;
    b_ = b;
}

double InfiniteIntegrator::compute() {
    if (!function_) {
        throw std::logic_error("No function to integrate");
    }

    last_ = integrate(function_, a_, b_, options_);
    return last_.value;
}

}; /* namespace integration */
