/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>

#include "infquad/consts.hpp"
#include "infquad/epsilon_table.hpp"

namespace epsilon_table {

EpsilonTable::EpsilonTable() { reset(); }

void EpsilonTable::reset() {
    table_.fill(0.0);
    res_last_.fill(0.0);
    n_ = 0;
    n_res_ = 0;
}

void EpsilonTable::push(double value) {
    /* extrapolate() needs two slots past the last element */
    if (n_ >= consts::epsilon::lim_exp) {
        std::copy(table_.begin() + 2, table_.begin() + n_, table_.begin());
        n_ -= 2;
    }

    table_[n_] = value;
    ++n_;
}

Extrapolation EpsilonTable::extrapolate() {
    ++n_res_;

    Extrapolation result{table_[n_ - 1], consts::oflow};

    if (n_ < 3) {
        result.abs_err = std::max(result.abs_err, 5.0 * consts::epmach * std::abs(result.value));
        return result;
    }

    table_[n_ + 1] = table_[n_ - 1];
    const int new_elm = (n_ - 1) / 2;
    table_[n_ - 1] = consts::oflow;

    const int num = n_;
    int k1 = n_ - 1;

    for (int i = 1; i <= new_elm; ++i) {
        const int k2 = k1 - 1;
        const int k3 = k1 - 2;

        double res = table_[k1 + 2];
        const double e0 = table_[k3];
        const double e1 = table_[k2];
        const double e2 = res;

        const double e1_abs = std::abs(e1);
        const double delta2 = e2 - e1;
        const double err2 = std::abs(delta2);
        const double tol2 = std::max(std::abs(e2), e1_abs) * consts::epmach;
        const double delta3 = e1 - e0;
        const double err3 = std::abs(delta3);
        const double tol3 = std::max(e1_abs, std::abs(e0)) * consts::epmach;

        if (err2 <= tol2 && err3 <= tol3) {
            /* e0, e1 and e2 are equal to within machine accuracy, convergence is assumed */
            result.value = res;
            result.abs_err = std::max(err2 + err3, 5.0 * consts::epmach * std::abs(result.value));
            return result;
        }

        const double e3 = table_[k1];
        table_[k1] = e1;
        const double delta1 = e1 - e3;
        const double err1 = std::abs(delta1);
        const double tol1 = std::max(e1_abs, std::abs(e3)) * consts::epmach;

        /* two elements very close to each other or irregular behaviour: omit the rest of the table */
        if (err1 <= tol1 || err2 <= tol2 || err3 <= tol3) {
            n_ = i + i - 1;
            break;
        }

        const double ss = 1.0 / delta1 + 1.0 / delta2 - 1.0 / delta3;
        if (std::abs(ss * e1) <= 1.0e-4) {
            n_ = i + i - 1;
            break;
        }

        res = e1 + 1.0 / ss;
        table_[k1] = res;
        k1 -= 2;

        const double error = err2 + std::abs(res - e2) + err3;
        if (error <= result.abs_err) {
            result.abs_err = error;
            result.value = res;
        }
    }

    /* shift the table */
    if (n_ == consts::epsilon::lim_exp) {
        n_ = 2 * (consts::epsilon::lim_exp / 2) - 1;
    }

    int ib = (num % 2 == 0) ? 1 : 0;
    for (int i = 0; i <= new_elm; ++i) {
        table_[ib] = table_[ib + 2];
        ib += 2;
    }
    if (num != n_) {
        std::copy(table_.begin() + (num - n_), table_.begin() + num, table_.begin());
    }

    if (n_res_ < 4) {
        res_last_[n_res_ - 1] = result.value;
        result.abs_err = consts::oflow;
    } else {
        result.abs_err = std::abs(result.value - res_last_[2]) + std::abs(result.value - res_last_[1]) +
                         std::abs(result.value - res_last_[0]);
        res_last_[0] = res_last_[1];
        res_last_[1] = res_last_[2];
        res_last_[2] = result.value;
    }

    result.abs_err = std::max(result.abs_err, 5.0 * consts::epmach * std::abs(result.value));
    return result;
}

}; /* namespace epsilon_table */
