/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdexcept>

#include "infquad/interval_list.hpp"

namespace interval_list {

IntervalList::IntervalList(int limit)
    : limit_(limit),
      size_(0),
      maxerr_(0),
      errmax_(0.0),
      nrmax_(0) {
    if (limit < 1) {
        throw std::invalid_argument("limit must be >= 1");
    }

    intervals_.resize(limit);
    order_.resize(limit);
}

void IntervalList::reset(const Subinterval &whole) {
    intervals_[0] = whole;
    order_[0] = 0;
    size_ = 1;
    maxerr_ = 0;
    errmax_ = whole.error;
    nrmax_ = 0;
}

void IntervalList::split(const Subinterval &left, const Subinterval &right) {
    if (size_ >= limit_) {
        throw std::length_error("Interval list is full");
    }

    if (right.error > left.error) {
        intervals_[maxerr_] = right;
        intervals_[size_] = left;
    } else {
        intervals_[maxerr_] = left;
        intervals_[size_] = right;
    }
    ++size_;
}

int IntervalList::sorted_prefix() const {
    if (size_ > limit_ / 2 + 2) {
        return limit_ + 3 - size_;
    }
    return size_;
}

void IntervalList::sort() {
    const int last = size_ - 1; /* slot of the appended subinterval */

    if (size_ <= 2) {
        for (int i = 0; i < size_; ++i) {
            order_[i] = i;
        }
        select(nrmax_);
        return;
    }

    /* the error of the bisected subinterval may have increased, in which case it moves up past its predecessors.
       otherwise insertion starts below the current rank */
    const double errmax = intervals_[maxerr_].error;
    for (int i = nrmax_; i > 0; --i) {
        const int isucc = order_[nrmax_ - 1];
        if (errmax <= intervals_[isucc].error) {
            break;
        }
        order_[nrmax_] = isucc;
        --nrmax_;
    }

    const int jupbn = sorted_prefix() - 1; /* last rank maintained in order */
    const int jbnd = jupbn - 1;
    const double errmin = intervals_[last].error;

    /* insert errmax top-down starting right below the current rank */
    int i = nrmax_ + 1;
    for (; i <= jbnd; ++i) {
        const int isucc = order_[i];
        if (errmax >= intervals_[isucc].error) {
            break;
        }
        order_[i - 1] = isucc;
    }

    if (i > jbnd) {
        order_[jbnd] = maxerr_;
        order_[jupbn] = last;
    } else {
        /* insert errmin bottom-up, never above errmax */
        order_[i - 1] = maxerr_;
        int k = jbnd;
        bool inserted = false;
        for (int j = i; j <= jbnd; ++j) {
            const int isucc = order_[k];
            if (errmin < intervals_[isucc].error) {
                order_[k + 1] = last;
                inserted = true;
                break;
            }
            order_[k + 1] = isucc;
            --k;
        }
        if (!inserted) {
            order_[i] = last;
        }
    }

    select(nrmax_);
}

void IntervalList::select(int rank) {
    nrmax_ = rank;
    maxerr_ = order_[rank];
    errmax_ = intervals_[maxerr_].error;
}

double IntervalList::area_sum() const {
    double sum = 0.0;
    for (int i = 0; i < size_; ++i) {
        sum += intervals_[i].area;
    }
    return sum;
}

double IntervalList::width_sum() const {
    double sum = 0.0;
    for (int i = 0; i < size_; ++i) {
        sum += intervals_[i].width();
    }
    return sum;
}

}; /* namespace interval_list */
