/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/**
 * @file KnotVector.cpp
 * @brief Knot span search and the B-spline derivative recurrence
 */

#include "Basis/KnotVector.h"
#include "Core/Exception.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace igak {
namespace basis {

namespace {

/**
 * @brief Nonzero basis functions and their derivatives at u within @p span
 *
 * ders[k*(p+1) + r] receives derivative k of function span-p+r, for
 * k = 0..n with n <= p.
 */
void ders_basis_funs(const std::vector<Real>& knots,
                     int p,
                     int span,
                     Real u,
                     int n,
                     std::vector<Real>& ders) {
    const std::size_t P = static_cast<std::size_t>(p) + 1;
    ders.assign(static_cast<std::size_t>(n + 1) * P, Real(0));

    // ndu[j][r]: basis values (upper triangle) and knot differences (lower)
    std::vector<Real> ndu(P * P, Real(0));
    std::vector<Real> left(P, Real(0));
    std::vector<Real> right(P, Real(0));
    auto NDU = [&](int i, int j) -> Real& {
        return ndu[static_cast<std::size_t>(i) * P + static_cast<std::size_t>(j)];
    };

    NDU(0, 0) = Real(1);
    for (int j = 1; j <= p; ++j) {
        left[static_cast<std::size_t>(j)] = u - knots[static_cast<std::size_t>(span + 1 - j)];
        right[static_cast<std::size_t>(j)] = knots[static_cast<std::size_t>(span + j)] - u;
        Real saved = Real(0);
        for (int r = 0; r < j; ++r) {
            NDU(j, r) = right[static_cast<std::size_t>(r + 1)] + left[static_cast<std::size_t>(j - r)];
            const Real temp = NDU(r, j - 1) / NDU(j, r);
            NDU(r, j) = saved + right[static_cast<std::size_t>(r + 1)] * temp;
            saved = left[static_cast<std::size_t>(j - r)] * temp;
        }
        NDU(j, j) = saved;
    }

    auto D = [&](int k, int r) -> Real& {
        return ders[static_cast<std::size_t>(k) * P + static_cast<std::size_t>(r)];
    };
    for (int r = 0; r <= p; ++r) {
        D(0, r) = NDU(r, p);
    }

    std::vector<Real> a(2 * P, Real(0));
    auto A = [&](int s, int j) -> Real& {
        return a[static_cast<std::size_t>(s) * P + static_cast<std::size_t>(j)];
    };

    for (int r = 0; r <= p; ++r) {
        int s1 = 0;
        int s2 = 1;
        A(0, 0) = Real(1);
        for (int k = 1; k <= n; ++k) {
            Real d = Real(0);
            const int rk = r - k;
            const int pk = p - k;
            if (r >= k) {
                A(s2, 0) = A(s1, 0) / NDU(pk + 1, rk);
                d = A(s2, 0) * NDU(rk, pk);
            }
            const int j1 = (rk >= -1) ? 1 : -rk;
            const int j2 = (r - 1 <= pk) ? k - 1 : p - r;
            for (int j = j1; j <= j2; ++j) {
                A(s2, j) = (A(s1, j) - A(s1, j - 1)) / NDU(pk + 1, rk + j);
                d += A(s2, j) * NDU(rk + j, pk);
            }
            if (r <= pk) {
                A(s2, k) = -A(s1, k - 1) / NDU(pk + 1, r);
                d += A(s2, k) * NDU(r, pk);
            }
            D(k, r) = d;
            std::swap(s1, s2);
        }
    }

    Real factor = static_cast<Real>(p);
    for (int k = 1; k <= n; ++k) {
        for (int r = 0; r <= p; ++r) {
            D(k, r) *= factor;
        }
        factor *= static_cast<Real>(p - k);
    }
}

} // anonymous namespace

// ============================================================================
// DerivativeTable
// ============================================================================

DerivativeTable::DerivativeTable(std::size_t num_functions, std::size_t num_points, int max_deriv)
    : num_functions_(num_functions),
      num_points_(num_points),
      max_deriv_(max_deriv) {
    IGAK_CHECK_ARG(max_deriv >= 0, "DerivativeTable: negative derivative order");
    data_.assign(num_functions_ * num_points_ * pointStride(), Real(0));
}

// ============================================================================
// KnotVector
// ============================================================================

KnotVector::KnotVector(int degree, std::vector<Real> knots)
    : degree_(degree),
      knots_(std::move(knots)) {
    IGAK_CHECK_ARG(degree_ >= 0, "KnotVector requires non-negative degree");
    IGAK_CHECK_ARG(knots_.size() >= static_cast<std::size_t>(degree_) + 2,
                   "KnotVector: knot vector too short for degree");
    IGAK_CHECK_ARG(std::is_sorted(knots_.begin(), knots_.end()),
                   "KnotVector: knot vector must be non-decreasing");

    num_dofs_ = knots_.size() - static_cast<std::size_t>(degree_) - 1;
    IGAK_CHECK_ARG(knots_[num_dofs_] > knots_[static_cast<std::size_t>(degree_)],
                   "KnotVector: empty parametric domain");

    const std::size_t P = static_cast<std::size_t>(degree_);
    for (std::size_t i = 0; i < num_dofs_; ++i) {
        IGAK_CHECK_ARG(knots_[i + P + 1] > knots_[i],
                       "KnotVector: knot multiplicity exceeds degree + 1 at function " +
                       std::to_string(i));
    }

    buildMeshSupport();
}

KnotVector KnotVector::openUniform(int degree, std::size_t num_elements, Real a, Real b) {
    IGAK_CHECK_ARG(degree >= 0, "openUniform: negative degree");
    IGAK_CHECK_ARG(num_elements > 0, "openUniform: need at least one element");
    IGAK_CHECK_ARG(b > a, "openUniform: empty interval");

    std::vector<Real> knots;
    knots.reserve(num_elements + 1 + 2 * static_cast<std::size_t>(degree));
    knots.insert(knots.end(), static_cast<std::size_t>(degree), a);
    for (std::size_t e = 0; e <= num_elements; ++e) {
        knots.push_back(a + (b - a) * static_cast<Real>(e) / static_cast<Real>(num_elements));
    }
    knots.back() = b;
    knots.insert(knots.end(), static_cast<std::size_t>(degree), b);
    return KnotVector(degree, std::move(knots));
}

void KnotVector::buildMeshSupport() {
    const std::size_t P = static_cast<std::size_t>(degree_);
    mesh_.assign(knots_.begin() + static_cast<std::ptrdiff_t>(P),
                 knots_.begin() + static_cast<std::ptrdiff_t>(num_dofs_) + 1);
    mesh_.erase(std::unique(mesh_.begin(), mesh_.end()), mesh_.end());

    const std::size_t n_el = numElements();
    auto element_of = [&](Real t) -> std::size_t {
        const auto it = std::lower_bound(mesh_.begin(), mesh_.end(), t);
        const auto idx = static_cast<std::size_t>(it - mesh_.begin());
        return std::min(idx, n_el);
    };

    support_.resize(num_dofs_);
    for (std::size_t i = 0; i < num_dofs_; ++i) {
        support_[i] = math::Interval{element_of(knots_[i]), element_of(knots_[i + P + 1])};
    }
}

math::Interval KnotVector::jointSupportRange(std::size_t i) const {
    IGAK_CHECK_INDEX(i, num_dofs_, "KnotVector::jointSupportRange: basis function");
    const math::Interval si = support_[i];

    // first j with b_j > a_i, first j with a_j >= b_i
    const auto first = std::upper_bound(support_.begin(), support_.end(), si.first,
        [](std::size_t value, const math::Interval& s) { return value < s.last; });
    const auto last = std::lower_bound(support_.begin(), support_.end(), si.last,
        [](const math::Interval& s, std::size_t value) { return s.first < value; });

    return math::Interval{static_cast<std::size_t>(first - support_.begin()),
                          static_cast<std::size_t>(last - support_.begin())};
}

int KnotVector::findSpan(Real u) const {
    const int p = degree_;
    const int n = static_cast<int>(num_dofs_);
    auto K = [&](int i) { return knots_[static_cast<std::size_t>(i)]; };

    if (u >= K(n)) {
        int s = n - 1;
        while (s > p && !(K(s) < K(s + 1))) {
            --s;
        }
        return s;
    }
    if (u <= K(p)) {
        int s = p;
        while (s < n - 1 && !(K(s) < K(s + 1))) {
            ++s;
        }
        return s;
    }

    int low = p;
    int high = n;
    int mid = (low + high) / 2;
    while (u < K(mid) || u >= K(mid + 1)) {
        if (u < K(mid)) {
            high = mid;
        } else {
            low = mid;
        }
        mid = (low + high) / 2;
    }
    return mid;
}

DerivativeTable KnotVector::evaluateDerivatives(std::span<const Real> points, int max_deriv) const {
    IGAK_CHECK_ARG(max_deriv >= 0, "evaluateDerivatives: negative derivative order");

    DerivativeTable table(num_dofs_, points.size(), max_deriv);
    const int n = std::min(max_deriv, degree_);
    const Real tol = std::numeric_limits<Real>::epsilon() * Real(64) *
                     std::max(Real(1), std::abs(upper() - lower()));

    std::vector<Real> ders;
    for (std::size_t q = 0; q < points.size(); ++q) {
        const Real u = points[q];
        IGAK_CHECK_ARG(u >= lower() - tol && u <= upper() + tol,
                       "evaluateDerivatives: point " + std::to_string(u) +
                       " outside the parametric domain");

        const int span = findSpan(u);
        ders_basis_funs(knots_, degree_, span, u, n, ders);

        const int first = span - degree_;
        for (int r = 0; r <= degree_; ++r) {
            const auto fn = static_cast<std::size_t>(first + r);
            for (int k = 0; k <= n; ++k) {
                table(fn, q, k) = ders[static_cast<std::size_t>(k) *
                                       (static_cast<std::size_t>(degree_) + 1) +
                                       static_cast<std::size_t>(r)];
            }
        }
    }
    return table;
}

} // namespace basis
} // namespace igak
