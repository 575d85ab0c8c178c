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

#ifndef IGAK_BASIS_KNOTVECTOR_H
#define IGAK_BASIS_KNOTVECTOR_H

/**
 * @file KnotVector.h
 * @brief Univariate B-spline knot vectors, mesh support and derivative tables
 */

#include "Core/Types.h"
#include "Math/MultiIndex.h"
#include <cstddef>
#include <span>
#include <vector>

namespace igak {
namespace basis {

/**
 * @brief Values of 1D basis functions and their derivatives at a point set
 *
 * Layout is [function][point][derivative], so the derivatives of one
 * function at consecutive points are contiguous with stride
 * maxDeriv() + 1. Kernels read rows through row().
 */
class DerivativeTable {
public:
    DerivativeTable() = default;
    DerivativeTable(std::size_t num_functions, std::size_t num_points, int max_deriv);

    std::size_t numFunctions() const noexcept { return num_functions_; }
    std::size_t numPoints() const noexcept { return num_points_; }
    int maxDeriv() const noexcept { return max_deriv_; }

    /// Distance between consecutive points in a row
    std::size_t pointStride() const noexcept {
        return static_cast<std::size_t>(max_deriv_) + 1;
    }

    Real operator()(std::size_t fn, std::size_t pt, int deriv) const noexcept {
        return data_[offset(fn, pt) + static_cast<std::size_t>(deriv)];
    }

    Real& operator()(std::size_t fn, std::size_t pt, int deriv) noexcept {
        return data_[offset(fn, pt) + static_cast<std::size_t>(deriv)];
    }

    /**
     * @brief Pointer to the derivatives of function @p fn at point @p pt
     */
    const Real* row(std::size_t fn, std::size_t pt) const noexcept {
        return data_.data() + offset(fn, pt);
    }

private:
    std::size_t offset(std::size_t fn, std::size_t pt) const noexcept {
        return (fn * num_points_ + pt) * pointStride();
    }

    std::size_t num_functions_ = 0;
    std::size_t num_points_ = 0;
    int max_deriv_ = 0;
    std::vector<Real> data_;
};

/**
 * @brief Knot vector of a univariate B-spline space
 *
 * The parametric domain is [t_p, t_n] with n the number of basis functions;
 * its distinct knots form the mesh whose intervals are the elements.
 */
class KnotVector {
public:
    /**
     * @brief Construct from degree and a non-decreasing knot sequence
     *
     * Requires at least degree + 2 knots, a nonempty domain and no knot of
     * multiplicity above degree + 1 inside the support of any function.
     */
    KnotVector(int degree, std::vector<Real> knots);

    /**
     * @brief Open uniform knot vector with @p num_elements elements on [a, b]
     */
    static KnotVector openUniform(int degree, std::size_t num_elements,
                                  Real a = Real(0), Real b = Real(1));

    int degree() const noexcept { return degree_; }
    std::size_t numDofs() const noexcept { return num_dofs_; }
    std::size_t numElements() const noexcept { return mesh_.size() - 1; }

    const std::vector<Real>& knots() const noexcept { return knots_; }

    /// Distinct knots of the parametric domain (element boundaries)
    const std::vector<Real>& mesh() const noexcept { return mesh_; }

    Real lower() const noexcept { return mesh_.front(); }
    Real upper() const noexcept { return mesh_.back(); }

    /**
     * @brief Element interval [a, b) covered by each basis function
     *
     * Both a and b are non-decreasing in the function index.
     */
    const std::vector<math::Interval>& meshSupport() const noexcept { return support_; }

    /**
     * @brief Functions whose support overlaps the support of function @p i
     */
    math::Interval jointSupportRange(std::size_t i) const;

    /**
     * @brief Knot span index s with t_s <= u < t_{s+1}, clamped to the domain
     */
    int findSpan(Real u) const;

    /**
     * @brief Values and derivatives 0..max_deriv of all functions at @p points
     *
     * Entries outside a function's support are exactly zero.
     */
    DerivativeTable evaluateDerivatives(std::span<const Real> points, int max_deriv) const;

private:
    void buildMeshSupport();

    int degree_;
    std::vector<Real> knots_;
    std::size_t num_dofs_ = 0;
    std::vector<Real> mesh_;
    std::vector<math::Interval> support_;
};

} // namespace basis
} // namespace igak

#endif // IGAK_BASIS_KNOTVECTOR_H
