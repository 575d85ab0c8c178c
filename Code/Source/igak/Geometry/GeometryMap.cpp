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
 * @file GeometryMap.cpp
 * @brief Concrete geometry maps and grid-wide Jacobian evaluation
 */

#include "Geometry/GeometryMap.h"
#include "Core/Exception.h"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace igak {
namespace geometry {

namespace {

void check_sizes(int dim, std::span<const Real> xi, std::span<Real> out, std::size_t out_size) {
    IGAK_THROW_IF(xi.size() != static_cast<std::size_t>(dim), ShapeMismatchException,
                  "GeometryMap: parametric point has " + std::to_string(xi.size()) +
                  " coordinates, expected " + std::to_string(dim));
    IGAK_THROW_IF(out.size() != out_size, ShapeMismatchException,
                  "GeometryMap: output buffer has wrong size");
}

template<int D>
void invert_fixed(const math::GridArray& jac,
                  math::GridArray* det,
                  math::GridArray* inv) {
    using Mat = Eigen::Matrix<Real, D, D, Eigen::RowMajor>;
    for (std::size_t n = 0; n < jac.numNodes(); ++n) {
        const Eigen::Map<const Mat> J(jac.nodeData(n));
        Mat Jinv;
        Real d = Real(0);
        bool invertible = false;
        J.computeInverseAndDetWithCheck(Jinv, d, invertible, Real(0));
        IGAK_THROW_IF(!invertible || !std::isfinite(d), InvalidArgumentException,
                      "determinantsAndInverses: singular Jacobian at grid node " +
                      std::to_string(n));
        if (det != nullptr) {
            (*det)(n, 0) = d;
        }
        if (inv != nullptr) {
            Eigen::Map<Mat>(inv->nodeData(n)) = Jinv;
        }
    }
}

void invert_dynamic(const math::GridArray& jac, int dim,
                    math::GridArray* det,
                    math::GridArray* inv) {
    using Mat = Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    for (std::size_t n = 0; n < jac.numNodes(); ++n) {
        const Eigen::Map<const Mat> J(jac.nodeData(n), dim, dim);
        const Eigen::FullPivLU<Mat> lu(J);
        IGAK_THROW_IF(!lu.isInvertible(), InvalidArgumentException,
                      "determinantsAndInverses: singular Jacobian at grid node " +
                      std::to_string(n));
        if (det != nullptr) {
            (*det)(n, 0) = lu.determinant();
        }
        if (inv != nullptr) {
            Eigen::Map<Mat>(inv->nodeData(n), dim, dim) = lu.inverse();
        }
    }
}

} // anonymous namespace

// ============================================================================
// IdentityMap
// ============================================================================

IdentityMap::IdentityMap(int dim) : dim_(dim) {
    IGAK_CHECK_ARG(dim >= 1, "IdentityMap: dimension must be positive");
}

void IdentityMap::evaluate(std::span<const Real> xi, std::span<Real> x) const {
    check_sizes(dim_, xi, x, static_cast<std::size_t>(dim_));
    std::copy(xi.begin(), xi.end(), x.begin());
}

void IdentityMap::jacobian(std::span<const Real> xi, std::span<Real> J) const {
    const auto d = static_cast<std::size_t>(dim_);
    check_sizes(dim_, xi, J, d * d);
    std::fill(J.begin(), J.end(), Real(0));
    for (std::size_t k = 0; k < d; ++k) {
        J[k * d + k] = Real(1);
    }
}

// ============================================================================
// BoxMap
// ============================================================================

BoxMap::BoxMap(std::vector<Real> lower, std::vector<Real> upper)
    : lower_(std::move(lower)),
      upper_(std::move(upper)) {
    IGAK_CHECK_ARG(!lower_.empty(), "BoxMap: empty box");
    IGAK_THROW_IF(lower_.size() != upper_.size(), ShapeMismatchException,
                  "BoxMap: lower and upper corners differ in dimension");
    for (std::size_t k = 0; k < lower_.size(); ++k) {
        IGAK_CHECK_ARG(upper_[k] > lower_[k], "BoxMap: degenerate extent along axis " +
                       std::to_string(k));
    }
}

void BoxMap::evaluate(std::span<const Real> xi, std::span<Real> x) const {
    check_sizes(dim(), xi, x, lower_.size());
    for (std::size_t k = 0; k < lower_.size(); ++k) {
        x[k] = lower_[k] + (upper_[k] - lower_[k]) * xi[k];
    }
}

void BoxMap::jacobian(std::span<const Real> xi, std::span<Real> J) const {
    const std::size_t d = lower_.size();
    check_sizes(dim(), xi, J, d * d);
    std::fill(J.begin(), J.end(), Real(0));
    for (std::size_t k = 0; k < d; ++k) {
        J[k * d + k] = upper_[k] - lower_[k];
    }
}

// ============================================================================
// QuarterAnnulusMap
// ============================================================================

QuarterAnnulusMap::QuarterAnnulusMap(Real r_inner, Real r_outer)
    : r_inner_(r_inner),
      r_outer_(r_outer) {
    IGAK_CHECK_ARG(r_inner > Real(0) && r_outer > r_inner,
                   "QuarterAnnulusMap: require 0 < r_inner < r_outer");
}

void QuarterAnnulusMap::evaluate(std::span<const Real> xi, std::span<Real> x) const {
    check_sizes(2, xi, x, 2);
    const Real r = r_inner_ + (r_outer_ - r_inner_) * xi[0];
    const Real theta = Real(0.5) * std::numbers::pi_v<Real> * xi[1];
    x[0] = r * std::cos(theta);
    x[1] = r * std::sin(theta);
}

void QuarterAnnulusMap::jacobian(std::span<const Real> xi, std::span<Real> J) const {
    check_sizes(2, xi, J, 4);
    const Real dr = r_outer_ - r_inner_;
    const Real r = r_inner_ + dr * xi[0];
    const Real dtheta = Real(0.5) * std::numbers::pi_v<Real>;
    const Real theta = dtheta * xi[1];
    const Real c = std::cos(theta);
    const Real s = std::sin(theta);
    J[0] = dr * c;
    J[1] = -r * s * dtheta;
    J[2] = dr * s;
    J[3] = r * c * dtheta;
}

// ============================================================================
// FunctionMap
// ============================================================================

FunctionMap::FunctionMap(int dim, EvalFn evaluate, EvalFn jacobian)
    : dim_(dim),
      evaluate_(std::move(evaluate)),
      jacobian_(std::move(jacobian)) {
    IGAK_CHECK_ARG(dim >= 1, "FunctionMap: dimension must be positive");
    IGAK_CHECK_ARG(static_cast<bool>(evaluate_), "FunctionMap: missing evaluation callback");
    IGAK_CHECK_ARG(static_cast<bool>(jacobian_), "FunctionMap: missing Jacobian callback");
}

void FunctionMap::evaluate(std::span<const Real> xi, std::span<Real> x) const {
    check_sizes(dim_, xi, x, static_cast<std::size_t>(dim_));
    evaluate_(xi, x);
}

void FunctionMap::jacobian(std::span<const Real> xi, std::span<Real> J) const {
    const auto d = static_cast<std::size_t>(dim_);
    check_sizes(dim_, xi, J, d * d);
    jacobian_(xi, J);
}

// ============================================================================
// Grid helpers
// ============================================================================

namespace {

template<typename Fn>
math::GridArray evaluate_on_grid(const GeometryMap& map,
                                 const quadrature::TensorQuadrature& grid,
                                 std::size_t components,
                                 Fn&& fn) {
    IGAK_THROW_IF(grid.dim() != map.dim(), InvalidDimensionException,
                  "Geometry map of dimension " + std::to_string(map.dim()) +
                  " applied to a grid of dimension " + std::to_string(grid.dim()));
    math::GridArray out(grid.shape(), components);
    std::vector<Real> xi(static_cast<std::size_t>(grid.dim()));
    math::forEachGridNode(out.gridShape(), [&](std::size_t node, const std::vector<std::size_t>& index) {
        for (std::size_t k = 0; k < index.size(); ++k) {
            xi[k] = grid.axes[k].nodes[index[k]];
        }
        fn(std::span<const Real>(xi), std::span<Real>(out.nodeData(node), components));
    });
    return out;
}

} // anonymous namespace

math::GridArray gridEvaluate(const GeometryMap& map, const quadrature::TensorQuadrature& grid) {
    const auto d = static_cast<std::size_t>(map.dim());
    return evaluate_on_grid(map, grid, d,
        [&map](std::span<const Real> xi, std::span<Real> x) { map.evaluate(xi, x); });
}

math::GridArray gridJacobian(const GeometryMap& map, const quadrature::TensorQuadrature& grid) {
    const auto d = static_cast<std::size_t>(map.dim());
    return evaluate_on_grid(map, grid, d * d,
        [&map](std::span<const Real> xi, std::span<Real> J) { map.jacobian(xi, J); });
}

void determinantsAndInverses(const math::GridArray& jacobians, int dim,
                             math::GridArray* determinants,
                             math::GridArray* inverses) {
    IGAK_CHECK_ARG(dim >= 1, "determinantsAndInverses: dimension must be positive");
    const auto d = static_cast<std::size_t>(dim);
    IGAK_THROW_IF(jacobians.components() != d * d, ShapeMismatchException,
                  "determinantsAndInverses: Jacobian array does not hold dim x dim entries");

    if (determinants != nullptr) {
        *determinants = math::GridArray(jacobians.gridShape(), 1);
    }
    if (inverses != nullptr) {
        *inverses = math::GridArray(jacobians.gridShape(), d * d);
    }

    switch (dim) {
        case 1: invert_fixed<1>(jacobians, determinants, inverses); break;
        case 2: invert_fixed<2>(jacobians, determinants, inverses); break;
        case 3: invert_fixed<3>(jacobians, determinants, inverses); break;
        case 4: invert_fixed<4>(jacobians, determinants, inverses); break;
        default: invert_dynamic(jacobians, dim, determinants, inverses); break;
    }
}

} // namespace geometry
} // namespace igak
