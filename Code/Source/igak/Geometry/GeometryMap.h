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

#ifndef IGAK_GEOMETRY_GEOMETRYMAP_H
#define IGAK_GEOMETRY_GEOMETRYMAP_H

/**
 * @file GeometryMap.h
 * @brief Maps from the parametric box to the physical domain
 *
 * Parametric coordinate k corresponds to tensor axis k. Jacobians are
 * stored row-major: J[r*dim + c] = dx_r / dxi_c.
 */

#include "Core/Types.h"
#include "Math/GridArray.h"
#include "Quadrature/GaussQuadrature.h"
#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace igak {
namespace geometry {

class GeometryMap {
public:
    virtual ~GeometryMap() = default;

    /// Parametric and physical dimension
    virtual int dim() const noexcept = 0;

    /// Physical coordinates of parametric point @p xi
    virtual void evaluate(std::span<const Real> xi, std::span<Real> x) const = 0;

    /// Jacobian dx/dxi at @p xi (row-major, dim x dim)
    virtual void jacobian(std::span<const Real> xi, std::span<Real> J) const = 0;
};

/**
 * @brief x = xi
 */
class IdentityMap : public GeometryMap {
public:
    explicit IdentityMap(int dim);

    int dim() const noexcept override { return dim_; }
    void evaluate(std::span<const Real> xi, std::span<Real> x) const override;
    void jacobian(std::span<const Real> xi, std::span<Real> J) const override;

private:
    int dim_;
};

/**
 * @brief Axis-aligned affine map x_k = lower_k + (upper_k - lower_k) * xi_k
 */
class BoxMap : public GeometryMap {
public:
    BoxMap(std::vector<Real> lower, std::vector<Real> upper);

    int dim() const noexcept override { return static_cast<int>(lower_.size()); }
    void evaluate(std::span<const Real> xi, std::span<Real> x) const override;
    void jacobian(std::span<const Real> xi, std::span<Real> J) const override;

private:
    std::vector<Real> lower_;
    std::vector<Real> upper_;
};

/**
 * @brief Quarter annulus in the first quadrant
 *
 * xi_0 in [0,1] runs from the inner to the outer radius, xi_1 in [0,1]
 * sweeps the angle from 0 to pi/2.
 */
class QuarterAnnulusMap : public GeometryMap {
public:
    QuarterAnnulusMap(Real r_inner, Real r_outer);

    int dim() const noexcept override { return 2; }
    void evaluate(std::span<const Real> xi, std::span<Real> x) const override;
    void jacobian(std::span<const Real> xi, std::span<Real> J) const override;

private:
    Real r_inner_;
    Real r_outer_;
};

/**
 * @brief Map defined by user callbacks
 */
class FunctionMap : public GeometryMap {
public:
    using EvalFn = std::function<void(std::span<const Real>, std::span<Real>)>;

    FunctionMap(int dim, EvalFn evaluate, EvalFn jacobian);

    int dim() const noexcept override { return dim_; }
    void evaluate(std::span<const Real> xi, std::span<Real> x) const override;
    void jacobian(std::span<const Real> xi, std::span<Real> J) const override;

private:
    int dim_;
    EvalFn evaluate_;
    EvalFn jacobian_;
};

// ============================================================================
// Grid helpers
// ============================================================================

/**
 * @brief Physical coordinates at every node of @p grid (dim components)
 */
math::GridArray gridEvaluate(const GeometryMap& map, const quadrature::TensorQuadrature& grid);

/**
 * @brief Jacobian at every node of @p grid (dim*dim components, row-major)
 */
math::GridArray gridJacobian(const GeometryMap& map, const quadrature::TensorQuadrature& grid);

/**
 * @brief Per-node determinant and inverse of a Jacobian grid array
 *
 * Either output may be null. Throws InvalidArgumentException on a singular
 * Jacobian.
 */
void determinantsAndInverses(const math::GridArray& jacobians, int dim,
                             math::GridArray* determinants,
                             math::GridArray* inverses);

} // namespace geometry
} // namespace igak

#endif // IGAK_GEOMETRY_GEOMETRYMAP_H
