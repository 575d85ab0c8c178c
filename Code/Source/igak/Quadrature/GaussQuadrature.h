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

#ifndef IGAK_QUADRATURE_GAUSSQUADRATURE_H
#define IGAK_QUADRATURE_GAUSSQUADRATURE_H

/**
 * @file GaussQuadrature.h
 * @brief Gauss-Legendre rules and their iterated/tensor-product versions
 *
 * An iterated rule places the same number of Gauss nodes on every element
 * of a 1D mesh, element by element, so element e owns the contiguous node
 * range [nqp*e, nqp*(e+1)). Kernels rely on this ordering to turn an
 * element interval into a quadrature sub-range.
 */

#include "Core/Types.h"
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace igak {
namespace quadrature {

/**
 * @brief Gauss-Legendre rule on the reference interval [-1, 1]
 */
class GaussQuadrature1D {
public:
    /// Construct rule with @p num_points nodes (1 <= num_points <= 128)
    explicit GaussQuadrature1D(int num_points);

    /// Abscissae and weights on [-1, 1], nodes ascending
    static std::pair<std::vector<Real>, std::vector<Real>>
    generate_raw(int num_points);

    int numPoints() const noexcept { return static_cast<int>(nodes_.size()); }

    /// Highest polynomial degree integrated exactly
    int order() const noexcept { return 2 * numPoints() - 1; }

    const std::vector<Real>& nodes() const noexcept { return nodes_; }
    const std::vector<Real>& weights() const noexcept { return weights_; }

private:
    std::vector<Real> nodes_;
    std::vector<Real> weights_;
};

/**
 * @brief Composite rule over the elements of a 1D mesh
 */
struct IteratedRule {
    std::vector<Real> nodes;
    std::vector<Real> weights;
    std::size_t points_per_element = 0;

    std::size_t numNodes() const noexcept { return nodes.size(); }
};

/**
 * @brief Map a Gauss rule onto every interval of @p mesh
 */
IteratedRule makeIteratedGauss(std::span<const Real> mesh, int points_per_element);

/**
 * @brief Tensor product of per-axis iterated rules
 */
struct TensorQuadrature {
    std::vector<IteratedRule> axes;

    int dim() const noexcept { return static_cast<int>(axes.size()); }

    /// Node count per axis
    std::vector<std::size_t> shape() const;

    /// Total number of grid nodes
    std::size_t numNodes() const;
};

/**
 * @brief Tensor quadrature with @p points_per_element nodes per element and axis
 */
TensorQuadrature makeTensorQuadrature(const std::vector<std::vector<Real>>& meshes,
                                      int points_per_element);

} // namespace quadrature
} // namespace igak

#endif // IGAK_QUADRATURE_GAUSSQUADRATURE_H
