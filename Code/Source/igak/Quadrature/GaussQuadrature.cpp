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
 * @file GaussQuadrature.cpp
 * @brief Gauss-Legendre nodes by Newton iteration and iterated rules
 */

#include "Quadrature/GaussQuadrature.h"
#include "Core/Exception.h"
#include <cmath>
#include <limits>
#include <numbers>

namespace igak {
namespace quadrature {

namespace {

/**
 * @brief P_n(x) and P_n'(x) via the three-term recurrence
 */
std::pair<Real, Real> legendre_with_derivative(int n, Real x) {
    Real p0 = Real(1);
    Real p1 = x;
    for (int k = 2; k <= n; ++k) {
        const Real pk = (Real(2 * k - 1) * x * p1 - Real(k - 1) * p0) / Real(k);
        p0 = p1;
        p1 = pk;
    }
    const Real derivative = Real(n) / (Real(1) - x * x) * (p0 - x * p1);
    return {p1, derivative};
}

} // anonymous namespace

std::pair<std::vector<Real>, std::vector<Real>> GaussQuadrature1D::generate_raw(int num_points) {
    IGAK_CHECK_ARG(num_points >= 1, "GaussQuadrature1D: num_points must be positive");
    IGAK_CHECK_ARG(num_points <= 128, "GaussQuadrature1D: num_points exceeds safe limit (128)");

    const int n = num_points;
    const int m = (n + 1) / 2;
    const Real tolerance = Real(1e-15);
    std::vector<Real> nodes(static_cast<std::size_t>(n));
    std::vector<Real> weights(static_cast<std::size_t>(n));

    for (int i = 0; i < m; ++i) {
        Real z = std::cos(std::numbers::pi_v<Real> * (Real(i) + Real(0.75)) / (Real(n) + Real(0.5)));
        Real z_prev = std::numeric_limits<Real>::max();

        for (int it = 0; it < 100 && std::abs(z - z_prev) > tolerance; ++it) {
            z_prev = z;
            const auto [P, dP] = legendre_with_derivative(n, z);
            z = z_prev - P / dP;
        }

        const auto [P, dP] = legendre_with_derivative(n, z);
        (void)P;
        const Real w = Real(2) / ((Real(1) - z * z) * dP * dP);

        nodes[static_cast<std::size_t>(i)] = -z;
        nodes[static_cast<std::size_t>(n - 1 - i)] = z;
        weights[static_cast<std::size_t>(i)] = w;
        weights[static_cast<std::size_t>(n - 1 - i)] = w;
    }

    return {nodes, weights};
}

GaussQuadrature1D::GaussQuadrature1D(int num_points) {
    auto [nodes, weights] = generate_raw(num_points);
    nodes_ = std::move(nodes);
    weights_ = std::move(weights);
}

IteratedRule makeIteratedGauss(std::span<const Real> mesh, int points_per_element) {
    IGAK_CHECK_ARG(mesh.size() >= 2, "makeIteratedGauss: mesh needs at least one element");
    const GaussQuadrature1D rule(points_per_element);
    const auto nqp = static_cast<std::size_t>(points_per_element);

    IteratedRule result;
    result.points_per_element = nqp;
    result.nodes.reserve((mesh.size() - 1) * nqp);
    result.weights.reserve((mesh.size() - 1) * nqp);

    for (std::size_t e = 0; e + 1 < mesh.size(); ++e) {
        const Real a = mesh[e];
        const Real b = mesh[e + 1];
        IGAK_CHECK_ARG(b > a, "makeIteratedGauss: mesh must be strictly increasing");
        const Real half = Real(0.5) * (b - a);
        const Real mid = Real(0.5) * (a + b);
        for (std::size_t q = 0; q < nqp; ++q) {
            result.nodes.push_back(mid + half * rule.nodes()[q]);
            result.weights.push_back(half * rule.weights()[q]);
        }
    }
    return result;
}

std::vector<std::size_t> TensorQuadrature::shape() const {
    std::vector<std::size_t> s;
    s.reserve(axes.size());
    for (const auto& axis : axes) {
        s.push_back(axis.numNodes());
    }
    return s;
}

std::size_t TensorQuadrature::numNodes() const {
    std::size_t n = axes.empty() ? 0 : 1;
    for (const auto& axis : axes) {
        n *= axis.numNodes();
    }
    return n;
}

TensorQuadrature makeTensorQuadrature(const std::vector<std::vector<Real>>& meshes,
                                      int points_per_element) {
    IGAK_CHECK_ARG(!meshes.empty(), "makeTensorQuadrature: no axes given");
    TensorQuadrature tq;
    tq.axes.reserve(meshes.size());
    for (const auto& mesh : meshes) {
        tq.axes.push_back(makeIteratedGauss(mesh, points_per_element));
    }
    return tq;
}

} // namespace quadrature
} // namespace igak
