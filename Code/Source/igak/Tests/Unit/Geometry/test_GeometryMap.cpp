/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_GeometryMap.cpp
 * @brief Unit tests for geometry maps and grid-wide Jacobian evaluation
 */

#include <gtest/gtest.h>
#include "igak/Core/Exception.h"
#include "igak/Geometry/GeometryMap.h"
#include "igak/Quadrature/GaussQuadrature.h"

#include <array>
#include <cmath>
#include <numbers>
#include <vector>

using namespace igak;
using namespace igak::geometry;

namespace {

/// Jacobian by central differences of map.evaluate()
std::vector<Real> finiteDifferenceJacobian(const GeometryMap& map, std::vector<Real> xi) {
    const int d = map.dim();
    const Real h = 1e-6;
    std::vector<Real> J(static_cast<std::size_t>(d * d));
    std::vector<Real> xp(static_cast<std::size_t>(d));
    std::vector<Real> xm(static_cast<std::size_t>(d));
    for (int c = 0; c < d; ++c) {
        const auto cc = static_cast<std::size_t>(c);
        std::vector<Real> p = xi;
        std::vector<Real> m = xi;
        p[cc] += h;
        m[cc] -= h;
        map.evaluate(p, xp);
        map.evaluate(m, xm);
        for (int r = 0; r < d; ++r) {
            const auto rr = static_cast<std::size_t>(r);
            J[rr * static_cast<std::size_t>(d) + cc] = (xp[rr] - xm[rr]) / (2.0 * h);
        }
    }
    return J;
}

} // namespace

TEST(IdentityMap, EvaluatesToInputAndUnitJacobian) {
    IdentityMap map(3);
    const std::array<Real, 3> xi{0.1, 0.2, 0.3};
    std::array<Real, 3> x{};
    std::array<Real, 9> J{};
    map.evaluate(xi, x);
    map.jacobian(xi, J);
    EXPECT_EQ(x, xi);
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            EXPECT_DOUBLE_EQ(J[static_cast<std::size_t>(3 * r + c)], r == c ? 1.0 : 0.0);
        }
    }
}

TEST(IdentityMap, RejectsWrongBufferSizes) {
    IdentityMap map(2);
    std::array<Real, 3> xi{};
    std::array<Real, 2> x{};
    EXPECT_THROW(map.evaluate(xi, x), ShapeMismatchException);
    EXPECT_THROW(IdentityMap(0), InvalidArgumentException);
}

TEST(BoxMap, ScalesEachAxis) {
    BoxMap map({1.0, -2.0}, {3.0, 2.0});
    const std::array<Real, 2> xi{0.25, 0.5};
    std::array<Real, 2> x{};
    std::array<Real, 4> J{};
    map.evaluate(xi, x);
    map.jacobian(xi, J);
    EXPECT_DOUBLE_EQ(x[0], 1.5);
    EXPECT_DOUBLE_EQ(x[1], 0.0);
    EXPECT_DOUBLE_EQ(J[0], 2.0);
    EXPECT_DOUBLE_EQ(J[1], 0.0);
    EXPECT_DOUBLE_EQ(J[2], 0.0);
    EXPECT_DOUBLE_EQ(J[3], 4.0);
}

TEST(BoxMap, RejectsDegenerateBox) {
    EXPECT_THROW(BoxMap({0.0, 0.0}, {1.0, 0.0}), InvalidArgumentException);
    EXPECT_THROW(BoxMap({0.0}, {1.0, 1.0}), ShapeMismatchException);
}

TEST(QuarterAnnulusMap, JacobianMatchesFiniteDifferences) {
    QuarterAnnulusMap map(1.0, 2.0);
    for (const auto& xi : {std::vector<Real>{0.3, 0.2}, std::vector<Real>{0.9, 0.7}}) {
        std::vector<Real> J(4);
        map.jacobian(xi, J);
        const std::vector<Real> fd = finiteDifferenceJacobian(map, xi);
        for (std::size_t k = 0; k < 4; ++k) {
            EXPECT_NEAR(J[k], fd[k], 1e-7);
        }
    }
}

TEST(QuarterAnnulusMap, GridAreaIsQuarterAnnulus) {
    QuarterAnnulusMap map(1.0, 2.0);
    const auto grid = quadrature::makeTensorQuadrature({{0.0, 0.5, 1.0}, {0.0, 0.25, 0.5, 0.75, 1.0}}, 8);
    const math::GridArray J = gridJacobian(map, grid);
    math::GridArray det;
    determinantsAndInverses(J, 2, &det, nullptr);

    Real area = 0.0;
    math::forEachGridNode(det.gridShape(), [&](std::size_t node, const std::vector<std::size_t>& idx) {
        area += std::abs(det(node, 0)) * grid.axes[0].weights[idx[0]] * grid.axes[1].weights[idx[1]];
    });
    EXPECT_NEAR(area, 0.25 * std::numbers::pi * (4.0 - 1.0), 1e-12);
}

TEST(GridHelpers, InverseTimesJacobianIsIdentity) {
    FunctionMap map(3,
        [](std::span<const Real> xi, std::span<Real> x) {
            x[0] = xi[0] + 0.1 * xi[1] * xi[1];
            x[1] = 2.0 * xi[1] + 0.2 * xi[2];
            x[2] = xi[2] + 0.3 * xi[0] * xi[1];
        },
        [](std::span<const Real> xi, std::span<Real> J) {
            J[0] = 1.0;           J[1] = 0.2 * xi[1]; J[2] = 0.0;
            J[3] = 0.0;           J[4] = 2.0;         J[5] = 0.2;
            J[6] = 0.3 * xi[1];   J[7] = 0.3 * xi[0]; J[8] = 1.0;
        });
    const auto grid = quadrature::makeTensorQuadrature({{0.0, 1.0}, {0.0, 1.0}, {0.0, 1.0}}, 2);
    const math::GridArray J = gridJacobian(map, grid);
    math::GridArray inv;
    determinantsAndInverses(J, 3, nullptr, &inv);

    ASSERT_EQ(inv.numNodes(), 8u);
    for (std::size_t n = 0; n < inv.numNodes(); ++n) {
        for (int r = 0; r < 3; ++r) {
            for (int c = 0; c < 3; ++c) {
                Real s = 0.0;
                for (int k = 0; k < 3; ++k) {
                    s += J(n, static_cast<std::size_t>(3 * r + k)) * inv(n, static_cast<std::size_t>(3 * k + c));
                }
                EXPECT_NEAR(s, r == c ? 1.0 : 0.0, 1e-13);
            }
        }
    }

    const math::GridArray x = gridEvaluate(map, grid);
    EXPECT_EQ(x.components(), 3u);
    EXPECT_EQ(x.numNodes(), 8u);
}

TEST(GridHelpers, SingularJacobianThrows) {
    FunctionMap map(2,
        [](std::span<const Real> xi, std::span<Real> x) { x[0] = xi[0]; x[1] = xi[0]; },
        [](std::span<const Real>, std::span<Real> J) { J[0] = 1.0; J[1] = 0.0; J[2] = 1.0; J[3] = 0.0; });
    const auto grid = quadrature::makeTensorQuadrature({{0.0, 1.0}, {0.0, 1.0}}, 1);
    const math::GridArray J = gridJacobian(map, grid);
    math::GridArray det;
    EXPECT_THROW(determinantsAndInverses(J, 2, &det, nullptr), InvalidArgumentException);
}

TEST(GridHelpers, DimensionMismatchThrows) {
    IdentityMap map(3);
    const auto grid = quadrature::makeTensorQuadrature({{0.0, 1.0}, {0.0, 1.0}}, 2);
    EXPECT_THROW(gridJacobian(map, grid), InvalidDimensionException);
}
