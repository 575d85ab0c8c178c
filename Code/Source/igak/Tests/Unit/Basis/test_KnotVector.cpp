/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_KnotVector.cpp
 * @brief Unit tests for knot vectors, mesh support and derivative tables
 */

#include <gtest/gtest.h>
#include "igak/Basis/KnotVector.h"
#include "igak/Core/Exception.h"

#include <cmath>
#include <numeric>
#include <vector>

using namespace igak;
using namespace igak::basis;

namespace {

std::vector<Real> samplePoints(const KnotVector& kv, std::size_t n) {
    std::vector<Real> pts(n);
    for (std::size_t q = 0; q < n; ++q) {
        pts[q] = kv.lower() + (kv.upper() - kv.lower()) * static_cast<Real>(q) /
                 static_cast<Real>(n - 1);
    }
    return pts;
}

} // namespace

TEST(KnotVector, OpenUniformCounts) {
    const KnotVector kv = KnotVector::openUniform(3, 5);
    EXPECT_EQ(kv.degree(), 3);
    EXPECT_EQ(kv.numDofs(), 8u);
    EXPECT_EQ(kv.numElements(), 5u);
    EXPECT_EQ(kv.knots().size(), 12u);
    EXPECT_DOUBLE_EQ(kv.lower(), 0.0);
    EXPECT_DOUBLE_EQ(kv.upper(), 1.0);
}

TEST(KnotVector, RejectsInvalidKnots) {
    EXPECT_THROW(KnotVector(2, {0.0, 0.0, 1.0}), InvalidArgumentException);
    EXPECT_THROW(KnotVector(1, {0.0, 1.0, 0.5, 1.0}), InvalidArgumentException);
    EXPECT_THROW(KnotVector(1, {0.0, 0.0, 0.0, 1.0, 1.0}), InvalidArgumentException);
    EXPECT_THROW(KnotVector(-1, {0.0, 1.0}), InvalidArgumentException);
    EXPECT_THROW(KnotVector::openUniform(2, 0), InvalidArgumentException);
}

TEST(KnotVector, MeshSupportOfOpenUniformCubic) {
    const KnotVector kv = KnotVector::openUniform(3, 5);
    const auto& s = kv.meshSupport();
    ASSERT_EQ(s.size(), 8u);
    EXPECT_EQ(s[0], (math::Interval{0, 1}));
    EXPECT_EQ(s[1], (math::Interval{0, 2}));
    EXPECT_EQ(s[3], (math::Interval{0, 4}));
    EXPECT_EQ(s[4], (math::Interval{1, 5}));
    EXPECT_EQ(s[7], (math::Interval{4, 5}));
    for (std::size_t i = 1; i < s.size(); ++i) {
        EXPECT_LE(s[i - 1].first, s[i].first);
        EXPECT_LE(s[i - 1].last, s[i].last);
    }
}

TEST(KnotVector, MeshSupportWithRepeatedInteriorKnot) {
    const KnotVector kv(2, {0.0, 0.0, 0.0, 0.5, 0.5, 1.0, 1.0, 1.0});
    EXPECT_EQ(kv.numElements(), 2u);
    const auto& s = kv.meshSupport();
    ASSERT_EQ(s.size(), 5u);
    EXPECT_EQ(s[0], (math::Interval{0, 1}));
    EXPECT_EQ(s[2], (math::Interval{0, 2}));
    EXPECT_EQ(s[3], (math::Interval{1, 2}));
}

TEST(KnotVector, JointSupportRangeMatchesBruteForce) {
    const KnotVector kv = KnotVector::openUniform(2, 6);
    const auto& s = kv.meshSupport();
    for (std::size_t i = 0; i < kv.numDofs(); ++i) {
        const math::Interval r = kv.jointSupportRange(i);
        for (std::size_t j = 0; j < kv.numDofs(); ++j) {
            const bool overlaps = !math::intersect(s[i], s[j]).empty();
            EXPECT_EQ(r.contains(j), overlaps) << "i=" << i << " j=" << j;
        }
    }
    EXPECT_THROW(kv.jointSupportRange(kv.numDofs()), IndexOutOfRangeException);
}

TEST(KnotVector, PartitionOfUnityAndZeroDerivativeSum) {
    const KnotVector kv(3, {0.0, 0.0, 0.0, 0.0, 0.2, 0.3, 0.7, 1.0, 1.0, 1.0, 1.0});
    const std::vector<Real> pts = samplePoints(kv, 41);
    const DerivativeTable t = kv.evaluateDerivatives(pts, 2);

    for (std::size_t q = 0; q < pts.size(); ++q) {
        Real value = 0.0;
        Real d1 = 0.0;
        Real d2 = 0.0;
        for (std::size_t i = 0; i < kv.numDofs(); ++i) {
            value += t(i, q, 0);
            d1 += t(i, q, 1);
            d2 += t(i, q, 2);
            EXPECT_GE(t(i, q, 0), -1e-14);
        }
        EXPECT_NEAR(value, 1.0, 1e-13);
        EXPECT_NEAR(d1, 0.0, 1e-10);
        EXPECT_NEAR(d2, 0.0, 1e-8);
    }
}

TEST(KnotVector, ValuesVanishOutsideSupport) {
    const KnotVector kv = KnotVector::openUniform(2, 4);
    const std::vector<Real> pts = samplePoints(kv, 33);
    const DerivativeTable t = kv.evaluateDerivatives(pts, 1);
    const auto& s = kv.meshSupport();
    const auto& mesh = kv.mesh();

    for (std::size_t i = 0; i < kv.numDofs(); ++i) {
        for (std::size_t q = 0; q < pts.size(); ++q) {
            if (pts[q] < mesh[s[i].first] || pts[q] > mesh[s[i].last]) {
                EXPECT_EQ(t(i, q, 0), 0.0);
                EXPECT_EQ(t(i, q, 1), 0.0);
            }
        }
    }
}

TEST(KnotVector, LinearDerivativesOnUniformMesh) {
    // Hat functions on [0, 1] with 4 elements: slopes are +-4
    const KnotVector kv = KnotVector::openUniform(1, 4);
    const std::vector<Real> pts{0.1, 0.375};
    const DerivativeTable t = kv.evaluateDerivatives(pts, 2);
    EXPECT_NEAR(t(0, 0, 0), 0.6, 1e-14);
    EXPECT_NEAR(t(0, 0, 1), -4.0, 1e-13);
    EXPECT_NEAR(t(1, 0, 1), 4.0, 1e-13);
    EXPECT_NEAR(t(2, 1, 0), 0.5, 1e-14);
    EXPECT_EQ(t(1, 0, 2), 0.0);
}

TEST(KnotVector, DerivativeAgainstFiniteDifference) {
    const KnotVector kv = KnotVector::openUniform(4, 3);
    const Real u = 0.41;
    const Real h = 1e-6;
    const std::vector<Real> pts{u - h, u, u + h};
    const DerivativeTable t = kv.evaluateDerivatives(pts, 1);
    for (std::size_t i = 0; i < kv.numDofs(); ++i) {
        const Real fd = (t(i, 2, 0) - t(i, 0, 0)) / (2.0 * h);
        EXPECT_NEAR(t(i, 1, 1), fd, 1e-6);
    }
}

TEST(KnotVector, RejectsPointOutsideDomain) {
    const KnotVector kv = KnotVector::openUniform(2, 3);
    const std::vector<Real> pts{1.5};
    EXPECT_THROW(kv.evaluateDerivatives(pts, 1), InvalidArgumentException);
}

TEST(DerivativeTable, RowLayout) {
    DerivativeTable t(3, 4, 2);
    EXPECT_EQ(t.pointStride(), 3u);
    t(1, 2, 1) = 5.0;
    EXPECT_DOUBLE_EQ(t.row(1, 2)[1], 5.0);
    EXPECT_DOUBLE_EQ(t.row(1, 0)[2 * t.pointStride() + 1], 5.0);
}
