/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_MultiLevelBandedMatrix.cpp
 * @brief Unit tests for per-axis candidates and banded entry storage
 */

#include <gtest/gtest.h>
#include "igak/Basis/KnotVector.h"
#include "igak/Core/Exception.h"
#include "igak/Sparsity/MultiLevelBandedMatrix.h"

#include <array>
#include <cstdlib>
#include <vector>

using namespace igak;
using namespace igak::sparsity;

TEST(AxisCandidates, FromSupportListsIntersectingPairsInOrder) {
    const basis::KnotVector kv = basis::KnotVector::openUniform(2, 5);
    const auto& s = kv.meshSupport();
    const AxisCandidates c = candidatesFromSupport(s);

    std::vector<std::pair<std::size_t, std::size_t>> expected;
    for (std::size_t i = 0; i < s.size(); ++i) {
        for (std::size_t j = 0; j < s.size(); ++j) {
            if (!math::intersect(s[i], s[j]).empty()) {
                expected.emplace_back(i, j);
            }
        }
    }
    ASSERT_EQ(c.size(), expected.size());
    for (std::size_t mu = 0; mu < c.size(); ++mu) {
        EXPECT_EQ(c.test[mu], expected[mu].first);
        EXPECT_EQ(c.trial[mu], expected[mu].second);
    }
}

TEST(AxisCandidates, BandwidthOfOpenUniformSpline) {
    // Degree p couples each function with at most 2p+1 neighbors
    const basis::KnotVector kv = basis::KnotVector::openUniform(3, 10);
    const AxisCandidates c = candidatesFromSupport(kv.meshSupport());
    for (std::size_t mu = 0; mu < c.size(); ++mu) {
        const auto d = static_cast<long>(c.test[mu]) - static_cast<long>(c.trial[mu]);
        EXPECT_LE(std::abs(d), 3);
    }
}

TEST(AxisCandidates, FromTwoSupportsPairsTestWithTrialFunctions) {
    const basis::KnotVector test = basis::KnotVector::openUniform(1, 4);
    const basis::KnotVector trial = basis::KnotVector::openUniform(3, 4);
    const auto& s = test.meshSupport();
    const auto& t = trial.meshSupport();
    const AxisCandidates c = candidatesFromSupport(s, t);

    std::vector<std::pair<std::size_t, std::size_t>> expected;
    for (std::size_t i = 0; i < s.size(); ++i) {
        for (std::size_t j = 0; j < t.size(); ++j) {
            if (!math::intersect(s[i], t[j]).empty()) {
                expected.emplace_back(i, j);
            }
        }
    }
    ASSERT_EQ(c.size(), expected.size());
    for (std::size_t mu = 0; mu < c.size(); ++mu) {
        EXPECT_EQ(c.test[mu], expected[mu].first);
        EXPECT_EQ(c.trial[mu], expected[mu].second);
    }
    EXPECT_LT(c.test.back(), test.numDofs());
    EXPECT_EQ(c.trial.back(), trial.numDofs() - 1);
}

TEST(TransposeIndex, MapsEachPairToItsMirror) {
    const basis::KnotVector kv = basis::KnotVector::openUniform(2, 4);
    const AxisCandidates c = candidatesFromSupport(kv.meshSupport());
    const std::vector<std::size_t> tr = transposeIndex(c);
    ASSERT_EQ(tr.size(), c.size());
    for (std::size_t mu = 0; mu < c.size(); ++mu) {
        EXPECT_EQ(c.test[tr[mu]], c.trial[mu]);
        EXPECT_EQ(c.trial[tr[mu]], c.test[mu]);
        EXPECT_EQ(tr[tr[mu]], mu);
    }
}

TEST(TransposeIndex, MissingMirrorThrows) {
    AxisCandidates c;
    c.add(0, 0);
    c.add(0, 1);
    EXPECT_THROW(transposeIndex(c), InvalidArgumentException);
}

TEST(MultiLevelBandedMatrix, GlobalIndexUsesLastAxisFastest) {
    AxisCandidates a0;
    a0.add(0, 0);
    a0.add(1, 0);
    AxisCandidates a1;
    a1.add(0, 1);
    a1.add(2, 2);
    a1.add(1, 0);

    std::vector<Real> entries(2 * 3 * 4);
    for (std::size_t k = 0; k < entries.size(); ++k) {
        entries[k] = static_cast<Real>(k + 1);
    }
    const MultiLevelBandedMatrix<2> m({a0, a1}, {2, 3}, {2, 3}, entries, 2);
    EXPECT_EQ(m.numPositions(), 6u);
    EXPECT_EQ(m.numRows(), 12u);
    EXPECT_EQ(m.rowComponents(), 2);
    EXPECT_EQ(m.colComponents(), 2);

    // mu = 4 -> (axis0 position 1, axis1 position 1): test (1, 2), trial (0, 2)
    const auto [row, col] = m.globalIndex(4, 1, 0);
    EXPECT_EQ(row, (1u * 3u + 2u) * 2u + 1u);
    EXPECT_EQ(col, (0u * 3u + 2u) * 2u + 0u);
    EXPECT_DOUBLE_EQ(m.entry(4)[2], 4.0 * 4.0 + 3.0);
}

TEST(MultiLevelBandedMatrix, ToSparseCarriesEveryBlockEntry) {
    AxisCandidates a0;
    a0.add(0, 0);
    a0.add(1, 1);
    AxisCandidates a1;
    a1.add(0, 0);
    a1.add(0, 1);
    const std::vector<Real> entries{1.0, 0.0, 2.0, 3.0};
    const MultiLevelBandedMatrix<2> m({a0, a1}, {2, 2}, {2, 2}, entries);

    const CsrMatrix A = m.toSparse();
    EXPECT_EQ(A.rows(), 4);
    EXPECT_EQ(A.nonZeros(), 4);
    EXPECT_DOUBLE_EQ(A.coeff(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(A.coeff(0, 1), 0.0);
    EXPECT_DOUBLE_EQ(A.coeff(2, 2), 2.0);
    EXPECT_DOUBLE_EQ(A.coeff(2, 3), 3.0);
}

TEST(MultiLevelBandedMatrix, RectangularBlocksUseRowAndColumnComponents) {
    AxisCandidates a0;
    a0.add(0, 1);
    a0.add(2, 0);
    AxisCandidates a1;
    a1.add(1, 2);

    // 1 row component by 2 column components per position
    const std::vector<Real> entries{1.0, 2.0, 3.0, 4.0};
    const MultiLevelBandedMatrix<2> m({a0, a1}, {3, 2}, {2, 3}, entries, 1, 2);
    EXPECT_EQ(m.numRows(), 6u);
    EXPECT_EQ(m.numCols(), 12u);
    EXPECT_EQ(m.rowComponents(), 1);
    EXPECT_EQ(m.colComponents(), 2);

    const CsrMatrix A = m.toSparse();
    ASSERT_EQ(A.rows(), 6);
    ASSERT_EQ(A.cols(), 12);
    // mu = 0: test (0, 1), trial (1, 2)
    EXPECT_DOUBLE_EQ(A.coeff(1, 10), 1.0);
    EXPECT_DOUBLE_EQ(A.coeff(1, 11), 2.0);
    // mu = 1: test (2, 1), trial (0, 2)
    EXPECT_DOUBLE_EQ(A.coeff(5, 4), 3.0);
    EXPECT_DOUBLE_EQ(A.coeff(5, 5), 4.0);
    EXPECT_EQ(A.nonZeros(), 4);

    EXPECT_THROW(MultiLevelBandedMatrix<2>({a0, a1}, {3, 2}, {2, 3}, entries, 2, 2),
                 InvalidArgumentException);
}

TEST(MultiLevelBandedMatrix, RejectsInconsistentInput) {
    AxisCandidates a;
    a.add(0, 0);
    AxisCandidates bad;
    bad.add(0, 5);
    EXPECT_THROW(MultiLevelBandedMatrix<2>({a, a}, {1, 1}, {1, 1}, {1.0, 2.0}), InvalidArgumentException);
    EXPECT_THROW(MultiLevelBandedMatrix<2>({a, bad}, {1, 1}, {1, 1}, {1.0}), IndexOutOfRangeException);
    EXPECT_THROW(MultiLevelBandedMatrix<2>({a, a}, {1, 1}, {1, 1}, {1.0}, 0), InvalidArgumentException);
}
