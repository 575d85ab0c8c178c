/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_SparseAssembly.cpp
 * @brief Unit tests for the dense-neighbor and banded-candidate assembly drivers
 */

#include <gtest/gtest.h>
#include "igak/Assembly/FormAssembler.h"
#include "igak/Assembly/SparseAssembly.h"
#include "igak/Core/Exception.h"
#include "Tests/Unit/ReferenceIntegration.h"

#include <Eigen/Dense>
#include <array>
#include <cmath>
#include <span>
#include <vector>

using namespace igak;
using namespace igak::assembly;
using namespace igak::forms;

namespace {

std::array<basis::KnotVector, 2> bases2D() {
    return {basis::KnotVector::openUniform(3, 3),
            basis::KnotVector::openUniform(2, 4)};
}

std::array<basis::KnotVector, 3> bases3D() {
    return {basis::KnotVector::openUniform(2, 2),
            basis::KnotVector::openUniform(1, 3),
            basis::KnotVector::openUniform(2, 2)};
}

WorkerPool makePool(int threads, bool symmetric = true) {
    AssemblyOptions options;
    options.num_threads = threads;
    options.symmetric = symmetric;
    return WorkerPool(options);
}

Eigen::MatrixXd dense(const sparsity::CsrMatrix& m) {
    return Eigen::MatrixXd(m);
}

template<int Dim>
Eigen::MatrixXd entryMatrix(const BaseAssembler<Dim>& a) {
    const auto rows = static_cast<Eigen::Index>(a.numRows());
    const auto cols = static_cast<Eigen::Index>(a.numCols());
    Eigen::MatrixXd m(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        for (Eigen::Index j = 0; j < cols; ++j) {
            m(i, j) = a.entry(static_cast<GlobalIndex>(i), static_cast<GlobalIndex>(j));
        }
    }
    return m;
}

/// Stored positions expected from support overlap, explicit zeros included
template<int Dim>
Eigen::Index expectedNonZeros(const BaseAssembler<Dim>& a) {
    Eigen::Index total = 0;
    for (GlobalIndex k = 0; k < a.numBasisFunctions(Space::Test); ++k) {
        const auto I = math::multiIndex(k, a.numDofsPerAxis(Space::Test));
        Eigen::Index neighbors = 1;
        for (int axis = 0; axis < Dim; ++axis) {
            neighbors *= static_cast<Eigen::Index>(
                a.neighborRange(axis, I[static_cast<std::size_t>(axis)]).size());
        }
        total += neighbors;
    }
    return total * a.numSlots();
}

Real source(std::span<const Real> x) {
    return x[0];
}

} // namespace

TEST(AssembleSparse, MatchesEntryQueries) {
    const geometry::QuarterAnnulusMap geo(1.0, 2.0);
    const FormAssembler<2> stiff(StiffnessForm{}, bases2D(), geo);

    const sparsity::CsrMatrix K = assembleSparse(stiff, makePool(1));
    ASSERT_EQ(static_cast<GlobalIndex>(K.rows()), stiff.numDofs());
    ASSERT_EQ(static_cast<GlobalIndex>(K.cols()), stiff.numDofs());
    EXPECT_EQ(K.nonZeros(), expectedNonZeros(stiff));

    const Eigen::MatrixXd reference = entryMatrix(stiff);
    EXPECT_LE((dense(K) - reference).cwiseAbs().maxCoeff(), 1e-13 * reference.cwiseAbs().maxCoeff());
}

TEST(AssembleSparse, SymmetricModeMatchesFullMode) {
    const geometry::QuarterAnnulusMap geo(1.0, 2.0);
    const FormAssembler<2> mass(MassForm{}, bases2D(), geo);

    const Eigen::MatrixXd half = dense(assembleSparse(mass, makePool(1, true)));
    const Eigen::MatrixXd full = dense(assembleSparse(mass, makePool(1, false)));
    EXPECT_LE((half - full).cwiseAbs().maxCoeff(), 1e-15);
    EXPECT_EQ((half - half.transpose()).cwiseAbs().maxCoeff(), 0.0);
}

TEST(AssembleSparse, WorkerCountDoesNotChangeResult) {
    const geometry::QuarterAnnulusMap geo(1.0, 2.0);
    const FormAssembler<2> heat(HeatForm{}, bases2D(), geo);

    const sparsity::CsrMatrix serial = assembleSparse(heat, makePool(1));
    const sparsity::CsrMatrix parallel = assembleSparse(heat, makePool(4));
    EXPECT_EQ(serial.nonZeros(), parallel.nonZeros());
    EXPECT_EQ((dense(serial) - dense(parallel)).cwiseAbs().maxCoeff(), 0.0);
}

TEST(AssembleSparse, SymmetricModeWorkerCountDoesNotChangeResult) {
    const geometry::QuarterAnnulusMap geo(1.0, 2.0);
    const FormAssembler<2> stiff(StiffnessForm{}, bases2D(), geo);
    ASSERT_TRUE(stiff.isSymmetric());

    const sparsity::CsrMatrix serial = assembleSparse(stiff, makePool(1, true));
    const sparsity::CsrMatrix parallel = assembleSparse(stiff, makePool(5, true));
    EXPECT_EQ(serial.nonZeros(), parallel.nonZeros());
    EXPECT_EQ((dense(serial) - dense(parallel)).cwiseAbs().maxCoeff(), 0.0);
}

TEST(AssembleSparse, SeparateSpacesMatchBruteForce) {
    const geometry::QuarterAnnulusMap geo(1.0, 2.0);
    const auto trial_bases = bases2D();
    const std::array<basis::KnotVector, 2> test_bases{basis::KnotVector::openUniform(2, 3),
                                                      basis::KnotVector::openUniform(1, 4)};
    const FormAssembler<2> mass(MassForm{}, trial_bases, test_bases, geo);
    ASSERT_EQ(mass.numRows(), 5u * 5u);
    ASSERT_EQ(mass.numCols(), 6u * 6u);

    const test::ReferenceIntegrator<2> ref(trial_bases, test_bases, geo, 0);
    Eigen::MatrixXd reference(static_cast<Eigen::Index>(mass.numRows()),
                              static_cast<Eigen::Index>(mass.numCols()));
    for (GlobalIndex i = 0; i < mass.numRows(); ++i) {
        const auto I = mass.fromLinearIndex(i, nullptr, Space::Test);
        for (GlobalIndex j = 0; j < mass.numCols(); ++j) {
            const auto J = mass.fromLinearIndex(j, nullptr, Space::Trial);
            reference(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = ref.integrate(
                [&](const test::ReferenceIntegrator<2>::Point& p) {
                    return p.weight * p.value(J) * p.testValue(I);
                });
        }
    }
    const Real scale = reference.cwiseAbs().maxCoeff();

    for (int threads : {1, 3}) {
        const WorkerPool pool = makePool(threads, true);
        const sparsity::CsrMatrix M = assembleSparse(mass, pool);
        ASSERT_EQ(M.rows(), reference.rows());
        ASSERT_EQ(M.cols(), reference.cols());
        EXPECT_EQ(M.nonZeros(), expectedNonZeros(mass));
        EXPECT_LE((dense(M) - reference).cwiseAbs().maxCoeff(), 1e-13 * scale);

        const auto banded = assembleBanded(mass, pool);
        EXPECT_EQ(banded.numRows(), mass.numRows());
        EXPECT_EQ(banded.numCols(), mass.numCols());
        EXPECT_LE((dense(banded.toSparse()) - reference).cwiseAbs().maxCoeff(), 1e-13 * scale);
    }
}

TEST(AssembleSparse, VectorFormBlocks) {
    const geometry::BoxMap geo({0.0, 0.0, 0.0}, {1.0, 2.0, 0.5});
    const FormAssembler<3> divdiv(DivDivForm{}, bases3D(), geo);
    ASSERT_EQ(divdiv.numComponents(), 3);

    const sparsity::CsrMatrix A = assembleSparse(divdiv, makePool(2));
    EXPECT_EQ(A.nonZeros(), expectedNonZeros(divdiv));

    const Eigen::MatrixXd M = dense(A);
    const Real scale = M.cwiseAbs().maxCoeff();
    EXPECT_LE((M - M.transpose()).cwiseAbs().maxCoeff(), 1e-15 * scale);

    const MultiIndex<3> I{1, 2, 0};
    const MultiIndex<3> J{2, 1, 1};
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            const auto row = static_cast<Eigen::Index>(divdiv.toLinearIndex(I, r));
            const auto col = static_cast<Eigen::Index>(divdiv.toLinearIndex(J, c));
            EXPECT_NEAR(M(row, col), divdiv.entry(static_cast<GlobalIndex>(row),
                                                  static_cast<GlobalIndex>(col)), 1e-14 * scale);
        }
    }
}

TEST(AssembleSparse, RejectsLinearForms) {
    const geometry::IdentityMap geo(2);
    const FormAssembler<2> load(LoadForm(source), bases2D(), geo);
    EXPECT_THROW(assembleSparse(load, makePool(1)), InvalidArgumentException);
    EXPECT_THROW(assembleBanded(load, makePool(1)), InvalidArgumentException);
}

TEST(AssembleBanded, ExpandsToSparseResult) {
    const geometry::QuarterAnnulusMap geo(1.0, 2.0);
    for (const bool symmetric : {true, false}) {
        const FormAssembler<2> stiff(StiffnessForm{}, bases2D(), geo);
        const WorkerPool pool = makePool(3, symmetric);

        const auto banded = assembleBanded(stiff, pool);
        EXPECT_EQ(banded.numRows(), stiff.numDofs());
        EXPECT_EQ(banded.rowComponents(), 1);
        EXPECT_EQ(banded.colComponents(), 1);

        const Eigen::MatrixXd fromBanded = dense(banded.toSparse());
        const Eigen::MatrixXd fromSparse = dense(assembleSparse(stiff, pool));
        const Real scale = fromSparse.cwiseAbs().maxCoeff();
        EXPECT_LE((fromBanded - fromSparse).cwiseAbs().maxCoeff(), 1e-13 * scale)
            << (symmetric ? "symmetric" : "full");
    }
}

TEST(AssembleBanded, WorkerCountDoesNotChangeResult) {
    const geometry::QuarterAnnulusMap geo(1.0, 2.0);
    const FormAssembler<2> stiff(StiffnessForm{}, bases2D(), geo);
    ASSERT_TRUE(stiff.isSymmetric());

    const auto serial = assembleBanded(stiff, makePool(1, true));
    const auto parallel = assembleBanded(stiff, makePool(5, true));
    ASSERT_EQ(serial.numPositions(), parallel.numPositions());
    EXPECT_EQ(serial.entries(), parallel.entries());
    EXPECT_EQ((dense(serial.toSparse()) - dense(parallel.toSparse())).cwiseAbs().maxCoeff(), 0.0);
}

TEST(AssembleBanded, NonSymmetricFormIgnoresSymmetricOption) {
    const geometry::QuarterAnnulusMap geo(1.0, 2.0);
    const FormAssembler<2> wave(WaveForm{}, bases2D(), geo);

    const auto banded = assembleBanded(wave, makePool(2, true));
    const Eigen::MatrixXd reference = entryMatrix(wave);
    EXPECT_LE((dense(banded.toSparse()) - reference).cwiseAbs().maxCoeff(),
              1e-13 * reference.cwiseAbs().maxCoeff());
}

TEST(AssembleBanded, VectorFormMatchesSparse) {
    const geometry::BoxMap geo({0.0, 0.0, 0.0}, {1.0, 2.0, 0.5});
    const FormAssembler<3> divdiv(DivDivForm{}, bases3D(), geo);
    const WorkerPool pool = makePool(4);

    const auto banded = assembleBanded(divdiv, pool);
    EXPECT_EQ(banded.rowComponents(), 3);
    EXPECT_EQ(banded.colComponents(), 3);
    const Eigen::MatrixXd a = dense(banded.toSparse());
    const Eigen::MatrixXd b = dense(assembleSparse(divdiv, pool));
    EXPECT_LE((a - b).cwiseAbs().maxCoeff(), 1e-14 * b.cwiseAbs().maxCoeff());
}

TEST(AssembleBanded, CustomCandidates) {
    const geometry::IdentityMap geo(2);
    const FormAssembler<2> mass(MassForm{}, bases2D(), geo);
    const auto& dofs = mass.numDofsPerAxis();

    std::array<sparsity::AxisCandidates, 2> diagonal;
    for (std::size_t k = 0; k < 2; ++k) {
        for (std::size_t i = 0; i < dofs[k]; ++i) {
            diagonal[k].add(i, i);
        }
    }
    const auto banded = assembleBanded(mass, makePool(2), diagonal);
    EXPECT_EQ(banded.numPositions(), mass.numBasisFunctions());

    const sparsity::CsrMatrix D = banded.toSparse();
    EXPECT_EQ(static_cast<GlobalIndex>(D.nonZeros()), mass.numDofs());
    for (GlobalIndex i = 0; i < mass.numDofs(); ++i) {
        EXPECT_NEAR(D.coeff(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(i)),
                    mass.entry(i, i), 1e-15);
    }
}

TEST(AssembleBanded, InvalidCandidates) {
    const geometry::IdentityMap geo(2);
    const FormAssembler<2> mass(MassForm{}, bases2D(), geo);

    std::array<sparsity::AxisCandidates, 2> empty;
    empty[0].add(0, 0);
    EXPECT_THROW(assembleBanded(mass, makePool(1), empty), InvalidArgumentException);

    std::array<sparsity::AxisCandidates, 2> outside;
    outside[0].add(0, 0);
    outside[1].add(0, mass.numDofsPerAxis()[1]);
    EXPECT_THROW(assembleBanded(mass, makePool(1), outside), IndexOutOfRangeException);
}
