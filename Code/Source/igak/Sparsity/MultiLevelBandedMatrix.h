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

#ifndef IGAK_SPARSITY_MULTILEVELBANDEDMATRIX_H
#define IGAK_SPARSITY_MULTILEVELBANDEDMATRIX_H

/**
 * @file MultiLevelBandedMatrix.h
 * @brief Tensor-product sparsity described by per-axis candidate pairs
 *
 * On each axis a candidate array lists the (test, trial) pairs of 1D basis
 * functions that may couple. The candidate positions of all axes form a
 * Cartesian product; position mu (last axis fastest) stores the
 * component block of the entry for the corresponding tensor-product pair,
 * row components (test) by column components (trial), row-major.
 *
 * Row and column spaces may differ; candidate test indices refer to the row
 * basis and trial indices to the column basis.
 */

#include "Core/Types.h"
#include "Math/MultiIndex.h"
#include "Sparsity/SparseMatrixBuilder.h"
#include <array>
#include <vector>
#include <utility>

namespace igak {
namespace sparsity {

/**
 * @brief (test, trial) pairs of 1D basis functions on one axis
 */
struct AxisCandidates {
    std::vector<std::size_t> test;
    std::vector<std::size_t> trial;

    std::size_t size() const noexcept { return test.size(); }

    void add(std::size_t i, std::size_t j) {
        test.push_back(i);
        trial.push_back(j);
    }
};

/**
 * @brief All pairs whose mesh supports intersect, in lexicographic order
 */
AxisCandidates candidatesFromSupport(const std::vector<math::Interval>& support);

/**
 * @brief Pairs (i, j) of a test function i and a trial function j on the
 *        same mesh whose supports intersect, in lexicographic order
 */
AxisCandidates candidatesFromSupport(const std::vector<math::Interval>& test_support,
                                     const std::vector<math::Interval>& trial_support);

/**
 * @brief Position of the mirrored pair (j, i) for every candidate (i, j)
 *
 * @throws InvalidArgumentException if some mirrored pair is not a candidate
 */
std::vector<std::size_t> transposeIndex(const AxisCandidates& candidates);

template<int Dim>
class MultiLevelBandedMatrix {
public:
    MultiLevelBandedMatrix(std::array<AxisCandidates, Dim> candidates,
                           std::array<std::size_t, Dim> row_dofs,
                           std::array<std::size_t, Dim> col_dofs,
                           std::vector<Real> entries,
                           int num_components = 1);

    MultiLevelBandedMatrix(std::array<AxisCandidates, Dim> candidates,
                           std::array<std::size_t, Dim> row_dofs,
                           std::array<std::size_t, Dim> col_dofs,
                           std::vector<Real> entries,
                           int row_components,
                           int col_components);

    /// Global row count including components
    GlobalIndex numRows() const noexcept { return math::product(row_dofs_) * row_nc_; }
    GlobalIndex numCols() const noexcept { return math::product(col_dofs_) * col_nc_; }

    int rowComponents() const noexcept { return static_cast<int>(row_nc_); }
    int colComponents() const noexcept { return static_cast<int>(col_nc_); }

    /// Number of candidate positions (product over axes)
    std::size_t numPositions() const noexcept;

    const AxisCandidates& candidates(int axis) const { return candidates_[static_cast<std::size_t>(axis)]; }
    const std::vector<Real>& entries() const noexcept { return entries_; }

    /// rowComponents() x colComponents() block (row-major) at position @p mu
    const Real* entry(std::size_t mu) const;

    /// Global (row, col) of component (r, c) at position @p mu
    std::pair<GlobalIndex, GlobalIndex> globalIndex(std::size_t mu, int r, int c) const;

    /**
     * @brief Expand to CSR with the last-axis-fastest index convention
     */
    CsrMatrix toSparse() const;

private:
    std::array<AxisCandidates, Dim> candidates_;
    std::array<std::size_t, Dim> row_dofs_;
    std::array<std::size_t, Dim> col_dofs_;
    std::array<std::size_t, Dim> positions_{};
    std::vector<Real> entries_;
    std::size_t row_nc_;
    std::size_t col_nc_;
};

extern template class MultiLevelBandedMatrix<2>;
extern template class MultiLevelBandedMatrix<3>;

} // namespace sparsity
} // namespace igak

#endif // IGAK_SPARSITY_MULTILEVELBANDEDMATRIX_H
