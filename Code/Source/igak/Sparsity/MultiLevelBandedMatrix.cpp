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
 * @file MultiLevelBandedMatrix.cpp
 * @brief Candidate construction and CSR expansion of banded entries
 */

#include "Sparsity/MultiLevelBandedMatrix.h"
#include "Core/Exception.h"
#include <algorithm>
#include <map>
#include <utility>

namespace igak {
namespace sparsity {

AxisCandidates candidatesFromSupport(const std::vector<math::Interval>& support) {
    return candidatesFromSupport(support, support);
}

AxisCandidates candidatesFromSupport(const std::vector<math::Interval>& test_support,
                                     const std::vector<math::Interval>& trial_support) {
    AxisCandidates cands;
    const std::size_t n = trial_support.size();
    std::size_t start = 0;
    for (std::size_t i = 0; i < test_support.size(); ++i) {
        const math::Interval& s = test_support[i];
        // supports are sorted in both ends
        while (start < n && trial_support[start].last <= s.first) {
            ++start;
        }
        for (std::size_t j = start; j < n && trial_support[j].first < s.last; ++j) {
            if (!math::intersect(s, trial_support[j]).empty()) {
                cands.add(i, j);
            }
        }
    }
    return cands;
}

std::vector<std::size_t> transposeIndex(const AxisCandidates& candidates) {
    IGAK_THROW_IF(candidates.test.size() != candidates.trial.size(), InvalidArgumentException,
                  "transposeIndex: test and trial arrays differ in length");
    std::map<std::pair<std::size_t, std::size_t>, std::size_t> position;
    for (std::size_t mu = 0; mu < candidates.size(); ++mu) {
        position.emplace(std::make_pair(candidates.test[mu], candidates.trial[mu]), mu);
    }

    std::vector<std::size_t> transp(candidates.size());
    for (std::size_t mu = 0; mu < candidates.size(); ++mu) {
        const auto it = position.find(std::make_pair(candidates.trial[mu], candidates.test[mu]));
        IGAK_THROW_IF(it == position.end(), InvalidArgumentException,
                      "transposeIndex: candidate (" + std::to_string(candidates.test[mu]) + ", " +
                      std::to_string(candidates.trial[mu]) + ") has no mirrored pair");
        transp[mu] = it->second;
    }
    return transp;
}

// ============================================================================
// MultiLevelBandedMatrix
// ============================================================================

template<int Dim>
MultiLevelBandedMatrix<Dim>::MultiLevelBandedMatrix(std::array<AxisCandidates, Dim> candidates,
                                                    std::array<std::size_t, Dim> row_dofs,
                                                    std::array<std::size_t, Dim> col_dofs,
                                                    std::vector<Real> entries,
                                                    int num_components)
    : MultiLevelBandedMatrix(std::move(candidates), row_dofs, col_dofs, std::move(entries),
                             num_components, num_components) {}

template<int Dim>
MultiLevelBandedMatrix<Dim>::MultiLevelBandedMatrix(std::array<AxisCandidates, Dim> candidates,
                                                    std::array<std::size_t, Dim> row_dofs,
                                                    std::array<std::size_t, Dim> col_dofs,
                                                    std::vector<Real> entries,
                                                    int row_components,
                                                    int col_components)
    : candidates_(std::move(candidates)),
      row_dofs_(row_dofs),
      col_dofs_(col_dofs),
      entries_(std::move(entries)),
      row_nc_(static_cast<std::size_t>(std::max(row_components, 0))),
      col_nc_(static_cast<std::size_t>(std::max(col_components, 0))) {
    IGAK_CHECK_ARG(row_components >= 1 && col_components >= 1,
                   "MultiLevelBandedMatrix: at least one component required");
    for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
        const AxisCandidates& c = candidates_[k];
        IGAK_THROW_IF(c.test.size() != c.trial.size(), InvalidArgumentException,
                      "MultiLevelBandedMatrix: candidate arrays of axis " + std::to_string(k) +
                      " differ in length");
        for (std::size_t mu = 0; mu < c.size(); ++mu) {
            IGAK_CHECK_INDEX(c.test[mu], row_dofs_[k], "MultiLevelBandedMatrix: test candidate");
            IGAK_CHECK_INDEX(c.trial[mu], col_dofs_[k], "MultiLevelBandedMatrix: trial candidate");
        }
        positions_[k] = c.size();
    }
    IGAK_THROW_IF(entries_.size() != numPositions() * row_nc_ * col_nc_, InvalidArgumentException,
                  "MultiLevelBandedMatrix: " + std::to_string(entries_.size()) +
                  " entries for " + std::to_string(numPositions()) + " positions");
}

template<int Dim>
std::size_t MultiLevelBandedMatrix<Dim>::numPositions() const noexcept {
    return math::product(positions_);
}

template<int Dim>
const Real* MultiLevelBandedMatrix<Dim>::entry(std::size_t mu) const {
    IGAK_CHECK_INDEX(mu, numPositions(), "MultiLevelBandedMatrix::entry: position");
    return entries_.data() + mu * row_nc_ * col_nc_;
}

template<int Dim>
std::pair<GlobalIndex, GlobalIndex>
MultiLevelBandedMatrix<Dim>::globalIndex(std::size_t mu, int r, int c) const {
    const auto pos = math::multiIndex(mu, positions_);
    MultiIndex<Dim> row{};
    MultiIndex<Dim> col{};
    for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
        row[k] = candidates_[k].test[pos[k]];
        col[k] = candidates_[k].trial[pos[k]];
    }
    return {math::linearIndex(row, row_dofs_) * row_nc_ + static_cast<std::size_t>(r),
            math::linearIndex(col, col_dofs_) * col_nc_ + static_cast<std::size_t>(c)};
}

template<int Dim>
CsrMatrix MultiLevelBandedMatrix<Dim>::toSparse() const {
    const std::size_t n = numPositions();
    const std::size_t block = row_nc_ * col_nc_;
    Triplets triplets;
    triplets.reserve(n * block);
    for (std::size_t mu = 0; mu < n; ++mu) {
        for (std::size_t r = 0; r < row_nc_; ++r) {
            for (std::size_t c = 0; c < col_nc_; ++c) {
                const auto [row, col] = globalIndex(mu, static_cast<int>(r), static_cast<int>(c));
                triplets.add(row, col, entries_[mu * block + r * col_nc_ + c]);
            }
        }
    }
    return buildCsr(triplets, numRows(), numCols());
}

template class MultiLevelBandedMatrix<2>;
template class MultiLevelBandedMatrix<3>;

} // namespace sparsity
} // namespace igak
