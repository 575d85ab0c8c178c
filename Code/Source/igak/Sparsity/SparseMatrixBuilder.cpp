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
 * @file SparseMatrixBuilder.cpp
 * @brief Triplet-to-CSR compression on top of Eigen
 */

#include "Sparsity/SparseMatrixBuilder.h"
#include "Core/Exception.h"
#include <limits>

namespace igak {
namespace sparsity {

void Triplets::append(const Triplets& other) {
    values.insert(values.end(), other.values.begin(), other.values.end());
    rows.insert(rows.end(), other.rows.begin(), other.rows.end());
    cols.insert(cols.end(), other.cols.begin(), other.cols.end());
}

CsrMatrix buildCsr(std::span<const Real> values,
                   std::span<const GlobalIndex> rows,
                   std::span<const GlobalIndex> cols,
                   GlobalIndex n_rows,
                   GlobalIndex n_cols) {
    IGAK_THROW_IF(values.size() != rows.size() || values.size() != cols.size(),
                  InvalidArgumentException,
                  "buildCsr: " + std::to_string(values.size()) + " values, " +
                  std::to_string(rows.size()) + " rows and " +
                  std::to_string(cols.size()) + " cols");
    IGAK_THROW_IF(n_rows > static_cast<GlobalIndex>(std::numeric_limits<StorageIndex>::max()) ||
                      n_cols > static_cast<GlobalIndex>(std::numeric_limits<StorageIndex>::max()),
                  InvalidArgumentException,
                  "buildCsr: matrix dimensions exceed the storage index range");

    std::vector<Eigen::Triplet<Real, StorageIndex>> triplets;
    triplets.reserve(values.size());
    for (std::size_t k = 0; k < values.size(); ++k) {
        IGAK_CHECK_INDEX(rows[k], n_rows, "buildCsr: row index");
        IGAK_CHECK_INDEX(cols[k], n_cols, "buildCsr: column index");
        triplets.emplace_back(static_cast<StorageIndex>(rows[k]),
                              static_cast<StorageIndex>(cols[k]),
                              values[k]);
    }

    CsrMatrix mat(static_cast<StorageIndex>(n_rows), static_cast<StorageIndex>(n_cols));
    mat.setFromTriplets(triplets.begin(), triplets.end());
    mat.makeCompressed();
    return mat;
}

CsrMatrix buildCsr(const Triplets& triplets, GlobalIndex n_rows, GlobalIndex n_cols) {
    return buildCsr(triplets.values, triplets.rows, triplets.cols, n_rows, n_cols);
}

} // namespace sparsity
} // namespace igak
