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

#ifndef IGAK_SPARSITY_SPARSEMATRIXBUILDER_H
#define IGAK_SPARSITY_SPARSEMATRIXBUILDER_H

/**
 * @file SparseMatrixBuilder.h
 * @brief Coordinate triplets and their compression into a CSR matrix
 */

#include "Core/Types.h"
#include <Eigen/Sparse>
#include <span>
#include <vector>

namespace igak {
namespace sparsity {

using StorageIndex = int;

/// Compressed-row matrix produced by the assembly drivers
using CsrMatrix = Eigen::SparseMatrix<Real, Eigen::RowMajor, StorageIndex>;

/**
 * @brief (value, row, col) arrays in coordinate format
 */
struct Triplets {
    std::vector<Real> values;
    std::vector<GlobalIndex> rows;
    std::vector<GlobalIndex> cols;

    std::size_t size() const noexcept { return values.size(); }

    void reserve(std::size_t n) {
        values.reserve(n);
        rows.reserve(n);
        cols.reserve(n);
    }

    void add(GlobalIndex row, GlobalIndex col, Real value) {
        rows.push_back(row);
        cols.push_back(col);
        values.push_back(value);
    }

    void append(const Triplets& other);
};

/**
 * @brief Compress coordinate triplets into a CSR matrix
 *
 * Duplicate (row, col) pairs are summed. Every explicitly given pair is part
 * of the sparsity pattern, including zero values.
 *
 * @throws InvalidArgumentException if the arrays differ in length or the
 *         shape exceeds the storage index range
 * @throws IndexOutOfRangeException for a row or column outside the shape
 */
CsrMatrix buildCsr(std::span<const Real> values,
                   std::span<const GlobalIndex> rows,
                   std::span<const GlobalIndex> cols,
                   GlobalIndex n_rows,
                   GlobalIndex n_cols);

CsrMatrix buildCsr(const Triplets& triplets, GlobalIndex n_rows, GlobalIndex n_cols);

} // namespace sparsity
} // namespace igak

#endif // IGAK_SPARSITY_SPARSEMATRIXBUILDER_H
