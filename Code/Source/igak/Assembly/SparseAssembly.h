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

#ifndef IGAK_ASSEMBLY_SPARSEASSEMBLY_H
#define IGAK_ASSEMBLY_SPARSEASSEMBLY_H

/**
 * @file SparseAssembly.h
 * @brief Parallel drivers assembling a bilinear form into a sparse matrix
 *
 * Two strategies share the same symmetric exploitation. When the pool's
 * options request it and the form is symmetric, only pairs (I, J) with
 * J lexicographically not above I are computed and every off-diagonal value
 * is mirrored to (J, I) with its component block transposed.
 *
 * Rows belong to the test space and columns to the trial space, so forms
 * over distinct spaces give rectangular matrices.
 *
 *  - assembleSparse(): dense-neighbor traversal. For each test function the
 *    trial functions with intersecting support on every axis are visited;
 *    the first axis is split into chunks across the workers. Produces CSR.
 *  - assembleBanded(): per-axis candidate pairs; the entries are stored over
 *    the Cartesian product of candidate positions, the first axis is split
 *    across the workers. Produces a MultiLevelBandedMatrix.
 */

#include "Assembly/BaseAssembler.h"
#include "Assembly/WorkerPool.h"
#include "Sparsity/MultiLevelBandedMatrix.h"
#include "Sparsity/SparseMatrixBuilder.h"
#include <array>
#include <type_traits>

namespace igak {
namespace assembly {

/**
 * @brief Dense-neighbor assembly into a numRows() x numCols() CSR matrix
 *
 * @throws InvalidArgumentException for linear forms
 */
template<int Dim>
sparsity::CsrMatrix assembleSparse(const BaseAssembler<Dim>& assembler, const WorkerPool& pool);

/**
 * @brief Banded assembly with candidates derived from the mesh supports
 */
template<int Dim>
sparsity::MultiLevelBandedMatrix<Dim> assembleBanded(const BaseAssembler<Dim>& assembler,
                                                     const WorkerPool& pool);

/**
 * @brief Banded assembly over explicit per-axis candidates
 *
 * In symmetric mode every candidate array must contain the mirror of each
 * of its pairs. Dim is deduced from @p assembler only.
 */
template<int Dim>
sparsity::MultiLevelBandedMatrix<Dim> assembleBanded(
    const BaseAssembler<Dim>& assembler,
    const WorkerPool& pool,
    std::type_identity_t<std::array<sparsity::AxisCandidates, Dim>> candidates);

} // namespace assembly
} // namespace igak

#endif // IGAK_ASSEMBLY_SPARSEASSEMBLY_H
