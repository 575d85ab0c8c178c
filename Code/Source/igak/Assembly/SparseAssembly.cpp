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
 * @file SparseAssembly.cpp
 * @brief Dense-neighbor and banded-candidate assembly drivers
 */

#include "Assembly/SparseAssembly.h"
#include "Core/Exception.h"
#include "Core/Logger.h"
#include "Math/MultiIndex.h"

namespace igak {
namespace assembly {

namespace {

void log_assembly(bool verbose, const std::string& message) {
    if (verbose) {
        IGAK_LOG_INFO(message);
    } else {
        IGAK_LOG_DEBUG(message);
    }
}

std::size_t num_chunks(const WorkerPool& pool) {
    return static_cast<std::size_t>(pool.numWorkers() * pool.options().chunks_per_worker);
}

template<int Dim>
void require_bilinear(const BaseAssembler<Dim>& assembler, const char* driver) {
    IGAK_THROW_IF(assembler.arity() != Arity::Bilinear, InvalidArgumentException,
                  std::string(driver) + ": '" + assembler.name() +
                  "' is a linear form, use assembleVector()");
}

} // anonymous namespace

// ============================================================================
// Dense-neighbor strategy
// ============================================================================

template<int Dim>
sparsity::CsrMatrix assembleSparse(const BaseAssembler<Dim>& assembler, const WorkerPool& pool) {
    require_bilinear(assembler, "assembleSparse");

    const bool symmetric = pool.options().symmetric && assembler.isSymmetric();
    const auto& dofs = assembler.numDofsPerAxis(Space::Test);
    const auto& trial_dofs = assembler.numDofsPerAxis(Space::Trial);
    const auto nr = static_cast<std::size_t>(assembler.numComponents(Space::Test));
    const auto nc = static_cast<std::size_t>(assembler.numComponents(Space::Trial));
    const std::size_t block = nr * nc;

    Timer timer;
    timer.start();

    const auto chunks = WorkerPool::chunkRanges(dofs[0], num_chunks(pool));
    const auto parts = pool.map<sparsity::Triplets>(chunks.size(), [&](std::size_t chunk) {
        const WorkerAssembler<Dim> worker(assembler);
        const BaseAssembler<Dim>& a = worker.get();

        sparsity::Triplets triplets;
        std::vector<Real> values(block);

        MultiIndex<Dim> start{};
        MultiIndex<Dim> end = dofs;
        start[0] = chunks[chunk].first;
        end[0] = chunks[chunk].last;

        MultiIndex<Dim> I = start;
        do {
            MultiIndex<Dim> first{};
            MultiIndex<Dim> last{};
            for (int k = 0; k < Dim; ++k) {
                const math::Interval range = a.neighborRange(k, I[static_cast<std::size_t>(k)]);
                first[static_cast<std::size_t>(k)] = range.first;
                last[static_cast<std::size_t>(k)] = range.last;
            }

            const GlobalIndex li = math::linearIndex(I, dofs);
            MultiIndex<Dim> J = first;
            do {
                const GlobalIndex lj = math::linearIndex(J, trial_dofs);
                if (symmetric && lj > li) {
                    // J only grows from here
                    break;
                }
                a.entryBlock(I, J, values.data());
                for (std::size_t r = 0; r < nr; ++r) {
                    for (std::size_t c = 0; c < nc; ++c) {
                        const Real v = values[r * nc + c];
                        triplets.add(li * nr + r, lj * nc + c, v);
                        if (symmetric && lj != li) {
                            triplets.add(lj * nc + c, li * nr + r, v);
                        }
                    }
                }
            } while (math::nextLexicographic(J, first, last));
        } while (math::nextLexicographic(I, start, end));

        return triplets;
    });

    sparsity::Triplets all;
    std::size_t total = 0;
    for (const auto& part : parts) {
        total += part.size();
    }
    all.reserve(total);
    for (const auto& part : parts) {
        all.append(part);
    }

    const GlobalIndex rows = assembler.numRows();
    const GlobalIndex cols = assembler.numCols();
    sparsity::CsrMatrix matrix = sparsity::buildCsr(all, rows, cols);
    timer.stop();

    log_assembly(pool.options().verbose,
                 "Assembled sparse matrix '" + assembler.name() + "': " + std::to_string(rows) +
                 " x " + std::to_string(cols) + ", " + std::to_string(matrix.nonZeros()) +
                 " nonzeros, " + std::to_string(pool.numWorkers()) + " workers, " +
                 (symmetric ? "symmetric, " : "") + std::to_string(timer.elapsed()) + " s");
    return matrix;
}

// ============================================================================
// Banded-candidate strategy
// ============================================================================

template<int Dim>
sparsity::MultiLevelBandedMatrix<Dim> assembleBanded(const BaseAssembler<Dim>& assembler,
                                                     const WorkerPool& pool) {
    std::array<sparsity::AxisCandidates, Dim> candidates;
    for (int k = 0; k < Dim; ++k) {
        candidates[static_cast<std::size_t>(k)] =
            sparsity::candidatesFromSupport(assembler.meshSupport(k, Space::Test),
                                            assembler.meshSupport(k, Space::Trial));
    }
    return assembleBanded(assembler, pool, std::move(candidates));
}

template<int Dim>
sparsity::MultiLevelBandedMatrix<Dim> assembleBanded(
    const BaseAssembler<Dim>& assembler,
    const WorkerPool& pool,
    std::type_identity_t<std::array<sparsity::AxisCandidates, Dim>> candidates) {
    require_bilinear(assembler, "assembleBanded");

    const bool symmetric = pool.options().symmetric && assembler.isSymmetric();
    const auto& dofs = assembler.numDofsPerAxis(Space::Test);
    const auto& trial_dofs = assembler.numDofsPerAxis(Space::Trial);
    const auto nr = static_cast<std::size_t>(assembler.numComponents(Space::Test));
    const auto nc = static_cast<std::size_t>(assembler.numComponents(Space::Trial));
    const std::size_t block = nr * nc;

    std::array<std::size_t, Dim> sizes{};
    std::array<std::vector<std::size_t>, Dim> transp;
    for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
        const sparsity::AxisCandidates& c = candidates[k];
        IGAK_THROW_IF(c.size() == 0 || c.test.size() != c.trial.size(), InvalidArgumentException,
                      "assembleBanded: invalid candidate arrays on axis " + std::to_string(k));
        for (std::size_t mu = 0; mu < c.size(); ++mu) {
            IGAK_CHECK_INDEX(c.test[mu], dofs[k], "assembleBanded: test candidate");
            IGAK_CHECK_INDEX(c.trial[mu], trial_dofs[k], "assembleBanded: trial candidate");
        }
        sizes[k] = c.size();
        if (symmetric) {
            transp[k] = sparsity::transposeIndex(c);
        }
    }

    Timer timer;
    timer.start();

    std::vector<Real> entries(math::product(sizes) * block, Real(0));
    const auto chunks = WorkerPool::chunkRanges(sizes[0], num_chunks(pool));
    pool.parallelFor(chunks.size(), [&](std::size_t chunk) {
        const WorkerAssembler<Dim> worker(assembler);
        const BaseAssembler<Dim>& a = worker.get();

        std::array<std::size_t, Dim> start{};
        std::array<std::size_t, Dim> end = sizes;
        start[0] = chunks[chunk].first;
        end[0] = chunks[chunk].last;

        std::array<std::size_t, Dim> P = start;
        do {
            MultiIndex<Dim> I{};
            MultiIndex<Dim> J{};
            int diag_sign = 0;
            for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
                I[k] = candidates[k].test[P[k]];
                J[k] = candidates[k].trial[P[k]];
                if (diag_sign == 0 && J[k] != I[k]) {
                    diag_sign = J[k] > I[k] ? 1 : -1;
                }
            }
            if (symmetric && diag_sign > 0) {
                // filled from the mirrored position
                continue;
            }

            const std::size_t mu = math::linearIndex(P, sizes);
            Real* values = entries.data() + mu * block;
            a.entryBlock(I, J, values);

            if (symmetric && diag_sign != 0) {
                std::array<std::size_t, Dim> T{};
                for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
                    T[k] = transp[k][P[k]];
                }
                Real* mirror = entries.data() + math::linearIndex(T, sizes) * block;
                for (std::size_t r = 0; r < nr; ++r) {
                    for (std::size_t c = 0; c < nc; ++c) {
                        mirror[c * nc + r] = values[r * nc + c];
                    }
                }
            }
        } while (math::nextLexicographic(P, start, end));
    });
    timer.stop();

    log_assembly(pool.options().verbose,
                 "Assembled banded matrix '" + assembler.name() + "': " +
                 std::to_string(math::product(sizes)) + " candidate positions, " +
                 std::to_string(pool.numWorkers()) + " workers, " +
                 (symmetric ? "symmetric, " : "") + std::to_string(timer.elapsed()) + " s");

    return sparsity::MultiLevelBandedMatrix<Dim>(std::move(candidates), dofs, trial_dofs,
                                                 std::move(entries),
                                                 static_cast<int>(nr), static_cast<int>(nc));
}

template sparsity::CsrMatrix assembleSparse<2>(const BaseAssembler<2>&, const WorkerPool&);
template sparsity::CsrMatrix assembleSparse<3>(const BaseAssembler<3>&, const WorkerPool&);
template sparsity::MultiLevelBandedMatrix<2> assembleBanded<2>(const BaseAssembler<2>&, const WorkerPool&);
template sparsity::MultiLevelBandedMatrix<3> assembleBanded<3>(const BaseAssembler<3>&, const WorkerPool&);
template sparsity::MultiLevelBandedMatrix<2> assembleBanded<2>(
    const BaseAssembler<2>&, const WorkerPool&,
    std::type_identity_t<std::array<sparsity::AxisCandidates, 2>>);
template sparsity::MultiLevelBandedMatrix<3> assembleBanded<3>(
    const BaseAssembler<3>&, const WorkerPool&,
    std::type_identity_t<std::array<sparsity::AxisCandidates, 3>>);

} // namespace assembly
} // namespace igak
