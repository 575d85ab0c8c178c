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
 * @file BaseAssembler.cpp
 * @brief Index mapping, single and batched entry queries
 */

#include "Assembly/BaseAssembler.h"
#include "Core/Exception.h"
#include "Core/Logger.h"
#include <algorithm>

namespace igak {
namespace assembly {

template<int Dim>
BaseAssembler<Dim>::BaseAssembler(std::array<std::size_t, Dim> num_dofs,
                                  Arity arity,
                                  int num_components,
                                  bool symmetric)
    : BaseAssembler(num_dofs, num_dofs, arity, num_components, num_components, symmetric) {}

template<int Dim>
BaseAssembler<Dim>::BaseAssembler(std::array<std::size_t, Dim> test_dofs,
                                  std::array<std::size_t, Dim> trial_dofs,
                                  Arity arity,
                                  int test_components,
                                  int trial_components,
                                  bool symmetric)
    : test_{test_dofs, test_components},
      trial_{trial_dofs, trial_components},
      arity_(arity),
      symmetric_(symmetric) {
    IGAK_CHECK_ARG(test_components >= 1 && trial_components >= 1,
                   "BaseAssembler: at least one component required");
    for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
        IGAK_CHECK_ARG(test_dofs[k] > 0 && trial_dofs[k] > 0, "BaseAssembler: empty basis on some axis");
    }
    IGAK_THROW_IF(symmetric && (test_dofs != trial_dofs || test_components != trial_components),
                  InvalidArgumentException,
                  "BaseAssembler: a symmetric form needs identical test and trial spaces");
}

template<int Dim>
void BaseAssembler<Dim>::checkIndex(const Index& I, Space space) const {
    const auto& dofs = layout(space).num_dofs;
    for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
        IGAK_CHECK_INDEX(I[k], dofs[k], "BaseAssembler: basis index on axis " + std::to_string(k));
    }
}

// ============================================================================
// Index mapping
// ============================================================================

template<int Dim>
GlobalIndex BaseAssembler<Dim>::toLinearIndex(const Index& I, int comp, Space space) const {
    checkIndex(I, space);
    const Layout& l = layout(space);
    IGAK_CHECK_INDEX(comp, l.num_components, "BaseAssembler::toLinearIndex: component");
    return math::linearIndex(I, l.num_dofs) * static_cast<GlobalIndex>(l.num_components) +
           static_cast<GlobalIndex>(comp);
}

template<int Dim>
typename BaseAssembler<Dim>::Index
BaseAssembler<Dim>::fromLinearIndex(GlobalIndex k, int* comp, Space space) const {
    IGAK_CHECK_INDEX(k, numDofs(space), "BaseAssembler::fromLinearIndex: global index");
    const Layout& l = layout(space);
    const auto nc = static_cast<GlobalIndex>(l.num_components);
    if (comp != nullptr) {
        *comp = static_cast<int>(k % nc);
    }
    return math::multiIndex(k / nc, l.num_dofs);
}

// ============================================================================
// Entry queries
// ============================================================================

template<int Dim>
void BaseAssembler<Dim>::entryBlock(const Index& test, const Index& trial, Real* out) const {
    IGAK_CHECK_NOT_NULL(out, "entryBlock output");
    checkIndex(test, Space::Test);
    checkIndex(trial, Space::Trial);
    IGAK_THROW_IF(arity_ != Arity::Bilinear, InvalidArgumentException,
                  "entryBlock: '" + name() + "' is a linear form");
    entryImpl(test, trial, out);
}

template<int Dim>
void BaseAssembler<Dim>::entry1Block(const Index& test, Real* out) const {
    IGAK_CHECK_NOT_NULL(out, "entry1Block output");
    checkIndex(test, Space::Test);
    IGAK_THROW_IF(arity_ != Arity::Linear, InvalidArgumentException,
                  "entry1Block: '" + name() + "' is a bilinear form");
    entry1Impl(test, out);
}

template<int Dim>
Real BaseAssembler<Dim>::entry(GlobalIndex i, GlobalIndex j) const {
    int r = 0;
    int c = 0;
    const Index test = fromLinearIndex(i, &r, Space::Test);
    const Index trial = fromLinearIndex(j, &c, Space::Trial);
    if (arity_ != Arity::Bilinear) {
        return Real(0);
    }
    std::vector<Real> block(static_cast<std::size_t>(numSlots()));
    entryImpl(test, trial, block.data());
    return block[static_cast<std::size_t>(r * trial_.num_components + c)];
}

template<int Dim>
Real BaseAssembler<Dim>::entry1(GlobalIndex i) const {
    int r = 0;
    const Index test = fromLinearIndex(i, &r, Space::Test);
    if (arity_ != Arity::Linear) {
        return Real(0);
    }
    std::vector<Real> values(static_cast<std::size_t>(numSlots()));
    entry1Impl(test, values.data());
    return values[static_cast<std::size_t>(r)];
}

template<int Dim>
std::vector<Real> BaseAssembler<Dim>::multiEntries(const std::vector<IndexPair>& pairs,
                                                   const WorkerPool* pool) const {
    // validate up front so that no worker starts on a bad batch
    for (const auto& [i, j] : pairs) {
        IGAK_CHECK_INDEX(i, numRows(), "multiEntries: row index");
        IGAK_CHECK_INDEX(j, numCols(), "multiEntries: column index");
    }

    auto run = [&pairs](const BaseAssembler& a, math::Interval range) {
        std::vector<Real> values;
        values.reserve(range.size());
        for (std::size_t p = range.first; p < range.last; ++p) {
            values.push_back(a.entry(pairs[p].first, pairs[p].second));
        }
        return values;
    };

    if (pool == nullptr || pool->numWorkers() <= 1 ||
        pairs.size() < pool->options().serial_threshold) {
        return run(*this, math::Interval{0, pairs.size()});
    }

    const auto chunks = WorkerPool::chunkRanges(pairs.size(), static_cast<std::size_t>(pool->numWorkers()));
    const auto parts = pool->map<std::vector<Real>>(chunks.size(), [&](std::size_t c) {
        const WorkerAssembler<Dim> worker(*this);
        return run(worker.get(), chunks[c]);
    });

    std::vector<Real> values;
    values.reserve(pairs.size());
    for (const auto& part : parts) {
        values.insert(values.end(), part.begin(), part.end());
    }
    return values;
}

template<int Dim>
std::vector<Real> BaseAssembler<Dim>::assembleVector(const WorkerPool* pool) const {
    IGAK_THROW_IF(arity_ != Arity::Linear, InvalidArgumentException,
                  "assembleVector: '" + name() + "' is a bilinear form");
    const GlobalIndex n = numBasisFunctions(Space::Test);
    const auto nc = static_cast<std::size_t>(test_.num_components);
    std::vector<Real> result(n * nc, Real(0));

    auto run = [this, &result, nc](const BaseAssembler& a, math::Interval range) {
        for (std::size_t k = range.first; k < range.last; ++k) {
            const Index I = math::multiIndex(k, test_.num_dofs);
            a.entry1Impl(I, result.data() + k * nc);
        }
    };

    Timer timer;
    timer.start();
    if (pool == nullptr || pool->numWorkers() <= 1) {
        run(*this, math::Interval{0, n});
    } else {
        const auto chunks = WorkerPool::chunkRanges(
            n, static_cast<std::size_t>(pool->numWorkers() * pool->options().chunks_per_worker));
        pool->parallelFor(chunks.size(), [&](std::size_t c) {
            const WorkerAssembler<Dim> worker(*this);
            run(worker.get(), chunks[c]);
        });
    }
    timer.stop();

    IGAK_LOG_DEBUG("Assembled vector '" + name() + "': " + std::to_string(result.size()) +
                   " entries in " + std::to_string(timer.elapsed()) + " s");
    return result;
}

// ============================================================================
// Support structure / worker capability
// ============================================================================

template<int Dim>
math::Interval BaseAssembler<Dim>::neighborRange(int axis, std::size_t i) const {
    IGAK_CHECK_INDEX(axis, Dim, "neighborRange: axis");
    const auto& test_support = meshSupport(axis, Space::Test);
    IGAK_CHECK_INDEX(i, test_support.size(), "neighborRange: basis index");
    const math::Interval s = test_support[i];
    const auto& support = meshSupport(axis, Space::Trial);
    // supports are sorted in both ends
    const auto lo = std::partition_point(support.begin(), support.end(),
        [&s](const math::Interval& t) { return t.last <= s.first; });
    const auto hi = std::partition_point(lo, support.end(),
        [&s](const math::Interval& t) { return t.first < s.last; });
    return math::Interval{static_cast<std::size_t>(lo - support.begin()),
                          static_cast<std::size_t>(hi - support.begin())};
}

template<int Dim>
std::unique_ptr<BaseAssembler<Dim>> BaseAssembler<Dim>::cloneForWorker() const {
    IGAK_NOT_IMPLEMENTED("cloneForWorker for assembler '" + name() + "'");
}

template<int Dim>
WorkerAssembler<Dim>::WorkerAssembler(const BaseAssembler<Dim>& assembler)
    : assembler_(&assembler) {
    if (!assembler.isThreadSafe()) {
        clone_ = assembler.cloneForWorker();
        IGAK_CHECK_NOT_NULL(clone_.get(), "cloneForWorker result");
        assembler_ = clone_.get();
    }
}

template class BaseAssembler<2>;
template class BaseAssembler<3>;
template class WorkerAssembler<2>;
template class WorkerAssembler<3>;

} // namespace assembly
} // namespace igak
