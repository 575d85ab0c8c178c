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

#ifndef IGAK_ASSEMBLY_BASEASSEMBLER_H
#define IGAK_ASSEMBLY_BASEASSEMBLER_H

/**
 * @file BaseAssembler.h
 * @brief Index mapping and entry queries shared by every assembler
 *
 * A tensor-product basis function is identified by its multi-index I (one
 * 1D index per axis). Multi-indices are linearized with the last axis
 * varying fastest; for vector-valued forms the component index is appended
 * as the fastest index, so the global index of (I, comp) is
 * linear(I) * numComponents() + comp.
 *
 * Rows are indexed by the test space and columns by the trial space. The
 * two spaces may differ in their bases (on a common mesh) and in their
 * component counts; a bilinear block then has numComponents(Space::Test)
 * rows and numComponents(Space::Trial) columns. Linear forms only use the
 * test space. Queries that take a Space default to the test space.
 *
 * Thread safety: the default assembler is immutable after construction and
 * can be shared by all workers. An implementation that keeps mutable state
 * returns false from isThreadSafe() and must provide cloneForWorker(), which
 * creates an independent instance sharing only read-only tables.
 */

#include "Assembly/WorkerPool.h"
#include "Core/Types.h"
#include "Math/MultiIndex.h"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace igak {
namespace assembly {

enum class Space : std::uint8_t {
    Trial,
    Test
};

template<int Dim>
class BaseAssembler {
public:
    using Index = MultiIndex<Dim>;
    using IndexPair = std::pair<GlobalIndex, GlobalIndex>;

    virtual ~BaseAssembler() = default;

    virtual std::string name() const { return "assembler"; }

    const std::array<std::size_t, Dim>& numDofsPerAxis(Space space = Space::Test) const noexcept {
        return layout(space).num_dofs;
    }

    /// Number of tensor-product basis functions
    GlobalIndex numBasisFunctions(Space space = Space::Test) const noexcept {
        return math::product(layout(space).num_dofs);
    }

    /// Number of global unknowns (basis functions times components)
    GlobalIndex numDofs(Space space = Space::Test) const noexcept {
        return numBasisFunctions(space) * static_cast<GlobalIndex>(layout(space).num_components);
    }

    GlobalIndex numRows() const noexcept { return numDofs(Space::Test); }
    GlobalIndex numCols() const noexcept { return numDofs(Space::Trial); }

    Arity arity() const noexcept { return arity_; }
    int numComponents(Space space = Space::Test) const noexcept { return layout(space).num_components; }
    bool isSymmetric() const noexcept { return symmetric_; }

    /// Values produced per entry query: nc_test * nc_trial (bilinear) or nc_test (linear)
    int numSlots() const noexcept {
        const int nr = test_.num_components;
        return arity_ == Arity::Bilinear ? nr * trial_.num_components : nr;
    }

    // =========================================================================
    // Index mapping
    // =========================================================================

    /**
     * @brief Global index of component @p comp of basis function @p I
     *
     * @throws IndexOutOfRangeException for an index outside the basis
     */
    GlobalIndex toLinearIndex(const Index& I, int comp = 0, Space space = Space::Test) const;

    /**
     * @brief Inverse of toLinearIndex()
     *
     * @param comp If non-null, receives the component index
     */
    Index fromLinearIndex(GlobalIndex k, int* comp = nullptr, Space space = Space::Test) const;

    // =========================================================================
    // Entry queries
    // =========================================================================

    /**
     * @brief Matrix entry for test dof @p i (row) and trial dof @p j (column)
     *
     * Zero for linear forms.
     */
    Real entry(GlobalIndex i, GlobalIndex j) const;

    /// Load vector entry for test dof @p i; zero for bilinear forms
    Real entry1(GlobalIndex i) const;

    /// Component block (numSlots() values, row-major) for a basis pair
    void entryBlock(const Index& test, const Index& trial, Real* out) const;

    /// Component values (numSlots()) of the linear form for one basis function
    void entry1Block(const Index& test, Real* out) const;

    /**
     * @brief entry() for every pair, results in the order of @p pairs
     *
     * Runs on the calling thread when @p pool is null or the batch is
     * smaller than the pool's serial threshold.
     */
    std::vector<Real> multiEntries(const std::vector<IndexPair>& pairs,
                                   const WorkerPool* pool = nullptr) const;

    /**
     * @brief Full load vector, numRows() values with the component fastest
     *
     * @throws InvalidArgumentException for bilinear forms
     */
    std::vector<Real> assembleVector(const WorkerPool* pool = nullptr) const;

    // =========================================================================
    // Support structure
    // =========================================================================

    /// Mesh-element interval of every 1D basis function of @p space on @p axis
    virtual const std::vector<math::Interval>& meshSupport(int axis, Space space) const = 0;

    /**
     * @brief 1D trial functions on @p axis whose support intersects that
     *        of test function @p i
     */
    virtual math::Interval neighborRange(int axis, std::size_t i) const;

    // =========================================================================
    // Worker capability
    // =========================================================================

    /// Whether one instance may serve concurrent queries
    virtual bool isThreadSafe() const noexcept { return true; }

    /**
     * @brief Independent instance for one worker
     *
     * Required when isThreadSafe() is false.
     */
    virtual std::unique_ptr<BaseAssembler> cloneForWorker() const;

protected:
    /// Test and trial space share @p num_dofs and @p num_components
    BaseAssembler(std::array<std::size_t, Dim> num_dofs,
                  Arity arity,
                  int num_components,
                  bool symmetric);

    /**
     * @throws InvalidArgumentException if @p symmetric is requested for
     *         spaces of different shape
     */
    BaseAssembler(std::array<std::size_t, Dim> test_dofs,
                  std::array<std::size_t, Dim> trial_dofs,
                  Arity arity,
                  int test_components,
                  int trial_components,
                  bool symmetric);

    BaseAssembler(const BaseAssembler&) = default;

    virtual void entryImpl(const Index& test, const Index& trial, Real* out) const = 0;
    virtual void entry1Impl(const Index& test, Real* out) const = 0;

    void checkIndex(const Index& I, Space space) const;

private:
    struct Layout {
        std::array<std::size_t, Dim> num_dofs{};
        int num_components = 1;
    };

    const Layout& layout(Space space) const noexcept {
        return space == Space::Trial ? trial_ : test_;
    }

    Layout test_;
    Layout trial_;
    Arity arity_;
    bool symmetric_;
};

/**
 * @brief Holds a worker-private clone when @p assembler is not thread safe
 */
template<int Dim>
class WorkerAssembler {
public:
    explicit WorkerAssembler(const BaseAssembler<Dim>& assembler);

    const BaseAssembler<Dim>& get() const noexcept { return *assembler_; }

private:
    std::unique_ptr<BaseAssembler<Dim>> clone_;
    const BaseAssembler<Dim>* assembler_;
};

extern template class BaseAssembler<2>;
extern template class BaseAssembler<3>;
extern template class WorkerAssembler<2>;
extern template class WorkerAssembler<3>;

} // namespace assembly
} // namespace igak

#endif // IGAK_ASSEMBLY_BASEASSEMBLER_H
