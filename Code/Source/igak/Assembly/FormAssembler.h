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

#ifndef IGAK_ASSEMBLY_FORMASSEMBLER_H
#define IGAK_ASSEMBLY_FORMASSEMBLER_H

/**
 * @file FormAssembler.h
 * @brief Assembler evaluating a compiled form kernel over a tensor-product basis
 *
 * Example:
 * @code
 *   std::array<basis::KnotVector, 2> bases{basis::KnotVector::openUniform(3, 8),
 *                                          basis::KnotVector::openUniform(3, 8)};
 *   geometry::IdentityMap geo(2);
 *   assembly::FormAssembler<2> A(forms::StiffnessForm{}, bases, geo);
 *   Real a_ij = A.entry(i, j);
 * @endcode
 *
 * The trial and test functions may come from different bases on a common
 * mesh, for instance of different degree; the matrix then has
 * numRows() test dofs and numCols() trial dofs. Symmetric mode is only
 * used when both spaces are the same basis.
 */

#include "Assembly/BaseAssembler.h"
#include "Basis/KnotVector.h"
#include "Forms/KernelEmitter.h"
#include "Forms/StandardForms.h"
#include "Geometry/GeometryMap.h"
#include <array>
#include <memory>
#include <string>

namespace igak {
namespace assembly {

template<int Dim>
class FormAssembler : public BaseAssembler<Dim> {
public:
    using Index = typename BaseAssembler<Dim>::Index;
    using Kernel = forms::CompiledKernel<Dim>;

    /**
     * @brief Compile @p spec for Dim and initialize it on the given basis
     *
     * @throws InvalidDimensionException if the geometry dimension is not Dim
     */
    FormAssembler(const forms::FormSpec& spec,
                  std::array<basis::KnotVector, Dim> bases,
                  const geometry::GeometryMap& geometry);

    /**
     * @brief Compile @p spec with distinct trial and test bases
     *
     * @throws InvalidArgumentException if the bases have different meshes
     */
    FormAssembler(const forms::FormSpec& spec,
                  std::array<basis::KnotVector, Dim> trial_bases,
                  std::array<basis::KnotVector, Dim> test_bases,
                  const geometry::GeometryMap& geometry);

    /// Initialize an already compiled kernel
    FormAssembler(std::shared_ptr<const Kernel> kernel,
                  std::array<basis::KnotVector, Dim> bases,
                  const geometry::GeometryMap& geometry);

    FormAssembler(std::shared_ptr<const Kernel> kernel,
                  std::array<basis::KnotVector, Dim> trial_bases,
                  std::array<basis::KnotVector, Dim> test_bases,
                  const geometry::GeometryMap& geometry);

    std::string name() const override { return kernel_->name(); }

    const Kernel& kernel() const noexcept { return *kernel_; }
    const forms::KernelData<Dim>& data() const noexcept { return *data_; }

    const basis::KnotVector& basis(int axis, Space space = Space::Test) const {
        const auto& bases = space == Space::Trial ? trial_bases_ : test_bases_;
        return bases.at(static_cast<std::size_t>(axis));
    }

    /// Whether trial and test functions come from different bases
    bool hasSeparateSpaces() const noexcept { return separate_; }

    const std::vector<math::Interval>& meshSupport(int axis, Space space) const override;
    math::Interval neighborRange(int axis, std::size_t i) const override;

    /**
     * @brief Re-evaluate input field @p name from @p fn
     *
     * Must not run concurrently with queries on this assembler. Workers that
     * already hold the previous grid data keep it.
     */
    void updateInput(const std::string& name, forms::InputFunction fn);

protected:
    void entryImpl(const Index& test, const Index& trial, Real* out) const override;
    void entry1Impl(const Index& test, Real* out) const override;

private:
    FormAssembler(std::shared_ptr<const Kernel> kernel,
                  std::array<basis::KnotVector, Dim> trial_bases,
                  std::array<basis::KnotVector, Dim> test_bases,
                  bool separate,
                  const geometry::GeometryMap& geometry);

    std::shared_ptr<const Kernel> kernel_;
    std::array<basis::KnotVector, Dim> trial_bases_;
    std::array<basis::KnotVector, Dim> test_bases_;
    bool separate_;
    std::shared_ptr<const forms::KernelData<Dim>> data_;
};

extern template class FormAssembler<2>;
extern template class FormAssembler<3>;

} // namespace assembly
} // namespace igak

#endif // IGAK_ASSEMBLY_FORMASSEMBLER_H
