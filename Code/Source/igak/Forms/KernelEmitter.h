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

#ifndef IGAK_FORMS_KERNELEMITTER_H
#define IGAK_FORMS_KERNELEMITTER_H

/**
 * @file KernelEmitter.h
 * @brief Dimension-specialized combine/entry kernels for a finalized form
 *
 * KernelEmitter<Dim>::emit() lowers a form once into a KernelProgram and
 * wraps it in a CompiledKernel<Dim>. The compiled kernel provides
 *
 *  - initialize(): quadrature grid, per-axis derivative tables of the trial
 *    and test space and every array field of the form (geometry builtins,
 *    input functions, precomputed tensors), collected in a KernelData<Dim>;
 *  - entry()/entry1(): the value of the form for one (test, trial) pair of
 *    tensor-product basis functions, integrating only over the intersection
 *    of their supports.
 *
 * The combine loop is a Dim-deep nest over quadrature nodes. The value of a
 * partial derivative of a tensor-product basis function at a node is the
 * product over axes of 1D derivative-table entries; these products are
 * built incrementally, one axis per loop level.
 *
 * Only Dim = 2 and Dim = 3 are instantiated.
 */

#include "Core/Config.h"
#include "Core/Types.h"
#include "Basis/KnotVector.h"
#include "Forms/FormBuilder.h"
#include "Forms/KernelProgram.h"
#include "Forms/StandardForms.h"
#include "Geometry/GeometryMap.h"
#include "Math/GridArray.h"
#include "Math/MultiIndex.h"
#include "Quadrature/GaussQuadrature.h"
#include <array>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace igak {
namespace forms {

/**
 * @brief One basis space sampled on the quadrature grid
 */
template<int Dim>
struct SpaceTables {
    std::array<std::size_t, Dim> num_dofs{};
    std::array<std::vector<math::Interval>, Dim> support;
    std::array<basis::DerivativeTable, Dim> tables;

    std::size_t numDofs() const noexcept { return math::product(num_dofs); }
};

/**
 * @brief Grid data a compiled kernel reads, owned by an assembler
 *
 * Immutable once initialized; concurrent entry() calls only read it.
 * Linear forms only read the test space.
 */
template<int Dim>
struct KernelData {
    SpaceTables<Dim> trial;
    SpaceTables<Dim> test;
    int points_per_element = 0;
    quadrature::TensorQuadrature quadrature;

    /// Array fields indexed by registry id; local fields stay empty
    std::vector<math::GridArray> fields;

    /// Physical coordinates of the grid nodes (present when input fields exist)
    math::GridArray points;
};

template<int Dim>
class CompiledKernel {
public:
    static_assert(config::is_supported_dim<Dim>, "kernels are compiled for 2D and 3D only");

    CompiledKernel(VForm form, KernelProgram program);

    const VForm& form() const noexcept { return form_; }
    const KernelProgram& program() const noexcept { return program_; }
    const std::string& name() const noexcept { return form_.name; }
    Arity arity() const noexcept { return form_.arity; }
    int numComponents() const noexcept { return form_.num_components; }
    int numSlots() const noexcept { return program_.numSlots(); }
    bool isSymmetric() const noexcept { return form_.symmetric; }

    /**
     * @brief Build quadrature, derivative tables and array fields with the
     *        same basis for trial and test functions
     *
     * @throws InvalidDimensionException if the geometry dimension differs from Dim
     */
    KernelData<Dim> initialize(const std::array<basis::KnotVector, Dim>& bases,
                               const geometry::GeometryMap& geometry) const;

    /**
     * @brief Build the kernel data for distinct trial and test bases
     *
     * Both bases must have the same mesh on every axis. The quadrature uses
     * max degree + 1 points per element over both spaces.
     *
     * @throws InvalidArgumentException if the meshes differ
     */
    KernelData<Dim> initialize(const std::array<basis::KnotVector, Dim>& trial_bases,
                               const std::array<basis::KnotVector, Dim>& test_bases,
                               const geometry::GeometryMap& geometry) const;

    /**
     * @brief Re-sample input field @p name from @p fn and refresh the
     *        precomputed fields
     */
    void updateInput(KernelData<Dim>& data, const std::string& name, InputFunction fn) const;

    /**
     * @brief Value of the bilinear form for test function @p test and trial
     *        function @p trial
     *
     * Writes numSlots() values to @p out. All of them are exactly zero when
     * the supports do not intersect on some axis.
     */
    void entry(const KernelData<Dim>& data,
               const MultiIndex<Dim>& test,
               const MultiIndex<Dim>& trial,
               Real* out) const;

    /// Value of the linear form for test function @p test
    void entry1(const KernelData<Dim>& data, const MultiIndex<Dim>& test, Real* out) const;

private:
    void combine(const KernelData<Dim>& data,
                 const std::array<math::Interval, Dim>& nodes,
                 const MultiIndex<Dim>& test,
                 const MultiIndex<Dim>& trial,
                 Real* out) const;

    void evaluatePrecomputed(KernelData<Dim>& data) const;

    VForm form_;
    KernelProgram program_;
    std::vector<std::pair<int, KernelProgram>> field_programs_;
};

template<int Dim>
class KernelEmitter {
public:
    using Kernel = CompiledKernel<Dim>;

    /// Compile a form specification
    static std::shared_ptr<const Kernel> emit(const FormSpec& spec);

    /**
     * @brief Compile an already finalized form
     *
     * @throws InvalidDimensionException if form.dim != Dim
     */
    static std::shared_ptr<const Kernel> emit(const VForm& form);
};

extern template class CompiledKernel<2>;
extern template class CompiledKernel<3>;
extern template class KernelEmitter<2>;
extern template class KernelEmitter<3>;

} // namespace forms
} // namespace igak

#endif // IGAK_FORMS_KERNELEMITTER_H
