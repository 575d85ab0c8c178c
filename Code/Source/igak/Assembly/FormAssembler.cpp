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
 * @file FormAssembler.cpp
 * @brief Kernel initialization and entry dispatch
 */

#include "Assembly/FormAssembler.h"
#include "Core/Exception.h"
#include "Core/Logger.h"

namespace igak {
namespace assembly {

namespace {

template<int Dim>
std::array<std::size_t, Dim> dofs_of(const std::array<basis::KnotVector, Dim>& bases) {
    std::array<std::size_t, Dim> n{};
    for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
        n[k] = bases[k].numDofs();
    }
    return n;
}

template<int Dim>
const forms::CompiledKernel<Dim>& checked(const std::shared_ptr<const forms::CompiledKernel<Dim>>& kernel) {
    IGAK_CHECK_NOT_NULL(kernel.get(), "FormAssembler kernel");
    return *kernel;
}

} // anonymous namespace

template<int Dim>
FormAssembler<Dim>::FormAssembler(const forms::FormSpec& spec,
                                  std::array<basis::KnotVector, Dim> bases,
                                  const geometry::GeometryMap& geometry)
    : FormAssembler(forms::KernelEmitter<Dim>::emit(spec), std::move(bases), geometry) {}

template<int Dim>
FormAssembler<Dim>::FormAssembler(const forms::FormSpec& spec,
                                  std::array<basis::KnotVector, Dim> trial_bases,
                                  std::array<basis::KnotVector, Dim> test_bases,
                                  const geometry::GeometryMap& geometry)
    : FormAssembler(forms::KernelEmitter<Dim>::emit(spec), std::move(trial_bases),
                    std::move(test_bases), geometry) {}

template<int Dim>
FormAssembler<Dim>::FormAssembler(std::shared_ptr<const Kernel> kernel,
                                  std::array<basis::KnotVector, Dim> bases,
                                  const geometry::GeometryMap& geometry)
    : FormAssembler(std::move(kernel), bases, bases, false, geometry) {}

template<int Dim>
FormAssembler<Dim>::FormAssembler(std::shared_ptr<const Kernel> kernel,
                                  std::array<basis::KnotVector, Dim> trial_bases,
                                  std::array<basis::KnotVector, Dim> test_bases,
                                  const geometry::GeometryMap& geometry)
    : FormAssembler(std::move(kernel), std::move(trial_bases), std::move(test_bases), true, geometry) {}

template<int Dim>
FormAssembler<Dim>::FormAssembler(std::shared_ptr<const Kernel> kernel,
                                  std::array<basis::KnotVector, Dim> trial_bases,
                                  std::array<basis::KnotVector, Dim> test_bases,
                                  bool separate,
                                  const geometry::GeometryMap& geometry)
    : BaseAssembler<Dim>(dofs_of<Dim>(test_bases),
                         dofs_of<Dim>(trial_bases),
                         checked<Dim>(kernel).arity(),
                         checked<Dim>(kernel).numComponents(),
                         checked<Dim>(kernel).numComponents(),
                         checked<Dim>(kernel).isSymmetric() && !separate),
      kernel_(std::move(kernel)),
      trial_bases_(std::move(trial_bases)),
      test_bases_(std::move(test_bases)),
      separate_(separate) {
    Timer timer;
    timer.start();
    data_ = std::make_shared<const forms::KernelData<Dim>>(
        separate_ ? kernel_->initialize(trial_bases_, test_bases_, geometry)
                  : kernel_->initialize(test_bases_, geometry));
    timer.stop();

    std::string spaces = std::to_string(this->numBasisFunctions(Space::Test)) + " basis functions";
    if (separate_) {
        spaces = std::to_string(this->numBasisFunctions(Space::Test)) + " test x " +
                 std::to_string(this->numBasisFunctions(Space::Trial)) + " trial functions";
    }
    IGAK_LOG_INFO("FormAssembler<" + std::to_string(Dim) + "> '" + kernel_->name() + "': " +
                  spaces + " x " + std::to_string(this->numComponents()) + " components, " +
                  std::to_string(data_->quadrature.numNodes()) + " quadrature nodes, " +
                  "initialized in " + std::to_string(timer.elapsed()) + " s");
}

template<int Dim>
const std::vector<math::Interval>& FormAssembler<Dim>::meshSupport(int axis, Space space) const {
    IGAK_CHECK_INDEX(axis, Dim, "FormAssembler::meshSupport: axis");
    const auto& tables = space == Space::Trial ? data_->trial : data_->test;
    return tables.support[static_cast<std::size_t>(axis)];
}

template<int Dim>
math::Interval FormAssembler<Dim>::neighborRange(int axis, std::size_t i) const {
    IGAK_CHECK_INDEX(axis, Dim, "FormAssembler::neighborRange: axis");
    if (separate_) {
        return BaseAssembler<Dim>::neighborRange(axis, i);
    }
    return test_bases_[static_cast<std::size_t>(axis)].jointSupportRange(i);
}

template<int Dim>
void FormAssembler<Dim>::updateInput(const std::string& name, forms::InputFunction fn) {
    IGAK_TIMED_SCOPE_LEVEL("FormAssembler '" + kernel_->name() + "': update input field '" + name + "'",
                           LogLevel::DEBUG);
    auto updated = std::make_shared<forms::KernelData<Dim>>(*data_);
    kernel_->updateInput(*updated, name, std::move(fn));
    data_ = std::move(updated);
}

template<int Dim>
void FormAssembler<Dim>::entryImpl(const Index& test, const Index& trial, Real* out) const {
    kernel_->entry(*data_, test, trial, out);
}

template<int Dim>
void FormAssembler<Dim>::entry1Impl(const Index& test, Real* out) const {
    kernel_->entry1(*data_, test, out);
}

template class FormAssembler<2>;
template class FormAssembler<3>;

} // namespace assembly
} // namespace igak
