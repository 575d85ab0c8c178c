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

#ifndef IGAK_FORMS_STANDARDFORMS_H
#define IGAK_FORMS_STANDARDFORMS_H

/**
 * @file StandardForms.h
 * @brief Dimension-agnostic specifications of the standard variational forms
 *
 * A FormSpec describes a form once for every dimension. build(dim) runs the
 * two hooks on a fresh FormBuilder: declareFields() registers extra array
 * fields (input functions, precomputed tensors) and generateBody() adds the
 * accumulations, possibly after introducing kernel-local temporaries.
 *
 * For space-time forms the last parametric axis is time.
 */

#include "Core/Types.h"
#include "Forms/FormBuilder.h"
#include <memory>
#include <string>
#include <vector>

namespace igak {
namespace forms {

class FormSpec {
public:
    virtual ~FormSpec() = default;

    virtual std::string name() const = 0;
    virtual Arity arity() const { return Arity::Bilinear; }

    /// Components of the unknown field in dimension @p dim
    virtual int numComponents(int /*dim*/) const { return 1; }

    /// Whether a(u, v) = a(v, u) for every pair of basis functions
    virtual bool isSymmetric() const { return false; }

    /// Register array fields read by the body
    virtual void declareFields(FormBuilder& /*builder*/) const {}

    /// Add the (slot, expression) accumulations
    virtual void generateBody(FormBuilder& builder) const = 0;

    /**
     * @brief Run the hooks for dimension @p dim and finalize
     */
    VForm build(int dim) const;
};

/**
 * @brief Mass matrix: weight * u * v
 */
class MassForm : public FormSpec {
public:
    std::string name() const override { return "mass"; }
    bool isSymmetric() const override { return true; }
    void generateBody(FormBuilder& builder) const override;
};

/**
 * @brief Stiffness matrix: (B grad u) . grad v with B = weight * J^{-1} J^{-T}
 */
class StiffnessForm : public FormSpec {
public:
    std::string name() const override { return "stiffness"; }
    bool isSymmetric() const override { return true; }
    void declareFields(FormBuilder& builder) const override;
    void generateBody(FormBuilder& builder) const override;
};

/**
 * @brief Space-time heat operator: weight * (du/dt v + grad_x u . grad_x v)
 */
class HeatForm : public FormSpec {
public:
    std::string name() const override { return "heat_st"; }
    void generateBody(FormBuilder& builder) const override;
};

/**
 * @brief Space-time wave operator tested with dv/dt:
 *        weight * (d2u/dt2 dv/dt + grad_x u . d/dt grad_x v)
 */
class WaveForm : public FormSpec {
public:
    std::string name() const override { return "wave_st"; }
    void generateBody(FormBuilder& builder) const override;
};

/**
 * @brief Vector div-div operator, slot dim*i+j gets weight * du/dx_j * dv/dx_i
 */
class DivDivForm : public FormSpec {
public:
    std::string name() const override { return "divdiv"; }
    int numComponents(int dim) const override { return dim; }
    bool isSymmetric() const override { return true; }
    void generateBody(FormBuilder& builder) const override;
};

/**
 * @brief Load vector: weight * f(x) * v
 */
class LoadForm : public FormSpec {
public:
    /// Name of the input field holding f
    static constexpr const char* SOURCE = "f";

    explicit LoadForm(InputFunction f);

    std::string name() const override { return "load"; }
    Arity arity() const override { return Arity::Linear; }
    void declareFields(FormBuilder& builder) const override;
    void generateBody(FormBuilder& builder) const override;

private:
    InputFunction f_;
};

/**
 * @brief Vector load: component c of the result is weight * f_c(x) * v
 *
 * Input fields are named "f0", "f1", ...
 */
class VectorLoadForm : public FormSpec {
public:
    explicit VectorLoadForm(std::vector<InputFunction> f);

    std::string name() const override { return "vector_load"; }
    Arity arity() const override { return Arity::Linear; }
    int numComponents(int /*dim*/) const override { return static_cast<int>(f_.size()); }
    void declareFields(FormBuilder& builder) const override;
    void generateBody(FormBuilder& builder) const override;

    static std::string sourceName(int component);

private:
    std::vector<InputFunction> f_;
};

} // namespace forms
} // namespace igak

#endif // IGAK_FORMS_STANDARDFORMS_H
