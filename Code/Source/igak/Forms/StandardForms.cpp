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
 * @file StandardForms.cpp
 * @brief Bodies of the standard variational forms
 */

#include "Forms/StandardForms.h"
#include "Core/Exception.h"

namespace igak {
namespace forms {

VForm FormSpec::build(int dim) const {
    IGAK_THROW_IF(dim < 1, InvalidDimensionException,
                  "FormSpec::build: invalid dimension " + std::to_string(dim));
    FormBuilder builder(name(), dim, arity(), numComponents(dim), isSymmetric());
    declareFields(builder);
    generateBody(builder);
    return builder.finalize();
}

// ============================================================================
// Mass / Stiffness
// ============================================================================

void MassForm::generateBody(FormBuilder& builder) const {
    const Expr w = builder.quadratureWeight();
    builder.add(w * builder.basisValue(FormBuilder::TRIAL) * builder.basisValue(FormBuilder::TEST));
}

void StiffnessForm::declareFields(FormBuilder& builder) const {
    const int D = builder.dim();
    const Expr JT = builder.jacobianInverseTranspose();
    const Expr w = builder.quadratureWeight();

    // B = J^{-1} J^{-T} |det J| w, so grad_x u . grad_x v = (B grad u) . grad v
    std::vector<Expr> entries;
    entries.reserve(static_cast<std::size_t>(D * D));
    for (int r = 0; r < D; ++r) {
        for (int c = 0; c < D; ++c) {
            Expr sum = entry(JT, 0, r) * entry(JT, 0, c);
            for (int k = 1; k < D; ++k) {
                sum = sum + entry(JT, k, r) * entry(JT, k, c);
            }
            entries.push_back(w * sum);
        }
    }
    builder.precompute("B", Expr::matrix(D, D, std::move(entries)), true);
}

void StiffnessForm::generateBody(FormBuilder& builder) const {
    const Expr B = builder.field("B");
    const Expr gu = builder.gradient(FormBuilder::TRIAL);
    const Expr gv = builder.gradient(FormBuilder::TEST);
    builder.add(inner(matmul(B, gu), gv));
}

// ============================================================================
// Space-time forms
// ============================================================================

void HeatForm::generateBody(FormBuilder& builder) const {
    const int D = builder.dim();
    IGAK_THROW_IF(D < 2, InvalidDimensionException,
                  "HeatForm: space-time form needs at least one space axis");
    const Expr w = builder.quadratureWeight();
    const Expr gu = builder.physicalGradient(FormBuilder::TRIAL);
    const Expr gv = builder.physicalGradient(FormBuilder::TEST);
    const Expr v = builder.basisValue(FormBuilder::TEST);

    const Expr ut = gu[-1];
    builder.add(w * (ut * v + inner(slice(gu, 0, D - 1), slice(gv, 0, D - 1))));
}

void WaveForm::generateBody(FormBuilder& builder) const {
    const int D = builder.dim();
    IGAK_THROW_IF(D < 2, InvalidDimensionException,
                  "WaveForm: space-time form needs at least one space axis");
    const std::vector<int> dt = builder.unitOrder(-1);
    const Expr w = builder.quadratureWeight();

    const Expr utt = builder.physicalGradient(FormBuilder::TRIAL, dt)[-1];
    const Expr vt = builder.physicalGradient(FormBuilder::TEST)[-1];
    const Expr gu = builder.physicalGradient(FormBuilder::TRIAL);
    const Expr gv_t = builder.defineLocal("gv_t", builder.physicalGradient(FormBuilder::TEST, dt));

    builder.add(w * (utt * vt + inner(slice(gu, 0, D - 1), slice(gv_t, 0, D - 1))));
}

// ============================================================================
// Vector forms
// ============================================================================

void DivDivForm::generateBody(FormBuilder& builder) const {
    const int D = builder.dim();
    const Expr w = builder.quadratureWeight();
    const Expr gu = builder.physicalGradient(FormBuilder::TRIAL);
    const Expr gv = builder.physicalGradient(FormBuilder::TEST);
    for (int i = 0; i < D; ++i) {
        for (int j = 0; j < D; ++j) {
            builder.addToSlot(D * i + j, w * gu[j] * gv[i]);
        }
    }
}

// ============================================================================
// Load forms
// ============================================================================

LoadForm::LoadForm(InputFunction f) : f_(std::move(f)) {
    IGAK_CHECK_ARG(static_cast<bool>(f_), "LoadForm: empty source function");
}

void LoadForm::declareFields(FormBuilder& builder) const {
    builder.inputFunction(SOURCE, f_);
}

void LoadForm::generateBody(FormBuilder& builder) const {
    const Expr w = builder.quadratureWeight();
    builder.add(w * builder.field(SOURCE) * builder.basisValue(FormBuilder::TEST));
}

VectorLoadForm::VectorLoadForm(std::vector<InputFunction> f) : f_(std::move(f)) {
    IGAK_CHECK_ARG(!f_.empty(), "VectorLoadForm: no source functions");
    for (const auto& fn : f_) {
        IGAK_CHECK_ARG(static_cast<bool>(fn), "VectorLoadForm: empty source function");
    }
}

std::string VectorLoadForm::sourceName(int component) {
    return "f" + std::to_string(component);
}

void VectorLoadForm::declareFields(FormBuilder& builder) const {
    for (std::size_t c = 0; c < f_.size(); ++c) {
        builder.inputFunction(sourceName(static_cast<int>(c)), f_[c]);
    }
}

void VectorLoadForm::generateBody(FormBuilder& builder) const {
    const Expr w = builder.quadratureWeight();
    const Expr v = builder.basisValue(FormBuilder::TEST);
    for (std::size_t c = 0; c < f_.size(); ++c) {
        const int slot = static_cast<int>(c);
        builder.addToSlot(slot, w * builder.field(sourceName(slot)) * v);
    }
}

} // namespace forms
} // namespace igak
