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

#ifndef IGAK_FORMS_LOWERING_H
#define IGAK_FORMS_LOWERING_H

/**
 * @file Lowering.h
 * @brief Componentwise lowering of expressions onto a KernelProgram tape
 */

#include "Forms/Expr.h"
#include "Forms/FormBuilder.h"
#include "Forms/KernelProgram.h"
#include <map>
#include <vector>

namespace igak {
namespace forms {

/**
 * @brief Lowers expressions of one form into a ProgramBuilder
 *
 * Every expression becomes one register per scalar component (row-major).
 * Local fields are lowered the first time they are referenced and the
 * registers are reused afterwards.
 */
class Lowering {
public:
    enum class Mode {
        Kernel,   ///< per (test, trial) quadrature point, basis loads allowed
        Grid      ///< per grid node, array fields only
    };

    Lowering(const VForm& form, ProgramBuilder& builder, Mode mode = Mode::Kernel);

    /// Registers holding the components of @p expr
    std::vector<Reg> lower(const Expr& expr);

    const VForm& form() const noexcept { return form_; }
    Mode mode() const noexcept { return mode_; }
    ProgramBuilder& builder() noexcept { return builder_; }

    /// Registers of a field reference, lowering its definition if local
    std::vector<Reg> fieldRegisters(const std::string& name);

private:
    const VForm& form_;
    ProgramBuilder& builder_;
    Mode mode_;
    std::map<int, std::vector<Reg>> locals_;
};

/**
 * @brief Tape accumulating every (slot, expression) pair of @p form
 */
KernelProgram lowerForm(const VForm& form);

/**
 * @brief Grid tape for a precomputed field
 *
 * Output slot k receives backing component k of the field. Symmetric
 * matrices only produce the entries with row <= col.
 */
KernelProgram lowerFieldDefinition(const VForm& form, const FieldVariable& field);

} // namespace forms
} // namespace igak

#endif // IGAK_FORMS_LOWERING_H
