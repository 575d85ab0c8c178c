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
 * @file Lowering.cpp
 * @brief Visitor translating expression nodes into tape instructions
 */

#include "Forms/Lowering.h"
#include "Core/Exception.h"

namespace igak {
namespace forms {

namespace {

struct LowerVisitor {
    Lowering& lowering;

    std::vector<Reg> operator()(const ConstantNode& n) const {
        return {lowering.builder().constant(n.value)};
    }

    std::vector<Reg> operator()(const FieldNode& n) const {
        return lowering.fieldRegisters(n.name);
    }

    std::vector<Reg> operator()(const BinaryNode& n) const {
        const std::vector<Reg> lhs = lowering.lower(n.lhs);
        const std::vector<Reg> rhs = lowering.lower(n.rhs);
        std::vector<Reg> out(lhs.size());
        for (std::size_t k = 0; k < lhs.size(); ++k) {
            out[k] = lowering.builder().binary(n.op, lhs[k], rhs[k]);
        }
        return out;
    }

    std::vector<Reg> operator()(const IndexNode& n) const {
        const std::vector<Reg> v = lowering.lower(n.operand);
        return {v[static_cast<std::size_t>(n.index)]};
    }

    std::vector<Reg> operator()(const EntryNode& n) const {
        const std::vector<Reg> m = lowering.lower(n.operand);
        const int cols = n.operand.shape().cols;
        return {m[static_cast<std::size_t>(n.row * cols + n.col)]};
    }

    std::vector<Reg> operator()(const SliceNode& n) const {
        const std::vector<Reg> v = lowering.lower(n.operand);
        std::vector<Reg> out;
        out.reserve(n.indices.size());
        for (int k : n.indices) {
            out.push_back(v[static_cast<std::size_t>(k)]);
        }
        return out;
    }

    std::vector<Reg> operator()(const MatMulNode& n) const {
        const std::vector<Reg> A = lowering.lower(n.matrix);
        const std::vector<Reg> x = lowering.lower(n.vector);
        const std::size_t rows = static_cast<std::size_t>(n.matrix.shape().rows);
        const std::size_t cols = static_cast<std::size_t>(n.matrix.shape().cols);
        ProgramBuilder& b = lowering.builder();
        std::vector<Reg> out(rows);
        for (std::size_t r = 0; r < rows; ++r) {
            Reg sum = b.binary(BinaryOp::Mul, A[r * cols], x[0]);
            for (std::size_t c = 1; c < cols; ++c) {
                sum = b.binary(BinaryOp::Add, sum, b.binary(BinaryOp::Mul, A[r * cols + c], x[c]));
            }
            out[r] = sum;
        }
        return out;
    }

    std::vector<Reg> operator()(const PartialDerivNode& n) const {
        IGAK_THROW_IF(lowering.mode() == Lowering::Mode::Grid, InvalidArgumentException,
                      "Lowering: basis function '" + n.basis +
                      "' referenced by a grid-wide field definition");
        BasisLoad load;
        if (n.basis == FormBuilder::TRIAL) {
            IGAK_THROW_IF(lowering.form().arity == Arity::Linear, InvalidArgumentException,
                          "Lowering: trial function in linear form '" + lowering.form().name + "'");
            load.role = BasisRole::Trial;
        } else if (n.basis == FormBuilder::TEST) {
            load.role = BasisRole::Test;
        } else {
            IGAK_THROW(InvalidArgumentException,
                       "Lowering: unknown basis function '" + n.basis + "'");
        }
        load.orders = n.orders;
        return {lowering.builder().loadBasis(load)};
    }

    std::vector<Reg> operator()(const ComposeNode& n) const {
        std::vector<Reg> out;
        out.reserve(n.components.size());
        for (const auto& c : n.components) {
            out.push_back(lowering.lower(c).front());
        }
        return out;
    }
};

} // anonymous namespace

Lowering::Lowering(const VForm& form, ProgramBuilder& builder, Mode mode)
    : form_(form), builder_(builder), mode_(mode) {}

std::vector<Reg> Lowering::lower(const Expr& expr) {
    IGAK_THROW_IF(!expr.valid(), InvalidArgumentException, "Lowering: empty expression");
    return std::visit(LowerVisitor{*this}, expr.node().payload());
}

std::vector<Reg> Lowering::fieldRegisters(const std::string& name) {
    const FieldVariable& f = form_.field(name);

    if (!f.isArray()) {
        IGAK_THROW_IF(mode_ == Mode::Grid, InvalidArgumentException,
                      "Lowering: local field '" + name + "' used in a grid-wide definition");
        const auto it = locals_.find(f.id);
        if (it != locals_.end()) {
            return it->second;
        }
        std::vector<Reg> regs = lower(f.definition.expr);
        locals_.emplace(f.id, regs);
        return regs;
    }

    std::vector<Reg> regs;
    regs.reserve(static_cast<std::size_t>(f.shape.size()));
    for (int i = 0; i < f.shape.rows; ++i) {
        for (int j = 0; j < f.shape.cols; ++j) {
            regs.push_back(builder_.loadField(f.id, f.backingIndex(i, j)));
        }
    }
    return regs;
}

KernelProgram lowerForm(const VForm& form) {
    ProgramBuilder builder(form.numOutputSlots());
    Lowering lowering(form, builder, Lowering::Mode::Kernel);
    for (const auto& acc : form.accumulations) {
        const std::vector<Reg> regs = lowering.lower(acc.expr);
        builder.accumulate(acc.slot, regs.front());
    }
    return builder.finish();
}

KernelProgram lowerFieldDefinition(const VForm& form, const FieldVariable& field) {
    IGAK_THROW_IF(field.definition.source != FieldSource::Precomputed, InvalidArgumentException,
                  "lowerFieldDefinition: field '" + field.name + "' is not precomputed");
    ProgramBuilder builder(field.storageSize());
    Lowering lowering(form, builder, Lowering::Mode::Grid);
    const std::vector<Reg> regs = lowering.lower(field.definition.expr);
    const int cols = field.shape.cols;
    for (int i = 0; i < field.shape.rows; ++i) {
        for (int j = field.symmetric ? i : 0; j < cols; ++j) {
            builder.accumulate(field.backingIndex(i, j), regs[static_cast<std::size_t>(i * cols + j)]);
        }
    }
    return builder.finish();
}

} // namespace forms
} // namespace igak
