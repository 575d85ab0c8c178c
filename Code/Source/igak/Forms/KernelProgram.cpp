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
 * @file KernelProgram.cpp
 * @brief Tape construction with CSE, constant folding and dead-code removal
 */

#include "Forms/KernelProgram.h"
#include "Core/Exception.h"
#include <algorithm>
#include <cstring>
#include <sstream>

namespace igak {
namespace forms {

namespace {

std::uint64_t bits_of(Real v) {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

bool is_commutative(OpCode op) {
    return op == OpCode::Add || op == OpCode::Mul;
}

OpCode opcode_of(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add: return OpCode::Add;
        case BinaryOp::Sub: return OpCode::Sub;
        case BinaryOp::Mul: return OpCode::Mul;
        case BinaryOp::Div: return OpCode::Div;
    }
    return OpCode::Add;
}

Real fold(OpCode op, Real a, Real b) {
    switch (op) {
        case OpCode::Add: return a + b;
        case OpCode::Sub: return a - b;
        case OpCode::Mul: return a * b;
        case OpCode::Div: return a / b;
        default: return Real(0);
    }
}

} // anonymous namespace

// ============================================================================
// ProgramBuilder
// ============================================================================

ProgramBuilder::ProgramBuilder(int num_slots) : num_slots_(num_slots) {
    IGAK_CHECK_ARG(num_slots >= 1, "ProgramBuilder: at least one output slot required");
}

Reg ProgramBuilder::emit(const Instruction& ins) {
    Reg a = ins.a;
    Reg b = ins.b;
    if (is_commutative(ins.op) && b < a) {
        std::swap(a, b);
    }
    const Key key{ins.op, a, b, ins.op == OpCode::Const ? bits_of(ins.value) : 0};
    const auto it = cse_.find(key);
    if (it != cse_.end()) {
        return it->second;
    }
    Instruction stored = ins;
    stored.a = a;
    stored.b = b;
    const auto reg = static_cast<Reg>(code_.size());
    code_.push_back(stored);
    cse_.emplace(key, reg);
    return reg;
}

Reg ProgramBuilder::constant(Real value) {
    Instruction ins;
    ins.op = OpCode::Const;
    ins.value = value;
    return emit(ins);
}

Reg ProgramBuilder::loadBasis(const BasisLoad& load) {
    auto it = std::find(basis_loads_.begin(), basis_loads_.end(), load);
    Reg slot = static_cast<Reg>(it - basis_loads_.begin());
    if (it == basis_loads_.end()) {
        basis_loads_.push_back(load);
    }
    Instruction ins;
    ins.op = OpCode::LoadBasis;
    ins.a = slot;
    return emit(ins);
}

Reg ProgramBuilder::loadField(int field_id, int component) {
    IGAK_CHECK_ARG(field_id >= 0 && component >= 0, "ProgramBuilder::loadField: negative id");
    auto it = std::find(fields_.begin(), fields_.end(), field_id);
    const Reg slot = static_cast<Reg>(it - fields_.begin());
    if (it == fields_.end()) {
        fields_.push_back(field_id);
    }
    Instruction ins;
    ins.op = OpCode::LoadField;
    ins.a = slot;
    ins.b = static_cast<Reg>(component);
    return emit(ins);
}

Reg ProgramBuilder::binary(BinaryOp op, Reg lhs, Reg rhs) {
    IGAK_CHECK_INDEX(lhs, code_.size(), "ProgramBuilder::binary: left register");
    IGAK_CHECK_INDEX(rhs, code_.size(), "ProgramBuilder::binary: right register");
    const OpCode code = opcode_of(op);
    const Instruction& l = code_[lhs];
    const Instruction& r = code_[rhs];
    if (l.op == OpCode::Const && r.op == OpCode::Const) {
        return constant(fold(code, l.value, r.value));
    }
    Instruction ins;
    ins.op = code;
    ins.a = lhs;
    ins.b = rhs;
    return emit(ins);
}

void ProgramBuilder::accumulate(int slot, Reg reg) {
    IGAK_CHECK_INDEX(slot, num_slots_, "ProgramBuilder::accumulate: output slot");
    IGAK_CHECK_INDEX(reg, code_.size(), "ProgramBuilder::accumulate: register");
    outputs_.emplace_back(slot, reg);
}

KernelProgram ProgramBuilder::finish() const {
    std::vector<bool> live(code_.size(), false);
    for (const auto& out : outputs_) {
        live[out.second] = true;
    }
    for (std::size_t i = code_.size(); i-- > 0;) {
        if (!live[i]) {
            continue;
        }
        const Instruction& ins = code_[i];
        if (ins.op == OpCode::Add || ins.op == OpCode::Sub ||
            ins.op == OpCode::Mul || ins.op == OpCode::Div) {
            live[ins.a] = true;
            live[ins.b] = true;
        }
    }

    KernelProgram program;
    program.num_slots_ = num_slots_;

    // compact basis and field slots to the ones still referenced
    std::vector<Reg> basis_map(basis_loads_.size(), 0);
    std::vector<bool> basis_used(basis_loads_.size(), false);
    std::vector<Reg> field_map(fields_.size(), 0);
    std::vector<bool> field_used(fields_.size(), false);
    for (std::size_t i = 0; i < code_.size(); ++i) {
        if (!live[i]) {
            continue;
        }
        if (code_[i].op == OpCode::LoadBasis) {
            basis_used[code_[i].a] = true;
        } else if (code_[i].op == OpCode::LoadField) {
            field_used[code_[i].a] = true;
        }
    }
    for (std::size_t s = 0; s < basis_loads_.size(); ++s) {
        if (basis_used[s]) {
            basis_map[s] = static_cast<Reg>(program.basis_loads_.size());
            program.basis_loads_.push_back(basis_loads_[s]);
        }
    }
    for (std::size_t s = 0; s < fields_.size(); ++s) {
        if (field_used[s]) {
            field_map[s] = static_cast<Reg>(program.fields_.size());
            program.fields_.push_back(fields_[s]);
        }
    }

    std::vector<Reg> renumber(code_.size(), 0);
    for (std::size_t i = 0; i < code_.size(); ++i) {
        if (!live[i]) {
            continue;
        }
        Instruction ins = code_[i];
        switch (ins.op) {
            case OpCode::LoadBasis: ins.a = basis_map[ins.a]; break;
            case OpCode::LoadField: ins.a = field_map[ins.a]; break;
            case OpCode::Const: break;
            default:
                ins.a = renumber[ins.a];
                ins.b = renumber[ins.b];
                break;
        }
        renumber[i] = static_cast<Reg>(program.code_.size());
        program.code_.push_back(ins);
    }
    for (const auto& [slot, reg] : outputs_) {
        program.outputs_.emplace_back(slot, renumber[reg]);
    }
    return program;
}

// ============================================================================
// KernelProgram
// ============================================================================

std::string KernelProgram::toString() const {
    std::ostringstream os;
    for (std::size_t i = 0; i < code_.size(); ++i) {
        const Instruction& ins = code_[i];
        os << "r" << i << " = ";
        switch (ins.op) {
            case OpCode::Const:
                os << ins.value;
                break;
            case OpCode::LoadBasis: {
                const BasisLoad& load = basis_loads_[ins.a];
                os << (load.role == BasisRole::Trial ? "u" : "v") << "[";
                for (std::size_t k = 0; k < load.orders.size(); ++k) {
                    os << (k ? "," : "") << load.orders[k];
                }
                os << "]";
                break;
            }
            case OpCode::LoadField:
                os << "field" << fields_[ins.a] << "[" << ins.b << "]";
                break;
            case OpCode::Add: os << "r" << ins.a << " + r" << ins.b; break;
            case OpCode::Sub: os << "r" << ins.a << " - r" << ins.b; break;
            case OpCode::Mul: os << "r" << ins.a << " * r" << ins.b; break;
            case OpCode::Div: os << "r" << ins.a << " / r" << ins.b; break;
        }
        os << "\n";
    }
    for (const auto& [slot, reg] : outputs_) {
        os << "out[" << slot << "] += r" << reg << "\n";
    }
    return os.str();
}

} // namespace forms
} // namespace igak
