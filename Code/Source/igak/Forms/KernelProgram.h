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

#ifndef IGAK_FORMS_KERNELPROGRAM_H
#define IGAK_FORMS_KERNELPROGRAM_H

/**
 * @file KernelProgram.h
 * @brief Flat SSA instruction tape evaluated at every quadrature point
 *
 * Lowering an expression produces scalar instructions. Each instruction
 * writes the register with its own index, so a program is evaluated by a
 * single forward sweep. The builder deduplicates identical instructions
 * (common-subexpression elimination), folds constant arithmetic and drops
 * instructions that no output depends on.
 *
 * Performance: the tape is interpreted. Only the quadrature loop nest is
 * specialized per dimension; the form body costs one switch dispatch and
 * one register store per instruction at every quadrature node, and the
 * compiler cannot fuse or vectorize across instructions.
 */

#include "Core/Types.h"
#include "Forms/Expr.h"
#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace igak {
namespace forms {

using Reg = std::uint32_t;

enum class OpCode : std::uint8_t {
    Const,
    LoadBasis,  ///< a = basis load slot
    LoadField,  ///< a = field slot, b = backing component
    Add,
    Sub,
    Mul,
    Div
};

struct Instruction {
    OpCode op = OpCode::Const;
    Reg a = 0;
    Reg b = 0;
    Real value = Real(0);
};

/// Basis functions a kernel reads: trial (u) and test (v)
enum class BasisRole : std::uint8_t {
    Trial = 0,
    Test = 1
};

/**
 * @brief One partial derivative of one basis function
 */
struct BasisLoad {
    BasisRole role = BasisRole::Test;
    std::vector<int> orders;
};

inline bool operator==(const BasisLoad& a, const BasisLoad& b) {
    return a.role == b.role && a.orders == b.orders;
}

/**
 * @brief Finalized instruction tape
 */
class KernelProgram {
public:
    const std::vector<Instruction>& instructions() const noexcept { return code_; }
    const std::vector<BasisLoad>& basisLoads() const noexcept { return basis_loads_; }

    /// Registry ids of the fields read by LoadField, indexed by field slot
    const std::vector<int>& fields() const noexcept { return fields_; }

    /// (output slot, register) pairs added into the result after each point
    const std::vector<std::pair<int, Reg>>& outputs() const noexcept { return outputs_; }

    int numSlots() const noexcept { return num_slots_; }
    std::size_t numRegisters() const noexcept { return code_.size(); }

    /**
     * @brief Evaluate the tape at one point
     *
     * Runs in the innermost quadrature loop; see the performance note above.
     *
     * @param regs         Register file with at least numRegisters() entries
     * @param basis_values Value of every basis load at the point
     * @param field_values Pointer to the node data of every field slot
     * @param result       numSlots() accumulators
     */
    void evaluate(Real* regs,
                  const Real* basis_values,
                  const Real* const* field_values,
                  Real* result) const noexcept {
        const std::size_t n = code_.size();
        for (std::size_t i = 0; i < n; ++i) {
            const Instruction& ins = code_[i];
            switch (ins.op) {
                case OpCode::Const:     regs[i] = ins.value; break;
                case OpCode::LoadBasis: regs[i] = basis_values[ins.a]; break;
                case OpCode::LoadField: regs[i] = field_values[ins.a][ins.b]; break;
                case OpCode::Add:       regs[i] = regs[ins.a] + regs[ins.b]; break;
                case OpCode::Sub:       regs[i] = regs[ins.a] - regs[ins.b]; break;
                case OpCode::Mul:       regs[i] = regs[ins.a] * regs[ins.b]; break;
                case OpCode::Div:       regs[i] = regs[ins.a] / regs[ins.b]; break;
            }
        }
        for (const auto& [slot, reg] : outputs_) {
            result[slot] += regs[reg];
        }
    }

    /// Human-readable listing, one instruction per line
    std::string toString() const;

private:
    friend class ProgramBuilder;

    std::vector<Instruction> code_;
    std::vector<BasisLoad> basis_loads_;
    std::vector<int> fields_;
    std::vector<std::pair<int, Reg>> outputs_;
    int num_slots_ = 1;
};

/**
 * @brief Incremental construction of a KernelProgram
 */
class ProgramBuilder {
public:
    explicit ProgramBuilder(int num_slots);

    Reg constant(Real value);
    Reg loadBasis(const BasisLoad& load);
    Reg loadField(int field_id, int component);
    Reg binary(BinaryOp op, Reg lhs, Reg rhs);

    /// Add register @p reg into output @p slot at every point
    void accumulate(int slot, Reg reg);

    std::size_t size() const noexcept { return code_.size(); }

    /**
     * @brief Remove dead instructions and return the compacted program
     */
    KernelProgram finish() const;

private:
    using Key = std::tuple<OpCode, Reg, Reg, std::uint64_t>;

    Reg emit(const Instruction& ins);

    int num_slots_;
    std::vector<Instruction> code_;
    std::map<Key, Reg> cse_;
    std::vector<BasisLoad> basis_loads_;
    std::vector<int> fields_;
    std::vector<std::pair<int, Reg>> outputs_;
};

} // namespace forms
} // namespace igak

#endif // IGAK_FORMS_KERNELPROGRAM_H
