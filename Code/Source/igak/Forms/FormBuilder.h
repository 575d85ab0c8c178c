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

#ifndef IGAK_FORMS_FORMBUILDER_H
#define IGAK_FORMS_FORMBUILDER_H

/**
 * @file FormBuilder.h
 * @brief Field and derivative registry used to define a variational form
 *
 * A FormBuilder records the fields a form reads, the basis-function
 * derivatives it needs and the (output slot, expression) accumulations it
 * adds at every quadrature point. Accessors set requirement flags as a side
 * effect: requesting a gradient raises the derivative order to at least 1,
 * requesting a physical gradient registers the Jacobian inverse transpose.
 * finalize() freezes everything into a VForm.
 */

#include "Core/Types.h"
#include "Forms/Expr.h"
#include "Forms/KernelProgram.h"
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace igak {
namespace forms {

// ============================================================================
// Fields
// ============================================================================

/**
 * @brief Where the values of a field come from
 */
enum class FieldSource : std::uint8_t {
    Builtin,      ///< geometry-derived array computed at initialization
    Precomputed,  ///< expression over other array fields, evaluated once over the grid
    Input,        ///< user function of the physical point, re-evaluated on update
    Local         ///< per-point temporary inside the kernel
};

enum class BuiltinField : std::uint8_t {
    Weight,                    ///< quadrature weight times |det J|
    JacobianInverseTranspose   ///< J^{-T}
};

/// Scalar function of the physical coordinates
using InputFunction = std::function<Real(std::span<const Real>)>;

struct FieldDefinition {
    FieldSource source = FieldSource::Builtin;
    BuiltinField builtin = BuiltinField::Weight;
    Expr expr;
    InputFunction function;

    static FieldDefinition makeBuiltin(BuiltinField b);
    static FieldDefinition makePrecomputed(Expr e);
    static FieldDefinition makeInput(InputFunction f);
    static FieldDefinition makeLocal(Expr e);
};

/**
 * @brief A registered field
 *
 * Array fields (every source except Local) are stored over the quadrature
 * grid with storageSize() entries per node. Symmetric matrices store their
 * upper triangle only.
 */
struct FieldVariable {
    int id = -1;
    std::string name;
    Shape shape;
    bool symmetric = false;
    FieldDefinition definition;

    bool isArray() const noexcept { return definition.source != FieldSource::Local; }

    int storageSize() const noexcept {
        return symmetric ? symmetricStorageSize(shape.rows) : shape.size();
    }

    /// Backing component of logical entry (i, j); vectors use j = 0
    int backingIndex(int i, int j) const noexcept {
        if (symmetric) {
            return symmetricIndex(i, j, shape.rows);
        }
        return i * shape.cols + j;
    }
};

// ============================================================================
// Finalized form
// ============================================================================

/**
 * @brief What the kernel initialization must precompute
 */
struct FormRequirements {
    bool needs_basis_value = false;
    bool needs_param_gradient = false;
    bool needs_physical_gradient = false;
    bool needs_weight = false;
    bool needs_jacobian = false;       ///< Jacobian, its determinant or inverse
    int max_deriv = 0;                 ///< highest derivative order on any axis
};

struct Accumulation {
    int slot = 0;
    Expr expr;
};

/**
 * @brief Immutable description of a form produced by FormBuilder::finalize()
 */
struct VForm {
    std::string name;
    int dim = 0;
    Arity arity = Arity::Bilinear;
    int num_components = 1;
    bool symmetric = false;
    std::vector<FieldVariable> fields;
    std::vector<Accumulation> accumulations;
    FormRequirements requirements;

    /// Scalar results per entry: nc^2 for bilinear, nc for linear forms
    int numOutputSlots() const noexcept {
        return arity == Arity::Bilinear ? num_components * num_components : num_components;
    }

    /// Registry id of a field, -1 if unknown
    int findField(const std::string& field_name) const noexcept;

    const FieldVariable& field(const std::string& field_name) const;
};

// ============================================================================
// FormBuilder
// ============================================================================

class FormBuilder {
public:
    /// Trial and test basis names
    static constexpr const char* TRIAL = "u";
    static constexpr const char* TEST = "v";

    FormBuilder(std::string name, int dim, Arity arity,
                int num_components = 1, bool symmetric = false);

    int dim() const noexcept { return dim_; }
    Arity arity() const noexcept { return arity_; }
    int numComponents() const noexcept { return num_components_; }

    // ---- Registry ----

    Expr registerScalar(const std::string& name, FieldDefinition def);
    Expr registerVector(const std::string& name, int size, FieldDefinition def);
    Expr registerMatrix(const std::string& name, int rows, int cols, bool symmetric,
                        FieldDefinition def);

    /**
     * @brief Array field evaluated once over the whole grid from @p definition
     *
     * @p definition may only reference array fields registered earlier. For a
     * symmetric matrix only the entries with row <= col are evaluated.
     */
    Expr precompute(const std::string& name, const Expr& definition, bool symmetric = false);

    /// Scalar array field sampled from @p fn at the physical quadrature points
    Expr inputFunction(const std::string& name, InputFunction fn);

    /// Per-point temporary lowered once and reused by every reference
    Expr defineLocal(const std::string& name, const Expr& definition);

    /// Previously registered field by name
    Expr field(const std::string& name) const;

    bool hasField(const std::string& name) const noexcept;

    // ---- Basis functions and geometry ----

    Expr basisValue(const std::string& basis);

    /**
     * @brief Parametric partial derivative with per-axis orders
     */
    Expr partialDeriv(const std::string& basis, const std::vector<int>& orders);

    /**
     * @brief Parametric gradient
     *
     * @param axes  Axes to differentiate along (empty: all)
     * @param extra Derivative orders added to every component
     */
    Expr gradient(const std::string& basis,
                  const std::vector<int>& axes = {},
                  const std::vector<int>& extra = {});

    /**
     * @brief Physical gradient J^{-T} * gradient(basis, all axes, extra)
     */
    Expr physicalGradient(const std::string& basis, const std::vector<int>& extra = {});

    /// Quadrature weight times |det J|
    Expr quadratureWeight();

    /// J^{-T} as a dim x dim matrix field
    Expr jacobianInverseTranspose();

    /// Unit derivative tuple along @p axis (negative wraps)
    std::vector<int> unitOrder(int axis) const;

    // ---- Accumulation ----

    /// Add scalar @p expr into output slot 0
    void add(const Expr& expr);

    void addToSlot(int slot, const Expr& expr);

    int numOutputSlots() const noexcept {
        return arity_ == Arity::Bilinear ? num_components_ * num_components_ : num_components_;
    }

    /**
     * @brief Freeze into a VForm
     *
     * Scans all accumulations and local definitions to promote the derivative
     * order to the highest one referenced.
     */
    VForm finalize() const;

private:
    Expr registerField(const std::string& name, Shape shape, bool symmetric,
                       FieldDefinition def);
    BasisRole checkBasis(const std::string& basis) const;
    void checkReferences(const Expr& expr, bool array_only, int before_id) const;
    void noteOrders(const std::vector<int>& orders);

    std::string name_;
    int dim_;
    Arity arity_;
    int num_components_;
    bool symmetric_;
    std::vector<FieldVariable> fields_;
    std::vector<Accumulation> accumulations_;
    FormRequirements requirements_;
};

} // namespace forms
} // namespace igak

#endif // IGAK_FORMS_FORMBUILDER_H
