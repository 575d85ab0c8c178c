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
 * @file FormBuilder.cpp
 * @brief Field registration, requirement tracking and form finalization
 */

#include "Forms/FormBuilder.h"
#include "Core/Exception.h"
#include <algorithm>

namespace igak {
namespace forms {

// ============================================================================
// FieldDefinition
// ============================================================================

FieldDefinition FieldDefinition::makeBuiltin(BuiltinField b) {
    FieldDefinition def;
    def.source = FieldSource::Builtin;
    def.builtin = b;
    return def;
}

FieldDefinition FieldDefinition::makePrecomputed(Expr e) {
    FieldDefinition def;
    def.source = FieldSource::Precomputed;
    def.expr = std::move(e);
    return def;
}

FieldDefinition FieldDefinition::makeInput(InputFunction f) {
    FieldDefinition def;
    def.source = FieldSource::Input;
    def.function = std::move(f);
    return def;
}

FieldDefinition FieldDefinition::makeLocal(Expr e) {
    FieldDefinition def;
    def.source = FieldSource::Local;
    def.expr = std::move(e);
    return def;
}

// ============================================================================
// VForm
// ============================================================================

int VForm::findField(const std::string& field_name) const noexcept {
    for (const auto& f : fields) {
        if (f.name == field_name) {
            return f.id;
        }
    }
    return -1;
}

const FieldVariable& VForm::field(const std::string& field_name) const {
    const int id = findField(field_name);
    IGAK_THROW_IF(id < 0, InvalidArgumentException,
                  "Form '" + name + "' has no field named '" + field_name + "'");
    return fields[static_cast<std::size_t>(id)];
}

// ============================================================================
// FormBuilder
// ============================================================================

FormBuilder::FormBuilder(std::string name, int dim, Arity arity,
                         int num_components, bool symmetric)
    : name_(std::move(name)),
      dim_(dim),
      arity_(arity),
      num_components_(num_components),
      symmetric_(symmetric) {
    IGAK_CHECK_ARG(dim_ >= 1, "FormBuilder: dimension must be positive");
    IGAK_CHECK_ARG(num_components_ >= 1, "FormBuilder: at least one component required");
}

Expr FormBuilder::registerField(const std::string& name, Shape shape, bool symmetric,
                                FieldDefinition def) {
    IGAK_CHECK_ARG(!name.empty(), "FormBuilder: empty field name");
    IGAK_CHECK_ARG(name != TRIAL && name != TEST,
                   "FormBuilder: field name '" + name + "' is reserved for basis functions");

    for (const auto& f : fields_) {
        if (f.name != name) {
            continue;
        }
        // repeated builtin requests share one field
        const bool same_builtin = f.definition.source == FieldSource::Builtin &&
                                  def.source == FieldSource::Builtin &&
                                  f.definition.builtin == def.builtin &&
                                  f.shape == shape && f.symmetric == symmetric;
        IGAK_THROW_IF(!same_builtin, InvalidArgumentException,
                      "FormBuilder: field '" + name + "' already registered in form '" +
                      name_ + "'");
        return Expr::field(f.name, f.shape, f.symmetric);
    }

    const int id = static_cast<int>(fields_.size());
    if (def.source == FieldSource::Precomputed || def.source == FieldSource::Local) {
        IGAK_THROW_IF(!def.expr.valid(), InvalidArgumentException,
                      "FormBuilder: field '" + name + "' has an empty definition");
        IGAK_THROW_IF(def.expr.shape() != shape, ShapeMismatchException,
                      "FormBuilder: definition of '" + name + "' has shape " +
                      def.expr.shape().toString() + ", declared " + shape.toString());
        checkReferences(def.expr, def.source == FieldSource::Precomputed, id);
    }
    if (def.source == FieldSource::Input) {
        IGAK_CHECK_ARG(static_cast<bool>(def.function),
                       "FormBuilder: input field '" + name + "' has no function");
        IGAK_THROW_IF(!shape.isScalar(), ShapeMismatchException,
                      "FormBuilder: input field '" + name + "' must be scalar");
    }
    if (def.source == FieldSource::Builtin) {
        // every builtin is derived from the Jacobian (the weight from its determinant)
        requirements_.needs_jacobian = true;
        if (def.builtin == BuiltinField::Weight) {
            requirements_.needs_weight = true;
        }
    }

    FieldVariable var;
    var.id = id;
    var.name = name;
    var.shape = shape;
    var.symmetric = symmetric;
    var.definition = std::move(def);
    fields_.push_back(std::move(var));
    return Expr::field(name, shape, symmetric);
}

Expr FormBuilder::registerScalar(const std::string& name, FieldDefinition def) {
    return registerField(name, Shape::scalar(), false, std::move(def));
}

Expr FormBuilder::registerVector(const std::string& name, int size, FieldDefinition def) {
    IGAK_CHECK_ARG(size >= 1, "FormBuilder::registerVector: empty vector");
    return registerField(name, Shape::vector(size), false, std::move(def));
}

Expr FormBuilder::registerMatrix(const std::string& name, int rows, int cols, bool symmetric,
                                 FieldDefinition def) {
    IGAK_CHECK_ARG(rows >= 1 && cols >= 1, "FormBuilder::registerMatrix: empty matrix");
    IGAK_THROW_IF(symmetric && rows != cols, ShapeMismatchException,
                  "FormBuilder::registerMatrix: symmetric matrix '" + name + "' is not square");
    return registerField(name, Shape::matrix(rows, cols), symmetric, std::move(def));
}

Expr FormBuilder::precompute(const std::string& name, const Expr& definition, bool symmetric) {
    const Shape shape = definition.shape();
    if (shape.isMatrix()) {
        return registerMatrix(name, shape.rows, shape.cols, symmetric,
                              FieldDefinition::makePrecomputed(definition));
    }
    IGAK_THROW_IF(symmetric, ShapeMismatchException,
                  "FormBuilder::precompute: only matrices can be symmetric (" + name + ")");
    if (shape.isVector()) {
        return registerVector(name, shape.rows, FieldDefinition::makePrecomputed(definition));
    }
    return registerScalar(name, FieldDefinition::makePrecomputed(definition));
}

Expr FormBuilder::inputFunction(const std::string& name, InputFunction fn) {
    return registerScalar(name, FieldDefinition::makeInput(std::move(fn)));
}

Expr FormBuilder::defineLocal(const std::string& name, const Expr& definition) {
    const Shape shape = definition.shape();
    return registerField(name, shape, false, FieldDefinition::makeLocal(definition));
}

Expr FormBuilder::field(const std::string& name) const {
    for (const auto& f : fields_) {
        if (f.name == name) {
            return Expr::field(f.name, f.shape, f.symmetric);
        }
    }
    IGAK_THROW(InvalidArgumentException,
               "FormBuilder: no field named '" + name + "' in form '" + name_ + "'");
}

bool FormBuilder::hasField(const std::string& name) const noexcept {
    return std::any_of(fields_.begin(), fields_.end(),
                       [&name](const FieldVariable& f) { return f.name == name; });
}

BasisRole FormBuilder::checkBasis(const std::string& basis) const {
    if (basis == TEST) {
        return BasisRole::Test;
    }
    if (basis == TRIAL) {
        IGAK_THROW_IF(arity_ == Arity::Linear, InvalidArgumentException,
                      "FormBuilder: linear form '" + name_ + "' has no trial function");
        return BasisRole::Trial;
    }
    IGAK_THROW(InvalidArgumentException,
               "FormBuilder: unknown basis function '" + basis + "'");
}

void FormBuilder::checkReferences(const Expr& expr, bool array_only, int before_id) const {
    forEachNode(expr, [&](const Expr& e) {
        const ExprPayload& payload = e.node().payload();
        if (const auto* f = std::get_if<FieldNode>(&payload)) {
            const auto it = std::find_if(fields_.begin(), fields_.end(),
                [f](const FieldVariable& v) { return v.name == f->name; });
            IGAK_THROW_IF(it == fields_.end() || it->id >= before_id, InvalidArgumentException,
                          "FormBuilder: reference to unregistered field '" + f->name + "'");
            IGAK_THROW_IF(array_only && !it->isArray(), InvalidArgumentException,
                          "FormBuilder: precomputed field references local '" + f->name + "'");
        } else if (const auto* d = std::get_if<PartialDerivNode>(&payload)) {
            IGAK_THROW_IF(array_only, InvalidArgumentException,
                          "FormBuilder: precomputed field references basis function '" +
                          d->basis + "'");
            checkBasis(d->basis);
            IGAK_THROW_IF(static_cast<int>(d->orders.size()) != dim_, ShapeMismatchException,
                          "FormBuilder: derivative tuple of length " +
                          std::to_string(d->orders.size()) + " in a " +
                          std::to_string(dim_) + "D form");
        }
    });
}

void FormBuilder::noteOrders(const std::vector<int>& orders) {
    for (int d : orders) {
        requirements_.max_deriv = std::max(requirements_.max_deriv, d);
    }
}

std::vector<int> FormBuilder::unitOrder(int axis) const {
    const int a = axis < 0 ? axis + dim_ : axis;
    IGAK_THROW_IF(a < 0 || a >= dim_, ShapeMismatchException,
                  "FormBuilder: axis " + std::to_string(axis) + " out of range for " +
                  std::to_string(dim_) + "D form");
    std::vector<int> orders(static_cast<std::size_t>(dim_), 0);
    orders[static_cast<std::size_t>(a)] = 1;
    return orders;
}

Expr FormBuilder::basisValue(const std::string& basis) {
    checkBasis(basis);
    requirements_.needs_basis_value = true;
    return Expr::partialDeriv(basis, std::vector<int>(static_cast<std::size_t>(dim_), 0));
}

Expr FormBuilder::partialDeriv(const std::string& basis, const std::vector<int>& orders) {
    checkBasis(basis);
    IGAK_THROW_IF(static_cast<int>(orders.size()) != dim_, ShapeMismatchException,
                  "FormBuilder::partialDeriv: tuple of length " +
                  std::to_string(orders.size()) + " in a " + std::to_string(dim_) + "D form");
    noteOrders(orders);
    return Expr::partialDeriv(basis, orders);
}

Expr FormBuilder::gradient(const std::string& basis,
                           const std::vector<int>& axes,
                           const std::vector<int>& extra) {
    checkBasis(basis);
    IGAK_THROW_IF(!extra.empty() && static_cast<int>(extra.size()) != dim_,
                  ShapeMismatchException,
                  "FormBuilder::gradient: extra derivative tuple has wrong length");

    std::vector<int> which = axes;
    if (which.empty()) {
        for (int k = 0; k < dim_; ++k) {
            which.push_back(k);
        }
    }

    requirements_.needs_param_gradient = true;
    requirements_.max_deriv = std::max(requirements_.max_deriv, 1);

    std::vector<Expr> components;
    components.reserve(which.size());
    for (int axis : which) {
        std::vector<int> orders = unitOrder(axis);
        for (std::size_t k = 0; k < extra.size(); ++k) {
            IGAK_CHECK_ARG(extra[k] >= 0, "FormBuilder::gradient: negative extra derivative");
            orders[k] += extra[k];
        }
        noteOrders(orders);
        components.push_back(Expr::partialDeriv(basis, std::move(orders)));
    }
    return Expr::vector(std::move(components));
}

Expr FormBuilder::jacobianInverseTranspose() {
    return registerMatrix("JacInvT", dim_, dim_, false,
                          FieldDefinition::makeBuiltin(BuiltinField::JacobianInverseTranspose));
}

Expr FormBuilder::physicalGradient(const std::string& basis, const std::vector<int>& extra) {
    const Expr JinvT = jacobianInverseTranspose();
    const Expr g = gradient(basis, {}, extra);
    requirements_.needs_physical_gradient = true;
    return matmul(JinvT, g);
}

Expr FormBuilder::quadratureWeight() {
    return registerScalar("weight", FieldDefinition::makeBuiltin(BuiltinField::Weight));
}

void FormBuilder::add(const Expr& expr) {
    addToSlot(0, expr);
}

void FormBuilder::addToSlot(int slot, const Expr& expr) {
    IGAK_THROW_IF(!expr.valid(), InvalidArgumentException,
                  "FormBuilder::addToSlot: empty expression");
    IGAK_THROW_IF(!expr.shape().isScalar(), ShapeMismatchException,
                  "FormBuilder::addToSlot: accumulated expression has shape " +
                  expr.shape().toString());
    IGAK_CHECK_INDEX(slot, numOutputSlots(), "FormBuilder::addToSlot: output slot");
    checkReferences(expr, false, static_cast<int>(fields_.size()));
    accumulations_.push_back(Accumulation{slot, expr});
}

VForm FormBuilder::finalize() const {
    IGAK_THROW_IF(accumulations_.empty(), InvalidArgumentException,
                  "FormBuilder: form '" + name_ + "' accumulates nothing");

    VForm form;
    form.name = name_;
    form.dim = dim_;
    form.arity = arity_;
    form.num_components = num_components_;
    form.symmetric = symmetric_;
    form.fields = fields_;
    form.accumulations = accumulations_;
    form.requirements = requirements_;

    auto scan = [&form](const Expr& e) {
        forEachNode(e, [&form](const Expr& sub) {
            if (const auto* d = std::get_if<PartialDerivNode>(&sub.node().payload())) {
                for (int o : d->orders) {
                    form.requirements.max_deriv = std::max(form.requirements.max_deriv, o);
                }
            }
        });
    };
    for (const auto& acc : form.accumulations) {
        scan(acc.expr);
    }
    for (const auto& f : form.fields) {
        if (f.definition.source == FieldSource::Local) {
            scan(f.definition.expr);
        }
    }
    return form;
}

} // namespace forms
} // namespace igak
