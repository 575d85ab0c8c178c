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
 * @file Expr.cpp
 * @brief Construction and shape checking of expression nodes
 */

#include "Forms/Expr.h"
#include "Core/Exception.h"
#include <sstream>
#include <type_traits>

namespace igak {
namespace forms {

namespace {

Expr make(Shape shape, ExprPayload payload) {
    return Expr(std::make_shared<const ExprNode>(shape, std::move(payload)));
}

void require_valid(const Expr& e, const char* op) {
    IGAK_THROW_IF(!e.valid(), InvalidArgumentException,
                  std::string(op) + ": operand is an empty expression");
}

int wrap_index(int k, int n, const char* op) {
    const int w = k < 0 ? k + n : k;
    IGAK_THROW_IF(w < 0 || w >= n, ShapeMismatchException,
                  std::string(op) + ": index " + std::to_string(k) +
                  " out of range for length " + std::to_string(n));
    return w;
}

Expr binary(BinaryOp op, const Expr& a, const Expr& b) {
    require_valid(a, binaryOpSymbol(op));
    require_valid(b, binaryOpSymbol(op));
    IGAK_THROW_IF(a.shape() != b.shape(), ShapeMismatchException,
                  std::string("operator") + binaryOpSymbol(op) + ": shapes " +
                  a.shape().toString() + " and " + b.shape().toString() + " differ");
    return make(a.shape(), BinaryNode{op, a, b});
}

struct Printer {
    std::ostringstream& os;

    void operator()(const ConstantNode& n) const { os << n.value; }
    void operator()(const FieldNode& n) const { os << n.name; }
    void operator()(const BinaryNode& n) const {
        os << "(" << n.lhs.toString() << " " << binaryOpSymbol(n.op) << " "
           << n.rhs.toString() << ")";
    }
    void operator()(const IndexNode& n) const {
        os << n.operand.toString() << "[" << n.index << "]";
    }
    void operator()(const EntryNode& n) const {
        os << n.operand.toString() << "[" << n.row << "," << n.col << "]";
    }
    void operator()(const SliceNode& n) const {
        os << n.operand.toString() << "[";
        for (std::size_t i = 0; i < n.indices.size(); ++i) {
            os << (i ? "," : "") << n.indices[i];
        }
        os << "]";
    }
    void operator()(const MatMulNode& n) const {
        os << "(" << n.matrix.toString() << " . " << n.vector.toString() << ")";
    }
    void operator()(const PartialDerivNode& n) const {
        os << "D[";
        for (std::size_t i = 0; i < n.orders.size(); ++i) {
            os << (i ? "," : "") << n.orders[i];
        }
        os << "](" << n.basis << ")";
    }
    void operator()(const ComposeNode& n) const {
        os << "{";
        for (std::size_t i = 0; i < n.components.size(); ++i) {
            os << (i ? ", " : "") << n.components[i].toString();
        }
        os << "}";
    }
};

} // anonymous namespace

std::string Shape::toString() const {
    switch (rank) {
        case 0: return "scalar";
        case 1: return "vector[" + std::to_string(rows) + "]";
        default: return "matrix[" + std::to_string(rows) + "," + std::to_string(cols) + "]";
    }
}

const char* binaryOpSymbol(BinaryOp op) noexcept {
    switch (op) {
        case BinaryOp::Add: return "+";
        case BinaryOp::Sub: return "-";
        case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/";
    }
    return "?";
}

// ============================================================================
// Expr
// ============================================================================

Expr::Expr(std::shared_ptr<const ExprNode> node) : node_(std::move(node)) {}

Expr Expr::constant(Real value) {
    return make(Shape::scalar(), ConstantNode{value});
}

Expr Expr::field(std::string name, Shape shape, bool symmetric) {
    IGAK_CHECK_ARG(!name.empty(), "Expr::field: empty field name");
    IGAK_CHECK_ARG(shape.rows > 0 && shape.cols > 0, "Expr::field: empty shape");
    IGAK_THROW_IF(symmetric && (!shape.isMatrix() || shape.rows != shape.cols),
                  ShapeMismatchException,
                  "Expr::field: only square matrices can be symmetric (" + name + ")");
    return make(shape, FieldNode{std::move(name), symmetric});
}

Expr Expr::partialDeriv(std::string basis, std::vector<int> orders) {
    IGAK_CHECK_ARG(!basis.empty(), "Expr::partialDeriv: empty basis name");
    IGAK_CHECK_ARG(!orders.empty(), "Expr::partialDeriv: empty derivative tuple");
    for (int d : orders) {
        IGAK_CHECK_ARG(d >= 0, "Expr::partialDeriv: negative derivative order");
    }
    return make(Shape::scalar(), PartialDerivNode{std::move(basis), std::move(orders)});
}

Expr Expr::vector(std::vector<Expr> components) {
    IGAK_CHECK_ARG(!components.empty(), "Expr::vector: no components");
    for (const auto& c : components) {
        require_valid(c, "Expr::vector");
        IGAK_THROW_IF(!c.shape().isScalar(), ShapeMismatchException,
                      "Expr::vector: component of shape " + c.shape().toString() +
                      " is not a scalar");
    }
    const int n = static_cast<int>(components.size());
    return make(Shape::vector(n), ComposeNode{std::move(components)});
}

Expr Expr::matrix(int rows, int cols, std::vector<Expr> components) {
    IGAK_CHECK_ARG(rows > 0 && cols > 0, "Expr::matrix: empty shape");
    IGAK_THROW_IF(components.size() != static_cast<std::size_t>(rows * cols),
                  ShapeMismatchException,
                  "Expr::matrix: " + std::to_string(components.size()) +
                  " components for a " + std::to_string(rows) + "x" +
                  std::to_string(cols) + " matrix");
    for (const auto& c : components) {
        require_valid(c, "Expr::matrix");
        IGAK_THROW_IF(!c.shape().isScalar(), ShapeMismatchException,
                      "Expr::matrix: component of shape " + c.shape().toString() +
                      " is not a scalar");
    }
    return make(Shape::matrix(rows, cols), ComposeNode{std::move(components)});
}

const Shape& Expr::shape() const {
    return node().shape();
}

ExprKind Expr::kind() const {
    return node().kind();
}

const ExprNode& Expr::node() const {
    IGAK_THROW_IF(node_ == nullptr, InvalidArgumentException, "Expr: empty expression");
    return *node_;
}

bool Expr::isSymmetric() const {
    const auto* f = std::get_if<FieldNode>(&node().payload());
    return f != nullptr && f->symmetric;
}

std::string Expr::toString() const {
    if (!valid()) {
        return "<empty>";
    }
    std::ostringstream os;
    std::visit(Printer{os}, node_->payload());
    return os.str();
}

Expr Expr::operator[](int k) const {
    return index(*this, k);
}

// ============================================================================
// Operations
// ============================================================================

Expr operator+(const Expr& a, const Expr& b) { return binary(BinaryOp::Add, a, b); }
Expr operator-(const Expr& a, const Expr& b) { return binary(BinaryOp::Sub, a, b); }
Expr operator*(const Expr& a, const Expr& b) { return binary(BinaryOp::Mul, a, b); }
Expr operator/(const Expr& a, const Expr& b) { return binary(BinaryOp::Div, a, b); }

Expr index(const Expr& v, int k) {
    require_valid(v, "index");
    IGAK_THROW_IF(!v.shape().isVector(), ShapeMismatchException,
                  "index: operand of shape " + v.shape().toString() + " is not a vector");
    const int w = wrap_index(k, v.shape().rows, "index");
    return make(Shape::scalar(), IndexNode{v, w});
}

Expr entry(const Expr& m, int i, int j) {
    require_valid(m, "entry");
    IGAK_THROW_IF(!m.shape().isMatrix(), ShapeMismatchException,
                  "entry: operand of shape " + m.shape().toString() + " is not a matrix");
    const int r = wrap_index(i, m.shape().rows, "entry");
    const int c = wrap_index(j, m.shape().cols, "entry");
    return make(Shape::scalar(), EntryNode{m, r, c});
}

Expr slice(const Expr& v, std::vector<int> indices) {
    require_valid(v, "slice");
    IGAK_THROW_IF(!v.shape().isVector(), ShapeMismatchException,
                  "slice: operand of shape " + v.shape().toString() + " is not a vector");
    IGAK_THROW_IF(indices.empty(), ShapeMismatchException, "slice: empty index set");
    for (int& k : indices) {
        k = wrap_index(k, v.shape().rows, "slice");
    }
    const int n = static_cast<int>(indices.size());
    return make(Shape::vector(n), SliceNode{v, std::move(indices)});
}

Expr slice(const Expr& v, int first, int last) {
    std::vector<int> indices;
    for (int k = first; k < last; ++k) {
        indices.push_back(k);
    }
    return slice(v, std::move(indices));
}

Expr matmul(const Expr& A, const Expr& x) {
    require_valid(A, "matmul");
    require_valid(x, "matmul");
    IGAK_THROW_IF(!A.shape().isMatrix(), ShapeMismatchException,
                  "matmul: left operand of shape " + A.shape().toString() + " is not a matrix");
    IGAK_THROW_IF(!x.shape().isVector(), ShapeMismatchException,
                  "matmul: right operand of shape " + x.shape().toString() + " is not a vector");
    IGAK_THROW_IF(A.shape().cols != x.shape().rows, ShapeMismatchException,
                  "matmul: inner dimensions " + std::to_string(A.shape().cols) + " and " +
                  std::to_string(x.shape().rows) + " differ");
    return make(Shape::vector(A.shape().rows), MatMulNode{A, x});
}

Expr inner(const Expr& x, const Expr& y) {
    require_valid(x, "inner");
    require_valid(y, "inner");
    IGAK_THROW_IF(!x.shape().isVector() || !y.shape().isVector(), ShapeMismatchException,
                  "inner: operands " + x.shape().toString() + " and " +
                  y.shape().toString() + " must be vectors");
    IGAK_THROW_IF(x.shape().rows != y.shape().rows, ShapeMismatchException,
                  "inner: lengths " + std::to_string(x.shape().rows) + " and " +
                  std::to_string(y.shape().rows) + " differ");
    Expr sum = index(x, 0) * index(y, 0);
    for (int k = 1; k < x.shape().rows; ++k) {
        sum = sum + index(x, k) * index(y, k);
    }
    return sum;
}

void forEachNode(const Expr& expr, const std::function<void(const Expr&)>& fn) {
    if (!expr.valid()) {
        return;
    }
    fn(expr);
    std::visit([&fn](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, BinaryNode>) {
            forEachNode(n.lhs, fn);
            forEachNode(n.rhs, fn);
        } else if constexpr (std::is_same_v<T, IndexNode> ||
                             std::is_same_v<T, EntryNode> ||
                             std::is_same_v<T, SliceNode>) {
            forEachNode(n.operand, fn);
        } else if constexpr (std::is_same_v<T, MatMulNode>) {
            forEachNode(n.matrix, fn);
            forEachNode(n.vector, fn);
        } else if constexpr (std::is_same_v<T, ComposeNode>) {
            for (const auto& c : n.components) {
                forEachNode(c, fn);
            }
        }
    }, expr.node().payload());
}

} // namespace forms
} // namespace igak
