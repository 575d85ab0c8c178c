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

#ifndef IGAK_FORMS_EXPR_H
#define IGAK_FORMS_EXPR_H

/**
 * @file Expr.h
 * @brief Shape-checked expression IR for bilinear and linear forms
 *
 * An Expr is an immutable, value-semantic handle to a node of a tagged
 * variant. Every constructor checks operand shapes and throws
 * ShapeMismatchException immediately; once built, an expression is always
 * well-formed and lowering never fails on shapes.
 *
 * Example:
 * @code
 *   Expr w  = builder.quadratureWeight();
 *   Expr gu = builder.gradient("u");
 *   Expr gv = builder.gradient("v");
 *   builder.add(w * inner(gu, gv));
 * @endcode
 */

#include "Core/Types.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace igak {
namespace forms {

// ============================================================================
// Shape
// ============================================================================

/**
 * @brief Rank and extents of an expression value
 */
struct Shape {
    int rank = 0;   ///< 0 scalar, 1 vector, 2 matrix
    int rows = 1;
    int cols = 1;

    static constexpr Shape scalar() noexcept { return Shape{0, 1, 1}; }
    static constexpr Shape vector(int n) noexcept { return Shape{1, n, 1}; }
    static constexpr Shape matrix(int r, int c) noexcept { return Shape{2, r, c}; }

    /// Number of scalar components in row-major order
    constexpr int size() const noexcept { return rows * cols; }

    constexpr bool isScalar() const noexcept { return rank == 0; }
    constexpr bool isVector() const noexcept { return rank == 1; }
    constexpr bool isMatrix() const noexcept { return rank == 2; }

    std::string toString() const;
};

constexpr bool operator==(const Shape& a, const Shape& b) noexcept {
    return a.rank == b.rank && a.rows == b.rows && a.cols == b.cols;
}
constexpr bool operator!=(const Shape& a, const Shape& b) noexcept { return !(a == b); }

/**
 * @brief Backing index of entry (i, j) of a symmetric n x n matrix stored
 *        as its upper triangle (row-major, i <= j)
 */
constexpr int symmetricIndex(int i, int j, int n) noexcept {
    if (i > j) {
        const int t = i;
        i = j;
        j = t;
    }
    return i * n - (i * (i - 1)) / 2 + (j - i);
}

/// Stored entries of a symmetric n x n matrix
constexpr int symmetricStorageSize(int n) noexcept { return n * (n + 1) / 2; }

// ============================================================================
// Node payloads
// ============================================================================

enum class ExprKind : std::uint8_t {
    Constant,
    Field,
    BinaryOp,
    Index,
    Entry,
    Slice,
    MatMul,
    PartialDeriv,
    Compose
};

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div
};

const char* binaryOpSymbol(BinaryOp op) noexcept;

class ExprNode;

/**
 * @brief Immutable handle to an expression node
 */
class Expr {
public:
    Expr() = default;
    explicit Expr(std::shared_ptr<const ExprNode> node);

    // ---- Literals ----
    static Expr constant(Real value);

    /**
     * @brief Reference to a registered field
     *
     * Normally obtained from FormBuilder rather than called directly.
     */
    static Expr field(std::string name, Shape shape, bool symmetric = false);

    // ---- Basis functions ----

    /**
     * @brief Partial derivative of basis function @p basis ("u" or "v")
     *
     * @param orders Derivative order per parametric axis
     */
    static Expr partialDeriv(std::string basis, std::vector<int> orders);

    // ---- Constructors ----
    static Expr vector(std::vector<Expr> components);
    static Expr matrix(int rows, int cols, std::vector<Expr> components);

    [[nodiscard]] bool valid() const noexcept { return node_ != nullptr; }
    [[nodiscard]] const Shape& shape() const;
    [[nodiscard]] ExprKind kind() const;
    [[nodiscard]] const ExprNode& node() const;

    /// Matrix field declared symmetric
    [[nodiscard]] bool isSymmetric() const;

    [[nodiscard]] std::string toString() const;

    /// Vector component, negative indices wrap
    Expr operator[](int k) const;

private:
    std::shared_ptr<const ExprNode> node_;
};

struct ConstantNode {
    Real value;
};

struct FieldNode {
    std::string name;
    bool symmetric;
};

struct BinaryNode {
    BinaryOp op;
    Expr lhs;
    Expr rhs;
};

struct IndexNode {
    Expr operand;
    int index;      ///< normalized, non-negative
};

struct EntryNode {
    Expr operand;
    int row;
    int col;
};

struct SliceNode {
    Expr operand;
    std::vector<int> indices;   ///< normalized, non-negative
};

struct MatMulNode {
    Expr matrix;
    Expr vector;
};

struct PartialDerivNode {
    std::string basis;
    std::vector<int> orders;
};

struct ComposeNode {
    std::vector<Expr> components;   ///< row-major scalars
};

using ExprPayload = std::variant<ConstantNode,
                                 FieldNode,
                                 BinaryNode,
                                 IndexNode,
                                 EntryNode,
                                 SliceNode,
                                 MatMulNode,
                                 PartialDerivNode,
                                 ComposeNode>;

class ExprNode {
public:
    ExprNode(Shape shape, ExprPayload payload)
        : shape_(shape), payload_(std::move(payload)) {}

    const Shape& shape() const noexcept { return shape_; }
    const ExprPayload& payload() const noexcept { return payload_; }
    ExprKind kind() const noexcept { return static_cast<ExprKind>(payload_.index()); }

private:
    Shape shape_;
    ExprPayload payload_;
};

// ============================================================================
// Operations
// ============================================================================

/// Elementwise arithmetic, operands must have identical shapes
Expr operator+(const Expr& a, const Expr& b);
Expr operator-(const Expr& a, const Expr& b);
Expr operator*(const Expr& a, const Expr& b);
Expr operator/(const Expr& a, const Expr& b);

/// Component @p k of vector @p v (negative indices wrap)
Expr index(const Expr& v, int k);

/// Entry (i, j) of matrix @p m (negative indices wrap)
Expr entry(const Expr& m, int i, int j);

/// Sub-vector of @p v at the given positions (negative indices wrap)
Expr slice(const Expr& v, std::vector<int> indices);

/// Sub-vector of components [first, last) of @p v
Expr slice(const Expr& v, int first, int last);

/// Matrix-vector product, rows(A) components
Expr matmul(const Expr& A, const Expr& x);

/// Sum of elementwise products of two vectors of equal length
Expr inner(const Expr& x, const Expr& y);

/**
 * @brief Call @p fn on @p expr and every sub-expression, parents first
 */
void forEachNode(const Expr& expr, const std::function<void(const Expr&)>& fn);

} // namespace forms
} // namespace igak

#endif // IGAK_FORMS_EXPR_H
