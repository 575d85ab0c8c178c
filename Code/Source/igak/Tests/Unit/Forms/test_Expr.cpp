/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_Expr.cpp
 * @brief Unit tests for expression construction and shape checking
 */

#include <gtest/gtest.h>
#include "igak/Core/Exception.h"
#include "igak/Forms/Expr.h"

#include <string>
#include <vector>

using namespace igak;
using namespace igak::forms;

namespace {

Expr scalarField(const std::string& name) {
    return Expr::field(name, Shape::scalar());
}

Expr vectorField(const std::string& name, int n) {
    return Expr::field(name, Shape::vector(n));
}

} // namespace

TEST(Shape, SizeAndRank) {
    EXPECT_EQ(Shape::scalar().size(), 1);
    EXPECT_EQ(Shape::vector(3).size(), 3);
    EXPECT_EQ(Shape::matrix(2, 3).size(), 6);
    EXPECT_TRUE(Shape::matrix(2, 2).isMatrix());
    EXPECT_NE(Shape::vector(1), Shape::scalar());
    EXPECT_EQ(Shape::matrix(2, 3).toString(), "matrix[2,3]");
}

TEST(Shape, SymmetricIndexIsUpperTriangleRowMajor) {
    // 3x3: (0,0)=0 (0,1)=1 (0,2)=2 (1,1)=3 (1,2)=4 (2,2)=5
    EXPECT_EQ(symmetricIndex(0, 0, 3), 0);
    EXPECT_EQ(symmetricIndex(0, 2, 3), 2);
    EXPECT_EQ(symmetricIndex(1, 1, 3), 3);
    EXPECT_EQ(symmetricIndex(2, 1, 3), 4);
    EXPECT_EQ(symmetricIndex(2, 2, 3), 5);
    EXPECT_EQ(symmetricStorageSize(3), 6);
}

TEST(Expr, ArithmeticRequiresEqualShapes) {
    const Expr a = scalarField("a");
    const Expr g = vectorField("g", 2);
    const Expr h = vectorField("h", 2);

    EXPECT_EQ((a * a).shape(), Shape::scalar());
    EXPECT_EQ((g + h).shape(), Shape::vector(2));
    EXPECT_THROW(a * g, ShapeMismatchException);
    EXPECT_THROW(g - vectorField("k", 3), ShapeMismatchException);
    EXPECT_THROW(a + Expr(), InvalidArgumentException);
}

TEST(Expr, IndexWrapsNegativeAndChecksRange) {
    const Expr g = vectorField("g", 3);
    const Expr last = g[-1];
    EXPECT_EQ(last.shape(), Shape::scalar());
    EXPECT_EQ(std::get<IndexNode>(last.node().payload()).index, 2);
    EXPECT_THROW(g[3], ShapeMismatchException);
    EXPECT_THROW(g[-4], ShapeMismatchException);
    EXPECT_THROW(scalarField("a")[0], ShapeMismatchException);
}

TEST(Expr, EntryRequiresMatrix) {
    const Expr M = Expr::field("M", Shape::matrix(2, 3));
    const Expr e = entry(M, 1, -1);
    EXPECT_EQ(std::get<EntryNode>(e.node().payload()).col, 2);
    EXPECT_THROW(entry(M, 2, 0), ShapeMismatchException);
    EXPECT_THROW(entry(vectorField("g", 2), 0, 0), ShapeMismatchException);
}

TEST(Expr, SliceSelectsPositions) {
    const Expr g = vectorField("g", 4);
    const Expr s = slice(g, 0, 3);
    EXPECT_EQ(s.shape(), Shape::vector(3));
    const Expr t = slice(g, std::vector<int>{-1, 0});
    EXPECT_EQ(std::get<SliceNode>(t.node().payload()).indices, (std::vector<int>{3, 0}));
    EXPECT_THROW(slice(g, 2, 2), ShapeMismatchException);
    EXPECT_THROW(slice(g, std::vector<int>{4}), ShapeMismatchException);
}

TEST(Expr, MatMulChecksInnerDimension) {
    const Expr A = Expr::field("A", Shape::matrix(3, 2));
    EXPECT_EQ(matmul(A, vectorField("x", 2)).shape(), Shape::vector(3));
    EXPECT_THROW(matmul(A, vectorField("x", 3)), ShapeMismatchException);
    EXPECT_THROW(matmul(vectorField("x", 2), vectorField("y", 2)), ShapeMismatchException);
}

TEST(Expr, InnerProductIsScalarSum) {
    const Expr x = vectorField("x", 3);
    const Expr y = vectorField("y", 3);
    const Expr d = inner(x, y);
    EXPECT_EQ(d.shape(), Shape::scalar());
    EXPECT_EQ(d.kind(), ExprKind::BinaryOp);
    EXPECT_THROW(inner(x, vectorField("z", 2)), ShapeMismatchException);
}

TEST(Expr, ComposeChecksComponents) {
    const Expr a = scalarField("a");
    EXPECT_EQ(Expr::vector({a, a, a}).shape(), Shape::vector(3));
    EXPECT_EQ(Expr::matrix(2, 2, {a, a, a, a}).shape(), Shape::matrix(2, 2));
    EXPECT_THROW(Expr::matrix(2, 2, {a, a, a}), ShapeMismatchException);
    EXPECT_THROW(Expr::vector({a, vectorField("g", 2)}), ShapeMismatchException);
    EXPECT_THROW(Expr::vector(std::vector<Expr>{}), InvalidArgumentException);
}

TEST(Expr, SymmetricFieldMustBeSquareMatrix) {
    EXPECT_TRUE(Expr::field("B", Shape::matrix(2, 2), true).isSymmetric());
    EXPECT_FALSE(Expr::field("C", Shape::matrix(2, 2)).isSymmetric());
    EXPECT_THROW(Expr::field("B", Shape::matrix(2, 3), true), ShapeMismatchException);
}

TEST(Expr, PartialDerivRejectsNegativeOrder) {
    const Expr d = Expr::partialDeriv("u", {1, 0});
    EXPECT_EQ(d.toString(), "D[1,0](u)");
    EXPECT_THROW(Expr::partialDeriv("u", {-1, 0}), InvalidArgumentException);
    EXPECT_THROW(Expr::partialDeriv("u", {}), InvalidArgumentException);
}

TEST(Expr, ForEachNodeVisitsParentsFirst) {
    const Expr e = scalarField("a") * (Expr::constant(2.0) + scalarField("b"));
    std::vector<ExprKind> kinds;
    forEachNode(e, [&kinds](const Expr& sub) { kinds.push_back(sub.kind()); });
    ASSERT_EQ(kinds.size(), 5u);
    EXPECT_EQ(kinds[0], ExprKind::BinaryOp);
    EXPECT_EQ(kinds[1], ExprKind::Field);
    EXPECT_EQ(kinds[2], ExprKind::BinaryOp);
    EXPECT_EQ(kinds[3], ExprKind::Constant);
}
