// File: tests/unit/test_expr_ast.cpp
// Purpose: Check operator metadata and structural equality of expression trees.
// Key invariants: Equality compares shape and values, never spans.
// Ownership/Lifetime: Trees are built with makeExpr/makePrimary and owned
//                     by the test.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "frontends/math/AST.hpp"
#include "frontends/math/Lexical.hpp"

#include <utility>
#include <vector>

using namespace mathexpr::frontends::math;

namespace
{

ExprPtr num(int64_t value, Span span = {})
{
    return makePrimary(span, NumberLiteral{value});
}

ExprPtr ident(const char *name, Span span = {})
{
    return makePrimary(span, Identifier{name});
}

} // namespace

TEST(ExprAst, SpellingsRoundTripThroughOperatorTables)
{
    for (const auto &entry : kBinaryOperators)
        EXPECT_EQ(spelling(entry.op), entry.literal);
    for (const auto &entry : kUnaryOperators)
        EXPECT_EQ(spelling(entry.op), entry.literal);
}

TEST(ExprAst, PrecedenceLevels)
{
    EXPECT_EQ(precedence(BinaryOp::Assign), 0);
    EXPECT_EQ(precedence(BinaryOp::Or), 1);
    EXPECT_EQ(precedence(BinaryOp::And), 2);
    EXPECT_EQ(precedence(BinaryOp::Eq), precedence(BinaryOp::Ne));
    EXPECT_EQ(precedence(BinaryOp::Lt), 4);
    EXPECT_EQ(precedence(BinaryOp::Ge), 4);
    EXPECT_EQ(precedence(BinaryOp::Sub), 5);
    EXPECT_EQ(precedence(BinaryOp::Pow), precedence(BinaryOp::Mul));
    EXPECT_GT(precedence(BinaryOp::Div), precedence(BinaryOp::Add));
}

TEST(ExprAst, EqualityIgnoresSpans)
{
    auto a = makeExpr(Span{0, 5},
                      BinaryExpression{num(1, {0, 1}), {{2, 3}, BinaryOp::Add}, ident("x", {4, 5})});
    auto b = makeExpr(Span{10, 13},
                      BinaryExpression{num(1, {10, 11}), {{11, 12}, BinaryOp::Add}, ident("x", {12, 13})});
    EXPECT_TRUE(*a == *b);
}

TEST(ExprAst, EqualityComparesShapeAndValues)
{
    auto sum = makeExpr(Span{}, BinaryExpression{num(1), {{}, BinaryOp::Add}, num(2)});
    auto diff = makeExpr(Span{}, BinaryExpression{num(1), {{}, BinaryOp::Sub}, num(2)});
    auto other = makeExpr(Span{}, BinaryExpression{num(1), {{}, BinaryOp::Add}, num(3)});
    EXPECT_FALSE(*sum == *diff);
    EXPECT_FALSE(*sum == *other);

    auto prefix = makeExpr(Span{}, UnaryExpression{{{}, UnaryOp::Neg}, num(1), true});
    auto postfix = makeExpr(Span{}, UnaryExpression{{{}, UnaryOp::Neg}, num(1), false});
    EXPECT_FALSE(*prefix == *postfix);

    // A grouped expression is a distinct node from its contents.
    auto grouped = makePrimary(Span{}, GroupedExpression{num(1)});
    EXPECT_FALSE(*grouped == *num(1));
}

TEST(ExprAst, EqualityOnListsAndCalls)
{
    std::vector<ExprPtr> left;
    left.push_back(num(1));
    left.push_back(ident("y"));
    std::vector<ExprPtr> right;
    right.push_back(num(1));
    right.push_back(ident("y"));
    auto a = makePrimary(Span{}, ArrayExpression{std::move(left)});
    auto b = makePrimary(Span{}, ArrayExpression{std::move(right)});
    EXPECT_TRUE(*a == *b);

    std::vector<ExprPtr> shorter;
    shorter.push_back(num(1));
    auto c = makePrimary(Span{}, ArrayExpression{std::move(shorter)});
    EXPECT_FALSE(*a == *c);

    std::vector<ExprPtr> args;
    args.push_back(num(2));
    auto f = makePrimary(Span{}, FunctionCall{{{}, Identifier{"f"}}, std::move(args)});
    std::vector<ExprPtr> args2;
    args2.push_back(num(2));
    auto g = makePrimary(Span{}, FunctionCall{{{}, Identifier{"g"}}, std::move(args2)});
    EXPECT_FALSE(*f == *g);
}

TEST(ExprAst, AccessorsMatchVariant)
{
    auto n = num(7);
    EXPECT_NE(asPrimary<NumberLiteral>(*n), nullptr);
    EXPECT_EQ(asPrimary<Identifier>(*n), nullptr);
    EXPECT_EQ(as<BinaryExpression>(*n), nullptr);
    EXPECT_NE(as<PrimaryExpression>(*n), nullptr);
    EXPECT_EQ(asPrimary<NumberLiteral>(*n)->value, 7);
}

TEST(ExprAst, TreeHeightCountsLongestPath)
{
    EXPECT_EQ(treeHeight(*num(1)), 1u);

    // 1 + (x * -2): Binary, Grouped, Binary, Unary, literal.
    auto negTwo = makeExpr(Span{}, UnaryExpression{{{}, UnaryOp::Neg}, num(2), true});
    auto product = makeExpr(Span{}, BinaryExpression{ident("x"), {{}, BinaryOp::Mul}, std::move(negTwo)});
    auto group = makePrimary(Span{}, GroupedExpression{std::move(product)});
    auto sum = makeExpr(Span{}, BinaryExpression{num(1), {{}, BinaryOp::Add}, std::move(group)});
    EXPECT_EQ(treeHeight(*sum), 5u);

    std::vector<ExprPtr> elements;
    elements.push_back(ident("y"));
    std::vector<ExprPtr> args;
    args.push_back(num(1));
    args.push_back(makePrimary(Span{}, ArrayExpression{std::move(elements)}));
    auto call = makePrimary(Span{}, FunctionCall{{{}, Identifier{"f"}}, std::move(args)});
    EXPECT_EQ(treeHeight(*call), 3u);
}
