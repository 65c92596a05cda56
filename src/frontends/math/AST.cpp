//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.cpp
/// @brief Operator tables and structural equality for the expression AST.
///
//===----------------------------------------------------------------------===//

#include "frontends/math/AST.hpp"

#include <algorithm>

namespace mathexpr::frontends::math
{

std::string_view spelling(UnaryOp op)
{
    switch (op)
    {
        case UnaryOp::Inc:
            return "++";
        case UnaryOp::Dec:
            return "--";
        case UnaryOp::Not:
            return "!";
        case UnaryOp::Neg:
            return "-";
    }
    return "?";
}

std::string_view spelling(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Pow:
            return "^";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Assign:
            return "=";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::And:
            return "&&";
        case BinaryOp::Or:
            return "||";
    }
    return "?";
}

int precedence(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Assign:
            return 0;
        case BinaryOp::Or:
            return 1;
        case BinaryOp::And:
            return 2;
        case BinaryOp::Eq:
        case BinaryOp::Ne:
            return 3;
        case BinaryOp::Lt:
        case BinaryOp::Gt:
        case BinaryOp::Le:
        case BinaryOp::Ge:
            return 4;
        case BinaryOp::Add:
        case BinaryOp::Sub:
            return 5;
        case BinaryOp::Mul:
        case BinaryOp::Div:
        case BinaryOp::Pow:
            return 6;
    }
    return 0;
}

//===----------------------------------------------------------------------===//
// Structural equality
//===----------------------------------------------------------------------===//

namespace
{

bool sameExpr(const ExprPtr &lhs, const ExprPtr &rhs)
{
    if (!lhs || !rhs)
        return !lhs && !rhs;
    return *lhs == *rhs;
}

bool sameList(const std::vector<ExprPtr> &lhs, const std::vector<ExprPtr> &rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    for (size_t i = 0; i < lhs.size(); ++i)
    {
        if (!sameExpr(lhs[i], rhs[i]))
            return false;
    }
    return true;
}

} // namespace

bool operator==(const UnaryExpression &lhs, const UnaryExpression &rhs)
{
    return lhs.isPrefix == rhs.isPrefix && lhs.op == rhs.op && sameExpr(lhs.operand, rhs.operand);
}

bool operator==(const BinaryExpression &lhs, const BinaryExpression &rhs)
{
    return lhs.op == rhs.op && sameExpr(lhs.left, rhs.left) && sameExpr(lhs.right, rhs.right);
}

bool operator==(const GroupedExpression &lhs, const GroupedExpression &rhs)
{
    return sameExpr(lhs.inner, rhs.inner);
}

bool operator==(const ArrayExpression &lhs, const ArrayExpression &rhs)
{
    return sameList(lhs.elements, rhs.elements);
}

bool operator==(const FunctionCall &lhs, const FunctionCall &rhs)
{
    return lhs.name == rhs.name && sameList(lhs.args, rhs.args);
}

bool operator==(const Expression &lhs, const Expression &rhs)
{
    return lhs.value == rhs.value;
}

//===----------------------------------------------------------------------===//
// Tree height
//===----------------------------------------------------------------------===//

std::size_t treeHeight(const ExprNode &root)
{
    std::size_t height = 0;
    std::vector<std::pair<const ExprNode *, std::size_t>> pending{{&root, 1}};
    while (!pending.empty())
    {
        const ExprNode *node = pending.back().first;
        const std::size_t level = pending.back().second;
        pending.pop_back();
        height = std::max(height, level);

        auto push = [&](const ExprPtr &child) { pending.emplace_back(child.get(), level + 1); };
        std::visit(Overload{
                       [&](const UnaryExpression &u) { push(u.operand); },
                       [&](const BinaryExpression &b)
                       {
                           push(b.left);
                           push(b.right);
                       },
                       [&](const PrimaryExpression &primary)
                       {
                           std::visit(Overload{
                                          [&](const GroupedExpression &g) { push(g.inner); },
                                          [&](const ArrayExpression &a)
                                          {
                                              for (const auto &e : a.elements)
                                                  push(e);
                                          },
                                          [&](const FunctionCall &call)
                                          {
                                              for (const auto &arg : call.args)
                                                  push(arg);
                                          },
                                          [](const NumberLiteral &) {},
                                          [](const Identifier &) {},
                                      },
                                      primary);
                       },
                   },
                   node->node.value);
    }
    return height;
}

} // namespace mathexpr::frontends::math
