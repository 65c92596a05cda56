//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Binary and unary expression parsing.
///
/// @details parseExpression() works in two phases:
///
/// 1. Scan the flat sequence `u0 (op1 u1) (op2 u2) ...` of unary
///    expressions and binary operators.
/// 2. Reduce it with an operand stack and an operator stack.  For each
///    `(op, u)` pair, pop and combine while the operator on top of the stack
///    binds at least as tightly as `op`, then push `u` and `op`.  Whatever
///    remains is reduced from the top once the sequence is exhausted.
///
/// Because equal precedence reduces immediately, every level is
/// left-associative: `2 - 3 - 4` is `(2 - 3) - 4`, and `^` behaves the same
/// way.
///
/// The height of every operand is tracked next to the operand stack; a
/// reduction that would grow the tree past kMaxTreeDepth fails with
/// NestingTooDeep at the offending operator.
///
/// @see Parser.hpp for the class interface
///
//===----------------------------------------------------------------------===//

#include "frontends/math/Lexical.hpp"
#include "frontends/math/Parser.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace mathexpr::frontends::math
{

using support::ErrorCode;

namespace
{

/// @brief Pop two operands and one operator and push their BinaryExpression.
/// @details @p heights runs parallel to @p operands.
void reduceTop(std::vector<ExprPtr> &operands,
               std::vector<std::size_t> &heights,
               std::vector<AstNode<BinaryOp>> &operators)
{
    ExprPtr right = std::move(operands.back());
    operands.pop_back();
    ExprPtr left = std::move(operands.back());
    operands.pop_back();
    const std::size_t rightHeight = heights.back();
    heights.pop_back();
    const std::size_t leftHeight = heights.back();
    heights.pop_back();
    const AstNode<BinaryOp> op = operators.back();
    operators.pop_back();

    const Span span = support::join(left->span, right->span);
    operands.push_back(makeExpr(span, BinaryExpression{std::move(left), op, std::move(right)}));
    heights.push_back(1 + std::max(leftHeight, rightHeight));
}

/// @brief Height of the tree reduceTop() would build from the top two operands.
std::size_t reducedHeight(const std::vector<std::size_t> &heights)
{
    return 1 + std::max(heights[heights.size() - 1], heights[heights.size() - 2]);
}

} // namespace

//===----------------------------------------------------------------------===//
// Expression Parsing
//===----------------------------------------------------------------------===//

Expected<ExprPtr> Parser::parseExpression()
{
    if (++depth_ > kMaxNestingDepth)
    {
        --depth_;
        return errorHere("expression nesting too deep (limit: " +
                             std::to_string(kMaxNestingDepth) + ")",
                         ErrorCode::NestingTooDeep);
    }
    struct DepthGuard
    {
        unsigned &d;

        ~DepthGuard()
        {
            --d;
        }
    } depthGuard{depth_};

    auto first = parseUnary();
    if (!first)
        return first.takeError();

    std::vector<std::pair<AstNode<BinaryOp>, ExprPtr>> sequence;
    cursor_.skipWs();
    while (auto op = scanBinaryOperator(cursor_))
    {
        auto operand = parseUnary();
        if (!operand)
            return operand.takeError();
        sequence.emplace_back(*op, std::move(operand.value()));
        cursor_.skipWs();
    }

    std::vector<ExprPtr> operands;
    std::vector<std::size_t> heights;
    std::vector<AstNode<BinaryOp>> operators;
    operands.reserve(sequence.size() + 1);
    heights.reserve(sequence.size() + 1);
    operators.reserve(sequence.size());
    heights.push_back(treeHeight(*first.value()));
    operands.push_back(std::move(first.value()));

    // Each reduction is checked before it runs, so no tree taller than
    // kMaxTreeDepth is ever built.
    auto reduce = [&]() -> Expected<void>
    {
        if (reducedHeight(heights) > kMaxTreeDepth)
            return tooDeepAt(operators.back().span.start);
        reduceTop(operands, heights, operators);
        return {};
    };

    for (auto &[op, operand] : sequence)
    {
        while (!operators.empty() && precedence(operators.back().node) >= precedence(op.node))
        {
            if (auto reduced = reduce(); !reduced)
                return reduced.takeError();
        }
        heights.push_back(treeHeight(*operand));
        operands.push_back(std::move(operand));
        operators.push_back(op);
    }
    while (!operators.empty())
    {
        if (auto reduced = reduce(); !reduced)
            return reduced.takeError();
    }

    return std::move(operands.back());
}

support::Diag Parser::tooDeepAt(std::size_t offset)
{
    parse::Cursor::Checkpoint restore(cursor_);
    cursor_.seek(offset);
    return errorHere("expression tree too deep (limit: " + std::to_string(kMaxTreeDepth) + ")",
                     ErrorCode::NestingTooDeep);
}

Expected<ExprPtr> Parser::parseUnary()
{
    cursor_.skipWs();
    const std::size_t start = cursor_.offset();

    // A prefix operator takes priority; no postfix check follows it.
    if (auto op = scanUnaryOperator(cursor_))
    {
        auto operand = parsePrimary();
        if (!operand)
            return operand.takeError();
        return makeExpr(cursor_.spanFrom(start),
                        UnaryExpression{*op, std::move(operand.value()), true});
    }

    auto primary = parsePrimary();
    if (!primary)
        return primary.takeError();

    if (auto op = scanPostfixOperator())
    {
        return makeExpr(cursor_.spanFrom(start),
                        UnaryExpression{*op, std::move(primary.value()), false});
    }
    return std::move(primary.value());
}

std::optional<AstNode<UnaryOp>> Parser::scanPostfixOperator()
{
    const std::size_t binaryLength = binaryOperatorLengthAt(cursor_);

    parse::Cursor::Checkpoint checkpoint(cursor_);
    auto op = scanUnaryOperator(cursor_);
    if (!op || op->span.length() < binaryLength)
        return std::nullopt;

    // When the spelling is also a binary operator (`-`), a following unary
    // operator counts as the start of an operand too: `a- -b` subtracts.
    const bool alsoBinary = op->span.length() == binaryLength;
    bool operandFollows = false;
    {
        parse::Cursor::Checkpoint lookahead(cursor_);
        cursor_.skipWs();
        operandFollows = startsPrimary(cursor_.peek()) ||
                         (alsoBinary && scanUnaryOperator(cursor_).has_value());
    }
    if (operandFollows)
        return std::nullopt;

    checkpoint.commit();
    return op;
}

} // namespace mathexpr::frontends::math
