//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Abstract syntax tree for the expression language.
///
/// @details Every node is an `AstNode<T>`: a source span paired with a
/// payload.  Expressions are closed sum types built on std::variant, so
/// every traversal is an exhaustive std::visit and the compiler rejects a
/// renderer that forgets a case.
///
/// The tree layout is:
///
/// ```
/// Expression        = UnaryExpression | BinaryExpression | PrimaryExpression
/// PrimaryExpression = GroupedExpression | ArrayExpression | FunctionCall
///                   | NumberLiteral | Identifier
/// ```
///
/// Ownership/Lifetime: children are owned by their parent through
/// std::unique_ptr.  There is no sharing and no back-reference, so the
/// tree is destroyed with its root.  Nodes are built once by the parser
/// and never mutated afterwards.
///
/// @invariant A BinaryExpression node spans exactly
///            `[left.span.start, right.span.end)`.
/// @invariant An ArrayExpression has at least one element.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mathexpr::frontends::math
{

using support::Span;

/// @brief Pairs a source span with a payload.
/// @tparam T Payload type.
template <class T> struct AstNode
{
    /// @brief Source bytes the node was parsed from.
    Span span;

    /// @brief Node payload.
    T node;
};

/// @brief Structural equality; spans are provenance only and are ignored.
template <class T> bool operator==(const AstNode<T> &lhs, const AstNode<T> &rhs)
{
    return lhs.node == rhs.node;
}

struct Expression;

/// @brief Expression node with its span.
using ExprNode = AstNode<Expression>;

/// @brief Unique pointer to an expression node.
using ExprPtr = std::unique_ptr<ExprNode>;

/// @brief Unary operators.
enum class UnaryOp
{
    Inc, ///< `++`
    Dec, ///< `--`
    Not, ///< `!`
    Neg, ///< `-`
};

/// @brief Binary operators.
enum class BinaryOp
{
    Add,    ///< `+`
    Sub,    ///< `-`
    Mul,    ///< `*`
    Div,    ///< `/`
    Pow,    ///< `^`
    Eq,     ///< `==`
    Assign, ///< `=`
    Ne,     ///< `!=`
    Le,     ///< `<=`
    Ge,     ///< `>=`
    Lt,     ///< `<`
    Gt,     ///< `>`
    And,    ///< `&&`
    Or,     ///< `||`
};

/// @brief Source spelling of @p op.
std::string_view spelling(UnaryOp op);

/// @brief Source spelling of @p op.
std::string_view spelling(BinaryOp op);

/// @brief Binding strength of @p op; higher binds tighter.
/// @details `=` 0, `||` 1, `&&` 2, `==` `!=` 3, `<` `>` `<=` `>=` 4,
///          `+` `-` 5, `*` `/` `^` 6.  All levels are left-associative,
///          `^` included.
int precedence(BinaryOp op);

/// @brief Unary operation: `-a`, `!b`, `x++`.
/// @details Exactly one of prefix or postfix, recorded by @ref isPrefix.
struct UnaryExpression
{
    AstNode<UnaryOp> op;
    ExprPtr operand;
    bool isPrefix;
};

/// @brief Binary operation: `a + b`.
struct BinaryExpression
{
    ExprPtr left;
    AstNode<BinaryOp> op;
    ExprPtr right;
};

/// @brief Parenthesised expression: `(a + b)`.
struct GroupedExpression
{
    ExprPtr inner;
};

/// @brief Bracketed list: `[a, b, c]`.
struct ArrayExpression
{
    std::vector<ExprPtr> elements;
};

/// @brief Name matching `[A-Za-z][A-Za-z0-9_]*`.
struct Identifier
{
    std::string name;

    bool operator==(const Identifier &) const = default;
};

/// @brief Call of a named function: `f(a, b)`; the argument list may be empty.
struct FunctionCall
{
    AstNode<Identifier> name;
    std::vector<ExprPtr> args;
};

/// @brief Signed 64-bit integer literal.
struct NumberLiteral
{
    int64_t value;

    bool operator==(const NumberLiteral &) const = default;
};

/// @brief Operand forms that need no operator.
using PrimaryExpression =
    std::variant<GroupedExpression, ArrayExpression, FunctionCall, NumberLiteral, Identifier>;

/// @brief Any expression.
struct Expression
{
    std::variant<UnaryExpression, BinaryExpression, PrimaryExpression> value;
};

bool operator==(const UnaryExpression &lhs, const UnaryExpression &rhs);
bool operator==(const BinaryExpression &lhs, const BinaryExpression &rhs);
bool operator==(const GroupedExpression &lhs, const GroupedExpression &rhs);
bool operator==(const ArrayExpression &lhs, const ArrayExpression &rhs);
bool operator==(const FunctionCall &lhs, const FunctionCall &rhs);
bool operator==(const Expression &lhs, const Expression &rhs);

/// @brief Number of nodes on the longest root-to-leaf path of @p root.
/// @details Walks the tree with an explicit stack, so it is safe on trees of
///          any depth.  A single literal has height 1.
std::size_t treeHeight(const ExprNode &root);

/// @brief Allocate an expression node holding @p payload.
template <class Payload> ExprPtr makeExpr(Span span, Payload &&payload)
{
    return std::make_unique<ExprNode>(ExprNode{span, Expression{std::forward<Payload>(payload)}});
}

/// @brief Allocate a primary expression node holding @p payload.
template <class Payload> ExprPtr makePrimary(Span span, Payload &&payload)
{
    return makeExpr(span, PrimaryExpression{std::forward<Payload>(payload)});
}

/// @brief View @p expr as a unary or binary expression, or nullptr.
template <class T> const T *as(const ExprNode &expr)
{
    return std::get_if<T>(&expr.node.value);
}

/// @brief View @p expr as the given primary form, or nullptr.
template <class T> const T *asPrimary(const ExprNode &expr)
{
    if (const auto *primary = std::get_if<PrimaryExpression>(&expr.node.value))
        return std::get_if<T>(primary);
    return nullptr;
}

/// @brief Aggregates lambdas into one visitor for std::visit.
template <typename... Ts> struct Overload : Ts...
{
    using Ts::operator()...;
};

template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;

} // namespace mathexpr::frontends::math
