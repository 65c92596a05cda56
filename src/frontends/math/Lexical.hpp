//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexical.hpp
/// @brief Number, identifier and operator scanners built on parse::Cursor.
///
/// @details There is no separate tokenizer; the parser calls these scanners
/// directly at the point in the grammar where a lexeme is expected.
///
/// Operators are recognised by trying ordered `(literal, operator)` tables
/// in sequence and taking the first literal that matches.  The order is
/// part of the grammar: `==` sits before `=`, and `<=`/`>=` before `<`/`>`,
/// so the longer spelling wins.  Reordering a table changes parse results.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/math/AST.hpp"
#include "mathexpr/parse/Cursor.h"
#include "support/diag_expected.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mathexpr::frontends::math
{

using support::Expected;

/// @brief One entry of an ordered operator table.
template <class Op> struct OperatorSpelling
{
    std::string_view literal;
    Op op;
};

/// @brief Binary operators in match order.
inline constexpr std::array<OperatorSpelling<BinaryOp>, 14> kBinaryOperators{{
    {"+", BinaryOp::Add},
    {"-", BinaryOp::Sub},
    {"*", BinaryOp::Mul},
    {"/", BinaryOp::Div},
    {"^", BinaryOp::Pow},
    {"==", BinaryOp::Eq},
    {"=", BinaryOp::Assign},
    {"!=", BinaryOp::Ne},
    {"<=", BinaryOp::Le},
    {">=", BinaryOp::Ge},
    {"<", BinaryOp::Lt},
    {">", BinaryOp::Gt},
    {"&&", BinaryOp::And},
    {"||", BinaryOp::Or},
}};

/// @brief Unary operators in match order; two-character spellings first.
inline constexpr std::array<OperatorSpelling<UnaryOp>, 4> kUnaryOperators{{
    {"++", UnaryOp::Inc},
    {"--", UnaryOp::Dec},
    {"!", UnaryOp::Not},
    {"-", UnaryOp::Neg},
}};

/// @brief Scan `'-'? digit+` into a signed 64-bit value.
/// @details The span covers the sign when present.  On failure the cursor is
///          left where it started.
/// @return The literal, or UnexpectedCharacter when no digit follows the
///         optional sign, or InvalidNumber when the value overflows.
Expected<AstNode<int64_t>> scanNumber(parse::Cursor &cursor);

/// @brief Scan `alpha (alpha | digit | '_')*`.
/// @return The identifier, or ExpectedIdentifier when the next character is
///         not alphabetic (the cursor does not move).
Expected<AstNode<Identifier>> scanIdentifier(parse::Cursor &cursor);

/// @brief Consume the first binary operator of kBinaryOperators that matches.
std::optional<AstNode<BinaryOp>> scanBinaryOperator(parse::Cursor &cursor);

/// @brief Consume the first unary operator of kUnaryOperators that matches.
std::optional<AstNode<UnaryOp>> scanUnaryOperator(parse::Cursor &cursor);

/// @brief Length of the binary operator scanBinaryOperator would consume, or 0.
/// @details Does not move the cursor.
std::size_t binaryOperatorLengthAt(const parse::Cursor &cursor);

/// @brief Check whether @p ch can begin a primary expression.
[[nodiscard]] bool startsPrimary(char ch);

/// @brief Describe the character under the cursor for diagnostics.
/// @return `'c'` quoted, a `\xNN` escape for control bytes, or `end of input`.
std::string describeCurrent(const parse::Cursor &cursor);

} // namespace mathexpr::frontends::math
