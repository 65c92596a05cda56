//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.hpp
/// @brief Textual renderings of an expression tree.
///
/// @details Two renderings are provided:
///
/// - toCanonicalString() produces the compact structural form used to
///   compare trees in tests and traces.  Spans never appear in it, and
///   grouping parentheses are dropped because the nesting already encodes
///   them:
///   @code
///     2 + 3 * 4   =>  binExp(2, +, binExp(3, *, 4))
///     -x          =>  unExp(-, x)
///     f([1, 2])   =>  f([1, 2])
///   @endcode
///
/// - dumpAst() produces an indentation-based debug dump with one node per
///   line and the byte span of each node:
///   @code
///     BinaryExpression (+) [0, 9)
///       NumberLiteral 2 [0, 1)
///       BinaryExpression (*) [4, 9)
///         NumberLiteral 3 [4, 5)
///         NumberLiteral 4 [8, 9)
///   @endcode
///
/// @invariant Printing never mutates the tree.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/math/AST.hpp"

#include <string>

namespace mathexpr::frontends::math
{

/// @brief Render @p root in canonical structural form.
std::string toCanonicalString(const ExprNode &root);

/// @brief Produce a human-readable dump of the tree rooted at @p root.
std::string dumpAst(const ExprNode &root);

} // namespace mathexpr::frontends::math
