//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser for mathematical expressions.
///
/// @details The parser scans characters straight from a parse::Cursor; there
/// is no token stream.  Each grammar rule is a parseXxx() method:
///
/// ```
/// expression        = unaryExpression (binaryOperator unaryExpression)*
/// unaryExpression   = unaryOperator primaryExpression
///                   | primaryExpression unaryOperator?
/// primaryExpression = "(" expression ")"
///                   | "[" expression ("," expression)* "]"
///                   | functionCall | number | identifier
/// functionCall      = identifier "(" (expression ("," expression)*)? ")"
/// ```
///
/// ## Operator Precedence
///
/// parseExpression() first collects the flat operand/operator sequence and
/// then reduces it with an operand stack and an operator stack.  An incoming
/// operator first reduces every stacked operator of greater or equal
/// precedence, so equal levels associate to the left.
///
/// | Level | Operators            |
/// |-------|----------------------|
/// |   6   | `*` `/` `^`          |
/// |   5   | `+` `-`              |
/// |   4   | `<` `>` `<=` `>=`    |
/// |   3   | `==` `!=`            |
/// |   2   | `&&`                 |
/// |   1   | `||`                 |
/// |   0   | `=`                  |
///
/// ## Primary Dispatch
///
/// Primary expressions are chosen by a fixed sequence of checks: `(`, `[`,
/// identifier immediately followed by `(` (a checkpointed lookahead that
/// rewinds whatever it scanned), digit, letter.
///
/// ## Errors
///
/// There is no recovery.  The first failure is returned as a Diagnostic and
/// no partial tree escapes.
///
/// @invariant The cursor only moves forward except inside a Checkpoint.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/math/AST.hpp"
#include "mathexpr/parse/Cursor.h"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mathexpr::frontends::math
{

using support::Expected;

/// @brief Maximum nesting of groups, arrays and calls.
inline constexpr unsigned kMaxNestingDepth = 256;

/// @brief Maximum height of a parsed tree.
/// @details Renderers, equality and teardown recurse once per level, so a
///          long operator chain such as `1+1+...+1` is rejected with
///          NestingTooDeep once its tree would exceed this height.
inline constexpr std::size_t kMaxTreeDepth = 2048;

/// @brief Recursive descent parser over one source string.
///
/// @details The parser borrows the source text, which must outlive it.  The
/// tree it returns owns copies of every identifier, so the tree may outlive
/// both the parser and the text.
class Parser
{
  public:
    /// @brief Create a parser over @p source.
    explicit Parser(std::string_view source, support::ParseOptions options = {});

    /// @brief Parse the whole source as one expression.
    /// @return The root node, or the first syntax error.
    ///
    /// @details In strict mode the whole input must be consumed; trailing
    /// text is a TrailingInput error.  In lenient mode parsing stops after
    /// the first complete expression.
    Expected<ExprNode> parse();

    /// @brief Repairs made by lenient parsing, in source order.
    /// @details Each missing closer and any ignored trailing text is recorded
    /// as a Warning carrying the code strict mode would have failed with.
    const std::vector<support::Diag> &warnings() const
    {
        return warnings_;
    }

  private:
    //=========================================================================
    /// @name Grammar Rules
    /// @{
    //=========================================================================

    /// @brief expression = unaryExpression (binaryOperator unaryExpression)*
    Expected<ExprPtr> parseExpression();

    /// @brief unaryExpression = unaryOperator primary | primary unaryOperator?
    Expected<ExprPtr> parseUnary();

    /// @brief Dispatch to the primary form that starts at the cursor.
    Expected<ExprPtr> parsePrimary();

    /// @brief "(" expression ")" with the "(" already consumed.
    Expected<ExprPtr> parseGrouped(std::size_t start);

    /// @brief "[" expression ("," expression)* "]" with the "[" already consumed.
    Expected<ExprPtr> parseArray(std::size_t start);

    /// @brief identifier "(" arguments? ")".
    Expected<ExprPtr> parseFunctionCall(std::size_t start);

    /// @}
    //=========================================================================
    /// @name Helpers
    /// @{
    //=========================================================================

    /// @brief Check whether an identifier directly followed by "(" starts here.
    /// @details Never consumes input.
    bool startsFunctionCall();

    /// @brief Scan a postfix operator after a primary expression.
    /// @details Declines (and consumes nothing) when the operator is the
    /// prefix of a longer binary operator, as in `a!=b`, or when an operand
    /// follows it, as in `2-3` or `a- -b`; the text then belongs to a binary
    /// operator.
    std::optional<AstNode<UnaryOp>> scanPostfixOperator();

    /// @brief Consume the closing delimiter @p closer.
    /// @param open Offset of the matching opener, for the message.
    /// @details A missing closer is an UnterminatedStructure error in strict
    /// mode and a warning otherwise.
    Expected<void> expectCloser(char closer, std::size_t open);

    /// @brief Build an error at the current cursor position.
    support::Diag errorHere(std::string message, support::ErrorCode code) const;

    /// @brief NestingTooDeep error for a tree grown too tall at @p offset.
    /// @details The cursor is left where it was.
    support::Diag tooDeepAt(std::size_t offset);

    /// @}

    parse::Cursor cursor_;
    support::ParseOptions options_;
    unsigned depth_{0};
    std::vector<support::Diag> warnings_;
};

/// @brief Parse @p text with @p options.
/// @details Traces the input and the outcome when tracing is enabled.
Expected<ExprNode> parseExpression(std::string_view text, const support::ParseOptions &options = {});

/// @brief Parse @p text and report every diagnostic to @p diags.
/// @details Lenient warnings are reported first, followed by the error when
/// parsing fails.  The returned Expected still carries that error.
Expected<ExprNode> parseExpression(std::string_view text,
                                   const support::ParseOptions &options,
                                   support::DiagnosticEngine &diags);

} // namespace mathexpr::frontends::math
