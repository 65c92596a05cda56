//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares settings that influence parsing and rendering.
// Key invariants: Flags are independent booleans.
// Ownership/Lifetime: Caller owns option values.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

namespace mathexpr::support
{

/// @brief Holds settings that influence parser behaviour.
/// @invariant Flags are independent booleans.
/// @ownership Value type.
struct ParseOptions
{
    /// @brief Reject missing closing delimiters and unparsed trailing text.
    /// @details When false the parser tolerates a missing `)` or `]` and stops
    ///          after the first complete expression, recording each repair as
    ///          a warning.
    bool strict = true;

    /// @brief Enable verbose tracing regardless of the environment.
    bool trace = false;
};

/// @brief Holds settings for the MathML writer.
struct MathMLOptions
{
    /// @brief Wrap the output in a `<math>` root carrying the MathML namespace.
    bool wrapInMath = true;

    /// @brief Emit one element per line, indented by nesting depth.
    bool pretty = false;
};
} // namespace mathexpr::support
