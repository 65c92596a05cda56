//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostics and the engine that collects them.
// Key invariants: The error count reflects reported Error diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace mathexpr::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Warning, ///< Input was accepted with a repair (lenient parsing).
    Error    ///< Input was rejected.
};

/// @brief Failure classes reported by the parser.
enum class ErrorCode
{
    None,                  ///< No failure class.
    UnexpectedCharacter,   ///< No primary expression starts at the cursor.
    ExpectedIdentifier,    ///< Identifier required but next char is not alphabetic.
    UnterminatedStructure, ///< Missing `)` or `]`.
    InvalidNumber,         ///< Digit run does not fit a signed 64-bit integer.
    TrailingInput,         ///< Text remains after a complete expression.
    NestingTooDeep         ///< Groups, arrays or calls nest past the depth limit.
};

/// @brief Stable short code for @p code, e.g. "E0001".
const char *errorCodeId(ErrorCode code);

/// @brief Human-readable name for @p code, e.g. "unexpected-character".
const char *errorCodeName(ErrorCode code);

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;                ///< Message severity
    std::string message;              ///< Human-readable text
    SourceLoc loc;                    ///< Scan position when the diagnostic was raised
    ErrorCode code = ErrorCode::None; ///< Failure class, also set on warnings
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    /// @param d Diagnostic to store.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param os Output stream.
    /// @param sourceName Name prefixed to each located diagnostic.
    void printAll(std::ostream &os, std::string_view sourceName = {}) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Access the recorded diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
};
} // namespace mathexpr::support
