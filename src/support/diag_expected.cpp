//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library.  The utilities wrap structured diagnostics around an Expected<void>
// type, provide consistent severity-to-string mapping, and print diagnostics
// with their scan position so every entry point reports errors uniformly.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.

#include "diag_expected.hpp"

namespace mathexpr::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
///
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
///
/// @details Success is indicated by the absence of a stored diagnostic.
///
/// @return True if the instance holds no diagnostic (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

/// @brief Allow Expected<void> to participate directly in boolean tests.
Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
///
/// @return Reference to the stored diagnostic payload.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

/// @brief Move the stored diagnostic out of the Expected.
Diag Expected<void>::takeError()
{
    return std::move(*error_);
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
///
/// @param severity Severity enumeration value to translate.
/// @return Null-terminated string naming the severity level.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

/// @brief Build an error diagnostic with the provided location and message.
///
/// @param loc Scan position that triggered the diagnostic.
/// @param msg Human-readable description of the problem.
/// @param code Failure class recorded on the diagnostic.
/// @return Diagnostic populated with error severity and provided context.
Diag makeError(SourceLoc loc, std::string msg, ErrorCode code)
{
    return Diag{Severity::Error, std::move(msg), loc, code};
}

Diag makeWarning(SourceLoc loc, std::string msg, ErrorCode code)
{
    return Diag{Severity::Warning, std::move(msg), loc, code};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When @p sourceName is non-empty the message is prefixed with
///          "<name>:<line>:<column>:" following the common compiler diagnostic
///          style; the column is printed one-based.  Errors carrying a failure
///          class append its identifier to the severity, e.g.
///          `error[E0001]: ...`.  The function always emits a trailing newline
///          so multiple diagnostics appear as a contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sourceName Label for the source text, such as `<stdin>`.
void printDiag(const Diag &diag, std::ostream &os, std::string_view sourceName)
{
    if (!sourceName.empty())
    {
        os << sourceName;
        if (diag.loc.hasLine())
        {
            os << ':' << diag.loc.line << ':' << (diag.loc.column + 1);
        }
        os << ": ";
    }
    os << detail::diagSeverityToString(diag.severity);
    if (diag.code != ErrorCode::None)
    {
        os << '[' << errorCodeId(diag.code) << ']';
    }
    os << ": " << diag.message << '\n';
}
} // namespace mathexpr::support
