/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The engine aggregates the warnings and the error raised while parsing
 *     one expression and counts the errors.  Diagnostics are stored until
 *     callers explicitly print or inspect them.
 */

#include "diagnostics.hpp"
#include "diag_expected.hpp"

namespace mathexpr::support
{
/**
 * @brief Maps an error code onto its stable identifier.
 *
 * Identifiers are part of the printed diagnostic and stay fixed so scripts
 * can match on them.
 *
 * @param code Failure class to translate.
 * @return Null-terminated identifier such as "E0001".
 */
const char *errorCodeId(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::None:
            return "";
        case ErrorCode::UnexpectedCharacter:
            return "E0001";
        case ErrorCode::ExpectedIdentifier:
            return "E0002";
        case ErrorCode::UnterminatedStructure:
            return "E0003";
        case ErrorCode::InvalidNumber:
            return "E0004";
        case ErrorCode::TrailingInput:
            return "E0005";
        case ErrorCode::NestingTooDeep:
            return "E0006";
    }
    return "";
}

/**
 * @brief Maps an error code onto a lowercase descriptive name.
 *
 * @param code Failure class to translate.
 * @return Null-terminated name such as "unexpected-character".
 */
const char *errorCodeName(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::None:
            return "none";
        case ErrorCode::UnexpectedCharacter:
            return "unexpected-character";
        case ErrorCode::ExpectedIdentifier:
            return "expected-identifier";
        case ErrorCode::UnterminatedStructure:
            return "unterminated-structure";
        case ErrorCode::InvalidNumber:
            return "invalid-number";
        case ErrorCode::TrailingInput:
            return "trailing-input";
        case ErrorCode::NestingTooDeep:
            return "nesting-too-deep";
    }
    return "none";
}

/**
 * @brief Adds a diagnostic to the engine and updates the error counter.
 *
 * The diagnostic is appended to the internal vector for later inspection.
 * Warnings are stored but not counted.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so the engine and one-off callers
 * produce identical text.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param sourceName Label printed in front of each location.
 */
void DiagnosticEngine::printAll(std::ostream &os, std::string_view sourceName) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sourceName);
    }
}

/**
 * @brief Returns the number of error-severity diagnostics recorded so far.
 *
 * @return Number of stored diagnostics with severity `Error`.
 */
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}
} // namespace mathexpr::support
