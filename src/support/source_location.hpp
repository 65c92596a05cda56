//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares byte spans and point locations attached to AST nodes and diagnostics.
// Key invariants: Spans are half-open [start, end) with start <= end.
// Ownership/Lifetime: Value types with no dynamic ownership.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>

namespace mathexpr::support
{

/// @brief Half-open byte range `[start, end)` into the parsed source text.
/// @invariant start <= end and end never exceeds the length of the source.
/// @ownership Value type with no owned resources.
struct Span
{
    /// @brief Byte offset of the first character covered by the span.
    std::size_t start = 0;

    /// @brief Byte offset one past the last character covered by the span.
    std::size_t end = 0;

    /// @brief Number of bytes covered.
    [[nodiscard]] std::size_t length() const
    {
        return end - start;
    }

    /// @brief Check whether @p offset falls inside the span.
    [[nodiscard]] bool contains(std::size_t offset) const
    {
        return offset >= start && offset < end;
    }

    /// @brief Check whether the span covers no characters.
    [[nodiscard]] bool empty() const
    {
        return start == end;
    }

    bool operator==(const Span &) const = default;
};

/// @brief Build the span running from the start of @p first to the end of @p last.
Span join(Span first, Span last);

/// @brief Represents a point within the source text.
/// @details Carries the byte offset together with the line/column pair the
///          cursor tracked when the location was captured.
struct SourceLoc
{
    /// @brief Zero-based byte offset.
    std::size_t offset = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief Zero-based column offset within the line.
    uint32_t column = 0;

    /// @brief Check whether a line number was recorded.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }
};

} // namespace mathexpr::support
