//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/parse/Cursor.cpp
// Purpose: Provide out-of-line helpers for the parse::Cursor utility.
// Key invariants: The cursor only moves on successful matches or explicit advances.
// Ownership/Lifetime: Operates on caller-owned string_view buffers.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the scanning cursor shared by the expression parser.

#include "mathexpr/parse/Cursor.h"

namespace mathexpr::parse
{

/// @brief Construct a cursor over the provided source buffer.
/// @details Initialises indices and current position so traversal starts at the
///          supplied @p start location.
/// @param text Source text to traverse.
/// @param start Source position representing the beginning of the buffer.
Cursor::Cursor(std::string_view text, SourcePos start) noexcept
    : text_(text), index_(0), start_(start), pos_(start)
{
}

/// @brief Inspect the current character without advancing.
/// @details Returns '\0' when the cursor is at the end to simplify callers that
///          expect a sentinel terminator.
/// @return Character at the current cursor position or '\0' at end.
char Cursor::peek() const noexcept
{
    return atEnd() ? '\0' : text_[index_];
}

/// @brief Capture offset, line and column for a diagnostic.
support::SourceLoc Cursor::loc() const noexcept
{
    return support::SourceLoc{index_, pos_.line, static_cast<uint32_t>(pos_.column)};
}

/// @brief View the text in `[start, end)`.
/// @details Both bounds are clamped to the buffer so a request running past the
///          end yields the available suffix rather than undefined behaviour.
std::string_view Cursor::slice(std::size_t start, std::size_t end) const noexcept
{
    if (start > text_.size())
        start = text_.size();
    if (end > text_.size())
        end = text_.size();
    if (end < start)
        end = start;
    return text_.substr(start, end - start);
}

/// @brief Update the tracked source position after consuming @p ch.
/// @details Handles newlines by incrementing the line counter and resetting the
///          column; other characters simply increment the column.
/// @param ch Character that was consumed.
void Cursor::applyAdvance(char ch) noexcept
{
    if (ch == '\n')
    {
        ++pos_.line;
        pos_.column = 0;
    }
    else
    {
        ++pos_.column;
    }
}

/// @brief Consume the current character and update the position.
/// @details Safely returns when already at end-of-input.
void Cursor::advance() noexcept
{
    if (atEnd())
        return;
    const char ch = text_[index_++];
    applyAdvance(ch);
}

/// @brief Advance past space, tab, newline and carriage return.
/// @details Other control characters are significant and stop the run.
void Cursor::skipWs() noexcept
{
    while (!atEnd() && isWhitespace(peek()))
        advance();
}

/// @brief Consume @p c when it matches the current character.
/// @details Returns @c false when the current character differs, leaving the
///          cursor untouched.
/// @param c Character to consume.
/// @return True when the character matched and was consumed.
bool Cursor::consume(char c) noexcept
{
    if (atEnd() || peek() != c)
        return false;
    advance();
    return true;
}

/// @brief Compare the unconsumed text against @p literal without moving.
/// @param literal Text to look for; an empty literal never matches.
/// @return True when the remaining input begins with @p literal.
bool Cursor::startsWith(std::string_view literal) const noexcept
{
    if (literal.empty())
        return false;
    return remaining().substr(0, literal.size()) == literal;
}

/// @brief Consume a fixed literal.
/// @details The comparison happens before any character is consumed, so a
///          partial match such as `=` against `==` leaves the cursor where it
///          was.
/// @param literal Literal that should be matched.
/// @return True when the literal was consumed.
bool Cursor::match(std::string_view literal) noexcept
{
    if (!startsWith(literal))
        return false;
    seek(index_ + literal.size());
    return true;
}

/// @brief Move the cursor to @p offset within the source buffer.
/// @details Adjusts both the byte index and the tracked source position. When
///          seeking backwards the routine recomputes the position from the start
///          of the buffer to keep line/column data accurate.
/// @param offset Zero-based index into the source buffer.
void Cursor::seek(std::size_t offset) noexcept
{
    if (offset > text_.size())
        offset = text_.size();

    if (offset >= index_)
    {
        while (index_ < offset)
            advance();
        return;
    }

    index_ = 0;
    pos_ = start_;
    while (index_ < offset)
        advance();
}

} // namespace mathexpr::parse
