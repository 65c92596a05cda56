//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/mathexpr/parse/Cursor.h
// Purpose: Declare the text cursor the expression parser scans with.
// Key invariants: Operates on a string_view without allocating or owning storage.
// Ownership/Lifetime: Views textual buffers owned by the caller; no allocations.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Defines the scanning cursor shared by the lexical primitives and the
///        grammar parser.
/// @details Scanning and parsing are fused: there is no token stream, so the
///          cursor is the only view the parser has of its input.  It tracks a
///          byte offset plus a line/column pair and exposes character-class
///          predicates, literal matching, and a checkpoint for bounded
///          speculative scans.

#pragma once

#include "support/source_location.hpp"

#include <concepts>
#include <cstddef>
#include <string_view>

namespace mathexpr::parse
{

template <class Predicate>
concept CursorPredicate = requires(Predicate pred, char ch) {
    { pred(ch) } -> std::convertible_to<bool>;
};

/// @brief Represents a line/column pair within a textual buffer.
struct SourcePos
{
    unsigned line = 1;      ///< 1-based line number for diagnostics.
    std::size_t column = 0; ///< 0-based column offset within the current line.
};

/// @brief Lightweight cursor for scanning expression text.
class Cursor
{
  public:
    /// @brief Saves the cursor position and restores it on scope exit.
    /// @details Used for lookahead that must not consume input, such as
    ///          checking whether an identifier is followed by `(`.  Calling
    ///          commit() keeps whatever the guarded scan consumed.
    class Checkpoint
    {
      public:
        explicit Checkpoint(Cursor &cursor) noexcept
            : cursor_(cursor), index_(cursor.index_), pos_(cursor.pos_)
        {
        }

        ~Checkpoint()
        {
            if (!committed_)
            {
                cursor_.index_ = index_;
                cursor_.pos_ = pos_;
            }
        }

        Checkpoint(const Checkpoint &) = delete;
        Checkpoint &operator=(const Checkpoint &) = delete;

        /// @brief Keep the consumed input instead of rewinding.
        void commit() noexcept
        {
            committed_ = true;
        }

      private:
        Cursor &cursor_;
        std::size_t index_;
        SourcePos pos_;
        bool committed_{false};
    };

    /// @brief Construct a cursor over @p text starting at @p start.
    explicit Cursor(std::string_view text, SourcePos start = {}) noexcept;

    /// @brief Return the backing view observed by the cursor.
    [[nodiscard]] std::string_view view() const noexcept
    {
        return text_;
    }

    /// @brief View the unconsumed suffix.
    [[nodiscard]] std::string_view remaining() const noexcept
    {
        return text_.substr(index_);
    }

    /// @brief Query whether the cursor has reached the end of the buffer.
    [[nodiscard]] bool atEnd() const noexcept
    {
        return index_ >= text_.size();
    }

    /// @brief Inspect the current character without consuming it.
    [[nodiscard]] char peek() const noexcept;

    /// @brief Report the current line/column location.
    [[nodiscard]] SourcePos pos() const noexcept
    {
        return pos_;
    }

    /// @brief Retrieve the absolute byte offset within the buffer.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return index_;
    }

    /// @brief Snapshot the current position for diagnostics.
    [[nodiscard]] support::SourceLoc loc() const noexcept;

    /// @brief Span from @p start to the current offset.
    [[nodiscard]] support::Span spanFrom(std::size_t start) const noexcept
    {
        return support::Span{start, index_};
    }

    /// @brief View the text between two offsets, clamped to the buffer.
    [[nodiscard]] std::string_view slice(std::size_t start, std::size_t end) const noexcept;

    /// @brief Skip space, tab, newline and carriage return.
    void skipWs() noexcept;

    /// @brief Consume the expected character.
    bool consume(char c) noexcept;

    /// @brief Test whether the unconsumed text begins with @p literal.
    [[nodiscard]] bool startsWith(std::string_view literal) const noexcept;

    /// @brief Consume @p literal when the unconsumed text begins with it.
    /// @return True when the literal matched; the cursor is untouched otherwise.
    bool match(std::string_view literal) noexcept;

    /// @brief Consume characters while @p pred returns true.
    template <CursorPredicate Predicate> std::string_view consumeWhile(Predicate pred) noexcept
    {
        const std::size_t begin = index_;
        while (!atEnd() && pred(peek()))
            advance();
        return text_.substr(begin, index_ - begin);
    }

    /// @brief Advance by a single character if not already at end.
    void advance() noexcept;

    /// @brief Advance to @p offset within the buffer.
    void seek(std::size_t offset) noexcept;

    /// @name Character classes
    /// @brief ASCII-only predicates; '\0' (the end sentinel) matches none.
    /// @{
    [[nodiscard]] static bool isDigit(char ch) noexcept
    {
        return ch >= '0' && ch <= '9';
    }

    [[nodiscard]] static bool isAlpha(char ch) noexcept
    {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
    }

    [[nodiscard]] static bool isAlphaNumeric(char ch) noexcept
    {
        return isAlpha(ch) || isDigit(ch);
    }

    [[nodiscard]] static bool isWhitespace(char ch) noexcept
    {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    }
    /// @}

  private:
    void applyAdvance(char ch) noexcept;

    std::string_view text_;
    std::size_t index_ = 0;
    SourcePos start_{};
    SourcePos pos_{};
};

} // namespace mathexpr::parse
