//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexical.cpp
/// @brief Lexical primitives: numbers, identifiers and operator spellings.
///
//===----------------------------------------------------------------------===//

#include "frontends/math/Lexical.hpp"

#include <charconv>
#include <cstdio>
#include <system_error>

namespace mathexpr::frontends::math
{

using parse::Cursor;
using support::ErrorCode;
using support::makeError;

std::string describeCurrent(const Cursor &cursor)
{
    if (cursor.atEnd())
        return "end of input";
    const char ch = cursor.peek();
    const auto byte = static_cast<unsigned char>(ch);
    if (byte < 0x20 || byte >= 0x7f)
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "'\\x%02X'", static_cast<unsigned>(byte));
        return buf;
    }
    return std::string("'") + ch + "'";
}

bool startsPrimary(char ch)
{
    return ch == '(' || ch == '[' || Cursor::isDigit(ch) || Cursor::isAlpha(ch);
}

/// @brief Scan an optionally negative decimal integer.
/// @details The sign is consumed first and the digit run second.  When the
///          run is empty the checkpoint rewinds past the sign, so a lone `-`
///          is left for the operator scanners.
Expected<AstNode<int64_t>> scanNumber(Cursor &cursor)
{
    Cursor::Checkpoint checkpoint(cursor);
    const std::size_t start = cursor.offset();
    const support::SourceLoc startLoc = cursor.loc();
    cursor.consume('-');

    const std::string_view digits = cursor.consumeWhile(Cursor::isDigit);
    if (digits.empty())
    {
        return makeError(cursor.loc(),
                         "expected digit but found " + describeCurrent(cursor),
                         ErrorCode::UnexpectedCharacter);
    }

    const std::string_view text = cursor.slice(start, cursor.offset());
    int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        return makeError(startLoc,
                         "invalid number '" + std::string(text) +
                             "': out of range for a 64-bit integer",
                         ErrorCode::InvalidNumber);
    }

    checkpoint.commit();
    return AstNode<int64_t>{cursor.spanFrom(start), value};
}

Expected<AstNode<Identifier>> scanIdentifier(Cursor &cursor)
{
    if (!Cursor::isAlpha(cursor.peek()))
    {
        return makeError(cursor.loc(),
                         "expected identifier but found " + describeCurrent(cursor),
                         ErrorCode::ExpectedIdentifier);
    }

    const std::size_t start = cursor.offset();
    const std::string_view name =
        cursor.consumeWhile([](char ch) { return Cursor::isAlphaNumeric(ch) || ch == '_'; });
    return AstNode<Identifier>{cursor.spanFrom(start), Identifier{std::string(name)}};
}

namespace
{

template <class Op, std::size_t N>
std::optional<AstNode<Op>> scanOperator(Cursor &cursor,
                                        const std::array<OperatorSpelling<Op>, N> &table)
{
    const std::size_t start = cursor.offset();
    for (const auto &entry : table)
    {
        if (cursor.match(entry.literal))
            return AstNode<Op>{cursor.spanFrom(start), entry.op};
    }
    return std::nullopt;
}

} // namespace

std::optional<AstNode<BinaryOp>> scanBinaryOperator(Cursor &cursor)
{
    return scanOperator(cursor, kBinaryOperators);
}

std::optional<AstNode<UnaryOp>> scanUnaryOperator(Cursor &cursor)
{
    return scanOperator(cursor, kUnaryOperators);
}

std::size_t binaryOperatorLengthAt(const Cursor &cursor)
{
    for (const auto &entry : kBinaryOperators)
    {
        if (cursor.startsWith(entry.literal))
            return entry.literal.size();
    }
    return 0;
}

} // namespace mathexpr::frontends::math
