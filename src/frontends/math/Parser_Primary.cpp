//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Primary.cpp
/// @brief Primary expression parsing: groups, arrays, calls, literals.
///
/// @see Parser.hpp for the dispatch order
///
//===----------------------------------------------------------------------===//

#include "frontends/math/Lexical.hpp"
#include "frontends/math/Parser.hpp"

#include <string>
#include <utility>
#include <vector>

namespace mathexpr::frontends::math
{

using support::ErrorCode;

Expected<ExprPtr> Parser::parsePrimary()
{
    cursor_.skipWs();
    const std::size_t start = cursor_.offset();

    if (cursor_.match("("))
        return parseGrouped(start);
    if (cursor_.match("["))
        return parseArray(start);
    if (startsFunctionCall())
        return parseFunctionCall(start);

    const char ch = cursor_.peek();
    if (parse::Cursor::isDigit(ch))
    {
        auto number = scanNumber(cursor_);
        if (!number)
            return number.takeError();
        return makePrimary(number.value().span, NumberLiteral{number.value().node});
    }
    if (parse::Cursor::isAlpha(ch))
    {
        auto ident = scanIdentifier(cursor_);
        if (!ident)
            return ident.takeError();
        return makePrimary(ident.value().span, std::move(ident.value().node));
    }

    return errorHere("expected primary expression but found " + describeCurrent(cursor_),
                     ErrorCode::UnexpectedCharacter);
}

Expected<ExprPtr> Parser::parseGrouped(std::size_t start)
{
    auto inner = parseExpression();
    if (!inner)
        return inner.takeError();
    if (auto closed = expectCloser(')', start); !closed)
        return closed.takeError();
    return makePrimary(cursor_.spanFrom(start), GroupedExpression{std::move(inner.value())});
}

Expected<ExprPtr> Parser::parseArray(std::size_t start)
{
    std::vector<ExprPtr> elements;
    do
    {
        auto element = parseExpression();
        if (!element)
            return element.takeError();
        elements.push_back(std::move(element.value()));
        cursor_.skipWs();
    } while (cursor_.match(","));

    if (auto closed = expectCloser(']', start); !closed)
        return closed.takeError();
    return makePrimary(cursor_.spanFrom(start), ArrayExpression{std::move(elements)});
}

Expected<ExprPtr> Parser::parseFunctionCall(std::size_t start)
{
    auto name = scanIdentifier(cursor_);
    if (!name)
        return name.takeError();

    const std::size_t open = cursor_.offset();
    cursor_.advance(); // '(' checked by startsFunctionCall()
    cursor_.skipWs();

    std::vector<ExprPtr> args;
    if (cursor_.peek() != ')')
    {
        do
        {
            auto arg = parseExpression();
            if (!arg)
                return arg.takeError();
            args.push_back(std::move(arg.value()));
            cursor_.skipWs();
        } while (cursor_.match(","));
    }

    if (auto closed = expectCloser(')', open); !closed)
        return closed.takeError();
    return makePrimary(cursor_.spanFrom(start),
                       FunctionCall{std::move(name.value()), std::move(args)});
}

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

bool Parser::startsFunctionCall()
{
    if (!parse::Cursor::isAlpha(cursor_.peek()))
        return false;
    parse::Cursor::Checkpoint checkpoint(cursor_);
    auto name = scanIdentifier(cursor_);
    return name && cursor_.peek() == '(';
}

Expected<void> Parser::expectCloser(char closer, std::size_t open)
{
    cursor_.skipWs();
    if (cursor_.peek() == closer)
    {
        cursor_.advance();
        return {};
    }
    const char opener = closer == ')' ? '(' : '[';
    if (!options_.strict)
    {
        warnings_.push_back(support::makeWarning(cursor_.loc(),
                                                 std::string("missing '") + closer +
                                                     "' to close '" + opener + "' at offset " +
                                                     std::to_string(open),
                                                 ErrorCode::UnterminatedStructure));
        return {};
    }
    return errorHere(std::string("expected '") + closer + "' to close '" + opener +
                         "' at offset " + std::to_string(open) + " but found " +
                         describeCurrent(cursor_),
                     ErrorCode::UnterminatedStructure);
}

} // namespace mathexpr::frontends::math
