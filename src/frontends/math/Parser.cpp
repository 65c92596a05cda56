//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.cpp
/// @brief Parser entry points and error construction.
///
//===----------------------------------------------------------------------===//

#include "frontends/math/Parser.hpp"

#include "frontends/math/AstPrinter.hpp"
#include "frontends/math/Lexical.hpp"
#include "support/trace.hpp"

namespace mathexpr::frontends::math
{

using support::ErrorCode;

Parser::Parser(std::string_view source, support::ParseOptions options)
    : cursor_(source), options_(options)
{
}

Expected<ExprNode> Parser::parse()
{
    auto root = parseExpression();
    if (!root)
        return root.takeError();

    cursor_.skipWs();
    if (!cursor_.atEnd())
    {
        if (options_.strict)
        {
            return errorHere("unexpected " + describeCurrent(cursor_) + " after expression",
                             ErrorCode::TrailingInput);
        }
        warnings_.push_back(support::makeWarning(cursor_.loc(),
                                                 "ignored trailing input starting at " +
                                                     describeCurrent(cursor_),
                                                 ErrorCode::TrailingInput));
    }
    return std::move(*root.value());
}

//===----------------------------------------------------------------------===//
// Error Handling
//===----------------------------------------------------------------------===//

support::Diag Parser::errorHere(std::string message, ErrorCode code) const
{
    return support::makeError(cursor_.loc(), std::move(message), code);
}

//===----------------------------------------------------------------------===//
// Free Entry Point
//===----------------------------------------------------------------------===//

Expected<ExprNode> parseExpression(std::string_view text, const support::ParseOptions &options)
{
    support::DiagnosticEngine diags;
    return parseExpression(text, options, diags);
}

Expected<ExprNode> parseExpression(std::string_view text,
                                   const support::ParseOptions &options,
                                   support::DiagnosticEngine &diags)
{
    const bool tracing = options.trace || support::isTraceEnabled();
    if (tracing)
    {
        support::trace("parse \"" + std::string(text) + "\"" + (options.strict ? "" : " (lenient)"),
                       true);
    }

    Parser parser(text, options);
    auto result = parser.parse();
    for (const auto &warning : parser.warnings())
        diags.report(warning);
    if (!result)
        diags.report(result.error());
    if (!tracing)
        return result;

    if (result)
    {
        support::trace("parsed " + toCanonicalString(result.value()), true);
    }
    else
    {
        const auto &diag = result.error();
        support::trace("parse failed at offset " + std::to_string(diag.loc.offset) + ": " +
                           diag.message,
                       true);
    }
    return result;
}

} // namespace mathexpr::frontends::math
