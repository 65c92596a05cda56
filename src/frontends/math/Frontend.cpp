//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Frontend.cpp
/// @brief Parse-and-render pipelines.
///
//===----------------------------------------------------------------------===//

#include "frontends/math/Frontend.hpp"

#include "frontends/math/AstPrinter.hpp"
#include "frontends/math/MathMLWriter.hpp"
#include "frontends/math/Parser.hpp"
#include "support/trace.hpp"

namespace mathexpr::frontends::math
{

support::Expected<std::string> generateString(std::string_view text,
                                              const support::ParseOptions &options)
{
    auto root = parseExpression(text, options);
    if (!root)
        return root.takeError();
    return toCanonicalString(root.value());
}

support::Expected<MarkupElement> generateMarkup(std::string_view text,
                                                const support::ParseOptions &options)
{
    auto root = parseExpression(text, options);
    if (!root)
        return root.takeError();

    if (options.trace || support::isTraceEnabled())
        support::trace("markup for " + toCanonicalString(root.value()), true);
    return buildMarkup(root.value());
}

support::Expected<std::string> generateMathML(std::string_view text,
                                              const support::ParseOptions &options,
                                              const support::MathMLOptions &mathml)
{
    auto markup = generateMarkup(text, options);
    if (!markup)
        return markup.takeError();
    return writeMathML(markup.value(), mathml);
}

} // namespace mathexpr::frontends::math
