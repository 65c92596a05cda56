//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Frontend.hpp
/// @brief One-call pipelines from expression text to rendered output.
///
/// @details Each function parses the text, returns the first syntax error
/// unchanged, and otherwise hands the tree to a renderer:
///
/// ```cpp
/// auto markup = generateMarkup("a / b");
/// if (markup)
///     std::cout << writeMathML(markup.value());
/// else
///     printDiag(markup.error(), std::cerr, "<input>");
/// ```
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/math/Markup.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"

#include <string>
#include <string_view>

namespace mathexpr::frontends::math
{

/// @brief Parse @p text and render its canonical string.
support::Expected<std::string> generateString(std::string_view text,
                                              const support::ParseOptions &options = {});

/// @brief Parse @p text and build its presentation markup.
/// @details Traces the canonical string of the parsed tree when tracing is
/// enabled.
support::Expected<MarkupElement> generateMarkup(std::string_view text,
                                                const support::ParseOptions &options = {});

/// @brief Parse @p text and serialise its markup as MathML.
support::Expected<std::string> generateMathML(std::string_view text,
                                              const support::ParseOptions &options = {},
                                              const support::MathMLOptions &mathml = {});

} // namespace mathexpr::frontends::math
