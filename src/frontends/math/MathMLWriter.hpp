//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file MathMLWriter.hpp
/// @brief Serialise presentation markup to MathML text.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/math/Markup.hpp"
#include "support/options.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace mathexpr::frontends::math
{

/// @brief Namespace URI placed on the `<math>` root.
inline constexpr std::string_view kMathMLNamespace = "http://www.w3.org/1998/Math/MathML";

/// @brief Escape `&`, `<`, `>`, `"` and `'` for XML character data.
std::string escapeXml(std::string_view text);

/// @brief Write @p element as MathML to @p os.
void writeMathML(const MarkupElement &element, std::ostream &os,
                 const support::MathMLOptions &options = {});

/// @brief Serialise @p element as a MathML string.
std::string writeMathML(const MarkupElement &element, const support::MathMLOptions &options = {});

} // namespace mathexpr::frontends::math
