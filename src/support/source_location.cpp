//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line helpers for the Span value type.  Binary
// expressions take their span from the outermost operands, so joining two
// spans is the one operation shared by the parser and tests.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements span composition for `Span`.

#include "support/source_location.hpp"

namespace mathexpr::support
{
/// @brief Join two spans into the range covering both.
///
/// @details The result starts where @p first starts and ends where @p last
///          ends.  Callers pass the spans in source order; the helper does not
///          reorder them, matching how binary expressions are reduced from
///          their left and right operands.
///
/// @param first Span of the leftmost construct.
/// @param last Span of the rightmost construct.
/// @return Span `[first.start, last.end)`.
Span join(Span first, Span last)
{
    return Span{first.start, last.end};
}
} // namespace mathexpr::support
