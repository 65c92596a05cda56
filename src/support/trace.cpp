//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file trace.cpp
/// @brief Opt-in trace output controlled by MATHEXPR_TRACE.
///
//===----------------------------------------------------------------------===//

#include "support/trace.hpp"

#include <cstdlib>
#include <iostream>

namespace mathexpr::support
{

bool isTraceEnabled() noexcept
{
    static const bool enabled = []
    {
        if (const char *flag = std::getenv(kTraceEnvVar))
            return flag[0] != '\0';
        return false;
    }();
    return enabled;
}

void trace(std::string_view message, bool force)
{
    if (!force && !isTraceEnabled())
        return;
    std::cerr << "[mathexpr] " << message << '\n';
}

} // namespace mathexpr::support
