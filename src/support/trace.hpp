//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.hpp
// Purpose: Declares the opt-in trace channel used by the parser and renderers.
// Key invariants: Output goes to std::cerr only while tracing is enabled.
// Ownership/Lifetime: Stateless apart from the cached environment flag.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace mathexpr::support
{

/// @brief Environment variable that enables tracing when set to a non-empty value.
inline constexpr const char *kTraceEnvVar = "MATHEXPR_TRACE";

/// @brief Check the environment to determine whether tracing is enabled.
/// @details Reads MATHEXPR_TRACE once and caches the result.
[[nodiscard]] bool isTraceEnabled() noexcept;

/// @brief Write @p message to std::cerr prefixed with `[mathexpr] `.
/// @param force Emit even when the environment does not enable tracing.
void trace(std::string_view message, bool force = false);

} // namespace mathexpr::support
