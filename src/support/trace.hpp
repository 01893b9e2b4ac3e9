//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.hpp
// Purpose: Opt-in progress trace for catalog loading and per-unit scanning.
// Key invariants: Trace output is line-oriented; concurrent writers never
//                 interleave within a line.
// Ownership/Lifetime: Process-wide switch; the sink stream is not owned.
// Links: tools/apicheck/cli.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <iosfwd>
#include <string_view>

namespace apicheck::support
{

/// @brief Whether tracing is on: forced by setTraceEnabled() or the
///        APICHECK_TRACE environment variable.
[[nodiscard]] bool traceEnabled();

/// @brief Turn tracing on or off for the rest of the process (the --trace flag).
void setTraceEnabled(bool enabled);

/// @brief Redirect trace lines to @p os (std::cerr by default).
void setTraceStream(std::ostream &os);

/// @brief Emit one "[apicheck] <message>" line when tracing is enabled.
void trace(std::string_view message);

} // namespace apicheck::support
