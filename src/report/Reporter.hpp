//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/report/Reporter.hpp
// Purpose: Render violations in lint format and summarize unreadable inputs.
// Key invariants: Rendering never reorders or merges; callers pass violations
//                 already sorted by check::sortViolations. An empty set
//                 renders as the single line "No warnings.".
// Ownership/Lifetime: Free functions writing to caller-supplied streams.
// Links: check/Reference.hpp, check/ApiChecker.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "check/Reference.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace apicheck::report
{

/// @brief Line printed when nothing was found.
inline constexpr const char *kNoWarnings = "No warnings.";

/// @brief Printed signature of @p v.
/// @details Classes render as source names ("android.app.Foo.Bar"), calls and
///          fields as "owner#member" with '$' kept in the owner, and UI tags
///          as "<Tag>".
[[nodiscard]] std::string formatSignature(const check::Violation &v);

/// @brief One report line without trailing newline:
///        "file:line: Error: Call requires API level 11 (current min is 1): sig".
[[nodiscard]] std::string formatViolation(const check::Violation &v);

/// @brief Write one line per violation, or "No warnings.".
void printReport(const std::vector<check::Violation> &violations, std::ostream &os);

/// @brief One-line summary of skipped inputs, listing at most @p maxItems.
/// @return Empty string when @p paths is empty.
[[nodiscard]] std::string parseFailureSummary(const std::vector<std::string> &paths,
                                              size_t maxItems = 3);

} // namespace apicheck::report
