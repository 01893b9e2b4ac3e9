//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/text_utils.hpp
// Purpose: Declare small text formatting helpers used by summaries.
// Key invariants: None.
// Ownership/Lifetime: Free functions returning owned strings.
// Links: report/Reporter.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace apicheck::support
{

/// @brief Join @p items with ", ", listing at most @p maxItems entries.
/// @details When entries are omitted the text ends in "... (N more)", e.g.
///          `formatList({"a","b","c","d"}, 2)` yields "a, b... (2 more)".
///          A @p maxItems of zero lists everything.
[[nodiscard]] std::string formatList(const std::vector<std::string> &items, size_t maxItems);

} // namespace apicheck::support
