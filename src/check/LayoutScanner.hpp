//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/check/LayoutScanner.hpp
// Purpose: Extract UI-tag references from one XML layout document.
// Key invariants: One reference per element whose tag is not always
//                 available, in document order, at the start tag's line.
//                 Attributes are never inspected.
// Ownership/Lifetime: Stateless free functions.
// Links: xml/XmlReader.hpp, check/Reference.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "check/Reference.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace apicheck::check
{

/// @brief True for tags that exist on every platform version
///        ("merge", "include", "fragment", ...).
[[nodiscard]] bool isAlwaysAvailableTag(std::string_view tag);

/// @brief Scan layout @p text stored at @p path.
/// @return References in document order, or a UnitParse diagnostic.
support::Expected<std::vector<Reference>> scanLayout(std::string_view text, const std::string &path);

/// @brief Read and scan the layout file at @p path.
support::Expected<std::vector<Reference>> scanLayoutFile(const std::string &path);

} // namespace apicheck::check
