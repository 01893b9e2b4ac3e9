//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/xml/XmlReader.hpp
// Purpose: Minimal XML element-tree reader for layouts and the API catalog.
// Key invariants: Every element records the 1-based line of its start tag.
//                 Text, comments, CDATA, processing instructions and DOCTYPE
//                 are skipped; only elements and attributes are modeled.
// Ownership/Lifetime: The returned tree owns all names and values.
// Links: layout/LayoutScanner.hpp, catalog/CatalogLoader.hpp
//
//===----------------------------------------------------------------------===//
//
// Both consumers only need tag names, attribute values and line numbers, so
// the reader builds a small owning tree rather than exposing a pull API.
// Malformed markup (unterminated tags, mismatched end tags, missing root) is
// reported as an error diagnostic whose message starts with "line N:".

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace apicheck::xml
{

/// @brief Name/value pair with entities already decoded.
struct XmlAttribute
{
    std::string name;
    std::string value;
};

/// @brief One element of the parsed document.
struct XmlElement
{
    std::string name;                     ///< Qualified tag name as written.
    uint32_t line = 0;                    ///< Line of the '<' opening the start tag.
    std::vector<XmlAttribute> attributes; ///< In document order.
    std::vector<XmlElement> children;     ///< Child elements in document order.

    /// @brief Find attribute @p attrName.
    /// @return Pointer to the decoded value, or nullptr when absent.
    [[nodiscard]] const std::string *attribute(std::string_view attrName) const;
};

/// @brief Parse @p text and return its root element.
/// @return Root element, or an error diagnostic (code None) describing the
///         first syntax problem.
support::Expected<XmlElement> parseXml(std::string_view text);

/// @brief Decode the predefined and numeric character entities in @p raw.
/// @details Unknown entities are kept verbatim.
[[nodiscard]] std::string decodeEntities(std::string_view raw);

} // namespace apicheck::xml
