//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/path_utils.hpp
// Purpose: Declare helpers for normalizing and classifying input file paths.
// Key invariants: Normalized paths always use forward slashes and have dot
// segments resolved.
// Ownership/Lifetime: Free functions returning owned strings.
// Links: support/source_manager.hpp
#pragma once

#include <string>
#include <string_view>

namespace apicheck::support
{

/// @brief Normalize @p path to forward slashes with dot segments collapsed.
/// @return "." for an empty input.
[[nodiscard]] std::string normalizePath(std::string_view path);

/// @brief True when @p path names a file with a case-insensitive ".xml" suffix.
[[nodiscard]] bool isXmlFile(std::string_view path);

/// @brief True when @p path names a file with a case-insensitive ".class" suffix.
[[nodiscard]] bool isClassFile(std::string_view path);

/// @brief Express @p path relative to @p base when @p path lies beneath it.
/// @return The normalized @p path unchanged when @p base is empty or unrelated.
[[nodiscard]] std::string relativeTo(std::string_view path, std::string_view base);

} // namespace apicheck::support
