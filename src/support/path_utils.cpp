//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/path_utils.cpp
// Purpose: Implement helpers for normalizing and classifying input file paths.
// Key invariants: Normalization always yields forward slashes and resolves dot
// segments.
// Ownership/Lifetime: Stateless.
// Links: support/path_utils.hpp

#include "support/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace apicheck::support
{
namespace
{
[[nodiscard]] bool endsWithIgnoreCase(std::string_view text, std::string_view suffix)
{
    if (text.size() < suffix.size())
        return false;
    const std::string_view tail = text.substr(text.size() - suffix.size());
    return std::equal(tail.begin(), tail.end(), suffix.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}
} // namespace

std::string normalizePath(std::string_view path)
{
    std::string sanitized(path);
    std::replace(sanitized.begin(), sanitized.end(), '\\', '/');

    if (sanitized.empty())
        return std::string{"."};

    std::filesystem::path fsPath(sanitized);
    std::string generic = fsPath.lexically_normal().generic_string();

    if (generic.empty())
        generic = sanitized.front() == '/' ? std::string{"/"} : std::string{"."};

    return generic;
}

bool isXmlFile(std::string_view path)
{
    // "xml" alone is a name, not an extension.
    return path.size() > 4 && endsWithIgnoreCase(path, ".xml");
}

bool isClassFile(std::string_view path)
{
    return path.size() > 6 && endsWithIgnoreCase(path, ".class");
}

std::string relativeTo(std::string_view path, std::string_view base)
{
    std::string normalized = normalizePath(path);
    if (base.empty())
        return normalized;

    const std::filesystem::path rel =
        std::filesystem::path(normalized).lexically_relative(normalizePath(base));
    const std::string relText = rel.generic_string();
    if (relText.empty() || relText.rfind("..", 0) == 0)
        return normalized;
    return relText;
}

} // namespace apicheck::support
