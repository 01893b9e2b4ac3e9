//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/check/SuppressionIndex.hpp
// Purpose: Persisted @SuppressLint scopes of the scanned classes, and the
//          lookup deciding whether a reference is covered by one.
// Key invariants: Scopes exist only for classes, methods and fields, since
//                 nothing narrower survives compilation. Lookup order is
//                 initialized field, method, class, then the lexically
//                 enclosing declarations of nested classes, outward; the
//                 first scope that names the check (or suppresses all)
//                 wins.
// Ownership/Lifetime: Built serially before scanning, read concurrently.
// Links: check/Reference.hpp, classfile/ClassFile.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "check/Reference.hpp"
#include "classfile/ClassFile.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace apicheck::check
{

/// @brief Identifier under which this checker's findings are suppressed.
inline constexpr std::string_view kNewApiCheckId = "NewApi";

/// @brief Annotation type carrying suppressions in class files.
inline constexpr std::string_view kSuppressLintDescriptor = "Landroid/annotation/SuppressLint;";

class SuppressionIndex
{
  public:
    /// @brief Record the suppression scopes declared by @p cls.
    void addClass(const classfile::ClassFile &cls);

    /// @brief True when a scope enclosing @p ref suppresses @p checkId.
    [[nodiscard]] bool isSuppressed(const Reference &ref, std::string_view checkId) const;

  private:
    /// Check ids of one suppressed declaration; empty means all checks.
    using Scope = std::vector<std::string>;

    struct ClassScopes
    {
        std::optional<Scope> self;
        std::unordered_map<std::string, Scope> methods; ///< Keyed by name + descriptor.
        std::unordered_map<std::string, Scope> fields;
        std::string outerClass; ///< Lexically enclosing class, if nested.
        std::string outerMethod; ///< Enclosing method name + descriptor, if local.
    };

    static std::optional<Scope> suppressionOf(const std::vector<classfile::Annotation> &annotations);
    static bool covers(const Scope &scope, std::string_view checkId);

    bool classSuppresses(const std::string &owner,
                         const std::string &methodKey,
                         const std::string &field,
                         std::string_view checkId) const;

    std::unordered_map<std::string, ClassScopes> classes_;
};

} // namespace apicheck::check
