//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/catalog/ApiCatalog.hpp
// Purpose: Versioned map from platform element signature to introduced-version,
//          plus the platform type-hierarchy edges.
// Key invariants: Class, method, field and UI-tag entries live in independent
//                 tables, so a member dated later than its class is never
//                 masked by the class entry (or vice versa).
//                 Absence from a table means "no constraint".
// Ownership/Lifetime: Built once per run by the loader, then shared read-only
//                     (const&) across scanning threads without locking.
// Links: catalog/CatalogLoader.hpp, check/VersionResolver.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace apicheck::catalog
{

/// @brief Kind of platform element an entry or reference denotes.
enum class ElementKind
{
    Class,
    Method,
    Field,
    UiTag
};

/// @brief Label used in reports: "Class", "Call", "Field", "View".
[[nodiscard]] std::string_view toString(ElementKind kind);

/// @brief Identity of a platform element.
/// @details For classes, @c owner is the internal name and the rest is empty.
///          For members, @c owner is the declaring type's internal name,
///          @c member the simple name and, for methods, @c descriptor the
///          parameter descriptor without return type ("(I)"). For UI tags,
///          @c owner holds the tag name.
struct Signature
{
    std::string owner;
    std::string member;
    std::string descriptor;
};

/// @brief (subtype, supertype) pair; supertype is a superclass or interface.
struct HierarchyEdge
{
    std::string subtype;
    std::string supertype;
};

class ApiCatalog
{
  public:
    /// @brief Introduced-version of the element @p sig of kind @p kind.
    /// @return std::nullopt when the catalog has no entry for it.
    [[nodiscard]] std::optional<int> lookup(const Signature &sig, ElementKind kind) const;

    /// @brief Direct supertypes of @p type, superclass first, then interfaces.
    /// @return Empty when @p type is unknown or has no recorded supertypes.
    [[nodiscard]] const std::vector<std::string> &supertypes(const std::string &type) const;

    /// @brief True when @p internalName has a Class entry.
    [[nodiscard]] bool hasClass(const std::string &internalName) const;

    /// @brief Highest introduced-version of any entry (0 for an empty catalog).
    [[nodiscard]] int maxVersion() const
    {
        return maxVersion_;
    }

    /// @brief Total number of entries across all tables.
    [[nodiscard]] size_t size() const;

    /// @name Construction
    /// Used by the loader and by tests; a catalog is not mutated once a scan
    /// has started.
    /// @{
    void addClass(const std::string &internalName, int since);
    void addMethod(const std::string &owner,
                   const std::string &name,
                   const std::string &params,
                   int since);
    void addField(const std::string &owner, const std::string &name, int since);

    /// @brief Register UI tag @p tag; the first registration of a tag wins.
    void addUiTag(const std::string &tag, int since);

    void addEdge(HierarchyEdge edge);
    /// @}

  private:
    static std::string memberKey(const std::string &owner,
                                 const std::string &member,
                                 const std::string &descriptor);

    void noteVersion(int since);

    std::unordered_map<std::string, int> classes_;
    std::unordered_map<std::string, int> methods_;
    std::unordered_map<std::string, int> fields_;
    std::unordered_map<std::string, int> tags_;
    std::unordered_map<std::string, std::vector<std::string>> supertypes_;
    int maxVersion_ = 0;
};

} // namespace apicheck::catalog
