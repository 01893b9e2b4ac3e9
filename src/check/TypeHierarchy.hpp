//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/check/TypeHierarchy.hpp
// Purpose: Signature-keyed adjacency index of supertypes used for inherited
//          member resolution: the catalog's platform edges overlaid with the
//          edges and declared members of the project's own classes.
// Key invariants: A project type's edges replace any catalog edges for the
//                 same name. Traversals must keep a visited set because
//                 interface graphs from untrusted input may contain cycles.
// Ownership/Lifetime: Borrows the catalog, which must outlive the index.
//                     Built serially, then shared read-only across workers.
// Links: check/VersionResolver.hpp, catalog/ApiCatalog.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "catalog/ApiCatalog.hpp"
#include "classfile/ClassFile.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace apicheck::check
{

class TypeHierarchy
{
  public:
    explicit TypeHierarchy(const catalog::ApiCatalog &catalog) : catalog_(catalog) {}

    /// @brief Register a scanned project class, its supertypes and members.
    void addProjectType(const classfile::ClassFile &cls);

    /// @brief Direct supertypes of @p type, superclass first.
    [[nodiscard]] const std::vector<std::string> &supertypes(const std::string &type) const;

    /// @brief True when project type @p type declares the member.
    /// @param params Parameter descriptor for methods; ignored for fields.
    [[nodiscard]] bool declaresMember(const std::string &type,
                                      catalog::ElementKind kind,
                                      const std::string &name,
                                      const std::string &params) const;

    [[nodiscard]] const catalog::ApiCatalog &catalog() const
    {
        return catalog_;
    }

  private:
    struct ProjectType
    {
        std::vector<std::string> supertypes;
        std::unordered_set<std::string> methods; ///< name + parameter descriptor.
        std::unordered_set<std::string> fields;
    };

    const catalog::ApiCatalog &catalog_;
    std::unordered_map<std::string, ProjectType> project_;
};

} // namespace apicheck::check
