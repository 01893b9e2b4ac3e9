//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/check/VersionResolver.hpp
// Purpose: Map a Reference to the introduced-version it requires.
// Key invariants: Classes and UI tags resolve by exact match only. Members
//                 resolve by exact match on the owner, else by breadth-first
//                 search over supertypes (superclass before interfaces);
//                 the nearest hit wins. A project type that declares the
//                 member ends the search without a constraint. Unknown
//                 owners yield no constraint rather than an error.
// Ownership/Lifetime: Borrows the hierarchy (and through it the catalog).
// Links: check/TypeHierarchy.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "check/Reference.hpp"
#include "check/TypeHierarchy.hpp"

#include <optional>
#include <string>

namespace apicheck::check
{

/// @brief Outcome of a successful lookup.
struct Resolution
{
    int required = 0;
    /// Owner to print: for members, the first catalog class met on the way
    /// from the reference's owner to the declaring type.
    std::string displayOwner;
};

class VersionResolver
{
  public:
    explicit VersionResolver(const TypeHierarchy &hierarchy) : hierarchy_(hierarchy) {}

    /// @brief Resolve @p ref against the catalog.
    /// @return std::nullopt when the reference carries no version constraint.
    [[nodiscard]] std::optional<Resolution> resolve(const Reference &ref) const;

  private:
    std::optional<Resolution> resolveMember(const Reference &ref) const;

    const TypeHierarchy &hierarchy_;
};

} // namespace apicheck::check
