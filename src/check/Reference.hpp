//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/check/Reference.hpp
// Purpose: Candidate usages of platform elements emitted by the scanners, and
//          the violations they may turn into.
// Key invariants: Violation::required > Violation::declaredMin always holds;
//                 the checker never constructs a Violation otherwise.
// Ownership/Lifetime: Plain values produced and discarded per scanned unit.
// Links: check/ClassScanner.hpp, check/LayoutScanner.hpp, check/ApiChecker.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "catalog/ApiCatalog.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace apicheck::check
{

/// @brief Declaration that lexically encloses a reference.
/// @details Drives suppression lookup. Only declarations that survive into the
///          scanned artifact are recorded; UI references carry an empty value.
struct Enclosing
{
    std::string owner;            ///< Internal name of the enclosing class.
    std::string method;           ///< Enclosing method name, if any.
    std::string methodDescriptor; ///< Full descriptor of @c method.
    std::string field;            ///< Field whose initializer holds the reference.
};

struct Reference
{
    catalog::ElementKind kind = catalog::ElementKind::Class;
    catalog::Signature signature;
    std::string file;  ///< Originating source or document path.
    uint32_t line = 0; ///< 1-based source line.
    Enclosing enclosing;
    uint32_t seq = 0; ///< Discovery order within the unit.
};

struct Violation
{
    Reference reference;
    int required = 0;         ///< Introduced-version of the resolved element.
    int declaredMin = 0;      ///< Declared minimum of the run.
    std::string displayOwner; ///< Owner type printed in the signature.
    size_t unitIndex = 0;     ///< Input position of the scanned unit.
};

} // namespace apicheck::check
