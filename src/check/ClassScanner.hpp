//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/check/ClassScanner.hpp
// Purpose: Extract platform-element references from one parsed class file.
// Key invariants: References come out in discovery order: supertypes first,
//                 then each method's instructions followed by its exception
//                 handlers. Every reference has a line >= 1.
// Ownership/Lifetime: Stateless; reads the ClassFile without retaining it.
// Links: classfile/ClassFile.hpp, check/Reference.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "check/Reference.hpp"
#include "classfile/ClassFile.hpp"

#include <string>
#include <vector>

namespace apicheck::check
{

/// @brief Collect the references of @p cls.
/// @param sourcePath Path stored in each Reference::file.
std::vector<Reference> scanClassFile(const classfile::ClassFile &cls, const std::string &sourcePath);

} // namespace apicheck::check
