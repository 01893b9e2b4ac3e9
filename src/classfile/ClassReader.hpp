//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/classfile/ClassReader.hpp
// Purpose: Parse JVM class files into the symbolic ClassFile model.
// Key invariants: Every constant-pool reference the model exposes has been
//                 checked for index range and tag; a malformed unit yields a
//                 DiagCode::UnitParse diagnostic and no partial model.
// Ownership/Lifetime: Stateless entry points; the returned ClassFile owns its
//                     data.
// Links: classfile/ClassFile.hpp,
//        https://docs.oracle.com/javase/specs/jvms/se17/html/jvms-4.html
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/ClassFile.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace apicheck::classfile
{

/// @brief Parse the class-file image @p bytes.
/// @param path Artifact path used in diagnostics only.
/// @return Parsed model or a UnitParse diagnostic naming @p path.
support::Expected<ClassFile> parseClassFile(std::string_view bytes, const std::string &path);

/// @brief Read and parse the class file at @p path.
support::Expected<ClassFile> readClassFile(const std::string &path);

} // namespace apicheck::classfile
