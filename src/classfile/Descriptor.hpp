//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/classfile/Descriptor.hpp
// Purpose: Helpers for JVM internal names and field/method descriptors.
// Key invariants: Internal names use '/' package separators and '$' for
//                 nested types; helpers never validate beyond what they need.
// Ownership/Lifetime: Free functions returning owned strings.
// Links: https://docs.oracle.com/javase/specs/jvms/se17/html/jvms-4.html#jvms-4.3
#pragma once

#include <string>
#include <string_view>

namespace apicheck::classfile
{

/// @brief Strip the return type from a method descriptor: "(ILfoo;)V" -> "(ILfoo;)".
/// @return @p descriptor unchanged when it has no closing parenthesis.
[[nodiscard]] std::string parameterDescriptor(std::string_view descriptor);

/// @brief Split a catalog method entry "name(args)ret" into name and "(args)".
/// @return False when @p entry carries no parameter list.
bool splitMethodEntry(std::string_view entry, std::string &name, std::string &params);

/// @brief Element class of an array or class descriptor, as an internal name.
/// @details "[[Landroid/widget/GridLayout;" -> "android/widget/GridLayout",
///          "Ljava/lang/String;" -> "java/lang/String", a plain internal name
///          is returned as is; primitive (arrays) yield an empty string.
[[nodiscard]] std::string elementClassName(std::string_view nameOrDescriptor);

/// @brief "android/graphics/PorterDuff$Mode" -> "android.graphics.PorterDuff$Mode".
[[nodiscard]] std::string toDottedName(std::string_view internalName);

/// @brief "android/app/ApplicationErrorReport$BatteryInfo" ->
///        "android.app.ApplicationErrorReport.BatteryInfo".
[[nodiscard]] std::string toSourceName(std::string_view internalName);

/// @brief Package part of an internal name including the trailing '/'.
[[nodiscard]] std::string_view packageOf(std::string_view internalName);

/// @brief Simple name of a top-level type ("android/widget/GridLayout" -> "GridLayout").
[[nodiscard]] std::string_view simpleNameOf(std::string_view internalName);

} // namespace apicheck::classfile
