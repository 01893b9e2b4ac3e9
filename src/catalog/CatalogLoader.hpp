//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/catalog/CatalogLoader.hpp
// Purpose: Load the finished api-versions table into an ApiCatalog.
// Key invariants: Any failure is a CatalogLoad diagnostic; a partially read
//                 catalog is never returned.
// Ownership/Lifetime: The returned catalog is owned by the caller.
// Links: catalog/ApiCatalog.hpp, xml/XmlReader.hpp
//
//===----------------------------------------------------------------------===//
//
// Expected input shape:
//
//   <api version="2">
//     <class name="android/app/Activity" since="1">
//       <extends name="android/view/ContextThemeWrapper"/>
//       <implements name="android/view/Window$Callback"/>
//       <method name="getActionBar()Landroid/app/ActionBar;" since="11"/>
//       <field name="RESULT_OK"/>
//     </class>
//   </api>
//
// A class without `since` is version 1; a member without `since` inherits the
// class version.  UI tags are derived from the classes of the view packages.

#pragma once

#include "catalog/ApiCatalog.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace apicheck::catalog
{

/// @brief Read and parse the catalog file at @p path.
support::Expected<ApiCatalog> loadCatalog(const std::string &path);

/// @brief Parse catalog text; @p path only labels diagnostics.
support::Expected<ApiCatalog> parseCatalog(std::string_view text, std::string_view path);

} // namespace apicheck::catalog
