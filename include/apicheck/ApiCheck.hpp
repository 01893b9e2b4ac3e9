//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/apicheck/ApiCheck.hpp
// Purpose: Stable facade for hosts embedding the compatibility check without
//          including src/ paths directly.
// Key invariants: The catalog is loaded completely before any unit is queued;
//                 a CatalogLoad failure returns before scanning starts.
// Ownership/Lifetime: Inputs stay owned by the caller; results are returned
//                     by value.
// Links: check/ApiChecker.hpp, catalog/CatalogLoader.hpp, report/Reporter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "catalog/ApiCatalog.hpp"
#include "catalog/CatalogLoader.hpp"
#include "check/ApiChecker.hpp"
#include "check/CheckOptions.hpp"
#include "report/Reporter.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <vector>

namespace apicheck
{

/// @brief Load the catalog at @p catalogPath, then check the inputs.
/// @return Scan result, or the CatalogLoad diagnostic that aborted the run.
support::Expected<check::ScanResult> runCheck(const std::string &catalogPath,
                                              const std::vector<check::CompiledUnit> &units,
                                              const std::vector<check::ResourceFile> &resources,
                                              const check::CheckOptions &options);

} // namespace apicheck
