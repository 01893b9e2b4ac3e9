//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/check/ApiChecker.hpp
// Purpose: The compatibility check as a pure function of its inputs: compiled
//          units, layout documents, a declared minimum and a catalog in;
//          ordered violations and per-file diagnostics out.
// Key invariants: Every returned violation has required > declaredMin and is
//                 not suppressed. Violations are sorted by file, line, input
//                 position and discovery order, so the result does not
//                 depend on the number of workers. A unit that fails to
//                 parse contributes one UnitParse diagnostic and nothing
//                 else.
// Ownership/Lifetime: ApiChecker borrows the catalog; results are owned by
//                     the caller.
// Links: check/ClassScanner.hpp, check/LayoutScanner.hpp,
//        check/VersionResolver.hpp, check/SuppressionIndex.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "catalog/ApiCatalog.hpp"
#include "check/CheckOptions.hpp"
#include "check/Reference.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <string>
#include <vector>

namespace apicheck::check
{

/// @brief One compiled artifact and the source it was compiled from.
struct CompiledUnit
{
    std::string artifactPath; ///< Path of the .class file.
    /// Originating source path used in reports. When empty it is derived from
    /// the SourceFile attribute and the class's package.
    std::string sourcePath;
    /// Class-file image; read from @c artifactPath when absent.
    std::optional<std::string> contents;
};

/// @brief One layout document.
struct ResourceFile
{
    std::string path;
    /// Document text; read from @c path when absent.
    std::optional<std::string> contents;
};

struct ScanResult
{
    std::vector<Violation> violations;     ///< Sorted for reporting.
    support::DiagnosticEngine diagnostics; ///< Per-file failures, in input order.
    support::SourceManager sources;        ///< Files named by @c diagnostics.
    std::vector<std::string> failedPaths;  ///< Paths behind @c diagnostics.
};

class ApiChecker
{
  public:
    ApiChecker(const catalog::ApiCatalog &catalog, CheckOptions options);

    /// @brief Check @p units and @p resources.
    /// @throws Only what allocation throws; per-file failures are diagnostics.
    [[nodiscard]] ScanResult run(const std::vector<CompiledUnit> &units,
                                 const std::vector<ResourceFile> &resources) const;

  private:
    const catalog::ApiCatalog &catalog_;
    CheckOptions options_;
};

/// @brief Run a check with default options except for @p declaredMin.
[[nodiscard]] ScanResult scan(const std::vector<CompiledUnit> &units,
                              const std::vector<ResourceFile> &resources,
                              int declaredMin,
                              const catalog::ApiCatalog &catalog);

/// @brief Order @p violations by file, line, input position, discovery order.
void sortViolations(std::vector<Violation> &violations);

} // namespace apicheck::check
