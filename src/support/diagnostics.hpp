//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic record and engine for per-file failures.
// Key invariants: Counts reflect reported diagnostics; insertion order is kept.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace apicheck::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Classification of a user-visible failure.
enum class DiagCode
{
    None = 0,    ///< Unclassified diagnostic.
    CatalogLoad, ///< Catalog missing or malformed; aborts the run.
    UnitParse,   ///< One compiled unit or UI document unreadable; unit skipped.
    Usage        ///< Command-line usage error.
};

/// @brief Stable textual prefix for @p code ("catalog-load", "unit-parse", ...).
std::string_view toString(DiagCode code);

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity = Severity::Error; ///< Message severity
    std::string message;                 ///< Human-readable text
    SourceLoc loc;                       ///< Optional source location
    DiagCode code = DiagCode::None;      ///< Failure class
    std::string path;                    ///< Artifact path when no file id applies
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param sm Optional source manager for location info.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    [[nodiscard]] const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    size_t errorCount() const;

    size_t warningCount() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};
} // namespace apicheck::support
